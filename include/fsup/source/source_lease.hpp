#pragma once

#include "fsup/core/result.hpp"
#include "fsup/source/document_repository.hpp"

#include <memory>

namespace fsup::source {

/**
 * @brief Scoped ownership of an open SourceStream
 *
 * The stream is closed exactly once: by release(), or by the destructor if
 * release() was never reached. A failed close is logged as a
 * ResourceReleaseError and otherwise ignored by the destructor.
 */
class SourceLease {
public:
    SourceLease() = default;
    explicit SourceLease(std::unique_ptr<SourceStream> stream);
    ~SourceLease();

    SourceLease(const SourceLease&) = delete;
    SourceLease& operator=(const SourceLease&) = delete;

    SourceLease(SourceLease&& other) noexcept;
    SourceLease& operator=(SourceLease&& other) noexcept;

    /// Takes ownership of @p stream; a stream already held is released first
    void acquire(std::unique_ptr<SourceStream> stream);

    [[nodiscard]] bool held() const noexcept { return stream_ != nullptr; }
    SourceStream& stream() { return *stream_; }

    /**
     * @brief Close the stream now
     *
     * No-op returning Ok when nothing is held. The stream is dropped even if
     * close() fails, so a second release() never closes it again.
     */
    fsup::Result<void> release();

private:
    std::unique_ptr<SourceStream> stream_;
};

} // namespace fsup::source
