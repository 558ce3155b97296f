#include "fsup/source/source_lease.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace fsup::source {

SourceLease::SourceLease(std::unique_ptr<SourceStream> stream)
    : stream_(std::move(stream)) {}

SourceLease::~SourceLease() {
    auto result = release();
    if (result.is_error()) {
        spdlog::error("ResourceReleaseError: Failed to close document input stream: {}", result.error());
    }
}

SourceLease::SourceLease(SourceLease&& other) noexcept
    : stream_(std::move(other.stream_)) {}

SourceLease& SourceLease::operator=(SourceLease&& other) noexcept {
    if (this != &other) {
        auto result = release();
        if (result.is_error()) {
            spdlog::error("ResourceReleaseError: Failed to close document input stream: {}", result.error());
        }
        stream_ = std::move(other.stream_);
    }
    return *this;
}

void SourceLease::acquire(std::unique_ptr<SourceStream> stream) {
    auto result = release();
    if (result.is_error()) {
        spdlog::error("ResourceReleaseError: Failed to close document input stream: {}", result.error());
    }
    stream_ = std::move(stream);
}

fsup::Result<void> SourceLease::release() {
    if (!stream_) {
        return fsup::Ok();
    }

    auto stream = std::move(stream_);
    try {
        return stream->close();
    } catch (const std::exception& e) {
        return fsup::Err<void>(std::string(e.what()));
    } catch (...) {
        return fsup::Err<void>(std::string("unknown exception"));
    }
}

} // namespace fsup::source
