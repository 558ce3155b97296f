#pragma once

#include "fsup/core/result.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace fsup {

/**
 * @brief Failure categories reported to the invoking workflow
 *
 * The string form (see to_string) is the prefix of every failure message,
 * e.g. "RemoteIOError: Failed to create directory reports".
 */
enum class ErrorKind {
    Configuration,   ///< No credential, missing document id, blank required input
    RemoteIO,        ///< Any failure talking to the remote share
    SourceRead,      ///< Version lookup, open or read on the document repository
    ResourceRelease, ///< Closing the source stream (logged, never reported)
    Internal         ///< Unexpected exception outside a known operation
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::RemoteIO: return "RemoteIOError";
        case ErrorKind::SourceRead: return "SourceReadError";
        case ErrorKind::ResourceRelease: return "ResourceReleaseError";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}

struct UploadError {
    ErrorKind kind = ErrorKind::Internal;
    std::string detail;

    UploadError() = default;
    UploadError(ErrorKind k, std::string d) : kind(k), detail(std::move(d)) {}

    /// "<kind>: <detail>"
    std::string message() const {
        return std::string(to_string(kind)) + ": " + detail;
    }
};

template<typename T>
using UploadResult = Result<T, UploadError>;

/**
 * @brief Run a collaborator call and tag any failure with @p kind
 *
 * @p call returns a Result<T> with a string error. Both an error result and a
 * thrown std::exception come back as an UploadError of the given kind.
 */
template<typename Fn>
auto capture(ErrorKind kind, Fn&& call)
    -> UploadResult<typename std::invoke_result_t<Fn>::value_type> {
    using T = typename std::invoke_result_t<Fn>::value_type;
    try {
        auto result = std::forward<Fn>(call)();
        if (result.is_error()) {
            return Err<T>(UploadError{kind, result.error()});
        }
        if constexpr (std::is_void_v<T>) {
            return Ok<UploadError>();
        } else {
            return Ok<T, UploadError>(std::move(result.value()));
        }
    } catch (const std::exception& e) {
        return Err<T>(UploadError{kind, e.what()});
    } catch (...) {
        return Err<T>(UploadError{kind, "unknown exception"});
    }
}

/**
 * @brief capture() for calls that hand back an owning pointer directly
 *
 * A thrown exception and a null handle both become an UploadError of
 * @p kind.
 */
template<typename Fn>
auto capture_handle(ErrorKind kind, Fn&& call) -> UploadResult<std::invoke_result_t<Fn>> {
    using Handle = std::invoke_result_t<Fn>;
    try {
        Handle handle = std::forward<Fn>(call)();
        if (!handle) {
            return Err<Handle>(UploadError{kind, "no handle returned"});
        }
        return Ok<Handle, UploadError>(std::move(handle));
    } catch (const std::exception& e) {
        return Err<Handle>(UploadError{kind, e.what()});
    } catch (...) {
        return Err<Handle>(UploadError{kind, "unknown exception"});
    }
}

} // namespace fsup
