#pragma once

#include <string>
#include <utility>

namespace mpu {

/**
 * @brief Failure categories reported by the upload engine
 */
enum class ErrorCode {
    SourceError,        ///< Source file missing, unreadable or changed size
    GatewayError,       ///< Storage backend rejected or failed a call
    IncompleteTransfer, ///< Finalize attempted with a part count different from the plan
    NoSuchTransfer,     ///< No registered transfer for (bucket, key)
    Aborted,            ///< Operation observed an abort request mid-flight
    TransferBusy,       ///< Another run is already driving the transfer
    InvalidArgument,
    ConfigError
};

struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceError: return "source_error";
        case ErrorCode::GatewayError: return "gateway_error";
        case ErrorCode::IncompleteTransfer: return "incomplete_transfer";
        case ErrorCode::NoSuchTransfer: return "no_such_transfer";
        case ErrorCode::Aborted: return "aborted";
        case ErrorCode::TransferBusy: return "transfer_busy";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::ConfigError: return "config_error";
    }
    return "unknown";
}

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.code)) + ": " + error.message;
}

} // namespace mpu
