#include "error.hpp"
#include <fmt/core.h>
#include <cerrno>
#include <cstdlib>

namespace ftool::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::SourceNotFound:         return "SourceNotFound";
        case ErrorCode::TargetNotDirectory:     return "TargetNotDirectory";
        case ErrorCode::RecursiveConflict:      return "RecursiveConflict";
        case ErrorCode::MissingTargetDirectory: return "MissingTargetDirectory";
        case ErrorCode::SameFile:               return "SameFile";
        case ErrorCode::InvalidName:            return "InvalidName";
        case ErrorCode::InvalidInvocation:      return "InvalidInvocation";
        case ErrorCode::InsufficientSpace:      return "InsufficientSpace";
        case ErrorCode::PermissionDenied:       return "PermissionDenied";
        case ErrorCode::CrossDeviceError:       return "CrossDeviceError";
        case ErrorCode::TrashUnavailable:       return "TrashUnavailable";
        case ErrorCode::VerificationFailed:     return "VerificationFailed";
        case ErrorCode::BackupNameExhausted:    return "BackupNameExhausted";
        case ErrorCode::IoError:                return "IoError";
        case ErrorCode::Aborted:                return "Aborted";
        case ErrorCode::Interrupted:            return "Interrupted";
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SourceNotFound:
        case ErrorCode::TargetNotDirectory:
        case ErrorCode::RecursiveConflict:
        case ErrorCode::SameFile:
        case ErrorCode::InvalidName:
        case ErrorCode::InvalidInvocation:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InsufficientSpace:
        case ErrorCode::TrashUnavailable:
        case ErrorCode::VerificationFailed:
        case ErrorCode::BackupNameExhausted:
        case ErrorCode::IoError:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::InvalidInvocation: return 3;
        case ErrorCode::Aborted:           return 2;
        case ErrorCode::Interrupted:       return 130; // SIGINT
        default:                           return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error from_error_code(const std::error_code& ec, std::string_view action,
                      const std::filesystem::path& path,
                      const std::source_location& loc) {
    ErrorCode code = ErrorCode::IoError;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted
        || ec == std::errc::read_only_file_system) {
        code = ErrorCode::PermissionDenied;
    } else if (ec == std::errc::no_space_on_device || ec.value() == EDQUOT) {
        code = ErrorCode::InsufficientSpace;
    } else if (ec == std::errc::cross_device_link) {
        code = ErrorCode::CrossDeviceError;
    } else if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::SourceNotFound;
    }
    return Error{code, fmt::format("{} {}: {}", action, path.string(), ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace ftool::infra
