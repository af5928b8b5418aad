#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace ftool::infra {

enum class ErrorCode {
    // Ошибки проверки путей (до начала переноса)
    SourceNotFound,
    TargetNotDirectory,
    RecursiveConflict,
    MissingTargetDirectory,
    SameFile,
    InvalidName,
    InvalidInvocation,

    // Ошибки во время переноса
    InsufficientSpace,
    PermissionDenied,
    CrossDeviceError,
    TrashUnavailable,
    VerificationFailed,
    BackupNameExhausted,
    IoError,

    // Остановка пакета
    Aborted,
    Interrupted,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    /// Fatal errors stop the current entry; the rest of the batch continues
    /// unless the code is Aborted or Interrupted.
    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto stops_batch() const -> bool {
        return code == ErrorCode::Aborted || code == ErrorCode::Interrupted;
    }
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Maps an OS error to the taxonomy and names the offending path in the
/// message. EACCES/EPERM, ENOSPC/EDQUOT, EXDEV and ENOENT get their own codes,
/// everything else is IoError.
[[nodiscard]] auto from_error_code(
    const std::error_code& ec,
    std::string_view action,
    const std::filesystem::path& path,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace ftool::infra
