#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace ftool::core {

enum class Verb {
    Move,
    Copy,
    Rename,
    Remove,
    Backup
};

[[nodiscard]] auto to_string(Verb verb) -> std::string_view;

/// Move and Copy need an existing (or creatable) destination directory.
[[nodiscard]] constexpr auto needs_directory_destination(Verb verb) -> bool {
    return verb == Verb::Move || verb == Verb::Copy;
}

struct Options {
    bool auto_mkdir = false;
    bool force_overwrite = false;
    bool no_clobber = false;
    bool verbose = false;
};

struct OperationRequest {
    Verb verb = Verb::Move;
    std::vector<std::filesystem::path> sources;
    // Каталог для Move/Copy, новое имя для Rename, пусто для Remove/Backup
    std::optional<std::filesystem::path> destination;
    Options options{};
};

/// Checks the request shape before it enters the engine: non-empty sources,
/// force/no-clobber exclusivity, destination presence per verb, a single
/// source for Rename.
[[nodiscard]] auto validate_request(const OperationRequest& request) -> infra::VoidResult;

enum class Strategy {
    AtomicRename,
    BufferedCopy,
    CopyThenDelete,
    CopyOnly,
    SoftDelete
};

[[nodiscard]] auto to_string(Strategy strategy) -> std::string_view;

[[nodiscard]] constexpr auto is_copy_class(Strategy strategy) -> bool {
    return strategy == Strategy::BufferedCopy
        || strategy == Strategy::CopyThenDelete
        || strategy == Strategy::CopyOnly;
}

struct TransferPlan {
    Verb verb = Verb::Move;
    std::filesystem::path source_path;
    std::filesystem::path resolved_target_path;
    Strategy strategy = Strategy::BufferedCopy;
    bool is_directory = false;
    std::uint64_t size_bytes = 0;
    bool report_progress = false;
};

enum class Outcome {
    Succeeded,
    Skipped,
    Failed,
    Aborted
};

[[nodiscard]] auto to_string(Outcome outcome) -> std::string_view;

enum class Warning {
    SourceRetained
};

struct OutcomeCounts {
    std::size_t succeeded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t aborted = 0;

    void add(Outcome outcome);
    void merge(const OutcomeCounts& other);
    [[nodiscard]] auto total() const -> std::size_t {
        return succeeded + skipped + failed + aborted;
    }
};

struct OperationResult {
    std::filesystem::path path;
    Outcome outcome = Outcome::Succeeded;
    std::optional<infra::Error> error;      // причина для Failed/Aborted
    std::vector<Warning> warnings;
    // Для файла — один элемент; для каталога — исходы всех листьев
    OutcomeCounts leaves{};

    [[nodiscard]] auto has_warning(Warning warning) const -> bool;

    [[nodiscard]] static auto leaf(std::filesystem::path path, Outcome outcome) -> OperationResult;
    [[nodiscard]] static auto failed(std::filesystem::path path, infra::Error error) -> OperationResult;
    [[nodiscard]] static auto aborted(std::filesystem::path path,
                                      std::optional<infra::Error> reason = std::nullopt) -> OperationResult;
};

struct BatchSummary {
    std::vector<OperationResult> results;
    OutcomeCounts counts{};
    bool aborted_by_user = false;
    bool interrupted = false;
    // Ошибка, остановившая весь пакет до начала (MissingTargetDirectory и т.п.)
    std::optional<infra::Error> batch_error;

    /// 0 all Succeeded/Skipped, 1 some Failed, 2 aborted by the user,
    /// 130 stopped by a signal.
    [[nodiscard]] auto exit_code() const -> int;
};

} // namespace ftool::core
