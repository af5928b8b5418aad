#pragma once

#include <filesystem>
#include <optional>
#include "core/model/operation.hpp"
#include "infra/error_handler/error.hpp"

namespace ftool::core {

/// Pure pre-flight checks for one source entry. Nothing on disk is touched.
///
/// Failure codes, in the order they are checked:
///   SourceNotFound          source is missing (a dangling symlink still exists)
///   InvalidName             Rename target is empty, "." / "..", or has a separator
///   TargetNotDirectory      Move/Copy destination exists and is not a directory
///   RecursiveConflict       a directory would land inside itself
///   SameFile                the final target is the source itself
///   MissingTargetDirectory  destination directory is absent and auto-mkdir is off
///
/// MissingTargetDirectory is advisory: the orchestrator may ask the user and
/// validate again with auto-mkdir implied.
class PathValidator {
public:
    [[nodiscard]] static auto validate(const std::filesystem::path& source,
                                       const std::optional<std::filesystem::path>& destination,
                                       Verb verb,
                                       const Options& options)
        -> infra::VoidResult;

    /// True when `path` equals `ancestor` or lies below it (lexical, both normalised).
    [[nodiscard]] static auto is_within(const std::filesystem::path& path,
                                        const std::filesystem::path& ancestor) -> bool;

    [[nodiscard]] static auto is_valid_new_name(const std::filesystem::path& name) -> bool;

private:
    // Каталоги пути разрешаются, последний компонент остаётся как есть
    [[nodiscard]] static auto location_of(const std::filesystem::path& path) -> std::filesystem::path;
};

} // namespace ftool::core
