#include "path_validator.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "adapters/fs.hpp"

namespace ftool::core {

using infra::ErrorCode;

auto PathValidator::is_within(const std::filesystem::path& path,
                              const std::filesystem::path& ancestor) -> bool
{
    auto p = path.lexically_normal();
    auto a = ancestor.lexically_normal();

    auto p_it = p.begin();
    for (auto a_it = a.begin(); a_it != a.end(); ++a_it, ++p_it) {
        // Завершающий "/" даёт пустой компонент
        if (a_it->empty()) continue;
        if (p_it == p.end() || *p_it != *a_it) return false;
    }
    return true;
}

auto PathValidator::is_valid_new_name(const std::filesystem::path& name) -> bool {
    const auto text = name.string();
    if (text.empty() || text == "." || text == "..") return false;
    if (text.find('/') != std::string::npos || text.find('\\') != std::string::npos) return false;
    return std::any_of(text.begin(), text.end(), [](unsigned char c) { return !std::isspace(c); });
}

auto PathValidator::location_of(const std::filesystem::path& path) -> std::filesystem::path {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) absolute = path;
    auto parent = std::filesystem::weakly_canonical(absolute.lexically_normal().parent_path(), ec);
    if (ec) parent = absolute.parent_path();
    return parent / adapters::fs::entry_name(absolute);
}

auto PathValidator::validate(const std::filesystem::path& source,
                             const std::optional<std::filesystem::path>& destination,
                             Verb verb,
                             const Options& options)
    -> infra::VoidResult
{
    if (!adapters::fs::exists_no_follow(source)) {
        return std::unexpected(infra::make_error(ErrorCode::SourceNotFound,
            fmt::format("Source does not exist: {}", source.string())));
    }

    std::error_code ec;
    const auto source_location = location_of(source);
    const bool source_is_dir = std::filesystem::is_directory(std::filesystem::symlink_status(source, ec));

    if (verb == Verb::Rename) {
        if (!destination || !is_valid_new_name(*destination)) {
            return std::unexpected(infra::make_error(ErrorCode::InvalidName,
                fmt::format("Invalid new name: '{}'", destination ? destination->string() : "")));
        }
        if (source_location.parent_path() / *destination == source_location) {
            return std::unexpected(infra::make_error(ErrorCode::SameFile,
                fmt::format("Source and target are the same: {}", source.string())));
        }
        return {};
    }

    if (!needs_directory_destination(verb)) {
        return {};
    }

    if (!destination) {
        return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation,
            fmt::format("{} requires a target directory", to_string(verb))));
    }

    const auto dest_status = std::filesystem::status(*destination, ec);
    const bool dest_exists = std::filesystem::exists(dest_status);
    if (dest_exists && !std::filesystem::is_directory(dest_status)) {
        return std::unexpected(infra::make_error(ErrorCode::TargetNotDirectory,
            fmt::format("Target must be a directory: {}", destination->string())));
    }

    auto dest_resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(*destination, ec), ec);
    if (ec) dest_resolved = destination->lexically_normal();

    if (source_is_dir && is_within(dest_resolved, source_location)) {
        return std::unexpected(infra::make_error(ErrorCode::RecursiveConflict,
            fmt::format("Cannot {} {} into itself ({})", to_string(verb), source.string(), destination->string())));
    }

    if (dest_resolved / adapters::fs::entry_name(source) == source_location) {
        return std::unexpected(infra::make_error(ErrorCode::SameFile,
            fmt::format("Source and target are the same: {}", source.string())));
    }

    if (!dest_exists && !options.auto_mkdir) {
        return std::unexpected(infra::make_error(ErrorCode::MissingTargetDirectory,
            fmt::format("Target directory does not exist: {}", destination->string())));
    }

    spdlog::debug("Validated {} -> {}", source.string(), destination->string());
    return {};
}

} // namespace ftool::core
