#include "strategy_selector.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace ftool::core {

using infra::ErrorCode;

StrategySelector::StrategySelector(const infra::Config& config, const adapters::fs::FsProbe& probe)
    : config_(config), probe_(probe) {}

auto StrategySelector::backup_path_for(const std::filesystem::path& source)
    -> infra::Result<std::filesystem::path>
{
    const auto name = adapters::fs::entry_name(source).string();
    const auto parent = source.lexically_normal().has_filename()
        ? source.lexically_normal().parent_path()
        : source.lexically_normal().parent_path().parent_path();

    auto candidate = parent / fmt::format("{}.bak", name);
    if (!adapters::fs::exists_no_follow(candidate)) {
        return candidate;
    }
    for (int counter = 2; counter <= kMaxBackupCandidates; ++counter) {
        candidate = parent / fmt::format("{}.bak{}", name, counter);
        if (!adapters::fs::exists_no_follow(candidate)) {
            return candidate;
        }
    }
    return std::unexpected(infra::make_error(ErrorCode::BackupNameExhausted,
        fmt::format("Too many backups of {}", source.string())));
}

auto StrategySelector::resolve_target(const PlanInput& input) const -> infra::Result<std::filesystem::path> {
    const auto source = input.source.lexically_normal();
    switch (input.verb) {
        case Verb::Move:
        case Verb::Copy:
            if (!input.destination) {
                return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation,
                    fmt::format("{} requires a target directory", to_string(input.verb))));
            }
            return *input.destination / adapters::fs::entry_name(source);
        case Verb::Rename: {
            if (!input.destination) {
                return std::unexpected(infra::make_error(ErrorCode::InvalidName, "rename requires a new name"));
            }
            auto parent = source.has_filename() ? source.parent_path() : source.parent_path().parent_path();
            return parent / *input.destination;
        }
        case Verb::Backup:
            return backup_path_for(source);
        case Verb::Remove:
            return source;
    }
    return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation, "Unknown verb"));
}

auto StrategySelector::strategy_for(Verb verb,
                                    const std::filesystem::path& source,
                                    const std::filesystem::path& target) const
    -> infra::Result<Strategy>
{
    switch (verb) {
        case Verb::Remove: return Strategy::SoftDelete;
        case Verb::Backup: return Strategy::CopyOnly;
        // Копирование не зависит от устройства
        case Verb::Copy:   return Strategy::BufferedCopy;
        case Verb::Move:
        case Verb::Rename:
            break;
    }

    auto source_dev = probe_.device_of(source);
    if (!source_dev) {
        return std::unexpected(std::move(source_dev.error()));
    }
    auto target_dev = probe_.device_of(target.parent_path());
    if (!target_dev) {
        return std::unexpected(std::move(target_dev.error()));
    }
    return *source_dev == *target_dev ? Strategy::AtomicRename : Strategy::CopyThenDelete;
}

auto StrategySelector::select(const PlanInput& input) const -> infra::Result<TransferPlan> {
    auto target = resolve_target(input);
    if (!target) {
        return std::unexpected(std::move(target.error()));
    }

    auto strategy = strategy_for(input.verb, input.source, *target);
    if (!strategy) {
        return std::unexpected(std::move(strategy.error()));
    }

    std::error_code ec;
    TransferPlan plan{
        .verb = input.verb,
        .source_path = input.source,
        .resolved_target_path = *target,
        .strategy = *strategy,
        .is_directory = std::filesystem::is_directory(std::filesystem::symlink_status(input.source, ec)),
        .size_bytes = adapters::fs::entry_size(input.source),
        .report_progress = false,
    };
    plan.report_progress = plan.strategy != Strategy::SoftDelete
        && (plan.size_bytes > config_.large_file_threshold
            || input.entry_count >= config_.multi_entry_threshold);

    spdlog::debug("Plan {} -> {}: {} ({} bytes{})",
                  plan.source_path.string(), plan.resolved_target_path.string(),
                  to_string(plan.strategy), plan.size_bytes,
                  plan.report_progress ? ", progress" : "");
    return plan;
}

auto StrategySelector::select_child(const TransferPlan& parent,
                                    const std::filesystem::path& child_source,
                                    const std::filesystem::path& child_target) const
    -> infra::Result<TransferPlan>
{
    auto strategy = strategy_for(parent.verb, child_source, child_target);
    if (!strategy) {
        return std::unexpected(std::move(strategy.error()));
    }

    std::error_code ec;
    return TransferPlan{
        .verb = parent.verb,
        .source_path = child_source,
        .resolved_target_path = child_target,
        .strategy = *strategy,
        .is_directory = std::filesystem::is_directory(std::filesystem::symlink_status(child_source, ec)),
        .size_bytes = adapters::fs::entry_size(child_source),
        .report_progress = parent.report_progress,
    };
}

} // namespace ftool::core
