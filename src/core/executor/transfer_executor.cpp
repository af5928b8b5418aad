#include "transfer_executor.hpp"

#include <algorithm>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "extensions/metadata.hpp"
#include "infra/hash/xxhash_verifier.hpp"
#include "infra/interrupt.hpp"

namespace ftool::core {

using infra::ErrorCode;

namespace {

auto interrupted_error(const std::filesystem::path& path) -> infra::Error {
    return infra::make_error(ErrorCode::Interrupted,
                             fmt::format("Interrupted before {}", path.string()));
}

auto is_dir_no_follow(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(std::filesystem::symlink_status(path, ec));
}

auto is_symlink_no_follow(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec));
}

// Move/Copy каталога в существующий каталог сливают деревья; Rename заменяет цель
auto merges_into_target(const TransferPlan& plan) -> bool {
    return plan.is_directory
        && needs_directory_destination(plan.verb)
        && is_dir_no_follow(plan.resolved_target_path);
}

auto moves_source(Strategy strategy) -> bool {
    return strategy == Strategy::AtomicRename || strategy == Strategy::CopyThenDelete;
}

} // namespace

TransferExecutor::TransferExecutor(const infra::Config& config,
                                   const StrategySelector& selector,
                                   const adapters::fs::FsProbe& probe,
                                   adapters::fs::FsOps& ops,
                                   adapters::trash::RecoverableStore& trash)
    : config_(config), selector_(selector), probe_(probe), ops_(ops), trash_(trash) {}

auto TransferExecutor::execute(const TransferPlan& plan,
                               OverwriteResolver& resolver,
                               ProgressSink& sink,
                               EntryPosition position) -> OperationResult
{
    Context ctx{
        .resolver = resolver,
        .sink = sink,
        .progress = ProgressEvent{
            .entry_index = position.index,
            .total_entries = position.total,
            .bytes_done = 0,
            .bytes_total = plan.size_bytes,
            .current_path = plan.source_path,
        },
        .report = plan.report_progress,
    };

    if (plan.strategy == Strategy::SoftDelete) {
        return soft_delete(plan);
    }
    return run_plan(plan, ctx);
}

auto TransferExecutor::run_plan(const TransferPlan& plan, Context& ctx) -> OperationResult {
    if (infra::is_interrupted()) {
        return OperationResult::aborted(plan.source_path, interrupted_error(plan.source_path));
    }
    return plan.is_directory ? transfer_directory(plan, ctx) : transfer_file(plan, ctx);
}

void TransferExecutor::advance(Context& ctx, const std::filesystem::path& current, std::uint64_t bytes) {
    ctx.progress.bytes_done += bytes;
    ctx.progress.current_path = current;
    if (ctx.report) {
        ctx.sink.on_progress(ctx.progress);
    }
}

void TransferExecutor::discard(const std::filesystem::path& leftover) {
    if (auto removed = ops_.remove_all(leftover); !removed) {
        spdlog::warn("Cannot remove leftover {}: {}", leftover.string(), removed.error().message);
    }
}

auto TransferExecutor::place(const std::filesystem::path& from, const std::filesystem::path& target)
    -> infra::VoidResult
{
    // rename(2) атомарно заменяет только файл файлом
    const bool displace = adapters::fs::exists_no_follow(target)
        && (is_dir_no_follow(from) || is_dir_no_follow(target));
    if (!displace) {
        return ops_.rename(from, target);
    }

    const auto aside = adapters::fs::displaced_sibling(target);
    if (adapters::fs::exists_no_follow(aside)) {
        discard(aside);
    }
    if (auto moved = ops_.rename(target, aside); !moved) {
        return moved;
    }
    if (auto placed = ops_.rename(from, target); !placed) {
        if (auto restored = ops_.rename(aside, target); !restored) {
            spdlog::error("Cannot restore {}, previous content left at {}", target.string(), aside.string());
            return restored;
        }
        return placed;
    }
    discard(aside);
    return {};
}

auto TransferExecutor::resolve_conflict(const TransferPlan& plan, Context& ctx)
    -> std::optional<OperationResult>
{
    const auto& target = plan.resolved_target_path;
    if (!adapters::fs::exists_no_follow(target)) {
        return std::nullopt;
    }
    // Слияние: конфликты решаются по файлам
    if (merges_into_target(plan)) {
        return std::nullopt;
    }

    switch (ctx.resolver.resolve(target)) {
        case ConflictAction::Overwrite:
            spdlog::debug("Overwriting {}", target.string());
            return std::nullopt;
        case ConflictAction::Skip:
            spdlog::debug("Skipped {}", target.string());
            return OperationResult::leaf(plan.source_path, Outcome::Skipped);
        case ConflictAction::Abort:
            return OperationResult::aborted(plan.source_path,
                infra::make_error(ErrorCode::Aborted, fmt::format("Aborted by user at {}", target.string())));
    }
    return std::nullopt;
}

auto TransferExecutor::ensure_space(const TransferPlan& plan) const -> infra::VoidResult {
    auto available = probe_.available_space(plan.resolved_target_path.parent_path());
    if (!available) {
        // Не смогли узнать — продолжаем, ENOSPC всё равно будет пойман при записи
        spdlog::warn("{}", available.error().message);
        return {};
    }
    if (*available < plan.size_bytes) {
        return std::unexpected(infra::make_error(ErrorCode::InsufficientSpace,
            fmt::format("Insufficient space for {}: need {} bytes, {} available at {}",
                        plan.source_path.string(), plan.size_bytes, *available,
                        plan.resolved_target_path.parent_path().string())));
    }
    return {};
}

auto TransferExecutor::transfer_file(const TransferPlan& plan, Context& ctx) -> OperationResult {
    if (auto stop = resolve_conflict(plan, ctx)) {
        return std::move(*stop);
    }
    if (plan.strategy == Strategy::AtomicRename) {
        return atomic_rename(plan, ctx);
    }
    return copy_leaf(plan, ctx);
}

auto TransferExecutor::atomic_rename(const TransferPlan& plan, Context& ctx) -> OperationResult {
    const auto& target = plan.resolved_target_path;

    auto renamed = place(plan.source_path, target);
    if (!renamed) {
        if (renamed.error().code == ErrorCode::CrossDeviceError) {
            spdlog::info("{} spans devices, falling back to copy and delete", plan.source_path.string());
            auto fallback = plan;
            fallback.strategy = Strategy::CopyThenDelete;
            return plan.is_directory ? copy_tree(fallback, ctx) : copy_leaf(fallback, ctx);
        }
        return OperationResult::failed(plan.source_path, infra::log_and_return(std::move(renamed.error())));
    }

    advance(ctx, plan.source_path, plan.size_bytes);
    spdlog::debug("Renamed {} -> {}", plan.source_path.string(), target.string());
    return OperationResult::leaf(plan.source_path, Outcome::Succeeded);
}

auto TransferExecutor::write_copy(const TransferPlan& plan,
                                  const std::filesystem::path& staging,
                                  Context& ctx) -> infra::VoidResult
{
    if (is_symlink_no_follow(plan.source_path)) {
        std::error_code ec;
        std::filesystem::copy_symlink(plan.source_path, staging, ec);
        if (ec) {
            return std::unexpected(infra::from_error_code(ec, "Cannot copy symlink", plan.source_path));
        }
        advance(ctx, plan.source_path, 0);
        return {};
    }

    auto copied = ops_.copy_file(
        plan.source_path, staging, config_.chunk_size(),
        [&](std::uint64_t bytes) {
            advance(ctx, plan.source_path, bytes);
            return !infra::is_interrupted();
        });
    if (!copied) {
        return copied;
    }

    auto verified = config_.verify
        ? infra::XXHashVerifier::verify_content(plan.source_path, staging)
        : infra::XXHashVerifier::verify_size(plan.source_path, staging);
    if (!verified) {
        return verified;
    }

    if (config_.preserve_metadata) {
        auto metadata_res = extensions::copy_metadata(plan.source_path, staging);
        if (!metadata_res) {
            spdlog::warn("Failed to copy metadata for {}: {}",
                         plan.source_path.string(), metadata_res.error().message);
        }
    }
    return {};
}

auto TransferExecutor::copy_leaf(const TransferPlan& plan, Context& ctx) -> OperationResult {
    const auto& target = plan.resolved_target_path;

    if (auto space = ensure_space(plan); !space) {
        return OperationResult::failed(plan.source_path, infra::log_and_return(std::move(space.error())));
    }

    const auto staging = adapters::fs::temporary_sibling(target);
    if (adapters::fs::exists_no_follow(staging)) {
        discard(staging);
    }

    if (auto written = write_copy(plan, staging, ctx); !written) {
        discard(staging);
        if (written.error().code == ErrorCode::Interrupted) {
            return OperationResult::aborted(plan.source_path, std::move(written.error()));
        }
        return OperationResult::failed(plan.source_path, infra::log_and_return(std::move(written.error())));
    }

    // Новое содержимое готово — только теперь трогаем цель
    if (auto placed = place(staging, target); !placed) {
        discard(staging);
        return OperationResult::failed(plan.source_path, infra::log_and_return(std::move(placed.error())));
    }

    auto result = OperationResult::leaf(plan.source_path, Outcome::Succeeded);
    if (plan.strategy == Strategy::CopyThenDelete) {
        if (auto removed = ops_.remove(plan.source_path); !removed) {
            // Данные уже в целевом месте, источник просто остался
            spdlog::warn("Copied {} but could not remove the source: {}",
                         plan.source_path.string(), removed.error().message);
            result.warnings.push_back(Warning::SourceRetained);
        }
    }
    spdlog::debug("{} {} -> {}", to_string(plan.strategy), plan.source_path.string(), target.string());
    return result;
}

auto TransferExecutor::transfer_directory(const TransferPlan& plan, Context& ctx) -> OperationResult {
    if (auto stop = resolve_conflict(plan, ctx)) {
        return std::move(*stop);
    }
    if (plan.strategy == Strategy::AtomicRename && !merges_into_target(plan)) {
        return atomic_rename(plan, ctx);
    }
    return copy_tree(plan, ctx);
}

auto TransferExecutor::copy_tree(const TransferPlan& plan, Context& ctx) -> OperationResult {
    const auto& target = plan.resolved_target_path;
    const bool merge = merges_into_target(plan);

    if (is_copy_class(plan.strategy)) {
        if (auto space = ensure_space(plan); !space) {
            return OperationResult::failed(plan.source_path, infra::log_and_return(std::move(space.error())));
        }
    }

    if (!merge && adapters::fs::exists_no_follow(target)) {
        return replace_tree(plan, ctx);
    }
    if (!merge) {
        std::error_code ec;
        std::filesystem::create_directory(target, ec);
        if (ec) {
            return OperationResult::failed(plan.source_path,
                infra::log_and_return(infra::from_error_code(ec, "Cannot create directory", target)));
        }
    }

    auto result = walk_children(plan, target, ctx);

    if (config_.preserve_metadata && !merge) {
        if (auto metadata_res = extensions::copy_metadata(plan.source_path, target); !metadata_res) {
            spdlog::warn("Failed to copy metadata for {}: {}", plan.source_path.string(), metadata_res.error().message);
        }
    }

    // Дети уже перенесены по одному, остался пустой каталог
    if (moves_source(plan.strategy) && result.outcome == Outcome::Succeeded && result.leaves.skipped == 0) {
        if (auto removed = ops_.remove(plan.source_path); !removed) {
            spdlog::warn("Moved contents of {} but could not remove it: {}",
                         plan.source_path.string(), removed.error().message);
            result.warnings.push_back(Warning::SourceRetained);
        }
    }
    return result;
}

auto TransferExecutor::replace_tree(const TransferPlan& plan, Context& ctx) -> OperationResult {
    const auto& target = plan.resolved_target_path;
    const auto staging = adapters::fs::temporary_sibling(target);
    if (adapters::fs::exists_no_follow(staging)) {
        discard(staging);
    }

    std::error_code ec;
    std::filesystem::create_directory(staging, ec);
    if (ec) {
        return OperationResult::failed(plan.source_path,
            infra::log_and_return(infra::from_error_code(ec, "Cannot create directory", staging)));
    }

    // Источник не трогаем, пока новое дерево не встанет на место цели
    auto copy_plan = plan;
    copy_plan.verb = Verb::Copy;
    copy_plan.strategy = Strategy::BufferedCopy;
    auto result = walk_children(copy_plan, staging, ctx);

    if (result.outcome != Outcome::Succeeded) {
        discard(staging);
        // Цель и источник остались как были: это один неудавшийся лист
        result.leaves = OutcomeCounts{};
        result.leaves.add(result.outcome);
        return result;
    }

    if (config_.preserve_metadata) {
        if (auto metadata_res = extensions::copy_metadata(plan.source_path, staging); !metadata_res) {
            spdlog::warn("Failed to copy metadata for {}: {}", plan.source_path.string(), metadata_res.error().message);
        }
    }

    if (auto placed = place(staging, target); !placed) {
        discard(staging);
        return OperationResult::failed(plan.source_path, infra::log_and_return(std::move(placed.error())));
    }
    spdlog::debug("Replaced {} with a copy of {}", target.string(), plan.source_path.string());

    if (moves_source(plan.strategy)) {
        if (auto removed = ops_.remove_all(plan.source_path); !removed) {
            spdlog::warn("Copied {} but could not remove the source: {}",
                         plan.source_path.string(), removed.error().message);
            result.warnings.push_back(Warning::SourceRetained);
        }
    }
    return result;
}

auto TransferExecutor::walk_children(const TransferPlan& plan,
                                     const std::filesystem::path& target_dir,
                                     Context& ctx) -> OperationResult
{
    std::error_code ec;
    std::vector<std::filesystem::path> children;
    for (std::filesystem::directory_iterator it(plan.source_path, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return OperationResult::failed(plan.source_path,
            infra::log_and_return(infra::from_error_code(ec, "Cannot list", plan.source_path)));
    }
    std::sort(children.begin(), children.end());

    OperationResult result;
    result.path = plan.source_path;
    std::optional<infra::Error> first_error;
    std::optional<infra::Error> abort_reason;

    for (const auto& child : children) {
        if (ctx.resolver.aborted()) {
            abort_reason = infra::make_error(ErrorCode::Aborted,
                fmt::format("Aborted by user inside {}", plan.source_path.string()));
            break;
        }
        if (infra::is_interrupted()) {
            abort_reason = interrupted_error(child);
            break;
        }

        auto child_plan = selector_.select_child(plan, child, target_dir / child.filename());
        if (!child_plan) {
            auto failed = OperationResult::failed(child, infra::log_and_return(std::move(child_plan.error())));
            if (!first_error) first_error = failed.error;
            result.leaves.merge(failed.leaves);
            continue;
        }

        auto child_result = run_plan(*child_plan, ctx);
        result.leaves.merge(child_result.leaves);
        result.warnings.insert(result.warnings.end(),
                               child_result.warnings.begin(), child_result.warnings.end());

        if (child_result.outcome == Outcome::Failed && !first_error) {
            first_error = child_result.error;
        }
        if (child_result.outcome == Outcome::Aborted) {
            abort_reason = child_result.error;
            break;
        }
    }

    if (abort_reason) {
        result.outcome = Outcome::Aborted;
        result.error = std::move(abort_reason);
    } else if (first_error) {
        result.outcome = Outcome::Failed;
        result.error = std::move(first_error);
    } else {
        result.outcome = Outcome::Succeeded;
    }

    // Пустой каталог — сам себе лист
    if (result.leaves.total() == 0) {
        result.leaves.add(result.outcome);
    }
    return result;
}

auto TransferExecutor::soft_delete(const TransferPlan& plan) -> OperationResult {
    auto sent = trash_.send(plan.source_path);
    if (!sent) {
        return OperationResult::failed(plan.source_path, infra::log_and_return(std::move(sent.error())));
    }
    spdlog::debug("Sent {} to trash", plan.source_path.string());
    return OperationResult::leaf(plan.source_path, Outcome::Succeeded);
}

} // namespace ftool::core
