#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include "core/model/operation.hpp"
#include "core/model/progress.hpp"
#include "core/overwrite/overwrite_resolver.hpp"
#include "core/strategy/strategy_selector.hpp"
#include "adapters/fs.hpp"
#include "adapters/trash/trash_store.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace ftool::core {

struct EntryPosition {
    std::size_t index = 1;   // 1-based
    std::size_t total = 1;
};

/// Carries out one TransferPlan: a file, a symlink, or a whole tree.
///
/// Copies go to a hidden sibling first and replace the target only after the
/// size (or, with verify, the content hash) matches, so an interrupted or
/// failed copy never leaves a half-written target behind. Trees are walked
/// depth-first; finished children are kept when a later one fails. A tree
/// that replaces an existing non-mergeable target is built beside it and
/// swapped in only when every leaf succeeded.
class TransferExecutor {
public:
    TransferExecutor(const infra::Config& config,
                     const StrategySelector& selector,
                     const adapters::fs::FsProbe& probe,
                     adapters::fs::FsOps& ops,
                     adapters::trash::RecoverableStore& trash);

    [[nodiscard]] auto execute(const TransferPlan& plan,
                               OverwriteResolver& resolver,
                               ProgressSink& sink,
                               EntryPosition position = {}) -> OperationResult;

private:
    struct Context {
        OverwriteResolver& resolver;
        ProgressSink& sink;
        ProgressEvent progress;
        bool report = false;
    };

    [[nodiscard]] auto run_plan(const TransferPlan& plan, Context& ctx) -> OperationResult;
    [[nodiscard]] auto transfer_file(const TransferPlan& plan, Context& ctx) -> OperationResult;
    [[nodiscard]] auto transfer_directory(const TransferPlan& plan, Context& ctx) -> OperationResult;
    [[nodiscard]] auto copy_tree(const TransferPlan& plan, Context& ctx) -> OperationResult;
    [[nodiscard]] auto replace_tree(const TransferPlan& plan, Context& ctx) -> OperationResult;
    [[nodiscard]] auto walk_children(const TransferPlan& plan,
                                     const std::filesystem::path& target_dir,
                                     Context& ctx) -> OperationResult;
    [[nodiscard]] auto atomic_rename(const TransferPlan& plan, Context& ctx) -> OperationResult;
    [[nodiscard]] auto copy_leaf(const TransferPlan& plan, Context& ctx) -> OperationResult;
    [[nodiscard]] auto soft_delete(const TransferPlan& plan) -> OperationResult;

    /// Empty optional: go ahead (no conflict, directory merge, or overwrite
    /// granted). Otherwise the Skipped/Aborted/Failed result to return.
    [[nodiscard]] auto resolve_conflict(const TransferPlan& plan, Context& ctx)
        -> std::optional<OperationResult>;

    [[nodiscard]] auto ensure_space(const TransferPlan& plan) const -> infra::VoidResult;
    [[nodiscard]] auto write_copy(const TransferPlan& plan,
                                  const std::filesystem::path& staging,
                                  Context& ctx) -> infra::VoidResult;

    void advance(Context& ctx, const std::filesystem::path& current, std::uint64_t bytes);
    // Переименовывает from -> target; мешающий каталог сначала отодвигается в сторону
    [[nodiscard]] auto place(const std::filesystem::path& from,
                             const std::filesystem::path& target) -> infra::VoidResult;
    void discard(const std::filesystem::path& leftover);

    const infra::Config& config_;
    const StrategySelector& selector_;
    const adapters::fs::FsProbe& probe_;
    adapters::fs::FsOps& ops_;
    adapters::trash::RecoverableStore& trash_;
};

} // namespace ftool::core
