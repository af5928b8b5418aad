#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>
#include "core/model/operation.hpp"
#include "core/model/progress.hpp"
#include "core/overwrite/overwrite_resolver.hpp"
#include "core/overwrite/prompt.hpp"
#include "core/strategy/strategy_selector.hpp"
#include "core/executor/transfer_executor.hpp"
#include "adapters/fs.hpp"
#include "adapters/trash/trash_store.hpp"
#include "i18n/messages.hpp"
#include "infra/config/config.hpp"

namespace ftool::core {

/// Runs one OperationRequest end to end: destination preparation, then for
/// every source validate → plan → execute, strictly in order. Overwrite state
/// lives for the duration of a single `run`.
class BatchOrchestrator {
public:
    BatchOrchestrator(const infra::Config& config,
                      const i18n::MessageProvider& messages,
                      Prompt& prompt,
                      const adapters::fs::FsProbe& probe,
                      adapters::fs::FsOps& ops,
                      adapters::trash::RecoverableStore& trash,
                      ProgressSink& sink);

    [[nodiscard]] auto run(const OperationRequest& request) -> BatchSummary;

private:
    /// Creates a missing destination (asking first unless auto-mkdir is set).
    /// Returns false when the batch must stop; `summary` is filled in then.
    [[nodiscard]] auto prepare_destination(const OperationRequest& request,
                                           Options& options,
                                           BatchSummary& summary) -> bool;

    void abort_remaining(const OperationRequest& request, std::size_t from,
                         const infra::Error& reason, BatchSummary& summary);
    void fail_all(const OperationRequest& request, const infra::Error& reason, BatchSummary& summary);

    void announce(const OperationRequest& request, const TransferPlan& plan,
                  std::size_t index, std::size_t total);
    void report(const OperationResult& result, bool verbose);

    const infra::Config& config_;
    const i18n::MessageProvider& messages_;
    Prompt& prompt_;
    ProgressSink& sink_;
    StrategySelector selector_;
    TransferExecutor executor_;
};

} // namespace ftool::core
