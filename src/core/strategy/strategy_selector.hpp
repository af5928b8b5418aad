#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include "core/model/operation.hpp"
#include "adapters/fs.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace ftool::core {

struct PlanInput {
    Verb verb = Verb::Move;
    std::filesystem::path source;
    std::optional<std::filesystem::path> destination;
    std::size_t entry_count = 1;   // размер пакета, влияет на показ прогресса
};

/// Turns one validated entry into a TransferPlan.
///
/// Decision table:
///   Remove                         -> SoftDelete
///   Backup                         -> CopyOnly, target from the backup naming rule
///   Move/Rename, same device       -> AtomicRename
///   Move/Rename, other device      -> CopyThenDelete
///   Copy, any device               -> BufferedCopy
class StrategySelector {
public:
    StrategySelector(const infra::Config& config, const adapters::fs::FsProbe& probe);

    [[nodiscard]] auto select(const PlanInput& input) const -> infra::Result<TransferPlan>;

    /// Plan for one child of a directory being transferred. The child keeps the
    /// parent's verb and progress setting; its strategy is decided again since
    /// a tree may span mount points.
    [[nodiscard]] auto select_child(const TransferPlan& parent,
                                    const std::filesystem::path& child_source,
                                    const std::filesystem::path& child_target) const
        -> infra::Result<TransferPlan>;

    /// `<name>.bak`, then `<name>.bak2`, `<name>.bak3`, ... first unused name
    /// beside the source.
    [[nodiscard]] static auto backup_path_for(const std::filesystem::path& source)
        -> infra::Result<std::filesystem::path>;

    static constexpr int kMaxBackupCandidates = 10000;

private:
    [[nodiscard]] auto resolve_target(const PlanInput& input) const -> infra::Result<std::filesystem::path>;
    [[nodiscard]] auto strategy_for(Verb verb,
                                    const std::filesystem::path& source,
                                    const std::filesystem::path& target) const
        -> infra::Result<Strategy>;

    const infra::Config& config_;
    const adapters::fs::FsProbe& probe_;
};

} // namespace ftool::core
