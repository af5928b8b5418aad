#pragma once

#include <filesystem>
#include <string_view>
#include "core/model/operation.hpp"
#include "core/overwrite/prompt.hpp"

namespace ftool::core {

/// Batch-wide answer state. Ask is the only state that prompts.
enum class OverwriteDecision {
    Ask,
    AlwaysOverwrite,
    AlwaysSkip,
    Aborted
};

[[nodiscard]] auto to_string(OverwriteDecision decision) -> std::string_view;

/// What to do with one conflicting target.
enum class ConflictAction {
    Overwrite,
    Skip,
    Abort
};

/// Overwrite state machine for one invocation. Owned by the batch
/// orchestrator; never shared between invocations.
///
///   input       effect
///   y / empty   overwrite this one
///   n           skip this one
///   a           overwrite, then AlwaysOverwrite
///   s           skip, then AlwaysSkip
///   q           Aborted (terminal)
///
/// --force seeds AlwaysOverwrite and --no-clobber AlwaysSkip; the prompt is
/// then never called.
class OverwriteResolver {
public:
    OverwriteResolver(Prompt& prompt, const Options& options);

    [[nodiscard]] auto resolve(const std::filesystem::path& target) -> ConflictAction;

    [[nodiscard]] auto state() const -> OverwriteDecision { return state_; }
    [[nodiscard]] auto aborted() const -> bool { return state_ == OverwriteDecision::Aborted; }

    // Внешняя остановка (сигнал), дальше вопросов не будет
    void abort() { state_ = OverwriteDecision::Aborted; }

private:
    Prompt& prompt_;
    OverwriteDecision state_ = OverwriteDecision::Ask;
};

/// Yes/no for creating a missing target directory. Empty answer means yes;
/// 'q' and a closed input mean no.
[[nodiscard]] auto confirm_directory_creation(Prompt& prompt, const std::filesystem::path& directory) -> bool;

} // namespace ftool::core
