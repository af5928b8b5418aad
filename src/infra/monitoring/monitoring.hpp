#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#include "core/model/progress.hpp"
#include "i18n/messages.hpp"

namespace ftool::infra {

/// Terminal renderer for engine progress. Draws a single self-overwriting
/// line, at most every `kRenderInterval`; status lines are printed above it.
class ProgressMonitor final : public core::ProgressSink {
public:
    struct Stats {
        std::uint64_t bytes_done = 0;
        std::uint64_t bytes_total = 0;
        std::size_t entries_done = 0;
        std::size_t total_entries = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    static constexpr std::chrono::milliseconds kRenderInterval{100};

    ProgressMonitor(const i18n::MessageProvider& messages, bool enabled = true, bool quiet = false,
                    std::FILE* out = stdout);
    ~ProgressMonitor() override;

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void on_progress(const core::ProgressEvent& event) override;
    void on_batch_progress(std::size_t entries_done, std::size_t total_entries) override;
    void on_status(std::string_view line) override;

    [[nodiscard]] auto get_stats() const -> Stats { return stats_; }
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_(bool force);
    void clear_line_();

    const i18n::MessageProvider& messages_;
    const bool enabled_;
    const bool quiet_;
    std::FILE* out_;
    Stats stats_{};
    std::string current_name_;
    std::chrono::steady_clock::time_point last_render_{};
    bool line_dirty_ = false;
};

/// "12.3 MB/s"-style formatting shared by the bar and the final summary.
[[nodiscard]] auto format_rate(double bytes_per_sec) -> std::string;
[[nodiscard]] auto format_bytes(std::uint64_t bytes) -> std::string;

} // namespace ftool::infra
