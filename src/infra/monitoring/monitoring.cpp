#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <unistd.h>

namespace ftool::infra {

auto format_bytes(std::uint64_t bytes) -> std::string {
    const char* unit = "B";
    double value = static_cast<double>(bytes);
    if (value >= 1024.0 * 1024 * 1024) { value /= 1024.0 * 1024 * 1024; unit = "GB"; }
    else if (value >= 1024.0 * 1024) { value /= 1024.0 * 1024; unit = "MB"; }
    else if (value >= 1024.0) { value /= 1024.0; unit = "KB"; }
    else return fmt::format("{} B", bytes);
    return fmt::format("{:.1f} {}", value, unit);
}

auto format_rate(double bytes_per_sec) -> std::string {
    if (!std::isfinite(bytes_per_sec) || bytes_per_sec <= 0) {
        return "-- B/s";
    }
    return format_bytes(static_cast<std::uint64_t>(bytes_per_sec)) + "/s";
}

ProgressMonitor::ProgressMonitor(const i18n::MessageProvider& messages, bool enabled, bool quiet,
                                 std::FILE* out)
    : messages_(messages)
    // Полоса только для терминала
    , enabled_(enabled && !quiet && ::isatty(::fileno(out)) == 1)
    , quiet_(quiet)
    , out_(out)
{
    stats_.start_time = std::chrono::steady_clock::now();
}

ProgressMonitor::~ProgressMonitor() {
    if (line_dirty_) {
        render_(true);
        std::fputs("\n", out_); // финальный перенос
        std::fflush(out_);
    }
}

void ProgressMonitor::on_progress(const core::ProgressEvent& event) {
    stats_.bytes_done = event.bytes_done;
    stats_.bytes_total = event.bytes_total;
    current_name_ = event.current_path.filename().string();
    if (stats_.total_entries == 0) {
        stats_.total_entries = event.total_entries;
    }
    render_(event.bytes_done >= event.bytes_total);
}

void ProgressMonitor::on_batch_progress(std::size_t entries_done, std::size_t total_entries) {
    stats_.entries_done = entries_done;
    stats_.total_entries = total_entries;
    render_(entries_done == total_entries);
}

void ProgressMonitor::on_status(std::string_view line) {
    if (quiet_) return;
    clear_line_();
    fmt::print(out_, "{}\n", line);
    std::fflush(out_);
    if (line_dirty_) {
        render_(true);
    }
}

void ProgressMonitor::clear_line_() {
    if (enabled_ && line_dirty_) {
        std::fputs("\r\033[K", out_); // ANSI: очистить строку
    }
}

void ProgressMonitor::render_(bool force) {
    if (!enabled_) return;

    const auto now = std::chrono::steady_clock::now();
    if (!force && line_dirty_ && now - last_render_ < kRenderInterval) {
        return;
    }
    last_render_ = now;

    const int bar_width = 20;
    const double ratio = stats_.bytes_total > 0
        ? std::min(1.0, static_cast<double>(stats_.bytes_done) / static_cast<double>(stats_.bytes_total))
        : 1.0;
    const int filled = static_cast<int>(ratio * bar_width);

    const auto elapsed_sec = std::chrono::duration<double>(now - stats_.start_time).count();
    const double bytes_per_sec = elapsed_sec > 0 ? stats_.bytes_done / elapsed_sec : 0.0;

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    std::string line = fmt::format("[{}] {:5.1f}% {} | {}", bar, ratio * 100.0,
                                   format_rate(bytes_per_sec), current_name_);
    if (stats_.total_entries > 1) {
        line += " | " + i18n::format(messages_, "batch_progress",
                                     fmt::arg("current", stats_.entries_done),
                                     fmt::arg("total", stats_.total_entries));
    }

    std::fputs("\r\033[K", out_);
    fmt::print(out_, "{}", line);
    std::fflush(out_);
    line_dirty_ = true;
}

} // namespace ftool::infra
