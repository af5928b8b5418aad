#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace ftool::core {

struct ProgressEvent {
    std::size_t entry_index = 0;     // 1-based
    std::size_t total_entries = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    std::filesystem::path current_path;
};

/// Receives engine output. The engine decides when to emit; sinks only render.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void on_progress(const ProgressEvent& event) = 0;

    /// Overall signal for large batches, independent of per-file progress.
    virtual void on_batch_progress(std::size_t entries_done, std::size_t total_entries) = 0;

    /// Human-readable status line (verbose mode only).
    virtual void on_status(std::string_view line) = 0;
};

class NullProgressSink final : public ProgressSink {
public:
    void on_progress(const ProgressEvent&) override {}
    void on_batch_progress(std::size_t, std::size_t) override {}
    void on_status(std::string_view) override {}
};

} // namespace ftool::core
