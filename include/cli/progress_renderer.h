#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace wcache {
namespace cli {

/// Single-line download progress ("small 45% [=========>   ] 210.3 MB/466.0 MB 12.1 MB/s ETA 21s")
class ProgressRenderer {
public:
    /// @param total_bytes Total bytes to download (0 if unknown)
    /// @param out Stream to draw on (stderr keeps stdout clean for piping)
    explicit ProgressRenderer(uint64_t total_bytes = 0, std::ostream& out = std::cerr);

    /// Redraw with the bytes received so far. Speed is derived from the
    /// elapsed time; redraws are limited to ~10 per second except the last one.
    void update(uint64_t downloaded_bytes);

    /// Mark as completed
    void complete();

    /// Mark as failed
    void fail(const std::string& error_message);

    /// Label printed in front of the bar (e.g. the model name)
    void setPhase(const std::string& phase);

    void setTotal(uint64_t total_bytes) { total_bytes_ = total_bytes; }

    /// @return e.g. " 45% [========>           ]"
    static std::string formatProgressBar(uint64_t downloaded_bytes, uint64_t total_bytes, int width = 20);

    /// @return e.g. "6.4 GB", "128.0 MB"
    static std::string formatBytes(uint64_t bytes);

    /// @return e.g. "45.2 MB/s"
    static std::string formatSpeed(double bps);

    /// @return e.g. "2m 30s", "45s"
    static std::string formatDuration(double seconds);

private:
    std::ostream& out_;
    uint64_t total_bytes_;
    uint64_t downloaded_bytes_{0};
    std::string phase_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_draw_;
    size_t last_length_{0};
    bool drawn_{false};
    bool completed_{false};
    bool failed_{false};

    /// Clear current line and print new content
    void clearAndPrint(const std::string& content);
};

}  // namespace cli
}  // namespace wcache
