#include "cli/progress_renderer.h"
#include <iomanip>
#include <sstream>
#include <cmath>

namespace wcache {
namespace cli {

ProgressRenderer::ProgressRenderer(uint64_t total_bytes, std::ostream& out)
    : out_(out)
    , total_bytes_(total_bytes)
    , start_time_(std::chrono::steady_clock::now())
    , last_draw_(start_time_)
{
}

void ProgressRenderer::update(uint64_t downloaded_bytes) {
    if (completed_ || failed_) {
        return;
    }

    downloaded_bytes_ = downloaded_bytes;

    const auto now = std::chrono::steady_clock::now();
    const bool finished = total_bytes_ > 0 && downloaded_bytes_ >= total_bytes_;
    if (drawn_ && !finished && now - last_draw_ < std::chrono::milliseconds(100)) {
        return;
    }
    last_draw_ = now;
    drawn_ = true;

    const double elapsed = std::chrono::duration<double>(now - start_time_).count();
    const double speed_bps = elapsed > 0.0 ? static_cast<double>(downloaded_bytes_) / elapsed : 0.0;

    std::ostringstream oss;
    if (!phase_.empty()) {
        oss << phase_ << " ";
    }
    if (total_bytes_ > 0) {
        oss << formatProgressBar(downloaded_bytes_, total_bytes_) << " ";
    }
    oss << formatBytes(downloaded_bytes_);
    if (total_bytes_ > 0) {
        oss << "/" << formatBytes(total_bytes_);
    }
    if (speed_bps > 0) {
        oss << " " << formatSpeed(speed_bps);
    }
    if (total_bytes_ > 0 && speed_bps > 0 && downloaded_bytes_ < total_bytes_) {
        const double remaining = static_cast<double>(total_bytes_ - downloaded_bytes_);
        oss << " ETA " << formatDuration(remaining / speed_bps);
    }

    clearAndPrint(oss.str());
}

void ProgressRenderer::complete() {
    if (completed_ || failed_) {
        return;
    }
    completed_ = true;

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
    const double seconds = duration.count() / 1000.0;

    std::ostringstream oss;
    if (!phase_.empty()) {
        oss << phase_ << " ";
    }
    oss << "complete";
    const uint64_t shown = total_bytes_ > 0 ? total_bytes_ : downloaded_bytes_;
    if (shown > 0) {
        oss << " " << formatBytes(shown);
    }
    if (seconds > 0) {
        oss << " in " << formatDuration(seconds);
    }

    clearAndPrint(oss.str());
    out_ << std::endl;
}

void ProgressRenderer::fail(const std::string& error_message) {
    if (completed_ || failed_) {
        return;
    }
    failed_ = true;

    std::ostringstream oss;
    if (!phase_.empty()) {
        oss << phase_ << " ";
    }
    oss << "failed: " << error_message;

    clearAndPrint(oss.str());
    out_ << std::endl;
}

void ProgressRenderer::setPhase(const std::string& phase) {
    phase_ = phase;
}

std::string ProgressRenderer::formatProgressBar(uint64_t downloaded_bytes, uint64_t total_bytes, int width) {
    if (total_bytes == 0) {
        return "";
    }

    double progress = static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes);
    if (progress > 1.0) progress = 1.0;
    const int filled = static_cast<int>(progress * width);

    std::ostringstream oss;
    oss << std::setw(3) << static_cast<int>(progress * 100) << "% [";
    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }
    oss << "]";
    return oss.str();
}

std::string ProgressRenderer::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << static_cast<uint64_t>(size) << " " << units[unit_index];
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    }
    return oss.str();
}

std::string ProgressRenderer::formatSpeed(double bps) {
    const char* units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
    int unit_index = 0;
    double speed = bps;

    while (speed >= 1024.0 && unit_index < 3) {
        speed /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << speed << " " << units[unit_index];
    return oss.str();
}

std::string ProgressRenderer::formatDuration(double seconds) {
    std::ostringstream oss;

    if (seconds < 60) {
        oss << static_cast<int>(std::ceil(seconds)) << "s";
    } else if (seconds < 3600) {
        const int minutes = static_cast<int>(seconds / 60);
        const int secs = static_cast<int>(seconds) % 60;
        oss << minutes << "m " << secs << "s";
    } else {
        const int hours = static_cast<int>(seconds / 3600);
        const int minutes = (static_cast<int>(seconds) % 3600) / 60;
        oss << hours << "h " << minutes << "m";
    }
    return oss.str();
}

void ProgressRenderer::clearAndPrint(const std::string& content) {
    out_ << "\r" << content;

    // Pad with spaces to clear what is left of a longer previous line
    if (content.length() < last_length_) {
        out_ << std::string(last_length_ - content.length(), ' ');
        out_ << "\r" << content;
    }
    last_length_ = content.length();

    out_.flush();
}

}  // namespace cli
}  // namespace wcache
