#pragma once

#include <cstdio>
#include <cstdint>
#include <string>
#include <chrono>

namespace panannot {

// Progress display on stderr for a batch of independent items.
// Not synchronized: callers serialize tick() themselves.
class Progress {
public:
    Progress(const std::string& label, uint64_t total, bool enabled = true)
        : label_(label), total_(total), enabled_(enabled),
          start_(std::chrono::steady_clock::now()) {}

    // Record one finished item.
    void tick(bool ok) {
        done_++;
        if (!ok) failed_++;
        update();
    }

    void finish() {
        if (!enabled_) return;
        auto now = std::chrono::steady_clock::now();
        auto total_elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            now - start_).count();
        std::fprintf(stderr, "\r%s: done (%lu/%lu items, %lu failed, %lds)\n",
                     label_.c_str(),
                     static_cast<unsigned long>(done_),
                     static_cast<unsigned long>(total_),
                     static_cast<unsigned long>(failed_),
                     static_cast<long>(total_elapsed));
        std::fflush(stderr);
    }

private:
    std::string label_;
    uint64_t total_;
    bool enabled_;
    uint64_t done_ = 0;
    uint64_t failed_ = 0;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_print_;

    void update() {
        if (!enabled_ || total_ == 0) return;

        // Only print at most once per 500ms or at 100%
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - last_print_).count();
        if (elapsed < 500 && done_ < total_) return;

        last_print_ = now;
        double pct = 100.0 * static_cast<double>(done_) / static_cast<double>(total_);
        auto total_elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            now - start_).count();

        std::fprintf(stderr, "\r%s: %.1f%% (%lu/%lu, %lu failed) [%lds]",
                     label_.c_str(), pct,
                     static_cast<unsigned long>(done_),
                     static_cast<unsigned long>(total_),
                     static_cast<unsigned long>(failed_),
                     static_cast<long>(total_elapsed));
        std::fflush(stderr);
    }
};

} // namespace panannot
