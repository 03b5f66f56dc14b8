#pragma once

#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>

namespace spindle::cli {

/**
 * @brief One-line "[####    ] 9/16 job.tap" display for a running batch
 *
 * Redraws in place when the stream is a terminal and is silent otherwise, so
 * piped output carries only the final summary. Redraws are throttled; the
 * last file of a batch is always drawn.
 *
 * Not synchronized: callers feed it from the batch progress callback, which
 * the accumulator already serializes.
 */
class ProgressIndicator {
public:
    explicit ProgressIndicator(std::ostream& out = std::cout);
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;

    void start(std::string label);

    void update(std::size_t completed, std::size_t discovered, const std::string& currentFile);

    // Erase the line; no-op when never started
    void stop();

    bool isActive() const { return active_; }

    void setInteractive(bool interactive) { interactive_ = interactive; }
    void setRedrawInterval(std::chrono::milliseconds interval) { interval_ = interval; }

private:
    void draw();

    std::ostream& out_;
    bool interactive_;
    bool active_ = false;
    std::string label_;
    std::string currentFile_;
    std::size_t completed_ = 0;
    std::size_t discovered_ = 0;
    std::chrono::milliseconds interval_{100};
    std::chrono::steady_clock::time_point lastDraw_{};
};

} // namespace spindle::cli
