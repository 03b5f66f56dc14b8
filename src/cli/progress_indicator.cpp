#include <spindle/cli/progress_indicator.h>
#include <spindle/cli/ui_helpers.hpp>

#include <utility>

namespace spindle::cli {

namespace {

constexpr std::size_t kBarCells = 30;
constexpr const char* kClearLine = "\r\x1b[K";

} // namespace

ProgressIndicator::ProgressIndicator(std::ostream& out)
    : out_(out), interactive_(&out == &std::cout && ui::stdout_is_tty()) {}

ProgressIndicator::~ProgressIndicator() {
    stop();
}

void ProgressIndicator::start(std::string label) {
    label_ = std::move(label);
    currentFile_.clear();
    completed_ = 0;
    discovered_ = 0;
    active_ = true;
    lastDraw_ = std::chrono::steady_clock::now();
    draw();
}

void ProgressIndicator::update(std::size_t completed, std::size_t discovered,
                               const std::string& currentFile) {
    if (!active_)
        return;
    completed_ = completed;
    discovered_ = discovered;
    currentFile_ = currentFile;

    const auto now = std::chrono::steady_clock::now();
    const bool last = discovered_ > 0 && completed_ >= discovered_;
    if (last || now - lastDraw_ >= interval_) {
        lastDraw_ = now;
        draw();
    }
}

void ProgressIndicator::stop() {
    if (!active_)
        return;
    active_ = false;
    if (interactive_)
        out_ << kClearLine << std::flush;
}

void ProgressIndicator::draw() {
    if (!interactive_)
        return;

    std::string line = kClearLine;
    if (discovered_ == 0) {
        line += label_ + "...";
    } else {
        const double fraction = static_cast<double>(completed_) / static_cast<double>(discovered_);
        line += label_ + " " + ui::progress_bar(fraction, kBarCells) + " " +
                std::to_string(completed_) + "/" + std::to_string(discovered_);
        if (!currentFile_.empty())
            line += " " + currentFile_;
    }
    out_ << line << std::flush;
}

} // namespace spindle::cli
