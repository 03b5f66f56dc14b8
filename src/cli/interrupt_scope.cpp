#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <spindle/cli/interrupt_scope.h>
#include <spindle/cli/spindle_cli.h>

#include <signal.h>

namespace spindle::cli {

namespace {

std::atomic<bool> g_interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void onTerminate(int) {
    g_interrupted.store(true, std::memory_order_relaxed);
}

void install(int sig, void (*handler)(int)) {
    struct sigaction sa {};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a pending prompt read returns and is treated as EOF
    if (::sigaction(sig, &sa, nullptr) != 0)
        spdlog::warn("[CLI] Failed to install handler for signal {}", sig);
}

} // namespace

InterruptScope::InterruptScope(SpindleCLI& cli) {
    g_interrupted.store(false, std::memory_order_relaxed);
    install(SIGINT, onTerminate);
    install(SIGTERM, onTerminate);

    watcher_ = std::jthread([&cli](std::stop_token done) {
        using namespace std::chrono_literals;
        while (!done.stop_requested()) {
            if (g_interrupted.load(std::memory_order_relaxed)) {
                spdlog::warn("[CLI] Interrupted; finishing files already started");
                cli.requestStop();
                return;
            }
            std::this_thread::sleep_for(20ms);
        }
    });
}

InterruptScope::~InterruptScope() {
    watcher_.request_stop();
    if (watcher_.joinable())
        watcher_.join();
    install(SIGINT, SIG_DFL);
    install(SIGTERM, SIG_DFL);
}

bool InterruptScope::interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace spindle::cli
