#pragma once

#include <thread>

namespace spindle::cli {

class SpindleCLI;

/**
 * SIGINT/SIGTERM handling for the lifetime of one CLI run.
 *
 * The handler only sets a lock-free flag. A watcher thread notices it and
 * calls SpindleCLI::requestStop(), so running batches finish the files they
 * have started. Destruction restores the default dispositions.
 */
class InterruptScope {
public:
    explicit InterruptScope(SpindleCLI& cli);
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

    // True once a signal arrived while a scope was installed
    static bool interrupted();

private:
    std::jthread watcher_;
};

} // namespace spindle::cli
