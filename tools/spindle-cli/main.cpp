#include <exception>
#include <memory>
#include <utility>

#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>
#include <spindle/cli/interrupt_scope.h>
#include <spindle/cli/spindle_cli.h>

namespace {

void installLogger() {
    // stdout carries listings and JSON; diagnostics go to stderr
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("spindle", std::move(sink));
    logger->set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_default_logger(std::move(logger));
    spdlog::set_level(spdlog::level::warn);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        installLogger();
        spindle::cli::SpindleCLI cli;
        spindle::cli::InterruptScope interrupts(cli);
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("spindle: {}", e.what());
        return 1;
    }
}
