/**
 * @file main.cpp
 * @brief Main entry point for proctord, the interview proctoring engine
 *
 * Starts the following components:
 * - Execution backend selection (container engine API, container CLI, or disabled)
 * - Sandbox runner with its worker pool
 * - Anti-cheat session store and metrics aggregator
 * - Interactive operator console
 */

#include <memory>
#include <csignal>
#include <atomic>
#include <chrono>
#include <thread>
#include <string>
#include <cstdlib>
#include <iostream>

#include "config/engine_properties.h"
#include "sandbox/backend_selector.h"
#include "sandbox/command_resolver.h"
#include "sandbox/sandbox_runner.h"
#include "anticheat/session_store.h"
#include "anticheat/metrics_aggregator.h"
#include "console/command_handler.h"
#include "utils/log.h"

std::atomic<bool> g_running{true};
proctor::console::CommandHandler* g_commandHandler = nullptr;

namespace {

constexpr auto EVICTION_INTERVAL = std::chrono::seconds(60);

}

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int signal) {
    LOGW_FMT("Received signal " << signal << ", initiating graceful shutdown...");
    g_running = false;

    if (g_commandHandler) {
        g_commandHandler->requestExit();
        // Print newline to help readline exit cleanly
        std::cout << "\n";
    }
}

/**
 * Resolve the configuration file from PROCTOR_CONFIG
 */
proctor::EngineProperties setupEngineProperties() {
    const char* configPath = std::getenv("PROCTOR_CONFIG");
    std::string configFile = configPath ? configPath : "./config/proctor.json";

    return proctor::loadEngineConfig(configFile);
}

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    LOGI("========================================");
    LOGI("Proctor - Interview Proctoring Engine");
    LOGI("         Version 1.0.0");
    LOGI("========================================");

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // Sandboxed programs may exit before consuming their stdin
    std::signal(SIGPIPE, SIG_IGN);

    try {
        LOGI("Loading engine configuration...");
        proctor::EngineProperties properties = setupEngineProperties();
        proctor::utils::setLogLevel(proctor::utils::parseLogLevel(properties.getLogLevel()));

        if (!properties.validate()) {
            LOGE("Invalid engine configuration");
            return 1;
        }

        LOGI("Selecting execution backend...");
        proctor::sandbox::BackendSelection selection = proctor::sandbox::BackendSelector(properties).select();

        proctor::sandbox::SandboxRunner runner(selection, proctor::sandbox::CommandResolver(properties), properties);

        proctor::anticheat::SessionStore sessions(properties.getSessionTtl());
        proctor::anticheat::MetricsAggregator aggregator(sessions);

        LOGI("Engine is running. Starting interactive command interface...\n");

        proctor::console::CommandHandler commandHandler(runner, aggregator);
        g_commandHandler = &commandHandler;

        std::atomic<bool> consoleFinished{false};
        std::thread commandThread([&commandHandler, &consoleFinished]() {
            commandHandler.runInteractive();
            consoleFinished = true;
            g_running = false;
        });

        // Main loop - expire idle sessions until shutdown
        auto lastEviction = std::chrono::steady_clock::now();
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));

            auto now = std::chrono::steady_clock::now();
            if (now - lastEviction >= EVICTION_INTERVAL) {
                size_t evicted = sessions.evictExpired(now);
                if (evicted > 0) {
                    LOGI_FMT("Evicted " << evicted << " idle session(s)");
                }
                lastEviction = now;
            }
        }

        // Give readline 2 seconds to return, then detach
        auto start = std::chrono::steady_clock::now();
        while (!consoleFinished &&
               std::chrono::steady_clock::now() - start < std::chrono::seconds(2)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (consoleFinished) {
            commandThread.join();
        } else {
            LOGW("Command thread did not exit cleanly, detaching...");
            commandThread.detach();
            // The console still references stack objects; leave without unwinding
            std::exit(0);
        }

        g_commandHandler = nullptr;

        LOGI("Waiting for queued executions...");
    } catch (const std::exception& e) {
        LOGF_FMT("Fatal error: " << e.what());
        return 1;
    }

    LOGI("Shutdown complete");
    return 0;
}
