#include "agent.h"
#include "logging.h"
#include <csignal>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

std::atomic<int> received_signal(0);

void signalHandler(int signal) {
    received_signal = signal;
}

int main(int argc, char** argv) {
    std::string config_path = "/etc/fleet-agent/agent.json";

    if (argc > 1) {
        config_path = argv[1];
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        logInfo("main", "Fleet agent starting, using config: " + config_path);

        Agent agent(config_path);
        agent.start();

        while (received_signal == 0 && agent.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (received_signal != 0) {
            logInfo("main", "Received signal " + std::to_string(received_signal.load()) +
                    ", shutting down gracefully");
        }
        logInfo("main", "Stopping agent");
        agent.stop();

        logInfo("main", "Fleet agent stopped successfully");
        return 0;

    } catch (const std::exception& e) {
        logError("main", std::string("[FATAL] ") + e.what());
        return 1;
    }
}
