#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <ixwebsocket/IXNetSystem.h>
#include <string>
#include <thread>

#include "tuiobridge/TuioBridge.h"

// Global shutdown flag for signal handling
std::atomic<bool> g_shutdown_requested(false);

/**
 * @brief Signal handler for graceful shutdown
 *
 * @param signum Signal number
 */
void signal_handler(int signum) {
    (void)signum;
    g_shutdown_requested.store(true);
}

int main(int argc, char *argv[]) {
    tuiobridge::Configuration config;
    if (!tuiobridge::ConfigurationParser::parseCommandLine(argc, argv, config)) {
        std::cerr << tuiobridge::ConfigurationParser::usage(argv[0]);
        return 1;
    }

    if (config.isHelpRequested()) {
        std::cout << tuiobridge::ConfigurationParser::usage(argv[0]);
        return 0;
    }

    tuiobridge::Logging::setDebug(config.isDebug());
    tuiobridge::logInfo("Starting TuioBridge v" + tuiobridge::getVersionString());
    tuiobridge::logDebug("Effective configuration: " + config.toJson().dump());

    // Set up signal handlers for graceful shutdown
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    ix::initNetSystem();
    int exitCode = 0;

    try {
        tuiobridge::Address udp(config.getUdpHost(), std::to_string(config.getUdpPort()));
        tuiobridge::logInfo("UDP socket created, destination: " + udp.url());

        std::string destination = config.getUdpHost() + ":" + std::to_string(config.getUdpPort());
        tuiobridge::BridgeServer server(
            config.getWsHost(), config.getWsPort(),
            [&udp](const std::vector<std::byte> &datagram) { udp.send(datagram); }, destination);

        server.start();
        tuiobridge::logInfo("Forwarding to UDP " + destination + ". Press Ctrl+C to stop.");

        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        tuiobridge::logInfo("Shutdown requested, stopping server...");
        server.stop();
        tuiobridge::logInfo("UDP socket closed");
    } catch (const tuiobridge::BridgeException &e) {
        tuiobridge::logError(std::string(e.what()) + " (" +
                             tuiobridge::BridgeException::getErrorDescription(e.code()) + ")");
        exitCode = 1;
    } catch (const std::exception &e) {
        tuiobridge::logError("Error: " + std::string(e.what()));
        exitCode = 1;
    }

    ix::uninitNetSystem();
    return exitCode;
}
