#include "tuiobridge/ConfigurationParser.h"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "tuiobridge/Configuration.h"
#include "tuiobridge/Logging.h"

namespace tuiobridge {

    namespace {
        bool takesValue(const std::string &arg) {
            return arg == "--ws-host" || arg == "--ws-port" || arg == "--udp-host" ||
                   arg == "--udp-port" || arg == "--config";
        }

        bool readString(const nlohmann::json &json, const char *key, std::string &value) {
            auto it = json.find(key);
            if (it == json.end()) {
                return true;
            }
            if (!it->is_string() || it->get<std::string>().empty()) {
                logError(std::string("Configuration key \"") + key + "\" must be a non-empty string");
                return false;
            }
            value = it->get<std::string>();
            return true;
        }

        bool readPort(const nlohmann::json &json, const char *key, int &value) {
            auto it = json.find(key);
            if (it == json.end()) {
                return true;
            }
            if (!it->is_number_integer()) {
                logError(std::string("Configuration key \"") + key + "\" must be an integer");
                return false;
            }
            int64_t port = it->get<int64_t>();
            if (port < 1 || port > 65535) {
                logError(std::string("Configuration key \"") + key + "\" is out of range (1-65535): " +
                         std::to_string(port));
                return false;
            }
            value = static_cast<int>(port);
            return true;
        }
    }  // namespace

    bool ConfigurationParser::parseCommandLine(int argc, char *argv[], Configuration &config) {
        // Pass 1: the configuration file, so explicit flags win over it
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (takesValue(arg)) {
                if (i + 1 >= argc) {
                    logError("Missing value for " + arg);
                    return false;
                }
                if (arg == "--config" && !parseJsonFile(argv[i + 1], config)) {
                    return false;
                }
                ++i;
            }
        }

        // Pass 2: everything else
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                config.setHelpRequested(true);
            } else if (arg == "--debug") {
                config.setDebug(true);
            } else if (arg == "--ws-host") {
                config.setWsHost(argv[++i]);
            } else if (arg == "--ws-port") {
                int port = 0;
                if (!parsePort(argv[++i], arg, port)) {
                    return false;
                }
                config.setWsPort(port);
            } else if (arg == "--udp-host") {
                config.setUdpHost(argv[++i]);
            } else if (arg == "--udp-port") {
                int port = 0;
                if (!parsePort(argv[++i], arg, port)) {
                    return false;
                }
                config.setUdpPort(port);
            } else if (arg == "--config") {
                ++i;
            } else {
                logError("Unknown argument: " + arg);
                return false;
            }
        }

        if (config.isHelpRequested()) {
            return true;
        }

        std::string error;
        if (!config.validate(error)) {
            logError("Invalid configuration: " + error);
            return false;
        }
        return true;
    }

    bool ConfigurationParser::parseJsonFile(const std::string &filePath, Configuration &config) {
        std::ifstream file(filePath);
        if (!file.is_open()) {
            logError("Failed to open configuration file: " + filePath);
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (!parseJsonString(buffer.str(), config)) {
            logError("Failed to load configuration file: " + filePath);
            return false;
        }
        return true;
    }

    bool ConfigurationParser::parseJsonString(const std::string &jsonContent,
                                              Configuration &config) {
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(jsonContent);
        } catch (const nlohmann::json::parse_error &e) {
            logError("Configuration is not valid JSON: " + std::string(e.what()));
            return false;
        }
        return applyJson(json, config);
    }

    bool ConfigurationParser::applyJson(const nlohmann::json &json, Configuration &config) {
        if (!json.is_object()) {
            logError("Configuration must be a JSON object");
            return false;
        }

        std::string wsHost = config.getWsHost();
        int wsPort = config.getWsPort();
        std::string udpHost = config.getUdpHost();
        int udpPort = config.getUdpPort();
        if (!readString(json, "wsHost", wsHost) || !readPort(json, "wsPort", wsPort) ||
            !readString(json, "udpHost", udpHost) || !readPort(json, "udpPort", udpPort)) {
            return false;
        }

        auto debug = json.find("debug");
        if (debug != json.end()) {
            if (!debug->is_boolean()) {
                logError("Configuration key \"debug\" must be a boolean");
                return false;
            }
            config.setDebug(debug->get<bool>());
        }

        // Unknown keys are ignored
        config.setWsHost(wsHost);
        config.setWsPort(wsPort);
        config.setUdpHost(udpHost);
        config.setUdpPort(udpPort);
        return true;
    }

    bool ConfigurationParser::parsePort(const std::string &text, const std::string &option,
                                        int &port) {
        size_t consumed = 0;
        int value = 0;
        try {
            value = std::stoi(text, &consumed);
        } catch (const std::invalid_argument &) {
            logError("Invalid value for " + option + ": " + text);
            return false;
        } catch (const std::out_of_range &) {
            logError("Value for " + option + " is out of range: " + text);
            return false;
        }

        if (consumed != text.size()) {
            logError("Invalid value for " + option + ": " + text);
            return false;
        }
        if (!Configuration::isValidPort(value)) {
            logError("Value for " + option + " is out of range (1-65535): " + text);
            return false;
        }
        port = value;
        return true;
    }

    std::string ConfigurationParser::usage(const std::string &programName) {
        std::ostringstream ss;
        ss << "Usage: " << programName << " [options]\n"
           << "\n"
           << "Relays JSON-encoded OSC packets received over WebSocket to a UDP\n"
           << "destination as binary OSC (for TUIO clients).\n"
           << "\n"
           << "Options:\n"
           << "  --ws-host <host>    WebSocket listen address (default: "
           << Configuration::DEFAULT_WS_HOST << ")\n"
           << "  --ws-port <port>    WebSocket listen port (default: "
           << Configuration::DEFAULT_WS_PORT << ")\n"
           << "  --udp-host <host>   UDP destination address (default: "
           << Configuration::DEFAULT_UDP_HOST << ")\n"
           << "  --udp-port <port>   UDP destination port (default: "
           << Configuration::DEFAULT_UDP_PORT << ")\n"
           << "  --config <file>     Load settings from a JSON file; other flags override it\n"
           << "  --debug             Enable debug logging\n"
           << "  -h, --help          Show this help and exit\n";
        return ss.str();
    }

}  // namespace tuiobridge
