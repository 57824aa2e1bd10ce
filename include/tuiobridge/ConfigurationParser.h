/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header file declares the ConfigurationParser, which fills a
 *  Configuration from the command line and from JSON documents.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace tuiobridge {

    // Forward declarations
    class Configuration;

    /**
     * @brief Parser for bridge configuration from different sources
     *
     * Every method reports problems through the log and a false return; the
     * configuration may be partially updated when that happens.
     */
    class ConfigurationParser {
       public:
        /**
         * @brief Parse configuration from command line arguments
         *
         * A file named with --config is applied first, so that the other flags
         * override its values regardless of their position.
         *
         * @param argc Argument count
         * @param argv Argument values
         * @param config Configuration to fill
         * @return bool True if parsing was successful
         */
        static bool parseCommandLine(int argc, char *argv[], Configuration &config);

        /**
         * @brief Parse configuration from a JSON file
         *
         * @param filePath Path to the JSON file
         * @param config Configuration to fill
         * @return bool True if parsing was successful
         */
        static bool parseJsonFile(const std::string &filePath, Configuration &config);

        /**
         * @brief Parse configuration from a JSON string
         *
         * @param jsonContent JSON content as string
         * @param config Configuration to fill
         * @return bool True if parsing was successful
         */
        static bool parseJsonString(const std::string &jsonContent, Configuration &config);

        /**
         * @brief Build the --help text
         * @param programName argv[0]
         */
        static std::string usage(const std::string &programName);

       private:
        static bool applyJson(const nlohmann::json &json, Configuration &config);

        static bool parsePort(const std::string &text, const std::string &option, int &port);
    };

}  // namespace tuiobridge
