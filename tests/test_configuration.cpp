#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

#include "tuiobridge/Configuration.h"
#include "tuiobridge/ConfigurationParser.h"

using namespace tuiobridge;

namespace {
    // Builds a mutable argv for parseCommandLine
    class Arguments {
       public:
        Arguments(std::initializer_list<std::string> args) : storage_(args) {
            for (auto& arg : storage_) {
                pointers_.push_back(&arg[0]);
            }
            pointers_.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(storage_.size()); }
        char** argv() { return pointers_.data(); }

       private:
        std::vector<std::string> storage_;
        std::vector<char*> pointers_;
    };

    std::string writeTempFile(const std::string& content) {
        char path[] = "/tmp/tuiobridge_config_XXXXXX";
        int fd = mkstemp(path);
        if (fd >= 0) {
            close(fd);
        }
        std::ofstream file(path);
        file << content;
        return path;
    }
}  // namespace

TEST(Configuration, Defaults) {
    Configuration config;
    EXPECT_EQ(config.getWsHost(), "0.0.0.0");
    EXPECT_EQ(config.getWsPort(), 8080);
    EXPECT_EQ(config.getUdpHost(), "127.0.0.1");
    EXPECT_EQ(config.getUdpPort(), 3333);
    EXPECT_FALSE(config.isDebug());
    EXPECT_FALSE(config.isHelpRequested());

    std::string error;
    EXPECT_TRUE(config.validate(error));
}

TEST(Configuration, Validate) {
    Configuration config;
    std::string error;

    config.setWsPort(0);
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("WebSocket port"), std::string::npos);

    config.setWsPort(8080);
    config.setUdpPort(70000);
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("UDP port"), std::string::npos);

    config.setUdpPort(3333);
    config.setUdpHost("");
    EXPECT_FALSE(config.validate(error));
}

TEST(Configuration, ToJson) {
    Configuration config;
    config.setUdpPort(4444);
    config.setDebug(true);

    nlohmann::json json = config.toJson();
    EXPECT_EQ(json["wsHost"].get<std::string>(), "0.0.0.0");
    EXPECT_EQ(json["wsPort"].get<int>(), 8080);
    EXPECT_EQ(json["udpHost"].get<std::string>(), "127.0.0.1");
    EXPECT_EQ(json["udpPort"].get<int>(), 4444);
    EXPECT_TRUE(json["debug"].get<bool>());

    // The serialized form loads back into an equal configuration
    Configuration reloaded;
    ASSERT_TRUE(ConfigurationParser::parseJsonString(json.dump(), reloaded));
    EXPECT_EQ(reloaded.toJson(), json);
}

TEST(ConfigurationParser, CommandLineFlags) {
    Arguments args = {"tuiobridge", "--ws-host", "127.0.0.1", "--ws-port", "9000",
                      "--udp-host", "10.0.0.2", "--udp-port", "3334", "--debug"};
    Configuration config;
    ASSERT_TRUE(ConfigurationParser::parseCommandLine(args.argc(), args.argv(), config));

    EXPECT_EQ(config.getWsHost(), "127.0.0.1");
    EXPECT_EQ(config.getWsPort(), 9000);
    EXPECT_EQ(config.getUdpHost(), "10.0.0.2");
    EXPECT_EQ(config.getUdpPort(), 3334);
    EXPECT_TRUE(config.isDebug());
}

TEST(ConfigurationParser, NoArgumentsKeepsDefaults) {
    Arguments args = {"tuiobridge"};
    Configuration config;
    ASSERT_TRUE(ConfigurationParser::parseCommandLine(args.argc(), args.argv(), config));
    EXPECT_EQ(config.getWsPort(), 8080);
    EXPECT_EQ(config.getUdpPort(), 3333);
}

TEST(ConfigurationParser, Help) {
    Arguments args = {"tuiobridge", "--help"};
    Configuration config;
    ASSERT_TRUE(ConfigurationParser::parseCommandLine(args.argc(), args.argv(), config));
    EXPECT_TRUE(config.isHelpRequested());

    std::string usage = ConfigurationParser::usage("tuiobridge");
    EXPECT_NE(usage.find("--udp-port"), std::string::npos);
    EXPECT_NE(usage.find("3333"), std::string::npos);
}

TEST(ConfigurationParser, RejectsBadArguments) {
    Configuration config;

    Arguments unknown = {"tuiobridge", "--verbose"};
    EXPECT_FALSE(ConfigurationParser::parseCommandLine(unknown.argc(), unknown.argv(), config));

    Arguments missingValue = {"tuiobridge", "--udp-port"};
    EXPECT_FALSE(
        ConfigurationParser::parseCommandLine(missingValue.argc(), missingValue.argv(), config));

    Arguments notANumber = {"tuiobridge", "--ws-port", "80a"};
    EXPECT_FALSE(
        ConfigurationParser::parseCommandLine(notANumber.argc(), notANumber.argv(), config));

    Arguments outOfRange = {"tuiobridge", "--udp-port", "65536"};
    EXPECT_FALSE(
        ConfigurationParser::parseCommandLine(outOfRange.argc(), outOfRange.argv(), config));

    Arguments zero = {"tuiobridge", "--ws-port", "0"};
    EXPECT_FALSE(ConfigurationParser::parseCommandLine(zero.argc(), zero.argv(), config));
}

TEST(ConfigurationParser, JsonString) {
    Configuration config;
    ASSERT_TRUE(ConfigurationParser::parseJsonString(
        R"({"udpHost":"192.168.1.20","udpPort":3335,"debug":true,"comment":"ignored"})", config));

    EXPECT_EQ(config.getUdpHost(), "192.168.1.20");
    EXPECT_EQ(config.getUdpPort(), 3335);
    EXPECT_TRUE(config.isDebug());

    // Keys that are absent keep their previous values
    EXPECT_EQ(config.getWsHost(), "0.0.0.0");
    EXPECT_EQ(config.getWsPort(), 8080);
}

TEST(ConfigurationParser, JsonStringRejectsBadValues) {
    Configuration config;
    EXPECT_FALSE(ConfigurationParser::parseJsonString("{not json", config));
    EXPECT_FALSE(ConfigurationParser::parseJsonString("[1, 2]", config));
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"wsPort":"8080"})", config));
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"wsPort":0})", config));
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"udpPort":99999})", config));
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"udpHost":""})", config));
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"debug":"yes"})", config));

    // A rejected document leaves the ports untouched
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"wsPort":9001,"udpPort":-1})", config));
    EXPECT_EQ(config.getWsPort(), 8080);
}

TEST(ConfigurationParser, JsonFileThenFlagsOverride) {
    std::string path = writeTempFile(R"({"wsPort":9100,"udpHost":"10.1.1.1","udpPort":4000})");

    // The flag comes before --config but still wins
    Arguments args = {"tuiobridge", "--udp-port", "4001", "--config", path};
    Configuration config;
    ASSERT_TRUE(ConfigurationParser::parseCommandLine(args.argc(), args.argv(), config));

    EXPECT_EQ(config.getWsPort(), 9100);
    EXPECT_EQ(config.getUdpHost(), "10.1.1.1");
    EXPECT_EQ(config.getUdpPort(), 4001);

    std::remove(path.c_str());
}

TEST(ConfigurationParser, MissingFile) {
    Configuration config;
    EXPECT_FALSE(ConfigurationParser::parseJsonFile("/nonexistent/tuiobridge.json", config));

    Arguments args = {"tuiobridge", "--config", "/nonexistent/tuiobridge.json"};
    EXPECT_FALSE(ConfigurationParser::parseCommandLine(args.argc(), args.argv(), config));
}
