#include <gtest/gtest.h>
#include "server_config.hpp"

#include <vector>

using namespace emp;

namespace {

ServerConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "employee_server");
    return parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(ServerConfigTest, Defaults) {
    ServerConfig config = parse({});
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.workers, 4u);
    EXPECT_EQ(config.base_path, "/api/v1/employee");
    EXPECT_EQ(config.log_level, spdlog::level::info);
    EXPECT_FALSE(config.log_file.has_value());
    EXPECT_TRUE(config.seed);
    EXPECT_FALSE(config.show_help);
}

TEST(ServerConfigTest, AllOptions) {
    ServerConfig config = parse({
        "--port", "9090",
        "--workers", "8",
        "--base-path", "/employee/",
        "--log-level", "debug",
        "--log-file", "/tmp/employee.log",
        "--no-seed",
    });
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.workers, 8u);
    EXPECT_EQ(config.base_path, "/employee");
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_EQ(config.log_file, "/tmp/employee.log");
    EXPECT_FALSE(config.seed);
}

TEST(ServerConfigTest, PortZeroIsAllowed) {
    EXPECT_EQ(parse({"--port", "0"}).port, 0);
}

TEST(ServerConfigTest, Help) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
    EXPECT_NE(usage().find("--base-path"), std::string::npos);
}

TEST(ServerConfigTest, LogLevelOff) {
    EXPECT_EQ(parse({"--log-level", "off"}).log_level, spdlog::level::off);
}

TEST(ServerConfigTest, RejectsBadPort) {
    EXPECT_THROW(parse({"--port", "65536"}), ConfigError);
    EXPECT_THROW(parse({"--port", "-1"}), ConfigError);
    EXPECT_THROW(parse({"--port", "80a"}), ConfigError);
    EXPECT_THROW(parse({"--port", ""}), ConfigError);
}

TEST(ServerConfigTest, RejectsBadWorkers) {
    EXPECT_THROW(parse({"--workers", "0"}), ConfigError);
    EXPECT_THROW(parse({"--workers", "257"}), ConfigError);
}

TEST(ServerConfigTest, RejectsBadBasePath) {
    EXPECT_THROW(parse({"--base-path", "employee"}), ConfigError);
    EXPECT_THROW(parse({"--base-path", "/"}), ConfigError);
    EXPECT_THROW(parse({"--base-path", "///"}), ConfigError);
    EXPECT_THROW(parse({"--base-path", "/emp?x=1"}), ConfigError);
}

TEST(ServerConfigTest, RejectsUnknownLogLevel) {
    EXPECT_THROW(parse({"--log-level", "loud"}), ConfigError);
}

TEST(ServerConfigTest, RejectsMissingValue) {
    EXPECT_THROW(parse({"--port"}), ConfigError);
}

TEST(ServerConfigTest, RejectsUnknownOption) {
    EXPECT_THROW(parse({"--verbose"}), ConfigError);
}
