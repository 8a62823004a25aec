//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_config.cpp
// Purpose: GoogleTests for layered configuration (env, config string, command line) and log sinks
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#include "logging/Logger.h"
#include "scaffold/ServerConfig.h"

using namespace scaffold;

namespace {

// argv builder; storage outlives the returned pointers
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        ::unsetenv("SCAFFOLD_LOG_FILE");
        ::unsetenv("SCAFFOLD_LOG_LEVEL");
        ::unsetenv("SCAFFOLD_LOG_CONSOLE");
        ::unsetenv("SCAFFOLD_WORKERS");
        ::unsetenv("SCAFFOLD_CONFIG");
    }
};

} // namespace

TEST_F(ServerConfigTest, Defaults) {
    Argv args({"server"});
    auto cfg = ServerConfig::Load(args.argc(), args.argv());
    EXPECT_EQ(cfg.logFile, "mcpserver.log");
    EXPECT_EQ(cfg.logLevel, "INFO");
    EXPECT_TRUE(cfg.logToConsole);
    EXPECT_EQ(cfg.workerThreads, 4u);
    EXPECT_FALSE(cfg.inputFile.has_value());
}

TEST_F(ServerConfigTest, ConfigStringKeys) {
    ServerConfig cfg;
    cfg.ApplyConfigString("log_file=/tmp/a.log; log_level=DEBUG\tlog_console=off workers=8 bogus=1 noequals");
    EXPECT_EQ(cfg.logFile, "/tmp/a.log");
    EXPECT_EQ(cfg.logLevel, "DEBUG");
    EXPECT_FALSE(cfg.logToConsole);
    EXPECT_EQ(cfg.workerThreads, 8u);
}

TEST_F(ServerConfigTest, WorkersClampedAndMalformedIgnored) {
    ServerConfig cfg;
    cfg.ApplyConfigString("workers=0");
    EXPECT_EQ(cfg.workerThreads, 1u);
    cfg.ApplyConfigString("workers=-5");
    EXPECT_EQ(cfg.workerThreads, 1u);
    cfg.ApplyConfigString("workers=six");
    EXPECT_EQ(cfg.workerThreads, 1u);
    cfg.ApplyConfigString("workers=6 log_console=maybe");
    EXPECT_EQ(cfg.workerThreads, 6u);
    EXPECT_TRUE(cfg.logToConsole);
}

TEST_F(ServerConfigTest, EnvironmentThenCommandLine) {
    ::setenv("SCAFFOLD_LOG_LEVEL", "WARN", 1);
    ::setenv("SCAFFOLD_WORKERS", "2", 1);
    ::setenv("SCAFFOLD_LOG_CONSOLE", "0", 1);
    ::setenv("SCAFFOLD_CONFIG", "log_file=env.log", 1);

    Argv args({"server", "--workers=12", "--log-file=cli.log", "request.json", "other.json"});
    auto cfg = ServerConfig::Load(args.argc(), args.argv());

    EXPECT_EQ(cfg.logLevel, "WARN");
    EXPECT_FALSE(cfg.logToConsole);
    EXPECT_EQ(cfg.workerThreads, 12u);
    EXPECT_EQ(cfg.logFile, "cli.log");
    ASSERT_TRUE(cfg.inputFile.has_value());
    EXPECT_EQ(cfg.inputFile.value(), "request.json");
}

TEST_F(ServerConfigTest, EmptyLogFileFromEnvDisablesSink) {
    ::setenv("SCAFFOLD_LOG_FILE", "", 1);
    ServerConfig cfg;
    cfg.ApplyEnvironment();
    EXPECT_TRUE(cfg.logFile.empty());
}

TEST_F(ServerConfigTest, CommandLineConfigString) {
    Argv args({"server", "--config=workers=3;log_level=ERROR", "--log-level=DEBUG"});
    auto cfg = ServerConfig::Load(args.argc(), args.argv());
    EXPECT_EQ(cfg.workerThreads, 3u);
    EXPECT_EQ(cfg.logLevel, "DEBUG");
}

TEST(GetArgValue, LastMatchWinsAndPrefixMustMatchExactly) {
    Argv args({"server", "--workers=2", "--workers-extra=9", "--workers=5", "--flag"});
    auto v = GetArgValue(args.argc(), args.argv(), "--workers");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), "5");
    EXPECT_FALSE(GetArgValue(args.argc(), args.argv(), "--flag").has_value());
    EXPECT_FALSE(GetArgValue(args.argc(), args.argv(), "--missing").has_value());
}

TEST(LoggerSinks, FileSinkReceivesFilteredLines) {
    const std::string path = ::testing::TempDir() + "scaffold_logger_test.log";
    std::remove(path.c_str());

    ServerConfig cfg;
    cfg.logFile = path;
    cfg.logLevel = "WARN";
    cfg.logToConsole = false;
    cfg.ApplyLogging();
    ASSERT_TRUE(Logger::hasLogFile());

    LOG_INFO("hidden {}", 1);
    LOG_WARN("visible {}", 2);
    Logger::closeLogFile();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::setConsoleEnabled(true);

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str().find("hidden 1"), std::string::npos);
    EXPECT_NE(content.str().find("[WARN]"), std::string::npos);
    EXPECT_NE(content.str().find("visible 2"), std::string::npos);
    std::remove(path.c_str());
}
