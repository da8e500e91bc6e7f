#include <gtest/gtest.h>
#include "utils/properties.h"
#include "config/engine_properties.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <thread>
#include <vector>

using namespace proctor;

// ============================================================================
// Properties Tests
// ============================================================================

TEST(PropertiesTest, SetAndGetTypedValues) {
    Properties props;
    props.set("name", std::string("proctor"));
    props.set("count", 42);
    props.set("enabled", true);
    props.set("ratio", 0.25);

    EXPECT_EQ(props.getString("name"), "proctor");
    EXPECT_EQ(props.getInt("count"), 42);
    EXPECT_TRUE(props.getBool("enabled"));
    EXPECT_DOUBLE_EQ(props.getDouble("ratio"), 0.25);
    EXPECT_EQ(props.size(), 4u);
}

TEST(PropertiesTest, StringFormsAreConverted) {
    Properties props;
    props.set("count", std::string("17"));
    props.set("ratio", std::string("0.5"));
    props.set("flag", std::string("yes"));

    EXPECT_EQ(props.getInt("count"), 17);
    EXPECT_DOUBLE_EQ(props.getDouble("ratio"), 0.5);
    EXPECT_TRUE(props.getBool("flag"));
}

TEST(PropertiesTest, DefaultsForMissingOrUnparseable) {
    Properties props;
    props.set("bad", std::string("not-a-number"));

    EXPECT_EQ(props.getInt("missing", 5), 5);
    EXPECT_EQ(props.getInt("bad", 9), 9);
    EXPECT_EQ(props.getString("missing", "fallback"), "fallback");
    EXPECT_DOUBLE_EQ(props.getDouble("bad", 1.5), 1.5);
}

TEST(PropertiesTest, IntIsReadableAsDouble) {
    Properties props;
    props.set("cpu", 2);
    EXPECT_DOUBLE_EQ(props.getDouble("cpu"), 2.0);
}

TEST(PropertiesTest, HasAndRemove) {
    Properties props;
    props.set("key", 1);

    EXPECT_TRUE(props.has("key"));
    EXPECT_TRUE(props.remove("key"));
    EXPECT_FALSE(props.has("key"));
    EXPECT_FALSE(props.remove("key"));
}

TEST(PropertiesTest, MergeOverwrites) {
    Properties base;
    base.set("a", 1);
    base.set("b", 2);

    Properties overlay;
    overlay.set("b", 20);
    overlay.set("c", 30);

    base.merge(overlay);
    EXPECT_EQ(base.getInt("a"), 1);
    EXPECT_EQ(base.getInt("b"), 20);
    EXPECT_EQ(base.getInt("c"), 30);
}

TEST(PropertiesTest, ConcurrentReadsDuringWrites) {
    Properties props;
    props.set("counter", 0);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&props, t]() {
            for (int i = 0; i < 200; ++i) {
                if (t % 2 == 0) {
                    props.set("counter", i);
                } else {
                    int value = props.getInt("counter", -1);
                    EXPECT_GE(value, 0);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_TRUE(props.has("counter"));
}

// ============================================================================
// EngineProperties Tests
// ============================================================================

TEST(EnginePropertiesTest, Defaults) {
    EngineProperties props;

    EXPECT_EQ(props.getTimeoutSeconds(), 10);
    EXPECT_EQ(props.getMemoryLimit(), "128m");
    EXPECT_DOUBLE_EQ(props.getCpuLimit(), 0.8);
    EXPECT_EQ(props.getBackendStrategy(), "auto");
    EXPECT_EQ(props.getDockerHost(), "unix:///var/run/docker.sock");
    EXPECT_EQ(props.getDockerBinary(), "docker");
    EXPECT_EQ(props.getWorkdirRoot(), "");
    EXPECT_EQ(props.getWorkerThreads(), 4u);
    EXPECT_EQ(props.getQueueCapacity(), 64u);
    EXPECT_EQ(props.getSessionTtl(), std::chrono::seconds(86400));
    EXPECT_EQ(props.getLogLevel(), "INFO");
    EXPECT_EQ(props.getImageOverride("python"), "");
    EXPECT_TRUE(props.validate());
}

TEST(EnginePropertiesTest, ConstructFromBaseProperties) {
    Properties base;
    base.set(EngineProperties::PROP_SANDBOX_TIMEOUT_SECONDS, std::string("3"));

    EngineProperties props(base);
    EXPECT_EQ(props.getTimeoutSeconds(), 3);
    EXPECT_EQ(props.getMemoryLimit(), "128m");
}

TEST(EnginePropertiesTest, ValidateRejectsUnusableValues) {
    EngineProperties timeout;
    timeout.setTimeoutSeconds(0);
    EXPECT_FALSE(timeout.validate());

    EngineProperties cpu;
    cpu.setCpuLimit(0.0);
    EXPECT_FALSE(cpu.validate());

    EngineProperties threads;
    threads.setWorkerThreads(0);
    EXPECT_FALSE(threads.validate());

    EngineProperties strategy;
    strategy.setBackendStrategy("kubernetes");
    EXPECT_FALSE(strategy.validate());
}

TEST(EnginePropertiesTest, ValidateRejectsBadMemoryLimit) {
    EngineProperties props;

    for (const char* bad : {"", "lots", "12x", "0m", "-5m"}) {
        props.setMemoryLimit(bad);
        EXPECT_FALSE(props.validate()) << bad;
    }

    props.setMemoryLimit("512M");
    EXPECT_TRUE(props.validate());
}

TEST(EnginePropertiesTest, ApplyJsonSections) {
    EngineProperties props;
    applyEngineConfigJson(R"({
        "sandbox": {
            "timeout_seconds": 5,
            "memory_limit": "256m",
            "cpu_limit": "1.5",
            "backend": "cli",
            "docker_binary": "podman",
            "images": { "python": "python:3.12-slim" }
        },
        "executor": { "worker_threads": 2, "queue_capacity": 8 },
        "anticheat": { "session_ttl_seconds": 600 },
        "log": { "level": "DEBUG" }
    })", props);

    EXPECT_EQ(props.getTimeoutSeconds(), 5);
    EXPECT_EQ(props.getMemoryLimit(), "256m");
    EXPECT_DOUBLE_EQ(props.getCpuLimit(), 1.5);
    EXPECT_EQ(props.getBackendStrategy(), "cli");
    EXPECT_EQ(props.getDockerBinary(), "podman");
    EXPECT_EQ(props.getImageOverride("python"), "python:3.12-slim");
    EXPECT_EQ(props.getWorkerThreads(), 2u);
    EXPECT_EQ(props.getQueueCapacity(), 8u);
    EXPECT_EQ(props.getSessionTtl(), std::chrono::seconds(600));
    EXPECT_EQ(props.getLogLevel(), "DEBUG");
}

TEST(EnginePropertiesTest, ApplyJsonRejectsMalformedText) {
    EngineProperties props;
    EXPECT_THROW(applyEngineConfigJson("{ not json", props), nlohmann::json::exception);
    EXPECT_THROW(applyEngineConfigJson(R"({"sandbox": {"timeout_seconds": "ten"}})", props),
                 nlohmann::json::exception);
}

TEST(EnginePropertiesTest, LoadMissingFileGivesDefaults) {
    unsetenv("DOCKER_HOST");
    EngineProperties props = loadEngineConfig("/nonexistent/proctor.json");
    EXPECT_EQ(props.getTimeoutSeconds(), 10);
    EXPECT_EQ(props.getDockerHost(), EngineProperties::DEFAULT_DOCKER_HOST);
}

TEST(EnginePropertiesTest, LoadFileAndEnvironmentOverride) {
    auto path = std::filesystem::temp_directory_path() / "proctor_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"sandbox": {"timeout_seconds": 7, "docker_host": "unix:///tmp/configured.sock"}})";
    }

    setenv("DOCKER_HOST", "unix:///tmp/from-env.sock", 1);
    EngineProperties props = loadEngineConfig(path.string());
    unsetenv("DOCKER_HOST");
    std::filesystem::remove(path);

    EXPECT_EQ(props.getTimeoutSeconds(), 7);
    EXPECT_EQ(props.getDockerHost(), "unix:///tmp/from-env.sock");
}

TEST(EnginePropertiesTest, LoadMalformedFileGivesDefaults) {
    auto path = std::filesystem::temp_directory_path() / "proctor_test_bad_config.json";
    {
        std::ofstream out(path);
        out << R"({"sandbox": {"timeout_seconds": 3}, )";
    }

    unsetenv("DOCKER_HOST");
    EngineProperties props = loadEngineConfig(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(props.getTimeoutSeconds(), 10);
}
