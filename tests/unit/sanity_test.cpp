#include <gtest/gtest.h>

// Test critical dependencies and infrastructure
#include <atomic>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @brief Infrastructure tests verify build system, dependencies, and basic features work.
 * These are not feature tests - they validate the foundation the codebase depends on.
 */

TEST(InfrastructureTest, YamlParsingWorks) {
    // The host configuration format
    YAML::Node node = YAML::Load("sidecar:\n  module: littera.desktop.server\n  ready_timeout_ms: 500\n");

    ASSERT_TRUE(node["sidecar"]);
    EXPECT_EQ(node["sidecar"]["module"].as<std::string>(), "littera.desktop.server");
    EXPECT_EQ(node["sidecar"]["ready_timeout_ms"].as<int>(), 500);
    EXPECT_FALSE(node["http"]);
}

TEST(InfrastructureTest, JsonParsingWorks) {
    // Same shape as ~/.littera/desktop.json
    auto parsed = nlohmann::json::parse(R"({"recent_works":["/a","/b"],"workspace":null})");
    ASSERT_TRUE(parsed["recent_works"].is_array());
    EXPECT_EQ(parsed["recent_works"].size(), 2u);
    EXPECT_EQ(parsed["recent_works"][0], "/a");
    EXPECT_TRUE(parsed["workspace"].is_null());

    EXPECT_THROW(nlohmann::json::parse("{not json"), nlohmann::json::parse_error);
}

TEST(InfrastructureTest, ThreadsShareAtomicState) {
    // HTTP pool threads and the main loop share flags this way
    std::atomic<int> counter{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&counter]() {
            for (int i = 0; i < 500; ++i) {
                counter.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(counter.load(), 2000);
}
