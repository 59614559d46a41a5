/**
 * @file test_registry.cpp
 * @brief Tests for EnvironmentRegistry lookup and atomic catalogue swaps.
 */

#include "environment/registry.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace exec_engine;

namespace {

ExecutionEnvironment make_env(const std::string& id,
                              EnvironmentStatus status = EnvironmentStatus::Active) {
    ExecutionEnvironment env;
    env.id = id;
    env.source_file = "main.sh";
    env.run_command = {"/bin/sh", "{source}"};
    env.status = status;
    return env;
}

}  // namespace

TEST(RegistryTest, ResolveKnownEnvironment) {
    EnvironmentRegistry registry({make_env("sh"), make_env("python3.11")});
    auto env = registry.resolve("python3.11");
    ASSERT_TRUE(env.has_value());
    EXPECT_EQ((*env)->id, "python3.11");
    EXPECT_EQ(registry.size(), 2u);
}

TEST(RegistryTest, UnknownEnvironment) {
    EnvironmentRegistry registry({make_env("sh")});
    auto env = registry.resolve("cobol");
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().reason, RejectReason::UnknownEnvironment);
}

TEST(RegistryTest, UnavailableEnvironments) {
    EnvironmentRegistry registry({make_env("maint", EnvironmentStatus::Maintenance),
                                  make_env("off", EnvironmentStatus::Disabled),
                                  make_env("old", EnvironmentStatus::Deprecated)});

    EXPECT_EQ(registry.resolve("maint").error().reason, RejectReason::EnvironmentUnavailable);
    EXPECT_EQ(registry.resolve("off").error().reason, RejectReason::EnvironmentUnavailable);
    // Deprecated environments still resolve
    EXPECT_TRUE(registry.resolve("old").has_value());
}

TEST(RegistryTest, InvalidCatalogueThrowsOnConstruction) {
    auto bad = make_env("bad");
    bad.run_command.clear();
    EXPECT_THROW(EnvironmentRegistry{std::vector<ExecutionEnvironment>{bad}}, std::invalid_argument);
}

TEST(RegistryTest, ReplaceAllIsAllOrNothing) {
    EnvironmentRegistry registry({make_env("sh")});

    auto bad = make_env("broken");
    bad.run_command.clear();
    auto replaced = registry.replace_all({make_env("python3.11"), bad});
    EXPECT_FALSE(replaced.has_value());

    // Old catalogue untouched
    EXPECT_TRUE(registry.resolve("sh").has_value());
    EXPECT_FALSE(registry.resolve("python3.11").has_value());
}

TEST(RegistryTest, ReplaceAllRejectsDuplicates) {
    EnvironmentRegistry registry;
    EXPECT_FALSE(registry.replace_all({make_env("sh"), make_env("sh")}).has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(RegistryTest, RegisterNeverRedefines) {
    EnvironmentRegistry registry({make_env("sh")});
    EXPECT_FALSE(registry.register_environment(make_env("sh")).has_value());
    EXPECT_TRUE(registry.register_environment(make_env("bash")).has_value());
    EXPECT_EQ(registry.size(), 2u);
}

TEST(RegistryTest, RetireKeepsResolvedHandlesAlive) {
    EnvironmentRegistry registry({make_env("sh")});
    auto handle = registry.resolve("sh");
    ASSERT_TRUE(handle.has_value());

    ASSERT_TRUE(registry.retire("sh").has_value());
    EXPECT_FALSE(registry.resolve("sh").has_value());
    // A run holding the handle still sees the environment
    EXPECT_EQ((*handle)->id, "sh");

    EXPECT_FALSE(registry.retire("sh").has_value());
}

TEST(RegistryTest, ListIsSortedById) {
    EnvironmentRegistry registry({make_env("node18"), make_env("cpp17"), make_env("sh")});
    auto all = registry.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->id, "cpp17");
    EXPECT_EQ(all[1]->id, "node18");
    EXPECT_EQ(all[2]->id, "sh");
}

TEST(RegistryTest, ReadersSeeOldOrNewCatalogue) {
    EnvironmentRegistry registry({make_env("a1"), make_env("a2")});
    std::atomic<bool> done{false};
    std::atomic<int> mixed{0};

    std::thread reader([&] {
        while (!done.load()) {
            auto all = registry.list();
            // A single snapshot never mixes the two generations
            if (all.size() != 2 || all[0]->id[0] != all[1]->id[0]) mixed.fetch_add(1);
        }
    });

    for (int i = 0; i < 200; ++i) {
        if (i % 2 == 0) {
            EXPECT_TRUE(registry.replace_all({make_env("b1"), make_env("b2")}).has_value());
        } else {
            EXPECT_TRUE(registry.replace_all({make_env("a1"), make_env("a2")}).has_value());
        }
    }
    done = true;
    reader.join();
    EXPECT_EQ(mixed.load(), 0);
}
