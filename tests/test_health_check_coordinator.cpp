#include <gtest/gtest.h>
#include "health_check_coordinator.hpp"
#include "fakes.hpp"
#include <future>
#include <latch>
#include <stdexcept>
#include <thread>

using namespace pg;
using namespace pg::fakes;

class HealthCheckCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 3; ++i) {
            providers.push_back(std::make_shared<FakeProvider>(
                "p" + std::to_string(i), backends({"a"})));
        }
    }

    std::vector<ProviderPtr> as_providers() const {
        return {providers.begin(), providers.end()};
    }

    std::vector<std::shared_ptr<FakeProvider>> providers;
    std::atomic<int> finished{0};
};

TEST_F(HealthCheckCoordinatorTest, SweepChecksEveryProviderOnce) {
    HealthCheckCoordinator coordinator("group", as_providers(), [this]() { ++finished; });

    EXPECT_TRUE(coordinator.run_sweep());
    for (const auto& provider : providers) {
        EXPECT_EQ(provider->health_checks.load(), 1);
    }
    EXPECT_EQ(finished.load(), 1);
    EXPECT_FALSE(coordinator.in_flight());
}

TEST_F(HealthCheckCoordinatorTest, NoProviders) {
    HealthCheckCoordinator coordinator("group", {}, [this]() { ++finished; });

    EXPECT_TRUE(coordinator.run_sweep());
    EXPECT_EQ(finished.load(), 1);
}

TEST_F(HealthCheckCoordinatorTest, ProvidersAreCheckedConcurrently) {
    // Every provider waits for all the others; a serial sweep would hang
    std::latch all_started(static_cast<std::ptrdiff_t>(providers.size()));
    for (const auto& provider : providers) {
        provider->on_health_check = [&all_started]() { all_started.arrive_and_wait(); };
    }
    HealthCheckCoordinator coordinator("group", as_providers());

    EXPECT_TRUE(coordinator.run_sweep());
}

TEST_F(HealthCheckCoordinatorTest, OnlyOneSweepAtATime) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> release_future = release.get_future().share();
    providers[0]->on_health_check = [&entered, release_future]() {
        entered.set_value();
        release_future.wait();
    };

    HealthCheckCoordinator coordinator("group", as_providers(), [this]() { ++finished; });

    auto first = std::async(std::launch::async, [&coordinator]() {
        return coordinator.run_sweep();
    });
    entered.get_future().wait();
    EXPECT_TRUE(coordinator.in_flight());

    constexpr int kThreads = 8;
    std::atomic<int> skipped{0};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&]() {
                if (!coordinator.run_sweep()) {
                    ++skipped;
                }
            });
        }
    }
    EXPECT_EQ(skipped.load(), kThreads);

    release.set_value();
    EXPECT_TRUE(first.get());

    EXPECT_EQ(providers[0]->health_checks.load(), 1);
    EXPECT_EQ(finished.load(), 1);
    EXPECT_FALSE(coordinator.in_flight());

    // A new sweep may start once the previous one is done
    providers[0]->on_health_check = nullptr;
    EXPECT_TRUE(coordinator.run_sweep());
    EXPECT_EQ(providers[0]->health_checks.load(), 2);
}

TEST_F(HealthCheckCoordinatorTest, FailingProviderIsSwallowed) {
    providers[1]->on_health_check = []() {
        throw std::runtime_error("subscription unreachable");
    };
    HealthCheckCoordinator coordinator("group", as_providers(), [this]() { ++finished; });

    EXPECT_TRUE(coordinator.run_sweep());
    EXPECT_EQ(providers[0]->health_checks.load(), 1);
    EXPECT_EQ(providers[2]->health_checks.load(), 1);
    EXPECT_EQ(finished.load(), 1);
    EXPECT_FALSE(coordinator.in_flight());
}
