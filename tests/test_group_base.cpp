#include <gtest/gtest.h>
#include "group_base.hpp"
#include "fakes.hpp"
#include <future>

using namespace pg;
using namespace pg::fakes;
using namespace std::chrono_literals;

class GroupBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        p1 = std::make_shared<FakeProvider>("p1", backends({"HK-1", "US-1"}));
        p2 = std::make_shared<FakeProvider>("p2", backends({"JP-1"}));

        auto filters = FilterSet::parse("HK`JP");
        ASSERT_TRUE(filters.has_value());

        GroupOptions options;
        options.name = "auto";
        options.filters = std::move(*filters);
        options.providers = {p1, p2};
        group = std::make_unique<GroupBase>(std::move(options), registry);
    }

    void fail(int times, std::error_code error = std::make_error_code(std::errc::timed_out)) {
        for (int i = 0; i < times; ++i) {
            group->on_dial_failed(AdapterType::Routed, error);
        }
    }

    FallbackRegistry registry;
    std::shared_ptr<FakeProvider> p1;
    std::shared_ptr<FakeProvider> p2;
    std::unique_ptr<GroupBase> group;
};

TEST_F(GroupBaseTest, ResolvesThroughFilters) {
    EXPECT_EQ(group->name(), "auto");
    EXPECT_EQ(names_of(group->resolve(false)),
              (std::vector<std::string>{"HK-1", "JP-1"}));
}

TEST_F(GroupBaseTest, TouchReachesEveryProvider) {
    group->touch();
    EXPECT_EQ(p1->touches.load(), 1);
    EXPECT_EQ(p2->touches.load(), 1);
}

TEST_F(GroupBaseTest, RepeatedFailuresRunOneBackgroundSweep) {
    fail(5);
    group->wait_background();

    EXPECT_EQ(p1->health_checks.load(), 1);
    EXPECT_EQ(p2->health_checks.load(), 1);
    EXPECT_EQ(group->failure_count(), 0);
    EXPECT_FALSE(group->health_check_in_flight());
}

TEST_F(GroupBaseTest, FewFailuresDoNotSweep) {
    fail(4);
    group->wait_background();

    EXPECT_EQ(p1->health_checks.load(), 0);
    EXPECT_EQ(group->failure_count(), 4);

    group->on_dial_success();
    EXPECT_EQ(group->failure_count(), 0);
}

TEST_F(GroupBaseTest, ConnectionRefusedSweepsImmediately) {
    fail(1, std::make_error_code(std::errc::connection_refused));
    group->wait_background();

    EXPECT_EQ(p1->health_checks.load(), 1);
    EXPECT_EQ(group->failure_count(), 0);
}

TEST_F(GroupBaseTest, HealthCheckWhileSweepRunningIsSkipped) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> release_future = release.get_future().share();
    p1->on_health_check = [&entered, release_future]() {
        entered.set_value();
        release_future.wait();
    };

    fail(1, std::make_error_code(std::errc::connection_refused));
    entered.get_future().wait();
    EXPECT_TRUE(group->health_check_in_flight());

    EXPECT_FALSE(group->health_check());

    release.set_value();
    group->wait_background();

    EXPECT_EQ(p1->health_checks.load(), 1);
    EXPECT_EQ(p2->health_checks.load(), 1);
}

TEST_F(GroupBaseTest, SentinelFailuresIgnored) {
    group->on_dial_failed(AdapterType::Direct, std::make_error_code(std::errc::connection_refused));
    group->on_dial_failed(AdapterType::Reject, std::make_error_code(std::errc::timed_out));
    group->wait_background();

    EXPECT_EQ(p1->health_checks.load(), 0);
    EXPECT_EQ(group->failure_count(), 0);
}

TEST_F(GroupBaseTest, UrlTestCoversResolvedBackends) {
    auto delays = group->url_test("http://www.gstatic.com/generate_204", 1s);

    ASSERT_TRUE(delays.has_value());
    EXPECT_EQ(delays->size(), 2);
    EXPECT_EQ(delays->count("HK-1"), 1);
    EXPECT_EQ(delays->count("JP-1"), 1);
    EXPECT_EQ(delays->count("US-1"), 0);
}

TEST_F(GroupBaseTest, ExplicitHealthCheckResetsFailures) {
    fail(3);
    EXPECT_TRUE(group->health_check());
    EXPECT_EQ(group->failure_count(), 0);
}

TEST_F(GroupBaseTest, FailureStormDuringSweepSpawnsNoExtraTasks) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> release_future = release.get_future().share();
    std::atomic<bool> first{true};
    p1->on_health_check = [&entered, &first, release_future]() {
        if (first.exchange(false)) {
            entered.set_value();
        }
        release_future.wait();
    };

    fail(1, std::make_error_code(std::errc::connection_refused));
    entered.get_future().wait();
    EXPECT_TRUE(group->health_check_in_flight());

    fail(100);
    EXPECT_EQ(group->background_tasks(), 1);

    release.set_value();
    group->wait_background();

    EXPECT_EQ(p1->health_checks.load(), 1);
    EXPECT_EQ(p2->health_checks.load(), 1);
    EXPECT_EQ(group->background_tasks(), 0);
}
