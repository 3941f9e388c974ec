#include <gtest/gtest.h>
#include "../../src/scheduler/frontier.hpp"

using namespace Vortex::Scheduling;
using Vortex::Core::Request;

namespace {

uint64_t next_sequence = 0;

FrontierEntry entry(const std::string& host, const std::string& path, double priority) {
    FrontierEntry e;
    e.request  = Request::get("https://" + host + path);
    e.priority = priority;
    e.sequence = next_sequence++;
    e.host     = host;
    return e;
}

bool any_host(const std::string&) {
    return true;
}

double no_adjustment(const std::string&) {
    return 0.0;
}

}  // namespace

TEST(FrontierTest, HighestPriorityFirstThenInsertionOrder) {
    Frontier frontier;
    frontier.push(entry("a.com", "/low", -2));
    frontier.push(entry("a.com", "/first", 0));
    frontier.push(entry("a.com", "/second", 0));
    frontier.push(entry("b.com", "/mid", -1));

    EXPECT_EQ(frontier.size(), 4);
    EXPECT_EQ(frontier.pending("a.com"), 3);

    std::vector<std::string> order;
    while (auto e = frontier.pop_best(any_host, no_adjustment))
        order.push_back(e->request.url);

    EXPECT_EQ(order,
              (std::vector<std::string>{"https://a.com/first",
                                        "https://a.com/second",
                                        "https://b.com/mid",
                                        "https://a.com/low"}));
    EXPECT_TRUE(frontier.empty());
}

TEST(FrontierTest, IneligibleHostsAreSkippedNotDropped) {
    Frontier frontier;
    frontier.push(entry("busy.com", "/1", 5));
    frontier.push(entry("free.com", "/1", 0));

    auto e = frontier.pop_best([](const std::string& host) { return host != "busy.com"; },
                               no_adjustment);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->host, "free.com");

    EXPECT_FALSE(frontier.pop_best([](const std::string&) { return false; }, no_adjustment));
    EXPECT_EQ(frontier.size(), 1);
    EXPECT_EQ(frontier.pending("busy.com"), 1);
}

TEST(FrontierTest, AdjustmentSinksWholeHost) {
    Frontier frontier;
    frontier.push(entry("slow.com", "/a", 0));
    frontier.push(entry("slow.com", "/b", 0));
    frontier.push(entry("fast.com", "/a", -3));

    auto penalise = [](const std::string& host) { return host == "slow.com" ? -10.0 : 0.0; };

    auto first = frontier.pop_best(any_host, penalise);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->host, "fast.com");

    auto second = frontier.pop_best(any_host, penalise);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->request.url, "https://slow.com/a");
}

TEST(FrontierTest, TiesBetweenHostsGoToOldestEntry) {
    Frontier frontier;
    frontier.push(entry("z.com", "/old", 1));
    frontier.push(entry("a.com", "/new", 1));

    auto e = frontier.pop_best(any_host, no_adjustment);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->host, "z.com");
}

TEST(FrontierTest, ForEachHostAndClear) {
    Frontier frontier;
    frontier.push(entry("a.com", "/1", 0));
    frontier.push(entry("a.com", "/2", 0));
    frontier.push(entry("b.com", "/1", 0));

    std::map<std::string, size_t> seen;
    frontier.for_each_host([&](const std::string& host, size_t n) { seen[host] = n; });
    EXPECT_EQ(seen.size(), 2);
    EXPECT_EQ(seen["a.com"], 2);

    frontier.clear();
    EXPECT_TRUE(frontier.empty());
    EXPECT_EQ(frontier.size(), 0);
    EXPECT_EQ(frontier.pending("a.com"), 0);
}
