#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "../../src/core/logger/logger.hpp"
#include "../../src/core/types/errors.hpp"
#include "../../src/engine/crawler/crawler.hpp"
#include "../../src/pipeline/collecting_sink.hpp"
#include "test_helpers.hpp"

using namespace Vortex::Engine;
using Vortex::Core::FetchStatus;
using Vortex::Core::Request;
using Vortex::Parsing::Condition;
using Vortex::Parsing::FieldExtractor;
using Vortex::Parsing::FieldSpec;
using Vortex::Parsing::ParseRule;
using Vortex::Pipeline::CollectingSink;
using Vortex::Pipeline::Pipeline;
using Vortex::Spider::Spider;
using Vortex::Testing::FakeHttpClient;
using std::chrono::milliseconds;

class CrawlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client   = std::make_shared<FakeHttpClient>();
        sink     = std::make_shared<CollectingSink>();
        pipeline = std::make_shared<Pipeline>();
        pipeline->add_sink(sink);
    }

    CrawlerConfig get_default_config() {
        CrawlerConfig cfg;
        cfg.threads              = 2;
        cfg.concurrency          = 4;
        cfg.parser_threads       = 2;
        cfg.per_host_concurrency = 0;
        cfg.max_depth            = 3;
        cfg.retry_cap            = 2;
        cfg.backoff_base         = milliseconds(1);
        cfg.backoff_max          = milliseconds(5);
        cfg.throttle.enabled     = false;
        cfg.stats_interval       = milliseconds(0);
        cfg.handle_signals       = false;
        cfg.log_level            = Vortex::Core::LOG_ERROR;
        return cfg;
    }

    static ParseRule follow(std::string pattern, std::vector<std::string> allow = {}) {
        ParseRule rule;
        rule.pattern     = std::move(pattern);
        rule.condition   = Condition::Follow;
        rule.links.allow = std::move(allow);
        return rule;
    }

    static ParseRule parse_title(std::string pattern, Condition condition = Condition::Parse) {
        ParseRule rule;
        rule.pattern   = std::move(pattern);
        rule.condition = condition;
        rule.extractor = std::make_shared<FieldExtractor>(
            std::vector<FieldSpec>{FieldSpec::text("title", "title")});
        return rule;
    }

    static Spider make_spider(std::vector<std::string> urls) {
        Spider spider;
        spider.name           = "test";
        spider.start_requests = Request::from_strings(urls);
        return spider;
    }

    static size_t reported(const CrawlSummary& summary) {
        return summary.ok + summary.client_errors + summary.server_errors + summary.timeouts
               + summary.network_errors;
    }

    std::shared_ptr<FakeHttpClient> client;
    std::shared_ptr<CollectingSink> sink;
    std::shared_ptr<Pipeline>       pipeline;
};

TEST_F(CrawlerTest, FollowsThenParses) {
    client->route(
        "https://example.com/a",
        FakeHttpClient::html("<a href='/b'>b</a><a href='/c'>c</a><a href='b'>again</a>"));
    client->route("https://example.com/b", FakeHttpClient::html("<title>B</title>"));
    client->route("https://example.com/c", FakeHttpClient::html("<title>C</title>"));

    Spider spider = make_spider({"https://example.com/a"});
    spider.rules.add(follow("/a$", {"/b$"}));
    spider.rules.add(parse_title("/b$"));

    Crawler crawler(get_default_config(), pipeline, client);
    auto    summary = crawler.run(spider);

    EXPECT_EQ(summary.final_state, CrawlState::Stopped);
    EXPECT_EQ(crawler.state(), CrawlState::Stopped);
    EXPECT_EQ(summary.dispatched, 2u);
    EXPECT_EQ(summary.ok, 2u);
    EXPECT_EQ(summary.records, 1u);
    EXPECT_EQ(client->calls("https://example.com/c"), 0u);

    auto records = sink->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].source_url(), "https://example.com/b");
    EXPECT_EQ(records[0].get_string("title").value_or(""), "B");
}

TEST_F(CrawlerTest, DepthLimitAndDuplicates) {
    client->route("https://example.com/",
                  FakeHttpClient::html("<a href='/1'>1</a><a href='/'>home</a>"));
    client->route("https://example.com/1",
                  FakeHttpClient::html("<a href='/2'>2</a><a href='/'>home</a>"));
    client->route("https://example.com/2", FakeHttpClient::html("<a href='/3'>3</a>"));

    auto cfg      = get_default_config();
    cfg.max_depth = 1;

    Spider spider = make_spider({"https://example.com/"});
    spider.rules.add(follow(".*"));

    Crawler crawler(cfg, pipeline, client);
    auto    summary = crawler.run(spider);

    EXPECT_EQ(summary.dispatched, 2u);
    EXPECT_EQ(client->calls("https://example.com/2"), 0u);
    EXPECT_EQ(summary.duplicates, 1u);
    EXPECT_EQ(summary.depth_exceeded, 2u);
    EXPECT_EQ(client->calls("https://example.com/"), 1u);
}

TEST_F(CrawlerTest, RedirectIsFollowedThroughScheduler) {
    client->route("https://example.com/old", FakeHttpClient::redirect(301, "/new"));
    client->route("https://example.com/new", FakeHttpClient::html("<title>New</title>"));

    Spider spider = make_spider({"https://example.com/old"});
    spider.rules.add(parse_title(".*"));

    Crawler crawler(get_default_config(), pipeline, client);
    auto    summary = crawler.run(spider);

    EXPECT_EQ(summary.dispatched, 2u);
    EXPECT_EQ(summary.redirects, 1u);
    ASSERT_EQ(sink->size(), 1u);
    EXPECT_EQ(sink->records()[0].source_url(), "https://example.com/new");
}

TEST_F(CrawlerTest, RetryCapAndFailureAccounting) {
    client->route("https://example.com/flaky", FakeHttpClient::status(503));
    client->route("https://example.com/gone", FakeHttpClient::status(404));

    Spider spider = make_spider({"https://example.com/flaky", "https://example.com/gone"});
    spider.rules.add(follow(".*"));

    Crawler crawler(get_default_config(), pipeline, client);
    auto    summary = crawler.run(spider);

    EXPECT_EQ(client->calls("https://example.com/flaky"), 3u);
    EXPECT_EQ(client->calls("https://example.com/gone"), 1u);
    EXPECT_EQ(summary.dispatched, 2u);
    EXPECT_EQ(summary.retries, 2u);
    EXPECT_EQ(summary.terminal_failures, 1u);
    EXPECT_EQ(summary.soft_failures, 1u);
    EXPECT_EQ(summary.server_errors, 1u);
    EXPECT_EQ(summary.client_errors, 1u);
    EXPECT_EQ(reported(summary), summary.dispatched);
}

TEST_F(CrawlerTest, GracefulStopLetsInFlightFinish) {
    for (int i = 0; i < 3; ++i) {
        auto reply  = FakeHttpClient::html("<title>T</title><a href='/next" + std::to_string(i)
                                          + "'>n</a>");
        reply.delay = milliseconds(300);
        client->route("https://example.com/" + std::to_string(i), reply);
    }

    Spider spider = make_spider(
        {"https://example.com/0", "https://example.com/1", "https://example.com/2"});
    spider.rules.add(parse_title(".*", Condition::Both));

    auto    cfg = get_default_config();
    Crawler crawler(cfg, pipeline, client);

    std::thread stopper([&]() {
        std::this_thread::sleep_for(milliseconds(100));
        crawler.stop(milliseconds(5000));
    });
    auto summary = crawler.run(spider);
    stopper.join();

    EXPECT_EQ(summary.final_state, CrawlState::Stopped);
    EXPECT_EQ(summary.dispatched, 3u);
    EXPECT_EQ(summary.ok, 3u);
    EXPECT_EQ(summary.cancelled, 0u);
    EXPECT_EQ(summary.records, 3u);
    EXPECT_EQ(client->calls("https://example.com/next0"), 0u);
    EXPECT_EQ(reported(summary), summary.dispatched);
}

TEST_F(CrawlerTest, DrainTimeoutReportsInFlightOnce) {
    auto reply  = FakeHttpClient::html("<title>slow</title>");
    reply.delay = milliseconds(3000);
    client->route("https://example.com/0", reply);
    client->route("https://example.com/1", reply);

    Spider spider = make_spider({"https://example.com/0", "https://example.com/1"});
    spider.rules.add(parse_title(".*"));

    Crawler crawler(get_default_config(), pipeline, client);

    std::thread stopper([&]() {
        std::this_thread::sleep_for(milliseconds(100));
        crawler.stop(milliseconds(100));
    });
    auto start   = std::chrono::steady_clock::now();
    auto summary = crawler.run(spider);
    stopper.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(2500));
    EXPECT_EQ(summary.dispatched, 2u);
    EXPECT_EQ(summary.cancelled, 2u);
    EXPECT_EQ(summary.timeouts, 2u);
    EXPECT_EQ(summary.records, 0u);
    EXPECT_EQ(reported(summary), summary.dispatched);
}

TEST_F(CrawlerTest, CancelAbandonsInFlight) {
    auto reply  = FakeHttpClient::html("<title>slow</title>");
    reply.delay = milliseconds(3000);
    client->route("https://example.com/", reply);

    Spider spider = make_spider({"https://example.com/"});
    spider.rules.add(parse_title(".*"));

    Crawler crawler(get_default_config(), pipeline, client);

    std::thread canceller([&]() {
        std::this_thread::sleep_for(milliseconds(100));
        crawler.cancel();
        crawler.cancel();
    });
    auto summary = crawler.run(spider);
    canceller.join();

    EXPECT_EQ(summary.final_state, CrawlState::Stopped);
    EXPECT_EQ(summary.dispatched, 1u);
    EXPECT_EQ(summary.cancelled, 1u);
    EXPECT_EQ(reported(summary), 1u);
    EXPECT_EQ(sink->size(), 0u);
}

TEST_F(CrawlerTest, LateCompletionAfterForceReportIsDropped) {
    Crawler crawler(get_default_config(), pipeline, client);

    crawler.scheduler_->admit(Request::get("https://example.com/"));
    auto request = crawler.scheduler_->next();
    ASSERT_TRUE(request.has_value());
    uint64_t id = crawler.register_in_flight(*request);

    crawler.abandon_in_flight("Drain timeout");
    EXPECT_EQ(crawler.in_flight_count(), 0u);
    EXPECT_TRUE(crawler.scheduler_->is_quiescent());

    Vortex::Download::Outcome late;
    late.kind                 = Vortex::Download::Outcome::Kind::Success;
    late.response.request     = *request;
    late.response.status_code = 200;
    late.response.status      = FetchStatus::Ok;
    crawler.complete(id, std::move(late));

    auto summary = crawler.summary();
    EXPECT_EQ(summary.ok, 0u);
    EXPECT_EQ(summary.timeouts, 1u);
    EXPECT_EQ(summary.cancelled, 1u);
    EXPECT_EQ(crawler.scheduler_->stats().completed, 1u);
    EXPECT_EQ(crawler.scheduler_->pending_tasks(), 0u);
}

TEST_F(CrawlerTest, DiscoveryChainNeverStopsEarly) {
    // Each page links only to the next one, so every admission happens while
    // the previous response is being parsed and nothing else is in flight.
    const int pages = 25;
    for (int i = 0; i < pages; ++i) {
        std::string body = "<title>" + std::to_string(i) + "</title>";
        if (i + 1 < pages)
            body += "<a href='/p" + std::to_string(i + 1) + "'>next</a>";
        client->route("https://example.com/p" + std::to_string(i), FakeHttpClient::html(body));
    }

    auto cfg           = get_default_config();
    cfg.threads        = 4;
    cfg.concurrency    = 8;
    cfg.parser_threads = 4;
    cfg.max_depth      = -1;

    for (int run = 0; run < 20; ++run) {
        Spider spider = make_spider({"https://example.com/p0"});
        spider.rules.add(follow(".*"));

        Crawler crawler(cfg, pipeline, client);
        auto    summary = crawler.run(spider);

        EXPECT_EQ(summary.final_state, CrawlState::Stopped);
        EXPECT_EQ(summary.dispatched, static_cast<size_t>(pages)) << "run " << run;
        EXPECT_EQ(crawler.scheduler_->stats().frontier_size, 0u) << "run " << run;
        EXPECT_EQ(crawler.scheduler_->stats().pending_tasks, 0u) << "run " << run;
    }
}

TEST_F(CrawlerTest, LogLevelIsProcessWide) {
    auto quiet      = get_default_config();
    quiet.log_level = Vortex::Core::LOG_ERROR;
    auto loud       = get_default_config();
    loud.log_level  = Vortex::Core::LOG_WARN | Vortex::Core::LOG_ERROR;

    Crawler first(quiet, pipeline, client);
    EXPECT_EQ(Vortex::Core::Logger::level(), Vortex::Core::LOG_ERROR);

    // The most recently constructed Crawler sets the level for both.
    Crawler second(loud, pipeline, client);
    EXPECT_EQ(Vortex::Core::Logger::level(), Vortex::Core::LOG_WARN | Vortex::Core::LOG_ERROR);

    Vortex::Core::Logger::set_level(Vortex::Core::LOG_ERROR);
}

TEST_F(CrawlerTest, CriticalSinkFailureCancels) {
    class RejectingSink : public Vortex::Pipeline::Sink {
    public:
        std::string name() const override {
            return "reject";
        }
        void accept(const Vortex::Core::Record& /*record*/) override {
            throw std::runtime_error("rejected");
        }
    };

    auto failing = std::make_shared<Pipeline>();
    failing->add_sink(std::make_shared<RejectingSink>(), true);

    std::vector<std::string> urls;
    for (int i = 0; i < 5; ++i) {
        urls.push_back("https://example.com/" + std::to_string(i));
        client->route(urls.back(), FakeHttpClient::html("<title>x</title>"));
    }
    Spider spider = make_spider(urls);
    spider.rules.add(parse_title(".*"));

    auto cfg           = get_default_config();
    cfg.parser_threads = 1;
    Crawler crawler(cfg, failing, client);
    auto    summary = crawler.run(spider);

    EXPECT_EQ(summary.final_state, CrawlState::Stopped);
    EXPECT_EQ(summary.records, 1u);
    EXPECT_EQ(summary.sink_failures, 1u);
}

TEST_F(CrawlerTest, RunsOnlyOnce) {
    client->route("https://example.com/", FakeHttpClient::html("<p>x</p>"));
    Spider spider = make_spider({"https://example.com/"});
    spider.rules.add(follow(".*"));

    Crawler crawler(get_default_config(), pipeline, client);
    crawler.run(spider);
    EXPECT_THROW(crawler.run(spider), std::logic_error);
}

TEST_F(CrawlerTest, InvalidSpiderLeavesCrawlerIdle) {
    Crawler crawler(get_default_config(), pipeline, client);
    Spider  spider = make_spider({"not a url"});
    EXPECT_THROW(crawler.run(spider), Vortex::Core::ConfigError);
    EXPECT_EQ(crawler.state(), CrawlState::Idle);
}

TEST_F(CrawlerTest, InvalidConfigRejected) {
    auto cfg        = get_default_config();
    cfg.concurrency = 0;
    EXPECT_THROW({ Crawler crawler(cfg, pipeline, client); }, Vortex::Core::ConfigError);
}
