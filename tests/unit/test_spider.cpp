#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"
#include "../../src/core/types/errors.hpp"
#include "../../src/parser/parser.hpp"
#include "../../src/spider/spider.hpp"

namespace Core    = Vortex::Core;
namespace Parsing = Vortex::Parsing;

using Vortex::Core::ConfigError;
using Vortex::Parsing::Condition;
using Vortex::Spider::Spider;

TEST(SpiderTest, ValidateSeeds) {
    Spider empty;
    EXPECT_THROW(empty.validate(), ConfigError);

    Spider bad;
    bad.start_requests = Core::Request::from_strings({"https://example.com/", "ftp://example.com"});
    EXPECT_THROW(bad.validate(), ConfigError);

    Spider good;
    good.start_requests = Core::Request::from_strings({"http://example.com/"});
    EXPECT_NO_THROW(good.validate());
}

TEST(SpiderTest, FieldFlags) {
    auto text = Spider::parse_field_flag("title=h1");
    EXPECT_EQ(text.name, "title");
    EXPECT_EQ(text.source, "text");
    EXPECT_EQ(text.selector, "h1");
    EXPECT_FALSE(text.multiple);

    auto attr = Spider::parse_field_flag("images[]=img.photo@src");
    EXPECT_EQ(attr.name, "images");
    EXPECT_TRUE(attr.multiple);
    EXPECT_EQ(attr.source, "attr");
    EXPECT_EQ(attr.selector, "img.photo");
    EXPECT_EQ(attr.attribute, "src");

    auto regex = Spider::parse_field_flag("price=re:\\$([0-9.]+)");
    EXPECT_EQ(regex.source, "regex");
    EXPECT_EQ(regex.pattern, "\\$([0-9.]+)");

    EXPECT_THROW(Spider::parse_field_flag("title"), ConfigError);
    EXPECT_THROW(Spider::parse_field_flag("=h1"), ConfigError);
    EXPECT_THROW(Spider::parse_field_flag("title="), ConfigError);
}

TEST(SpiderTest, CommandLineRule) {
    Core::Config config;
    config.urls            = {"https://example.com/"};
    config.follow_patterns = {"/docs/"};
    config.deny_links      = {"\\.pdf$"};
    config.field_specs     = {"title=title"};

    auto spider = Spider::from_config(config);
    ASSERT_EQ(spider.rules.size(), 1u);
    const auto& rule = spider.rules.rules()[0];
    EXPECT_EQ(rule.rule.name, "cli");
    EXPECT_EQ(rule.rule.condition, Condition::Both);
    EXPECT_EQ(rule.allow.size(), 1u);
    EXPECT_EQ(rule.deny.size(), 1u);
    ASSERT_EQ(spider.start_requests.size(), 1u);
    EXPECT_EQ(spider.start_requests[0].depth, 0u);
}

TEST(SpiderTest, RuleWithoutFieldsOnlyFollows) {
    Core::Config config;
    config.urls = {"https://example.com/"};

    auto spider = Spider::from_config(config);
    ASSERT_EQ(spider.rules.size(), 1u);
    EXPECT_EQ(spider.rules.rules()[0].rule.condition, Condition::Follow);
}

TEST(SpiderTest, YamlRulesBuildExtractors) {
    Core::RuleConfig follow;
    follow.name      = "listing";
    follow.pattern   = "/a$";
    follow.condition = "follow";
    follow.allow     = {"/b$"};

    Core::FieldConfig title;
    title.name     = "title";
    title.selector = "title";

    Core::FieldConfig author;
    author.name     = "author";
    author.source   = "group";
    author.selector = ".author";
    Core::FieldConfig author_name;
    author_name.name     = "name";
    author_name.selector = ".name";
    author.children      = {author_name};

    Core::RuleConfig detail;
    detail.name      = "detail";
    detail.pattern   = "/b$";
    detail.condition = "parse";
    detail.fields    = {title, author};

    Core::Config config;
    config.urls  = {"https://example.com/a"};
    config.rules = {follow, detail};

    auto spider = Spider::from_config(config);
    ASSERT_EQ(spider.rules.size(), 2u);

    Core::Response response;
    response.request      = Core::Request::get("https://example.com/b");
    response.status_code  = 200;
    response.status       = Core::FetchStatus::Ok;
    response.content_type = "text/html";
    response.body = "<title>B</title><div class='author'><span class='name'>Ann</span></div>";

    auto result = Parsing::Parser::parse(response, spider.rules);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].get_string("title").value_or(""), "B");
    ASSERT_TRUE(result.records[0].get_record("author").has_value());
    EXPECT_EQ(result.records[0].get_record("author")->get_string("name").value_or(""), "Ann");
}

TEST(SpiderTest, RegexLinksFromRuleConfig) {
    Core::RuleConfig config;
    config.link_regex = "href=\"([^\"]+)\"";
    auto rule         = Spider::build_rule(config);
    EXPECT_EQ(rule.links.kind, Parsing::LinkSpec::Kind::Regex);
    EXPECT_EQ(rule.condition, Condition::Follow);
}

TEST(SpiderTest, InvalidRuleConfig) {
    Core::RuleConfig bad_condition;
    bad_condition.condition = "sometimes";
    EXPECT_THROW(Spider::build_rule(bad_condition), ConfigError);

    Core::FieldConfig bad_source;
    bad_source.name   = "x";
    bad_source.source = "xpath";
    EXPECT_THROW(Spider::build_field(bad_source), ConfigError);

    Core::Config config;
    config.urls        = {"https://example.com/"};
    config.field_specs = {"broken=div["};
    EXPECT_THROW(Spider::from_config(config), ConfigError);
}
