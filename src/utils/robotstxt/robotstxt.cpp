/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#include "robotstxt.hpp"
#include <optional>
#include <stdexcept>
#include <vector>
#include "absl/strings/match.h"
#include "robots.h"

namespace Vortex {
namespace Utils {

RobotsTxt RobotsTxt::parse(const std::string& content) {
    RobotsTxt robots;
    robots.content_ = content;
    return robots;
}

namespace {
class CrawlDelayMatcher : public googlebot::RobotsMatcher {
public:
    explicit CrawlDelayMatcher(const std::vector<std::string>& user_agents) {
        InitUserAgentsAndPath(&user_agents, "/");
    }

    double GetDelay(const std::string& content) {
        googlebot::ParseRobotsTxt(content, this);
        if (specific_delay_)
            return *specific_delay_;
        if (global_delay_)
            return *global_delay_;
        return 0.0;
    }

protected:
    void
    HandleUnknownAction(int line_num, absl::string_view action, absl::string_view value) override {
        if (absl::EqualsIgnoreCase(action, "Crawl-delay")) {
            try {
                double delay = std::stod(std::string(value));
                if (delay < 0)
                    delay = 0;
                if (seen_specific_agent_)
                    specific_delay_ = delay;
                else if (seen_global_agent_)
                    global_delay_ = delay;
            } catch (const std::logic_error&) {
                // Non-numeric Crawl-delay values are ignored.
            }
        }
        googlebot::RobotsMatcher::HandleUnknownAction(line_num, action, value);
    }

private:
    std::optional<double> global_delay_;
    std::optional<double> specific_delay_;
};
}  // namespace

double RobotsTxt::get_crawl_delay(const std::string& user_agent) const {
    if (content_.empty())
        return 0.0;
    std::vector<std::string> ua_list{user_agent};
    CrawlDelayMatcher        matcher(ua_list);
    return matcher.GetDelay(content_);
}

std::chrono::milliseconds RobotsTxt::crawl_delay(const std::string& user_agent) const {
    return std::chrono::milliseconds(static_cast<long long>(get_crawl_delay(user_agent) * 1000));
}

}  // namespace Utils
}  // namespace Vortex
