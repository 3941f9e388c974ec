/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#pragma once

#include <chrono>
#include <string>

namespace Vortex {
namespace Utils {

class RobotsTxt {
public:
    RobotsTxt() = default;

    static RobotsTxt parse(const std::string& content);

    bool   empty() const {
        return content_.empty();
    }
    double get_crawl_delay(const std::string& user_agent) const;

    std::chrono::milliseconds crawl_delay(const std::string& user_agent) const;

private:
    std::string content_;
};

}  // namespace Utils
}  // namespace Vortex
