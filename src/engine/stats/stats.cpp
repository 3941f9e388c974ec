#include "stats.hpp"
#include <sstream>

namespace Vortex {
namespace Engine {

const char* to_string(CrawlState state) {
    switch (state) {
        case CrawlState::Idle:
            return "idle";
        case CrawlState::Running:
            return "running";
        case CrawlState::Draining:
            return "draining";
        case CrawlState::Cancelling:
            return "cancelling";
        case CrawlState::Stopped:
            return "stopped";
    }
    return "unknown";
}

CrawlSummary CrawlStats::snapshot() const {
    CrawlSummary summary;
    summary.dispatched          = dispatched.load();
    summary.ok                  = ok.load();
    summary.client_errors       = client_errors.load();
    summary.server_errors       = server_errors.load();
    summary.timeouts            = timeouts.load();
    summary.network_errors      = network_errors.load();
    summary.terminal_failures   = terminal_failures.load();
    summary.soft_failures       = soft_failures.load();
    summary.cancelled           = cancelled.load();
    summary.records             = records.load();
    summary.discovered          = discovered.load();
    summary.extraction_failures = extraction_failures.load();
    return summary;
}

std::string CrawlSummary::describe() const {
    std::ostringstream out;
    out << "Crawl " << to_string(final_state) << " after " << elapsed.count() << " ms\n"
        << "  dispatched:  " << dispatched << " (ok " << ok << ", client errors "
        << client_errors << ", server errors " << server_errors << ", timeouts " << timeouts
        << ", network errors " << network_errors << ")\n"
        << "  downloader:  " << retries << " retries, " << redirects << " redirects, "
        << terminal_failures << " terminal, " << soft_failures << " soft, " << cancelled
        << " cancelled\n"
        << "  admission:   " << discovered << " discovered, " << duplicates << " duplicates, "
        << depth_exceeded << " too deep, " << filtered << " filtered, " << forced << " forced\n"
        << "  extraction:  " << records << " records, " << extraction_failures
        << " failures, " << sink_failures << " sink failures";
    return out.str();
}

}  // namespace Engine
}  // namespace Vortex
