#include <iostream>
#include <memory>

#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "core/types/errors.hpp"
#include "engine/crawler/crawler.hpp"
#include "pipeline/json_lines_sink.hpp"
#include "pipeline/log_sink.hpp"
#include "pipeline/pipeline.hpp"
#include "pipeline/storage_sink.hpp"
#include "spider/spider.hpp"
#include "storage/disk_storage.hpp"

namespace {

std::shared_ptr<Vortex::Pipeline::Pipeline> build_pipeline(const Vortex::Core::Config& config) {
    auto pipeline = std::make_shared<Vortex::Pipeline::Pipeline>();

    if (!config.output_dir.empty()) {
        auto storage = std::make_shared<Vortex::Storage::DiskStorage>(config.output_dir);
        pipeline->add_sink(
            std::make_shared<Vortex::Pipeline::StorageSink>(storage, config.tree_structure));
    }
    if (!config.jsonl_path.empty()) {
        // Losing the primary output file is fatal for the crawl.
        pipeline->add_sink(std::make_shared<Vortex::Pipeline::JsonLinesSink>(config.jsonl_path),
                           true);
    }
    if (config.print_records || pipeline->empty())
        pipeline->add_sink(std::make_shared<Vortex::Pipeline::LogSink>());

    return pipeline;
}

}  // namespace

int main(int argc, char* argv[]) {
    using Vortex::Core::Logger;

    try {
        auto config         = Vortex::Core::Config::parse(argc, argv);
        auto crawler_config = config.to_crawler_config();
        auto spider         = Vortex::Spider::Spider::from_config(config);
        spider.validate();

        Vortex::Engine::Crawler crawler(crawler_config, build_pipeline(config));
        auto                    summary = crawler.run(spider);
        std::cout << summary.describe() << std::endl;
    } catch (const Vortex::Core::ConfigError& e) {
        Logger::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::error("Fatal: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
