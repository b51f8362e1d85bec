#include <iostream>

#include "core/Config.hpp"
#include "core/FootprintPipeline.hpp"
#include "io/MatrixWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    CentiPrep::Utils::ResourceMonitor monitor;

    CentiPrep::Config config;

    if (!CentiPrep::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    // Configure Logger
    auto& logger = CentiPrep::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty() && !logger.set_log_file(config.log_file)) {
        LOG_ERROR("Cannot open log file: " + config.log_file);
        return 1;
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    config.print();

    try {
        CentiPrep::Utils::ScopedLogger main_scope("Main Execution");

        CentiPrep::FootprintPipeline pipeline(config);
        CentiPrep::CentipedeData data = pipeline.run();

        CentiPrep::MatrixWriter writer(config.output_dir, config.get_output_prefix());
        writer.write(data);

        pipeline.print_summary();
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    LOG_INFO(monitor.format_stats("Total Execution"));

    return 0;
}
