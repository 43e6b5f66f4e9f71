#include <chrono>
#include <exception>
#include <iostream>
#include <string>

#include "errors.h"
#include "gdal_util.h"
#include "sync_config.h"
#include "sync_log.h"
#include "sync_workflow.h"

int main(int argc, char **argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    geosync::SyncConfig config;
    try {
        config = geosync::load_config(configPath);
    } catch (const geosync::ConfigurationError &e) {
        std::cerr << "Invalid configuration " << configPath << ": " << e.what() << std::endl;
        return 1;
    }

    geosync::Logger log(std::cerr, config.logs.level);
    if (!config.logs.log_file.empty()) {
        try {
            log.open_file(config.logs.log_file, config.logs.file_mode);
        } catch (const std::runtime_error &e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    if (config.backend == geosync::BackendKind::gdal) geosync::ensure_gdal_registered();

    auto overallStart = std::chrono::steady_clock::now();
    log.info("main", std::string("Starting sync of ") + config.data_folder + " (backend " +
                     geosync::backend_name(config.backend) + ", EPSG:" + std::to_string(config.crs) + ")");

    geosync::RunSummary summary;
    try {
        geosync::SyncWorkflow workflow(config, log);
        summary = workflow.run();
    } catch (const std::exception &e) {
        log.error("main", std::string("Run aborted: ") + e.what());
        return 1;
    }

    geosync::print_summary(summary, std::cout);

    std::chrono::duration<double> overallDur = std::chrono::steady_clock::now() - overallStart;
    log.info("main", "Script finished in " + std::to_string(overallDur.count()) + " seconds");
    return 0;
}
