#include "../src/common/logging.hpp"
#include "../src/core/api/http_server.hpp"
#include "../src/core/artifacts/artifact_locator.hpp"
#include "../src/core/config/config_manager.hpp"
#include "../src/core/inference/diagnosis_service.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace cattlediag;

namespace {

HTTPServer* running_server = nullptr;

void handle_signal(int) {
    if (running_server) {
        running_server->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file.json>]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        ConfigManager config;
        if (!config_path.empty()) {
            config.load_from_file(config_path);
        }
        config.apply_environment();
        if (!config.validate_configurations()) {
            std::cerr << "Invalid configuration:\n" << config.get_validation_errors() << std::endl;
            return 1;
        }
        common::Logger::instance().initialize(config.log_config());

        auto service = std::make_shared<DiagnosisService>(config);
        auto locator = std::make_shared<ArtifactLocator>(config.artifacts());

        // Load eagerly so /health reports the real runtime state
        service->model_provider().get();
        LOG_INFO("Model runtime " + to_string(service->model_provider().status()) +
                 ", version " + service->model_provider().model_version());

        HTTPServer server(service, locator, config);
        running_server = &server;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        server.start();
        running_server = nullptr;
        LOG_INFO("Server stopped");
        common::Logger::instance().shutdown();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
