#include "../src/common/logging.hpp"
#include "../src/core/artifacts/artifact_locator.hpp"
#include "../src/core/config/config_manager.hpp"
#include <fstream>
#include <iostream>
#include <string>

using namespace cattlediag;

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <locator> <output file>" << std::endl;
        return 2;
    }

    try {
        ConfigManager config;
        config.apply_environment();
        common::Logger::instance().initialize(config.log_config());

        ArtifactLocator locator(config.artifacts());
        auto bytes = locator.resolve(argv[1]);
        if (!bytes) {
            std::cerr << "Artifact not found: " << argv[1] << std::endl;
            return 1;
        }

        std::ofstream out(argv[2], std::ios::binary);
        out.write(bytes->data(), static_cast<std::streamsize>(bytes->size()));
        if (!out) {
            std::cerr << "Cannot write " << argv[2] << std::endl;
            return 1;
        }
        std::cout << "Wrote " << bytes->size() << " bytes to " << argv[2] << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
