#include "../src/common/logging.hpp"
#include "../src/common/utils.hpp"
#include "../src/core/config/config_manager.hpp"
#include "../src/core/inference/diagnosis_service.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

using namespace cattlediag;

namespace {

std::string content_type_for(const std::string& path) {
    auto lower = common::StringUtils::to_lower(path);
    if (common::StringUtils::ends_with(lower, ".png")) {
        return "image/png";
    }
    if (common::StringUtils::ends_with(lower, ".jpg") || common::StringUtils::ends_with(lower, ".jpeg")) {
        return "image/jpeg";
    }
    return "image/octet-stream";
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <file.json>] [--weight <kg>] [--age <years>] [--breed <name>]"
              << " <image|-> [symptom text...]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    DiagnosisRequest request;
    std::string image_path;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--weight" && i + 1 < argc) {
                request.subject.weight_kg = std::stof(argv[++i]);
            } else if (arg == "--age" && i + 1 < argc) {
                request.subject.age_years = std::stof(argv[++i]);
            } else if (arg == "--breed" && i + 1 < argc) {
                request.subject.breed = argv[++i];
            } else if (image_path.empty()) {
                image_path = arg;
            } else {
                request.symptom_text += (request.symptom_text.empty() ? "" : " ") + arg;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad numeric option: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }
    if (image_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        ConfigManager config;
        if (!config_path.empty()) {
            config.load_from_file(config_path);
        }
        config.apply_environment();
        common::Logger::instance().initialize(config.log_config());

        // "-" runs a text-only assessment
        if (image_path != "-") {
            std::ifstream file(image_path, std::ios::binary);
            if (!file) {
                std::cerr << "Cannot open " << image_path << std::endl;
                return 1;
            }
            request.image_bytes = std::string((std::istreambuf_iterator<char>(file)),
                                              std::istreambuf_iterator<char>());
            request.image_content_type = content_type_for(image_path);
        }

        DiagnosisService service(config);
        auto response = service.diagnose(request);
        std::cout << response.to_json().dump(2) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
