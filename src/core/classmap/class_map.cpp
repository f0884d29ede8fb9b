#include "class_map.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <charconv>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>

namespace cattlediag {

using common::ArgumentException;
using common::StringUtils;

namespace {

bool is_numeric_like(const nlohmann::json& value) {
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return true;
    }
    if (value.is_number_float()) {
        double v = value.get<double>();
        return v >= 0.0 && std::floor(v) == v;
    }
    return value.is_string() && StringUtils::is_digits(value.get<std::string>());
}

std::string index_string(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<unsigned long long>());
    }
    if (value.is_number_float()) {
        // Integral floats only, and only where a double is still exact
        double v = value.get<double>();
        if (v > 9007199254740992.0) {
            throw ArgumentException("Class map index out of range: " + value.dump());
        }
        return std::to_string(static_cast<unsigned long long>(v));
    }
    return std::to_string(value.get<long long>());
}

size_t parse_index(const std::string& index) {
    size_t position = 0;
    auto [end, ec] = std::from_chars(index.data(), index.data() + index.size(), position);
    if (ec != std::errc() || end != index.data() + index.size()) {
        throw ArgumentException("Class map index out of range: " + index);
    }
    return position;
}

std::string label_string(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

ClassMap::ClassMap(std::vector<std::string> labels)
    : labels_(std::move(labels)) {
}

ClassMap ClassMap::from_json(const nlohmann::json& raw) {
    if (!raw.is_object() || raw.empty()) {
        throw ArgumentException("Class map must be a non-empty JSON object");
    }

    bool all_values_numeric = true;
    bool all_keys_numeric = true;
    for (const auto& [key, value] : raw.items()) {
        all_values_numeric = all_values_numeric && is_numeric_like(value);
        all_keys_numeric = all_keys_numeric && StringUtils::is_digits(key);
    }
    bool label_to_index = all_values_numeric && !all_keys_numeric;

    // index string -> label, in index order
    std::map<size_t, std::string> by_index;
    for (const auto& [key, value] : raw.items()) {
        std::string index = label_to_index ? index_string(value) : key;
        std::string label = label_to_index ? key : label_string(value);

        if (!StringUtils::is_digits(index)) {
            throw ArgumentException("Class map index is not numeric: " + index);
        }
        size_t position = parse_index(index);
        if (!by_index.emplace(position, label).second) {
            throw ArgumentException("Duplicate class index: " + index);
        }
    }

    std::vector<std::string> labels;
    labels.reserve(by_index.size());
    for (const auto& [position, label] : by_index) {
        if (position != labels.size()) {
            throw ArgumentException("Class indices are not contiguous from 0, gap at " +
                                    std::to_string(labels.size()));
        }
        labels.push_back(label);
    }

    return ClassMap(std::move(labels));
}

ClassMap ClassMap::fallback() {
    return ClassMap({"foot-and-mouth", "healthy", "lumpy"});
}

std::string ClassMap::label_for(size_t index) const {
    if (index < labels_.size()) {
        return labels_[index];
    }
    return std::to_string(index);
}

nlohmann::json ClassMap::to_json() const {
    nlohmann::json json = nlohmann::json::object();
    for (size_t i = 0; i < labels_.size(); ++i) {
        json[std::to_string(i)] = labels_[i];
    }
    return json;
}

ClassMapLoader::ClassMapLoader(std::string path)
    : path_(std::move(path)) {
}

const ClassMap& ClassMapLoader::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cached_) {
        cached_ = std::make_unique<ClassMap>(read_source());

        std::ostringstream keys;
        for (size_t i = 0; i < cached_->size(); ++i) {
            keys << (i ? ", " : "") << i << "=" << cached_->label_for(i);
        }
        LOG_INFO("Loaded class map: " + keys.str());
    }
    return *cached_;
}

void ClassMapLoader::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
}

ClassMap ClassMapLoader::read_source() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        LOG_WARNING("Class map not found at " + path_ + ", using default 3-class map");
        return ClassMap::fallback();
    }

    try {
        nlohmann::json raw;
        file >> raw;
        return ClassMap::from_json(raw);
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING("Failed to parse class map " + path_ + ": " + e.what() + ", using default");
    } catch (const ArgumentException& e) {
        LOG_WARNING("Rejected class map " + path_ + ": " + e.what() + ", using default");
    }
    return ClassMap::fallback();
}

} // namespace cattlediag
