#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cattlediag {

/**
 * Immutable index -> disease label table.
 * Indices are the contiguous range 0..size()-1, matching the classifier's output width.
 */
class ClassMap {
public:
    explicit ClassMap(std::vector<std::string> labels);

    /**
     * Normalize a label table in either accepted shape:
     *   {"0": "foot-and-mouth", "1": "healthy"}   index -> label
     *   {"foot-and-mouth": 0, "healthy": 1}       label -> index (inverted)
     * @throws ArgumentException if the table is not an object or its indices
     *         are not a contiguous zero-based range
     */
    static ClassMap from_json(const nlohmann::json& raw);

    // {"0":"foot-and-mouth","1":"healthy","2":"lumpy"}
    static ClassMap fallback();

    // Label for an output index; unknown indices map to their own decimal string
    std::string label_for(size_t index) const;

    size_t size() const { return labels_.size(); }
    const std::vector<std::string>& labels() const { return labels_; }

    // Canonical {"0": label, ...} form
    nlohmann::json to_json() const;

private:
    std::vector<std::string> labels_;
};

/**
 * Loads the class map once and memoizes it for the life of the loader.
 * A missing or corrupt source yields ClassMap::fallback() and a warning.
 */
class ClassMapLoader {
public:
    explicit ClassMapLoader(std::string path);

    const ClassMap& load();

    // Forget the cached table; the next load() reads the source again
    void reset();

    const std::string& path() const { return path_; }

private:
    ClassMap read_source() const;

    std::string path_;
    std::unique_ptr<ClassMap> cached_;
    std::mutex mutex_;
};

} // namespace cattlediag
