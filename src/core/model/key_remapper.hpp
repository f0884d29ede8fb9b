#pragma once

#include <map>
#include <regex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cattlediag {

// One parameter-name rewrite
struct RemapRule {
    std::string name;                 // For logs
    std::regex pattern;               // Matched against the whole parameter name
    std::string replacement;          // std::regex_replace format, e.g. "$1.$3"
    int stage_group = 0;              // Capture group naming an indexed stage, 0 if none
    int index_group = 0;              // Capture group holding the stage index, 0 if none
};

/**
 * Ordered table of parameter-name rewrites used to repair checkpoints saved
 * from a wrapped or differently-headed classifier.
 *
 * Rules run in order over the whole name set. For an indexed rule only the
 * highest index of each stage is rewritten, so every parameter of the output
 * layer moves together. A rewritten name never replaces a name the mapping
 * already holds.
 */
class KeyRemapper {
public:
    KeyRemapper();
    explicit KeyRemapper(std::vector<RemapRule> rules);

    // strip "module." then collapse "fc|classifier|head.<n>." to "<stage>."
    static std::vector<RemapRule> default_rules();

    // source name -> target name for every name that changes
    std::map<std::string, std::string> plan(const std::vector<std::string>& names) const;

    // Rewrite an ordered mapping; colliding entries keep the first holder
    template<typename T>
    std::vector<std::pair<std::string, T>> apply(
        const std::vector<std::pair<std::string, T>>& entries) const {

        std::vector<std::string> names;
        names.reserve(entries.size());
        for (const auto& entry : entries) {
            names.push_back(entry.first);
        }
        auto renames = plan(names);

        // Names kept as-is own their slot before any rewritten name
        std::unordered_set<std::string> taken;
        for (const auto& name : names) {
            if (renames.find(name) == renames.end()) {
                taken.insert(name);
            }
        }

        std::vector<std::pair<std::string, T>> result;
        result.reserve(entries.size());
        for (const auto& [name, value] : entries) {
            auto it = renames.find(name);
            if (it == renames.end()) {
                result.emplace_back(name, value);
            } else if (taken.insert(it->second).second) {
                result.emplace_back(it->second, value);
            }
        }
        return result;
    }

    const std::vector<RemapRule>& rules() const { return rules_; }

private:
    // One rule over the current names; returns old -> new for changed names
    std::map<std::string, std::string> run_rule(
        const RemapRule& rule, const std::vector<std::string>& names) const;

    std::vector<RemapRule> rules_;
};

} // namespace cattlediag
