#include "key_remapper.hpp"
#include <algorithm>

namespace cattlediag {

KeyRemapper::KeyRemapper()
    : rules_(default_rules()) {
}

KeyRemapper::KeyRemapper(std::vector<RemapRule> rules)
    : rules_(std::move(rules)) {
}

std::vector<RemapRule> KeyRemapper::default_rules() {
    std::vector<RemapRule> rules;

    // DataParallel / DistributedDataParallel wrapper prefix
    rules.push_back({"strip_module_prefix",
                     std::regex(R"(^module\.(.+)$)"),
                     "$1", 0, 0});

    // Sequential heads: fc.1.weight -> fc.weight
    rules.push_back({"collapse_indexed_head",
                     std::regex(R"(^((?:.*\.)?(?:fc|classifier|head))\.(\d+)\.(.+)$)"),
                     "$1.$3", 1, 2});

    return rules;
}

std::map<std::string, std::string> KeyRemapper::plan(const std::vector<std::string>& names) const {
    std::vector<std::string> current = names;
    for (const auto& rule : rules_) {
        auto renames = run_rule(rule, current);
        for (auto& name : current) {
            auto it = renames.find(name);
            if (it != renames.end()) {
                name = it->second;
            }
        }
    }

    std::map<std::string, std::string> result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (current[i] != names[i]) {
            result[names[i]] = current[i];
        }
    }
    return result;
}

std::map<std::string, std::string> KeyRemapper::run_rule(
    const RemapRule& rule, const std::vector<std::string>& names) const {

    std::map<std::string, std::string> renames;
    std::smatch match;

    if (rule.index_group == 0) {
        for (const auto& name : names) {
            if (std::regex_match(name, match, rule.pattern)) {
                renames[name] = std::regex_replace(name, rule.pattern, rule.replacement);
            }
        }
        return renames;
    }

    // Highest index per stage is the layer that gets rewritten
    std::map<std::string, unsigned long> last_index;
    for (const auto& name : names) {
        if (std::regex_match(name, match, rule.pattern)) {
            auto index = std::stoul(match[rule.index_group].str());
            auto& slot = last_index[match[rule.stage_group].str()];
            slot = std::max(slot, index);
        }
    }

    for (const auto& name : names) {
        if (std::regex_match(name, match, rule.pattern) &&
            std::stoul(match[rule.index_group].str()) == last_index[match[rule.stage_group].str()]) {
            renames[name] = std::regex_replace(name, rule.pattern, rule.replacement);
        }
    }
    return renames;
}

} // namespace cattlediag
