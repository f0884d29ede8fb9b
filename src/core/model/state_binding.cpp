#include "state_binding.hpp"
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace cattlediag {

std::string to_string(BindMode mode) {
    switch (mode) {
        case BindMode::EXACT: return "exact";
        case BindMode::RELAXED: return "relaxed";
        case BindMode::REMAPPED: return "remapped";
    }
    return "unknown";
}

bool BindingPlan::ok() const {
    if (!conflicts.empty()) {
        return false;
    }
    if (mode == BindMode::EXACT) {
        return missing.empty() && unexpected.empty() && !matched.empty();
    }
    // Relaxed binds still need at least one copied entry
    return !matched.empty();
}

std::string BindingPlan::summary() const {
    std::ostringstream ss;
    ss << "mode=" << to_string(mode)
       << " matched=" << matched.size()
       << " missing=" << missing.size()
       << " unexpected=" << unexpected.size()
       << " conflicts=" << conflicts.size();
    if (!conflicts.empty()) {
        const auto& first = conflicts.front();
        ss << " (first: " << first.name << " expected " << shape_to_string(first.expected)
           << " got " << shape_to_string(first.actual) << ")";
    }
    return ss.str();
}

BindingPlan plan_binding(const ShapeTable& skeleton, const ShapeTable& source, BindMode mode) {
    BindingPlan plan;
    plan.mode = mode;

    std::unordered_map<std::string, const TensorShape*> by_name;
    for (const auto& [name, shape] : source) {
        by_name.emplace(name, &shape);
    }

    std::unordered_set<std::string> skeleton_names;
    for (const auto& [name, shape] : skeleton) {
        skeleton_names.insert(name);

        auto it = by_name.find(name);
        if (it == by_name.end()) {
            plan.missing.push_back(name);
        } else if (*it->second != shape) {
            plan.conflicts.push_back({name, shape, *it->second});
        } else {
            plan.matched.push_back(name);
        }
    }

    for (const auto& [name, shape] : source) {
        if (skeleton_names.find(name) == skeleton_names.end()) {
            plan.unexpected.push_back(name);
        }
    }

    return plan;
}

std::string shape_to_string(const TensorShape& shape) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        ss << (i ? ", " : "") << shape[i];
    }
    ss << "]";
    return ss.str();
}

} // namespace cattlediag
