#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cattlediag {

using TensorShape = std::vector<int64_t>;

// Ordered name -> shape listing of a model or a state mapping
using ShapeTable = std::vector<std::pair<std::string, TensorShape>>;

// Binding strictness, tried in this order
enum class BindMode {
    EXACT,      // Source and skeleton hold the same names with matching shapes
    RELAXED,    // Matching entries load, missing and extra ones are ignored
    REMAPPED    // Names rewritten by the KeyRemapper, then RELAXED
};

std::string to_string(BindMode mode);

// Mismatched entry: same name, different shape
struct ShapeConflict {
    std::string name;
    TensorShape expected;
    TensorShape actual;
};

// Outcome of matching a state mapping against the skeleton
struct BindingPlan {
    BindMode mode = BindMode::EXACT;
    std::vector<std::string> matched;       // Names that will be copied
    std::vector<std::string> missing;       // Skeleton names absent from the source
    std::vector<std::string> unexpected;    // Source names the skeleton does not have
    std::vector<ShapeConflict> conflicts;

    bool ok() const;

    // "matched=.. missing=.. unexpected=.. conflicts=.."
    std::string summary() const;
};

/**
 * Match a state mapping against a skeleton under the given strictness.
 * REMAPPED plans are computed over already-rewritten source names.
 */
BindingPlan plan_binding(const ShapeTable& skeleton, const ShapeTable& source, BindMode mode);

std::string shape_to_string(const TensorShape& shape);

} // namespace cattlediag
