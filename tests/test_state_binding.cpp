#include <gtest/gtest.h>
#include "core/model/state_binding.hpp"

using namespace cattlediag;

namespace {

ShapeTable skeleton() {
    return {
        {"conv1.weight", {64, 3, 7, 7}},
        {"bn1.weight", {64}},
        {"fc.weight", {3, 512}},
        {"fc.bias", {3}},
    };
}

} // namespace

TEST(StateBindingTest, ExactMatch) {
    auto plan = plan_binding(skeleton(), skeleton(), BindMode::EXACT);

    EXPECT_TRUE(plan.ok());
    EXPECT_EQ(plan.matched.size(), 4u);
    EXPECT_TRUE(plan.missing.empty());
    EXPECT_TRUE(plan.unexpected.empty());
}

TEST(StateBindingTest, ExactRejectsMissingAndExtra) {
    ShapeTable source = skeleton();
    source.pop_back();
    EXPECT_FALSE(plan_binding(skeleton(), source, BindMode::EXACT).ok());

    source = skeleton();
    source.push_back({"num_batches_tracked", {}});
    auto plan = plan_binding(skeleton(), source, BindMode::EXACT);
    EXPECT_FALSE(plan.ok());
    EXPECT_EQ(plan.unexpected, std::vector<std::string>{"num_batches_tracked"});
}

TEST(StateBindingTest, RelaxedIgnoresMissingAndExtra) {
    ShapeTable source = {{"conv1.weight", {64, 3, 7, 7}}, {"aux.weight", {10}}};
    auto plan = plan_binding(skeleton(), source, BindMode::RELAXED);

    EXPECT_TRUE(plan.ok());
    EXPECT_EQ(plan.matched, std::vector<std::string>{"conv1.weight"});
    EXPECT_EQ(plan.missing.size(), 3u);
    EXPECT_EQ(plan.unexpected, std::vector<std::string>{"aux.weight"});
}

TEST(StateBindingTest, ShapeConflictFailsEveryMode) {
    ShapeTable source = skeleton();
    source[2].second = {1000, 512};
    source[3].second = {1000};

    for (auto mode : {BindMode::EXACT, BindMode::RELAXED, BindMode::REMAPPED}) {
        auto plan = plan_binding(skeleton(), source, mode);
        EXPECT_FALSE(plan.ok()) << to_string(mode);
        ASSERT_EQ(plan.conflicts.size(), 2u);
        EXPECT_EQ(plan.conflicts[0].name, "fc.weight");
        EXPECT_EQ(plan.conflicts[0].actual, (TensorShape{1000, 512}));
    }
}

TEST(StateBindingTest, NothingMatchedFails) {
    ShapeTable source = {{"other.weight", {1}}};
    EXPECT_FALSE(plan_binding(skeleton(), source, BindMode::RELAXED).ok());
    EXPECT_FALSE(plan_binding(skeleton(), {}, BindMode::EXACT).ok());
}

TEST(StateBindingTest, SummaryNamesFirstConflict) {
    ShapeTable source = skeleton();
    source[3].second = {5};
    auto summary = plan_binding(skeleton(), source, BindMode::RELAXED).summary();

    EXPECT_NE(summary.find("mode=relaxed"), std::string::npos);
    EXPECT_NE(summary.find("conflicts=1"), std::string::npos);
    EXPECT_NE(summary.find("fc.bias expected [3] got [5]"), std::string::npos);
}

TEST(StateBindingTest, ShapeToString) {
    EXPECT_EQ(shape_to_string({}), "[]");
    EXPECT_EQ(shape_to_string({3, 512}), "[3, 512]");
}
