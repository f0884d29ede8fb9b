#include <gtest/gtest.h>
#include "core/model/checkpoint_shape.hpp"

using namespace cattlediag;

TEST(CheckpointShapeTest, LiveModelWins) {
    auto shape = classify_checkpoint(true, {"state_dict"});
    EXPECT_TRUE(std::holds_alternative<LiveModel>(shape));
    EXPECT_EQ(to_string(shape), "live_model");
}

TEST(CheckpointShapeTest, NestedStateDict) {
    auto shape = classify_checkpoint(false, {"epoch", "state_dict", "optimizer"});
    ASSERT_TRUE(std::holds_alternative<NestedStateDict>(shape));
    EXPECT_EQ(std::get<NestedStateDict>(shape).key, "state_dict");
}

TEST(CheckpointShapeTest, ModelStateDictKey) {
    auto shape = classify_checkpoint(false, {"model_state_dict", "optimizer_state_dict"});
    ASSERT_TRUE(std::holds_alternative<NestedStateDict>(shape));
    EXPECT_EQ(to_string(shape), "nested_state_dict[model_state_dict]");
}

TEST(CheckpointShapeTest, StateDictPreferredOverModelStateDict) {
    auto shape = classify_checkpoint(false, {"model_state_dict", "state_dict"});
    EXPECT_EQ(std::get<NestedStateDict>(shape).key, "state_dict");
}

TEST(CheckpointShapeTest, FlatStateDict) {
    auto shape = classify_checkpoint(false, {});
    EXPECT_TRUE(std::holds_alternative<FlatStateDict>(shape));
    EXPECT_EQ(to_string(shape), "flat_state_dict");
}
