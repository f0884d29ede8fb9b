#include <gtest/gtest.h>
#include "core/model/key_remapper.hpp"

using namespace cattlediag;

namespace {

using Entries = std::vector<std::pair<std::string, int>>;

std::vector<std::string> names_of(const Entries& entries) {
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace

TEST(KeyRemapperTest, StripsWrapperPrefix) {
    KeyRemapper remapper;
    auto renames = remapper.plan({"module.conv1.weight", "module.fc.bias", "bn1.weight"});

    EXPECT_EQ(renames.size(), 2u);
    EXPECT_EQ(renames.at("module.conv1.weight"), "conv1.weight");
    EXPECT_EQ(renames.at("module.fc.bias"), "fc.bias");
    EXPECT_EQ(renames.count("bn1.weight"), 0u);
}

TEST(KeyRemapperTest, CollapsesOnlyTheLastHeadLayer) {
    KeyRemapper remapper;
    auto renames = remapper.plan({"fc.0.weight", "fc.0.bias", "fc.3.weight", "fc.3.bias"});

    EXPECT_EQ(renames.size(), 2u);
    EXPECT_EQ(renames.at("fc.3.weight"), "fc.weight");
    EXPECT_EQ(renames.at("fc.3.bias"), "fc.bias");
}

TEST(KeyRemapperTest, CollapsesClassifierAndHeadStages) {
    KeyRemapper remapper;
    auto renames = remapper.plan({"classifier.1.weight", "backbone.head.2.bias"});

    EXPECT_EQ(renames.at("classifier.1.weight"), "classifier.weight");
    EXPECT_EQ(renames.at("backbone.head.2.bias"), "backbone.head.bias");
}

TEST(KeyRemapperTest, RulesCompose) {
    KeyRemapper remapper;
    auto renames = remapper.plan({"module.fc.1.weight", "module.fc.1.bias", "module.layer1.0.conv1.weight"});

    EXPECT_EQ(renames.at("module.fc.1.weight"), "fc.weight");
    EXPECT_EQ(renames.at("module.fc.1.bias"), "fc.bias");
    // layer1.0 is a residual stage, not a head
    EXPECT_EQ(renames.at("module.layer1.0.conv1.weight"), "layer1.0.conv1.weight");
}

TEST(KeyRemapperTest, ApplyKeepsOrderAndValues) {
    KeyRemapper remapper;
    Entries entries = {{"module.conv1.weight", 1}, {"module.fc.1.weight", 2}, {"module.fc.1.bias", 3}};

    auto result = remapper.apply(entries);

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(names_of(result), (std::vector<std::string>{"conv1.weight", "fc.weight", "fc.bias"}));
    EXPECT_EQ(result[1].second, 2);
}

TEST(KeyRemapperTest, ExistingNameWinsCollision) {
    KeyRemapper remapper;
    Entries entries = {{"module.fc.weight", 1}, {"fc.weight", 2}};

    auto result = remapper.apply(entries);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].first, "fc.weight");
    EXPECT_EQ(result[0].second, 2);
}

TEST(KeyRemapperTest, FirstRewriteWinsCollision) {
    KeyRemapper remapper;
    Entries entries = {{"module.fc.weight", 1}, {"module.module.fc.weight", 2}};

    // Both strip once to distinct names; nothing collides
    auto result = remapper.apply(entries);
    EXPECT_EQ(result.size(), 2u);

    Entries clash = {{"module.fc.bias", 1}, {"fc.1.bias", 2}};
    auto collapsed = remapper.apply(clash);
    ASSERT_EQ(collapsed.size(), 1u);
    EXPECT_EQ(collapsed[0].first, "fc.bias");
    EXPECT_EQ(collapsed[0].second, 1);
}

TEST(KeyRemapperTest, CustomRuleTable) {
    KeyRemapper remapper({{"rename_backbone", std::regex(R"(^backbone\.(.+)$)"), "$1", 0, 0}});
    auto renames = remapper.plan({"backbone.conv1.weight", "module.fc.weight"});

    EXPECT_EQ(renames.size(), 1u);
    EXPECT_EQ(renames.at("backbone.conv1.weight"), "conv1.weight");
}

TEST(KeyRemapperTest, CleanNamesUnchanged) {
    KeyRemapper remapper;
    EXPECT_TRUE(remapper.plan({"conv1.weight", "layer4.1.bn2.running_var", "fc.weight"}).empty());
}
