#include <gtest/gtest.h>
#include "core/postprocessing/treatment_catalog.hpp"
#include <cstdio>
#include <fstream>

using namespace cattlediag;

TEST(TreatmentCatalogTest, ExtractsAllSpellings) {
    EXPECT_DOUBLE_EQ(*TreatmentCatalog::extract_mg_per_kg("Give 10 mg/kg IM"), 10.0);
    EXPECT_DOUBLE_EQ(*TreatmentCatalog::extract_mg_per_kg("dose 2.5 MG / KG daily"), 2.5);
    EXPECT_DOUBLE_EQ(*TreatmentCatalog::extract_mg_per_kg("mg per kg 4"), 4.0);
    EXPECT_DOUBLE_EQ(*TreatmentCatalog::extract_mg_per_kg("mg_per_kg: 7.5"), 7.5);
    EXPECT_DOUBLE_EQ(*TreatmentCatalog::extract_mg_per_kg("mg_per_kg=3"), 3.0);
}

TEST(TreatmentCatalogTest, NoRate) {
    EXPECT_FALSE(TreatmentCatalog::extract_mg_per_kg("").has_value());
    EXPECT_FALSE(TreatmentCatalog::extract_mg_per_kg("Isolate the animal and call a vet").has_value());
    EXPECT_FALSE(TreatmentCatalog::extract_mg_per_kg("500 mg total").has_value());
}

TEST(TreatmentCatalogTest, ComputeDosage) {
    EXPECT_EQ(TreatmentCatalog::compute_dosage(250, 2), "500 mg total (2 mg/kg \xC3\x97 250 kg)");
    EXPECT_NE(TreatmentCatalog::compute_dosage(180, 2.5).find("450 mg total"), std::string::npos);
}

TEST(TreatmentCatalogTest, LookupSkipsEmptyText) {
    auto catalog = TreatmentCatalog::from_json({{"lumpy", "Vaccinate herd"}, {"healthy", ""}});

    EXPECT_EQ(catalog.size(), 2u);
    EXPECT_EQ(*catalog.lookup("lumpy"), "Vaccinate herd");
    EXPECT_FALSE(catalog.lookup("healthy").has_value());
    EXPECT_FALSE(catalog.lookup("foot-and-mouth").has_value());
}

TEST(TreatmentCatalogTest, NonObjectIsEmpty) {
    EXPECT_TRUE(TreatmentCatalog::from_json(nlohmann::json::array({1, 2})).empty());
}

TEST(TreatmentCatalogTest, LoadToleratesBom) {
    std::string path = testing::TempDir() + "treatment_bom.json";
    {
        std::ofstream out(path, std::ios::binary);
        out << "\xEF\xBB\xBF" << R"({"lumpy": "2 mg/kg"})";
    }

    auto catalog = TreatmentCatalog::load(path);
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_EQ(*catalog.lookup("lumpy"), "2 mg/kg");
    std::remove(path.c_str());
}

TEST(TreatmentCatalogTest, MissingOrCorruptFileIsEmpty) {
    EXPECT_TRUE(TreatmentCatalog::load("/nonexistent/treatment_map.json").empty());

    std::string path = testing::TempDir() + "treatment_corrupt.json";
    {
        std::ofstream out(path);
        out << "{\"lumpy\": ";
    }
    EXPECT_TRUE(TreatmentCatalog::load(path).empty());
    std::remove(path.c_str());
}

TEST(TreatmentCatalogTest, ShippedMapCarriesDosages) {
    auto catalog = TreatmentCatalog::load(std::string(CATTLEDIAG_TEST_DATA_DIR) + "/metadata/treatment_map.json");

    ASSERT_EQ(catalog.size(), 3u);
    ASSERT_TRUE(catalog.lookup("lumpy").has_value());
    EXPECT_EQ(TreatmentCatalog::extract_mg_per_kg(*catalog.lookup("lumpy")), std::optional<double>(10.0));
    EXPECT_EQ(TreatmentCatalog::extract_mg_per_kg(*catalog.lookup("foot-and-mouth")), std::optional<double>(0.5));
    EXPECT_FALSE(TreatmentCatalog::extract_mg_per_kg(*catalog.lookup("healthy")).has_value());
}
