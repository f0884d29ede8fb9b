#include <gtest/gtest.h>
#include "core/artifacts/artifact_locator.hpp"
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

using namespace cattlediag;
namespace fs = std::filesystem;

namespace {

// Canned responses keyed by URL; records every request
class FakeFetcher : public HttpFetcher {
public:
    std::optional<HttpResponse> get(const std::string& url) override {
        requested.push_back(url);
        if (url.find("explode") != std::string::npos) {
            throw std::runtime_error("connection reset");
        }
        auto it = responses.find(url);
        if (it == responses.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<std::string, HttpResponse> responses;
    std::vector<std::string> requested;
};

ArtifactConfig config_for(const std::string& root) {
    ArtifactConfig config;
    config.project_root = root;
    config.sample_gradcam_path = root + "/sample.png";
    return config;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

class ArtifactLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = testing::TempDir() + "artifact_root_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(root_);
        fs::create_directories(root_);
        fetcher_ = std::make_shared<FakeFetcher>();
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    std::string root_;
    std::shared_ptr<FakeFetcher> fetcher_;
};

} // namespace

TEST(ArtifactLocatorStaticTest, Classification) {
    EXPECT_TRUE(ArtifactLocator::is_http_url("http://host/a.png"));
    EXPECT_TRUE(ArtifactLocator::is_http_url(" HTTPS://host/a.png"));
    EXPECT_FALSE(ArtifactLocator::is_http_url("/gradcams/a.png"));
    EXPECT_TRUE(ArtifactLocator::is_file_uri("file:///tmp/a.png"));

    EXPECT_TRUE(ArtifactLocator::is_absolute_path("/tmp/a.png"));
    EXPECT_TRUE(ArtifactLocator::is_absolute_path("C:\\data\\a.png"));
    EXPECT_TRUE(ArtifactLocator::is_absolute_path("d:/data/a.png"));
    EXPECT_FALSE(ArtifactLocator::is_absolute_path("gradcams/a.png"));
    EXPECT_FALSE(ArtifactLocator::is_absolute_path(""));
}

TEST(ArtifactLocatorStaticTest, FileUriPath) {
    EXPECT_EQ(ArtifactLocator::file_uri_path("file:///tmp/a.png"), "/tmp/a.png");
    EXPECT_EQ(ArtifactLocator::file_uri_path("file://host/tmp/a.png"), "/tmp/a.png");
    EXPECT_EQ(ArtifactLocator::file_uri_path("file:///C:/data/a.png"), "C:/data/a.png");
}

TEST(ArtifactLocatorStaticTest, SplitUrl) {
    auto parts = HttplibFetcher::split_url("http://inference:8001/gradcams/a.png");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "http://inference:8001");
    EXPECT_EQ(parts->second, "/gradcams/a.png");

    EXPECT_EQ(HttplibFetcher::split_url("https://host")->second, "/");
    EXPECT_FALSE(HttplibFetcher::split_url("ftp://host/a").has_value());
    EXPECT_FALSE(HttplibFetcher::split_url("/gradcams/a.png").has_value());
}

TEST(ArtifactLocatorCandidatesTest, RootedLocator) {
    ArtifactLocator locator(config_for("/proj"), std::make_shared<FakeFetcher>());
    auto candidates = locator.local_candidates("/gradcams/a.png");

    std::vector<std::string> expected = {
        "/proj/gradcams/a.png",
        "/proj/ml-inference/gradcams/a.png",
        "/proj/sample.png",
    };
    EXPECT_EQ(candidates, expected);
}

TEST(ArtifactLocatorCandidatesTest, RelativeLocator) {
    ArtifactLocator locator(config_for("/proj"), std::make_shared<FakeFetcher>());
    auto candidates = locator.local_candidates("out/gradcam_1.png");

    std::vector<std::string> expected = {
        "/proj/ml-inference/gradcam_1.png",
        "/proj/gradcams/gradcam_1.png",
        "/proj/gradcam_1.png",
        "out/gradcam_1.png",
        "/proj/sample.png",
    };
    EXPECT_EQ(candidates, expected);
}

TEST(ArtifactLocatorCandidatesTest, WindowsLocatorUsesBasename) {
    ArtifactLocator locator(config_for("/proj"), std::make_shared<FakeFetcher>());
    auto candidates = locator.local_candidates("C:\\srv\\gradcams\\g.png");

    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates[0], "/proj/ml-inference/g.png");
    EXPECT_NE(std::find(candidates.begin(), candidates.end(), "C:/srv/gradcams/g.png"), candidates.end());
}

TEST(ArtifactLocatorCandidatesTest, DeterministicWithoutRepeats) {
    ArtifactLocator locator(config_for("/proj"), std::make_shared<FakeFetcher>());

    for (const std::string input : {"/gradcams/a.png", "gradcams/a.png", "a.png", "C:/x/a.png"}) {
        auto first = locator.local_candidates(input);
        auto second = locator.local_candidates(input);
        EXPECT_EQ(first, second);

        std::set<std::string> unique(first.begin(), first.end());
        EXPECT_EQ(unique.size(), first.size()) << input;
    }
}

TEST(ArtifactLocatorCandidatesTest, HttpCandidatesStripPredict) {
    auto config = config_for("/proj");
    config.inference_url = "http://inference:8001/predict/";
    ArtifactLocator locator(config, std::make_shared<FakeFetcher>());

    EXPECT_EQ(locator.http_candidates("/gradcams/a.png"),
              std::vector<std::string>{"http://inference:8001/gradcams/a.png"});
    EXPECT_EQ(locator.http_candidates("a.png"),
              (std::vector<std::string>{"http://inference:8001/gradcams/a.png", "http://inference:8001/a.png"}));
}

TEST(ArtifactLocatorCandidatesTest, PublicBaseWins) {
    auto config = config_for("/proj");
    config.public_base = "http://public:9000/";
    config.inference_url = "http://inference:8001/predict";
    ArtifactLocator locator(config, std::make_shared<FakeFetcher>());

    EXPECT_EQ(locator.http_candidates("/gradcams/a.png")[0], "http://public:9000/gradcams/a.png");
    EXPECT_TRUE(ArtifactLocator(config_for("/proj"), std::make_shared<FakeFetcher>())
                    .http_candidates("/gradcams/a.png").empty());
}

TEST_F(ArtifactLocatorTest, HttpLocatorFetchedDirectly) {
    fetcher_->responses["http://inference:8001/gradcams/a.png"] = {200, "PNGDATA"};
    ArtifactLocator locator(config_for(root_), fetcher_);

    EXPECT_EQ(locator.resolve("http://inference:8001/gradcams/a.png"), std::optional<std::string>("PNGDATA"));
}

TEST_F(ArtifactLocatorTest, FailedHttpFallsBackToLocalFile) {
    write_file(fs::path(root_) / "gradcams" / "a.png", "LOCAL");
    fetcher_->responses["http://inference:8001/gradcams/a.png"] = {404, "not found"};
    ArtifactLocator locator(config_for(root_), fetcher_);

    EXPECT_EQ(locator.resolve("http://inference:8001/gradcams/a.png"), std::optional<std::string>("LOCAL"));
}

TEST_F(ArtifactLocatorTest, FileUriAndAbsolutePath) {
    auto path = fs::path(root_) / "elsewhere" / "b.png";
    write_file(path, "ABS");
    ArtifactLocator locator(config_for(root_), fetcher_);

    EXPECT_EQ(locator.resolve("file://" + path.string()), std::optional<std::string>("ABS"));
    EXPECT_EQ(locator.resolve(path.string()), std::optional<std::string>("ABS"));
}

TEST_F(ArtifactLocatorTest, RootedLocatorUnderInferenceDir) {
    write_file(fs::path(root_) / "ml-inference" / "gradcams" / "c.png", "INFER");
    ArtifactLocator locator(config_for(root_), fetcher_);

    EXPECT_EQ(locator.resolve("/gradcams/c.png"), std::optional<std::string>("INFER"));
    EXPECT_TRUE(fetcher_->requested.empty());
}

TEST_F(ArtifactLocatorTest, SampleImageIsLastLocalResort) {
    write_file(fs::path(root_) / "sample.png", "SAMPLE");
    ArtifactLocator locator(config_for(root_), fetcher_);

    EXPECT_EQ(locator.resolve("/gradcams/missing.png"), std::optional<std::string>("SAMPLE"));
}

TEST_F(ArtifactLocatorTest, RemoteHostAfterLocalMiss) {
    auto config = config_for(root_);
    config.sample_gradcam_path.clear();
    config.inference_url = "http://inference:8001/predict";
    fetcher_->responses["http://inference:8001/gradcams/d.png"] = {200, "REMOTE"};
    ArtifactLocator locator(config, fetcher_);

    EXPECT_EQ(locator.resolve("/gradcams/d.png"), std::optional<std::string>("REMOTE"));
}

TEST_F(ArtifactLocatorTest, EmptyRemoteBodyIsAMiss) {
    auto config = config_for(root_);
    config.sample_gradcam_path.clear();
    config.public_base = "http://inference:8001";
    fetcher_->responses["http://inference:8001/gradcams/e.png"] = {200, ""};
    ArtifactLocator locator(config, fetcher_);

    EXPECT_FALSE(locator.resolve("/gradcams/e.png").has_value());
}

TEST_F(ArtifactLocatorTest, NotFoundIsSoft) {
    auto config = config_for(root_);
    config.sample_gradcam_path.clear();
    config.public_base = "http://explode:1";
    ArtifactLocator locator(config, fetcher_);

    EXPECT_FALSE(locator.resolve("/gradcams/none.png").has_value());
    EXPECT_FALSE(locator.resolve("http://explode:1/x.png").has_value());
    EXPECT_FALSE(locator.resolve("   ").has_value());
    EXPECT_FALSE(fetcher_->requested.empty());
}
