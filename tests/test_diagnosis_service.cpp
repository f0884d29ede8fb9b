#include <gtest/gtest.h>
#include "core/inference/diagnosis_service.hpp"
#include "common/error.hpp"
#include "fake_runtime.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <functional>

using namespace cattlediag;
using namespace cattlediag::testing_support;

namespace {

std::string encoded_png(int size = 100) {
    cv::Mat image(size, size, CV_8UC3, cv::Scalar(30, 120, 200));
    std::vector<uchar> buffer;
    cv::imencode(".png", image, buffer);
    return std::string(buffer.begin(), buffer.end());
}

class DiagnosisServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_dir_ = testing::TempDir() + "diagnosis_" +
                      ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(output_dir_);

        config_.update_param("class_map_path", "/nonexistent/class_map.json");
        config_.update_param("treatment_map_path", "/nonexistent/treatment_map.json");
        config_.update_param("gradcam_output_dir", output_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(output_dir_);
    }

    DiagnosisRequest image_request(const std::string& symptoms) {
        DiagnosisRequest request;
        request.case_id = "case-17";
        request.symptom_text = symptoms;
        request.image_bytes = encoded_png();
        request.image_content_type = "image/png";
        return request;
    }

    ConfigManager config_;
    std::string output_dir_;
};

int error_status(const std::function<void()>& fn, common::ErrorCode* code = nullptr) {
    try {
        fn();
    } catch (const common::RequestException& e) {
        if (code) {
            *code = e.code();
        }
        return e.http_status();
    }
    return 0;
}

} // namespace

TEST_F(DiagnosisServiceTest, StubDiagnosisEndToEnd) {
    DiagnosisService service(config_, unavailable_loader());
    auto json = service.diagnose(image_request("ulcer and drooling")).to_json();

    EXPECT_EQ(json["case_id"], "case-17");
    EXPECT_EQ(json["symptom_text"], "ulcer and drooling");
    EXPECT_EQ(json["model_version"].get<std::string>().rfind("stub", 0), 0u);
    EXPECT_TRUE(json["gradcam_url"].is_null());

    ASSERT_TRUE(json["top"].is_object());
    EXPECT_EQ(json["top"]["disease"], "foot-and-mouth");
    EXPECT_EQ(json["top_processed"]["disease"], "foot-and-mouth");

    float confidence = json["confidence_processed"].get<float>();
    EXPECT_GE(confidence, 0.0f);
    EXPECT_LE(confidence, 1.0f);
    EXPECT_EQ(json["predictions"].size(), 3u);
    EXPECT_EQ(json["predictions_processed"].size(), 3u);
    EXPECT_TRUE(json["uncertain"].is_boolean());
    EXPECT_FALSE(json["recommendation"].get<std::string>().empty());
    EXPECT_TRUE(json["severity"] == "low" || json["severity"] == "medium" || json["severity"] == "high");
}

TEST_F(DiagnosisServiceTest, SeverityFollowsReportedConfidence) {
    DiagnosisService service(config_, unavailable_loader());
    auto json = service.diagnose(image_request("ulcer and drooling")).to_json();

    EXPECT_FLOAT_EQ(json["confidence"].get<float>(), 0.5f);
    EXPECT_EQ(json["severity"], to_string(severity_for_confidence(json["confidence"].get<float>())));
    EXPECT_EQ(json["severity"], "low");
    EXPECT_EQ(json["severity_processed"],
              to_string(severity_for_confidence(json["confidence_processed"].get<float>())));
}

TEST_F(DiagnosisServiceTest, LowConfidenceNoteReachesExplanation) {
    DiagnosisService service(config_, unavailable_loader());
    DiagnosisRequest request;
    request.symptom_text = "fever";

    auto json = service.diagnose(request).to_json();
    ASSERT_TRUE(json["uncertain"].get<bool>());
    EXPECT_NE(json["explanation_text"].get<std::string>().find("Model confidence is low"), std::string::npos);
    EXPECT_NE(json["recommendation"].get<std::string>().find("Model confidence is low"), std::string::npos);
}

TEST_F(DiagnosisServiceTest, LiveRuntimeWritesOverlay) {
    DiagnosisService service(config_, fake_loader({0.1f, 0.2f, 0.7f}, true));
    auto response = service.diagnose(image_request(""));

    EXPECT_EQ(response.inference.model_version, "fake_model.pth:state_dict");
    EXPECT_EQ(response.inference.top.disease, "lumpy");
    ASSERT_TRUE(response.inference.gradcam_locator.has_value());
    EXPECT_EQ(response.inference.gradcam_locator->rfind("/gradcams/", 0), 0u);

    auto json = response.to_json();
    EXPECT_EQ(json["gradcam_url"], *response.inference.gradcam_locator);
    EXPECT_TRUE(std::filesystem::exists(
        std::filesystem::path(output_dir_) / std::filesystem::path(*response.inference.gradcam_locator).filename()));
}

TEST_F(DiagnosisServiceTest, SeverityOverrideWins) {
    DiagnosisService service(config_, unavailable_loader());
    auto request = image_request("");
    request.severity_override = Severity::HIGH;

    auto json = service.diagnose(request).to_json();
    EXPECT_EQ(json["severity"], "high");
    EXPECT_EQ(json["severity_processed"], "high");
}

TEST_F(DiagnosisServiceTest, TextOnlyUsesUniformScores) {
    DiagnosisService service(config_, unavailable_loader());
    DiagnosisRequest request;
    request.symptom_text = "fever";

    auto response = service.diagnose(request);
    ASSERT_EQ(response.inference.predictions.size(), 3u);
    for (const auto& prediction : response.inference.predictions) {
        EXPECT_FLOAT_EQ(prediction.score, 1.0f / 3.0f);
    }
    EXPECT_EQ(response.inference.explanation_text.rfind("Text-only assessment (no image supplied).", 0), 0u);
    EXPECT_FALSE(response.inference.gradcam_locator.has_value());
    EXPECT_EQ(response.to_json()["case_id"], "");
}

TEST_F(DiagnosisServiceTest, RejectsNonImageUpload) {
    DiagnosisService service(config_, unavailable_loader());
    auto request = image_request("");
    request.image_content_type = "text/plain";

    common::ErrorCode code{};
    EXPECT_EQ(error_status([&] { service.diagnose(request); }, &code), 400);
    EXPECT_EQ(code, common::ErrorCode::UNSUPPORTED_MEDIA);
}

TEST_F(DiagnosisServiceTest, MimeCheckIgnoresCase) {
    DiagnosisService service(config_, unavailable_loader());
    auto request = image_request("");
    request.image_content_type = "IMAGE/PNG";

    EXPECT_NO_THROW(service.diagnose(request));
}

TEST_F(DiagnosisServiceTest, RejectsUndecodableImage) {
    DiagnosisService service(config_, unavailable_loader());
    auto request = image_request("");
    request.image_bytes = std::string("definitely not a png");

    common::ErrorCode code{};
    EXPECT_EQ(error_status([&] { service.diagnose(request); }, &code), 400);
    EXPECT_EQ(code, common::ErrorCode::IMAGE_DECODE_ERROR);
}

TEST_F(DiagnosisServiceTest, RejectsOversizeUpload) {
    config_.update_param("max_upload_bytes", "64");
    DiagnosisService service(config_, unavailable_loader());

    common::ErrorCode code{};
    EXPECT_EQ(error_status([&] { service.diagnose(image_request("")); }, &code), 400);
    EXPECT_EQ(code, common::ErrorCode::PAYLOAD_TOO_LARGE);
}

TEST_F(DiagnosisServiceTest, ModelLoadsOnFirstImageRequest) {
    auto loads = std::make_shared<int>(0);
    DiagnosisService service(config_, fake_loader({0.6f, 0.3f, 0.1f}, false, loads));

    EXPECT_EQ(service.model_provider().status(), RuntimeStatus::NOT_LOADED);
    service.diagnose(image_request(""));
    service.diagnose(image_request(""));
    EXPECT_EQ(*loads, 1);
    EXPECT_EQ(service.model_provider().status(), RuntimeStatus::READY);
}
