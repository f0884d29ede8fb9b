#include "model_runtime.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"

namespace cattlediag {

std::string to_string(RuntimeStatus status) {
    switch (status) {
        case RuntimeStatus::NOT_LOADED: return "NOT_LOADED";
        case RuntimeStatus::READY: return "READY";
        case RuntimeStatus::UNAVAILABLE: return "UNAVAILABLE";
        case RuntimeStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

ModelProvider::ModelProvider(ModelConfig config,
                             PreprocessingParams preprocessing,
                             ClassMapLoader& class_maps,
                             RuntimeLoader loader)
    : config_(std::move(config))
    , preprocessing_(preprocessing)
    , class_maps_(class_maps)
    , loader_(std::move(loader)) {
    CHECK_ARG(static_cast<bool>(loader_), "Runtime loader cannot be empty");
}

std::shared_ptr<ModelRuntime> ModelProvider::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != RuntimeStatus::NOT_LOADED) {
        return runtime_;
    }

    common::TimeUtils::Timer timer;
    try {
        auto runtime = loader_(config_, preprocessing_, class_maps_.load());
        if (!runtime) {
            status_ = RuntimeStatus::UNAVAILABLE;
            last_error_ = "numeric runtime not available";
            LOG_WARNING("Numeric runtime not compiled in, serving stub predictions");
            return nullptr;
        }
        runtime_ = std::move(runtime);
        status_ = RuntimeStatus::READY;
        last_error_.clear();
        LOG_INFO("Model ready: " + runtime_->model_version() +
                 " (" + std::to_string(static_cast<int>(timer.elapsed_ms())) + " ms)");
    } catch (const common::Exception& e) {
        status_ = RuntimeStatus::FAILED;
        last_error_ = e.what();
        LOG_ERROR("Model load failed: " + last_error_);
    } catch (const std::exception& e) {
        status_ = RuntimeStatus::FAILED;
        last_error_ = e.what();
        LOG_ERROR("Model load failed with unexpected error: " + last_error_);
    }
    return runtime_;
}

RuntimeStatus ModelProvider::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string ModelProvider::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::string ModelProvider::model_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_ ? runtime_->model_version() : config_.stub_model_version;
}

void ModelProvider::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    runtime_.reset();
    status_ = RuntimeStatus::NOT_LOADED;
    last_error_.clear();
}

} // namespace cattlediag
