#include "checkpoint_resolver.hpp"
#include "../../common/error.hpp"
#include "../../common/logging.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unordered_map>

namespace cattlediag {

namespace fs = std::filesystem;
using common::CheckpointException;
using common::ModelLoadException;

CheckpointResolver::CheckpointResolver(int64_t num_classes, bool allow_unsafe_load, torch::Device device)
    : num_classes_(num_classes)
    , allow_unsafe_load_(allow_unsafe_load)
    , device_(device) {
    CHECK_ARG(num_classes_ > 0, "Classifier needs at least one class");
}

ResolvedClassifier CheckpointResolver::resolve(const std::string& path) const {
    auto payload = read(path);
    return bind(payload, fs::path(path).filename().string());
}

CheckpointPayload CheckpointResolver::read(const std::string& path) const {
    if (!fs::exists(path)) {
        throw ModelLoadException("Checkpoint not found: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ModelLoadException("Cannot open checkpoint: " + path);
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    CheckpointPayload payload;
    std::string direct_error;
    try {
        auto value = torch::jit::pickle_load(bytes);

        if (!value.isGenericDict()) {
            throw CheckpointException("Unsupported checkpoint payload of type " + value.tagKind());
        }
        auto dict = value.toGenericDict();

        std::vector<std::string> mapping_keys;
        for (const auto& entry : dict) {
            if (entry.key().isString() && entry.value().isGenericDict()) {
                mapping_keys.push_back(entry.key().toStringRef());
            }
        }

        payload.shape = classify_checkpoint(false, mapping_keys);
        if (const auto* nested = std::get_if<NestedStateDict>(&payload.shape)) {
            payload.state = state_from_dict(dict.at(nested->key).toGenericDict());
        } else {
            payload.state = state_from_dict(dict);
        }
        if (payload.state.empty()) {
            throw CheckpointException("Checkpoint holds no named tensors");
        }

        LOG_INFO("Read checkpoint " + path + " as " + to_string(payload.shape));
        return payload;
    } catch (const c10::Error& e) {
        direct_error = e.what_without_backtrace();
    } catch (const CheckpointException& e) {
        direct_error = e.what();
    }

    LOG_WARNING("Direct checkpoint load failed: " + direct_error);
    if (!allow_unsafe_load_) {
        throw CheckpointException("Cannot deserialize checkpoint " + path + ": " + direct_error);
    }

    LOG_WARNING("Unsafe load enabled; retrying " + path + " as a TorchScript archive");
    try {
        payload.module = torch::jit::load(path, device_);
    } catch (const c10::Error& unsafe_error) {
        LOG_ERROR("Unsafe checkpoint load failed: " +
                  std::string(unsafe_error.what_without_backtrace()));
        throw CheckpointException("Cannot deserialize checkpoint " + path + ": " + direct_error);
    }
    payload.shape = classify_checkpoint(true, {});
    payload.state.clear();
    payload.loaded_unsafely = true;

    LOG_INFO("Read checkpoint " + path + " as " + to_string(payload.shape));
    return payload;
}

ResolvedClassifier CheckpointResolver::bind(const CheckpointPayload& payload,
                                            const std::string& file_name) const {
    ResolvedClassifier resolved;
    ResNet18 skeleton(num_classes_);
    auto skeleton_shapes = shape_table(*skeleton);

    auto finish = [&](BindMode mode, const std::string& version) {
        skeleton->to(device_);
        skeleton->eval();
        for (auto& parameter : skeleton->parameters()) {
            parameter.requires_grad_(false);
        }
        resolved.model = skeleton;
        resolved.mode = mode;
        resolved.model_version = version + ":" + file_name;
        LOG_INFO("Bound checkpoint as " + resolved.model_version);
        return resolved;
    };

    if (std::holds_alternative<LiveModel>(payload.shape)) {
        auto entries = flatten(payload);
        auto plan = plan_binding(skeleton_shapes, shapes_of(entries), BindMode::EXACT);
        if (plan.ok()) {
            copy_into(skeleton, entries, plan);
            return finish(BindMode::EXACT, "module");
        }

        LOG_WARNING("Live module does not fit the skeleton (" + plan.summary() +
                    "), running it as-is");
        torch::jit::Module module = *payload.module;
        module.to(device_);
        module.eval();
        resolved.scripted = module;
        resolved.mode = BindMode::EXACT;
        resolved.model_version = "module:" + file_name;
        return resolved;
    }

    const auto& entries = payload.state;
    auto source_shapes = shapes_of(entries);

    auto plan = plan_binding(skeleton_shapes, source_shapes, BindMode::EXACT);
    if (plan.ok()) {
        copy_into(skeleton, entries, plan);
        return finish(BindMode::EXACT, "state_dict");
    }
    LOG_WARNING("Strict load failed: " + plan.summary());

    plan = plan_binding(skeleton_shapes, source_shapes, BindMode::RELAXED);
    if (plan.ok()) {
        copy_into(skeleton, entries, plan);
        return finish(BindMode::RELAXED, "state_dict_relaxed");
    }
    LOG_WARNING("Relaxed load failed: " + plan.summary());

    auto remapped = remapper_.apply(entries);
    plan = plan_binding(skeleton_shapes, shapes_of(remapped), BindMode::REMAPPED);
    if (plan.ok()) {
        copy_into(skeleton, remapped, plan);
        return finish(BindMode::REMAPPED, "state_dict_remapped");
    }
    LOG_ERROR("Remapped load failed: " + plan.summary());

    throw ModelLoadException("Model load failed after all attempts for " + file_name);
}

StateEntries CheckpointResolver::flatten(const CheckpointPayload& payload) {
    if (!payload.module) {
        return payload.state;
    }
    StateEntries entries;
    for (const auto& parameter : payload.module->named_parameters()) {
        entries.emplace_back(parameter.name, parameter.value);
    }
    for (const auto& buffer : payload.module->named_buffers()) {
        entries.emplace_back(buffer.name, buffer.value);
    }
    return entries;
}

StateEntries CheckpointResolver::state_from_dict(const c10::impl::GenericDict& dict) {
    StateEntries entries;
    for (const auto& entry : dict) {
        if (entry.key().isString() && entry.value().isTensor()) {
            entries.emplace_back(entry.key().toStringRef(), entry.value().toTensor());
        }
    }
    return entries;
}

ShapeTable CheckpointResolver::shapes_of(const StateEntries& entries) {
    ShapeTable table;
    table.reserve(entries.size());
    for (const auto& [name, tensor] : entries) {
        table.emplace_back(name, tensor.sizes().vec());
    }
    return table;
}

void CheckpointResolver::copy_into(ResNet18& model, const StateEntries& entries, const BindingPlan& plan) {
    std::unordered_map<std::string, torch::Tensor> by_name;
    for (const auto& [name, tensor] : entries) {
        by_name.emplace(name, tensor);
    }

    torch::NoGradGuard no_grad;
    auto parameters = model->named_parameters();
    auto buffers = model->named_buffers();
    for (const auto& name : plan.matched) {
        const auto& source = by_name.at(name);
        if (auto* parameter = parameters.find(name)) {
            parameter->copy_(source);
        } else if (auto* buffer = buffers.find(name)) {
            buffer->copy_(source);
        }
    }
}

} // namespace cattlediag
