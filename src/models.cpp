/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/models.hpp"
#include "scriba/logger.hpp"

namespace scriba {

namespace {
ModelSpec makeSpec(const std::string& name, const std::string& size, const std::string& description) {
    return {name, name + "-encoder.int8.onnx", name + "-decoder.int8.onnx", name + "-tokens.txt",
            size, description};
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
    }
    return out;
}
}

ModelCatalog::ModelCatalog(std::filesystem::path directory)
    : directory_(std::move(directory)) {
}

const std::vector<ModelSpec>& ModelCatalog::known() {
    static const std::vector<ModelSpec> specs = {
        makeSpec("tiny.en", "~100MB", "Fastest, English only"),
        makeSpec("tiny", "~100MB", "Fastest, multilingual"),
        makeSpec("base.en", "~160MB", "Balanced, English only"),
        makeSpec("base", "~160MB", "Balanced, multilingual"),
        makeSpec("small.en", "~500MB", "Most accurate, English only"),
        makeSpec("small", "~500MB", "Most accurate, multilingual"),
    };
    return specs;
}

const std::vector<std::string>& ModelCatalog::preferenceOrder() {
    static const std::vector<std::string> order = {
        "tiny.en", "base.en", "small.en", "tiny", "base", "small"
    };
    return order;
}

const ModelSpec* ModelCatalog::find(const std::string& name) noexcept {
    for (const auto& spec : known()) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

// Files of the variant not found in the directory
std::vector<std::string> ModelCatalog::missingFiles(const ModelSpec& spec) const {
    std::vector<std::string> missing;
    for (const auto* file : {&spec.encoder, &spec.decoder, &spec.tokens}) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(directory_ / *file, ec)) {
            missing.push_back(*file);
        }
    }
    return missing;
}

std::vector<ModelAvailability> ModelCatalog::available() const {
    std::vector<ModelAvailability> out;
    for (const auto& spec : known()) {
        out.push_back({spec.name, isAvailable(spec), spec.size, spec.description});
    }
    return out;
}

std::optional<std::string> ModelCatalog::autoSelect() const {
    for (const auto& name : preferenceOrder()) {
        if (const auto* spec = find(name); spec && isAvailable(*spec)) {
            return name;
        }
    }
    return std::nullopt;
}

ModelResolution ModelCatalog::resolve(const std::string& requested) const {
    // Empty request: first installed model in preference order
    std::string name = requested;
    if (name.empty()) {
        auto selected = autoSelect();
        if (!selected) {
            return {false, nullptr, "No model installed in " + directory_.string()};
        }
        name = *selected;
        LOG_DEBUG("Auto-selected model: " + name);
    }

    const ModelSpec* spec = find(name);
    if (!spec) {
        std::vector<std::string> names;
        for (const auto& known_spec : known()) {
            names.push_back(known_spec.name);
        }
        return {false, nullptr, "Unknown model: " + name + ". Available: " + joinNames(names)};
    }

    auto missing = missingFiles(*spec);
    if (!missing.empty()) {
        return {false, spec, "Missing model files: " + joinNames(missing)};
    }
    return {true, spec, ""};
}

}
