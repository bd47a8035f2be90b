/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scriba {

struct ModelSpec {
    std::string name;
    std::string encoder;
    std::string decoder;
    std::string tokens;
    std::string size;
    std::string description;
};

struct ModelAvailability {
    std::string name;
    bool available = false;
    std::string size;
    std::string description;
};

struct ModelResolution {
    bool ok = false;
    const ModelSpec* spec = nullptr;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Known model variants and which of them are installed in one directory.
class ModelCatalog final {
public:
    explicit ModelCatalog(std::filesystem::path directory);

    [[nodiscard]] static const std::vector<ModelSpec>& known();
    [[nodiscard]] static const std::vector<std::string>& preferenceOrder();
    [[nodiscard]] static const ModelSpec* find(const std::string& name) noexcept;

    [[nodiscard]] std::vector<std::string> missingFiles(const ModelSpec& spec) const;
    [[nodiscard]] bool isAvailable(const ModelSpec& spec) const { return missingFiles(spec).empty(); }
    [[nodiscard]] std::vector<ModelAvailability> available() const;

    // First installed model in preference order.
    [[nodiscard]] std::optional<std::string> autoSelect() const;

    // An empty name means auto-select.
    [[nodiscard]] ModelResolution resolve(const std::string& requested) const;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
};

}
