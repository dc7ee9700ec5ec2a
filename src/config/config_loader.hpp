#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace boxrun::config {

// Reads ~/.boxrun/config.json (or |path| when given), then applies BOXRUN_*
// environment overrides and validates the result. Throws ConfigError.
Config LoadConfig(const std::filesystem::path& path = {});

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

// Throws ConfigError naming the first invalid option.
void ValidateConfig(const Config& config);

// Parses "512m", "1g", "64k", "100b" or a plain byte count (binary units).
bool ParseMemoryLimit(const std::string& value, std::int64_t& bytes);

bool IsSupportedEncoding(const std::string& encoding);

const char* ToString(ImageFamily family);
bool ParseImageFamily(const std::string& value, ImageFamily& family);

}  // namespace boxrun::config
