#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

#if DMK_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace dmk::data {

#if DMK_ENABLE_DATA_YAML
bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out);
// Scalars become strings unless they read as bool, integer or float.
nlohmann::json yaml_to_json(const YAML::Node& node);
#endif

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out);
bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node);

// Loads a plan or other structured document by extension: .yaml/.yml go
// through yaml-cpp, everything else through nlohmann::json.
bool load_structured_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error);

std::string read_text_file(const std::filesystem::path& path);
bool read_text_file(const std::filesystem::path& path, std::string& out);
bool write_text_file(const std::filesystem::path& path, const std::string& contents);

} // namespace dmk::data
