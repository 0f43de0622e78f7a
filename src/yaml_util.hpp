#pragma once

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// Parses YAML (or JSON) text. Throws ParseError carrying the yaml-cpp message.
YAML::Node parse_yaml_string(const std::string& text, const std::string& origin);
YAML::Node parse_yaml_file(const std::filesystem::path& path);

// Case-insensitive map lookup; returns an undefined node when absent.
YAML::Node yaml_child(const YAML::Node& map, std::string_view key);

std::string yaml_string(const YAML::Node& map, std::string_view key);
bool yaml_bool(const YAML::Node& map, std::string_view key);
std::vector<std::string> yaml_string_list(const YAML::Node& map, std::string_view key);
std::map<std::string, std::string> yaml_string_map(const YAML::Node& map, std::string_view key);

// Single-line JSON-compatible rendering.
std::string emit_json(const YAML::Node& node);
// Block-style YAML rendering.
std::string emit_yaml(const YAML::Node& node);
