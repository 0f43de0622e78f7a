#include "yaml_util.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

YAML::Node parse_yaml_string(const std::string& text, const std::string& origin) {
    try {
        return YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw GoogetException(string_format("error.yaml_parse_failed", origin, e.what()), ErrorKind::ParseError);
    }
}

YAML::Node parse_yaml_file(const std::filesystem::path& path) {
    return parse_yaml_string(read_file(path), path.string());
}

YAML::Node yaml_child(const YAML::Node& map, std::string_view key) {
    if (!map.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    const std::string wanted = to_lower(key);
    for (const auto& kv : map) {
        if (to_lower(kv.first.Scalar()) == wanted) {
            return kv.second;
        }
    }
    return YAML::Node(YAML::NodeType::Undefined);
}

std::string yaml_string(const YAML::Node& map, std::string_view key) {
    YAML::Node n = yaml_child(map, key);
    if (!n.IsDefined() || n.IsNull()) return "";
    if (!n.IsScalar()) {
        throw GoogetException(string_format("error.yaml_expected_scalar", std::string(key)), ErrorKind::ParseError);
    }
    return n.Scalar();
}

bool yaml_bool(const YAML::Node& map, std::string_view key) {
    const std::string v = to_lower(yaml_string(map, key));
    return v == "true" || v == "yes" || v == "1";
}

std::vector<std::string> yaml_string_list(const YAML::Node& map, std::string_view key) {
    std::vector<std::string> out;
    YAML::Node n = yaml_child(map, key);
    if (!n.IsDefined() || n.IsNull()) return out;
    if (!n.IsSequence()) {
        throw GoogetException(string_format("error.yaml_expected_list", std::string(key)), ErrorKind::ParseError);
    }
    for (const auto& item : n) out.push_back(item.Scalar());
    return out;
}

std::map<std::string, std::string> yaml_string_map(const YAML::Node& map, std::string_view key) {
    std::map<std::string, std::string> out;
    YAML::Node n = yaml_child(map, key);
    if (!n.IsDefined() || n.IsNull()) return out;
    if (!n.IsMap()) {
        throw GoogetException(string_format("error.yaml_expected_map", std::string(key)), ErrorKind::ParseError);
    }
    for (const auto& kv : n) out[kv.first.Scalar()] = kv.second.Scalar();
    return out;
}

std::string emit_json(const YAML::Node& node) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << node;
    return out.c_str();
}

std::string emit_yaml(const YAML::Node& node) {
    YAML::Emitter out;
    out << node;
    return std::string(out.c_str()) + "\n";
}
