#include "synthflat/config/configuration.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

#include <fstream>
#include <sstream>

namespace synthflat::config {

namespace {

template <typename T>
std::optional<T> read_opt(const YAML::Node& n, const std::string& key) {
    if (!n[key] || n[key].IsNull()) return std::nullopt;
    try {
        return n[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("invalid value for '" + key + "': " + e.what());
    }
}

template <typename T>
void read_into(const YAML::Node& n, const std::string& key, T& out) {
    if (auto v = read_opt<T>(n, key)) out = *v;
}

bool is_known_method(const std::string& m) {
    return m == kMethodNone || m == kMethodThresholdMedian || m == kMethodExternal;
}

std::string scalar_or_list_to_text(const YAML::Node& n, const std::string& field) {
    if (n.IsScalar()) return n.as<std::string>();
    if (n.IsSequence()) {
        std::vector<std::string> parts;
        for (const auto& item : n) {
            if (!item.IsScalar()) {
                throw ConfigError("metadata." + field + ".value must be a scalar or a flat list");
            }
            parts.push_back(item.as<std::string>());
        }
        return core::join(parts, " ");
    }
    throw ConfigError("metadata." + field + ".value must be a scalar or a flat list");
}

} // namespace

ProcessingParameters ProcessingParameters::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

ProcessingParameters ProcessingParameters::from_yaml(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        throw ConfigError("process_params document is empty");
    }
    if (!root.IsMap()) {
        throw ConfigError("process_params must be a mapping");
    }
    const YAML::Node n = root["process"] ? root["process"] : root;

    ProcessingParameters p;
    read_into(n, "method", p.method);
    p.threshold = read_opt<float>(n, "threshold");
    read_into(n, "threshold_mode", p.threshold_mode);
    p.median_filter_size = read_opt<int>(n, "median_filter_size");
    p.gaussian_blur_sigma = read_opt<float>(n, "gaussian_blur_sigma");
    p.external_tool_path = read_opt<std::string>(n, "external_tool_path");
    read_into(n, "external_tool_timeout_seconds", p.external_tool_timeout_seconds);
    read_into(n, "external_tool_args", p.external_tool_args);
    read_into(n, "external_tool_format", p.external_tool_format);
    p.fallback_method = read_opt<std::string>(n, "fallback_method");
    read_into(n, "combine_rule", p.combine_rule);
    read_into(n, "strict", p.strict);
    read_into(n, "input_pattern", p.input_pattern);
    read_into(n, "parallel_workers", p.parallel_workers);
    read_into(n, "camera_db", p.camera_db);

    p.method = core::to_lower(p.method);
    p.threshold_mode = core::to_lower(p.threshold_mode);
    p.combine_rule = core::to_lower(p.combine_rule);
    p.external_tool_format = core::to_lower(p.external_tool_format);
    if (p.fallback_method) p.fallback_method = core::to_lower(*p.fallback_method);
    return p;
}

void ProcessingParameters::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node ProcessingParameters::to_yaml() const {
    YAML::Node node;
    node["method"] = method;
    if (threshold) node["threshold"] = *threshold;
    node["threshold_mode"] = threshold_mode;
    if (median_filter_size) node["median_filter_size"] = *median_filter_size;
    if (gaussian_blur_sigma) node["gaussian_blur_sigma"] = *gaussian_blur_sigma;
    if (external_tool_path) node["external_tool_path"] = *external_tool_path;
    node["external_tool_timeout_seconds"] = external_tool_timeout_seconds;
    if (!external_tool_args.empty()) node["external_tool_args"] = external_tool_args;
    node["external_tool_format"] = external_tool_format;
    if (fallback_method) node["fallback_method"] = *fallback_method;
    node["combine_rule"] = combine_rule;
    node["strict"] = strict;
    node["input_pattern"] = input_pattern;
    node["parallel_workers"] = parallel_workers;
    if (!camera_db.empty()) node["camera_db"] = camera_db;
    return node;
}

void ProcessingParameters::validate() const {
    if (!is_known_method(method)) {
        throw ConfigError("unknown method '" + method +
                          "' (expected none, threshold_median or external)");
    }

    if (method == kMethodThresholdMedian) {
        if (!threshold) throw ConfigError("method threshold_median requires 'threshold'");
        if (!median_filter_size) {
            throw ConfigError("method threshold_median requires 'median_filter_size'");
        }
        if (!gaussian_blur_sigma) {
            throw ConfigError("method threshold_median requires 'gaussian_blur_sigma'");
        }
    }
    if (method == kMethodExternal && (!external_tool_path || external_tool_path->empty())) {
        throw ConfigError("method external requires 'external_tool_path'");
    }

    if (threshold_mode != "percentile" && threshold_mode != "absolute") {
        throw ConfigError("threshold_mode must be 'percentile' or 'absolute'");
    }
    if (threshold && threshold_mode == "percentile" &&
        (*threshold < 0.0f || *threshold > 100.0f)) {
        throw ConfigError("threshold must be in [0, 100] when threshold_mode is percentile");
    }
    if (median_filter_size && (*median_filter_size < 1 || *median_filter_size % 2 == 0)) {
        throw ConfigError("median_filter_size must be an odd integer >= 1");
    }
    if (gaussian_blur_sigma && *gaussian_blur_sigma < 0.0f) {
        throw ConfigError("gaussian_blur_sigma must be >= 0");
    }
    if (external_tool_timeout_seconds <= 0) {
        throw ConfigError("external_tool_timeout_seconds must be > 0");
    }
    if (external_tool_format != "tiff" && external_tool_format != "fits") {
        throw ConfigError("external_tool_format must be 'tiff' or 'fits'");
    }

    if (fallback_method) {
        if (*fallback_method != kMethodNone && *fallback_method != kMethodThresholdMedian) {
            throw ConfigError("fallback_method must be 'none' or 'threshold_median'");
        }
        if (method != kMethodExternal) {
            throw ConfigError("fallback_method is only meaningful with method external");
        }
        if (*fallback_method == kMethodThresholdMedian &&
            (!threshold || !median_filter_size || !gaussian_blur_sigma)) {
            throw ConfigError("fallback_method threshold_median requires 'threshold', "
                              "'median_filter_size' and 'gaussian_blur_sigma'");
        }
    }

    if (combine_rule != "median" && combine_rule != "mean") {
        throw ConfigError("combine_rule must be 'median' or 'mean'");
    }
    if (input_pattern.empty()) {
        throw ConfigError("input_pattern must not be empty");
    }
    if (parallel_workers < 1) {
        throw ConfigError("parallel_workers must be >= 1");
    }
}

bool MetadataSpec::contains(const std::string& field) const {
    for (const auto& e : entries) {
        if (e.field == field) return true;
    }
    return false;
}

void MetadataSpec::add_literal(const std::string& field, const std::string& value) {
    entries.push_back({field, MetadataDirective::Kind::LITERAL, value});
}

void MetadataSpec::add_copy_if_stable(const std::string& field) {
    entries.push_back({field, MetadataDirective::Kind::COPY_IF_STABLE, ""});
}

MetadataSpec MetadataSpec::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Metadata spec not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

MetadataSpec MetadataSpec::from_yaml(const YAML::Node& root) {
    const YAML::Node fields = (root && root.IsMap() && root["metadata"]) ? root["metadata"] : root;
    if (!fields || !fields.IsMap()) {
        throw ConfigError("metadata spec must be a mapping of field -> directive");
    }

    MetadataSpec spec;
    for (const auto& kv : fields) {
        const std::string field = kv.first.as<std::string>();
        const YAML::Node& d = kv.second;
        if (spec.contains(field)) {
            throw ConfigError("metadata." + field + " declared twice");
        }

        if (d.IsMap() && d["value"]) {
            spec.add_literal(field, scalar_or_list_to_text(d["value"], field));
        } else if (d.IsMap() && d["copy_if_stable"]) {
            bool enabled = false;
            try {
                enabled = d["copy_if_stable"].as<bool>();
            } catch (const YAML::Exception&) {
                throw ConfigError("metadata." + field + ".copy_if_stable must be a boolean");
            }
            if (enabled) spec.add_copy_if_stable(field);
        } else {
            throw ConfigError("metadata." + field +
                              " must declare either 'value' or 'copy_if_stable'");
        }
    }
    return spec;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "title": "synthflat process_params",
  "type": "object",
  "properties": {
    "method": {"type": "string", "enum": ["none", "threshold_median", "external"]},
    "threshold": {"type": "number"},
    "threshold_mode": {"type": "string", "enum": ["percentile", "absolute"]},
    "median_filter_size": {"type": "integer", "minimum": 1},
    "gaussian_blur_sigma": {"type": "number", "minimum": 0},
    "external_tool_path": {"type": "string"},
    "external_tool_timeout_seconds": {"type": "integer", "exclusiveMinimum": 0},
    "external_tool_args": {"type": "array", "items": {"type": "string"}},
    "external_tool_format": {"type": "string", "enum": ["tiff", "fits"]},
    "fallback_method": {"type": "string", "enum": ["none", "threshold_median"]},
    "combine_rule": {"type": "string", "enum": ["median", "mean"]},
    "strict": {"type": "boolean"},
    "input_pattern": {"type": "string"},
    "parallel_workers": {"type": "integer", "minimum": 1},
    "camera_db": {"type": "string"}
  },
  "allOf": [
    {"if": {"properties": {"method": {"const": "threshold_median"}}},
     "then": {"required": ["threshold", "median_filter_size", "gaussian_blur_sigma"]}},
    {"if": {"properties": {"method": {"const": "external"}}},
     "then": {"required": ["external_tool_path"]}}
  ]
})";
}

} // namespace synthflat::config
