#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace synthflat::config {

namespace fs = std::filesystem;

// Recognized artifact-removal methods
inline constexpr const char* kMethodNone = "none";
inline constexpr const char* kMethodThresholdMedian = "threshold_median";
inline constexpr const char* kMethodExternal = "external";

struct ProcessingParameters {
    std::string method = kMethodNone;

    // threshold_median
    std::optional<float> threshold;
    std::string threshold_mode = "percentile"; // percentile | absolute
    std::optional<int> median_filter_size;
    std::optional<float> gaussian_blur_sigma;

    // external
    std::optional<std::string> external_tool_path;
    int external_tool_timeout_seconds = 600;
    std::vector<std::string> external_tool_args;
    std::string external_tool_format = "tiff"; // tiff | fits

    std::optional<std::string> fallback_method;

    std::string combine_rule = "median"; // median | mean
    bool strict = false;
    std::string input_pattern = "*.nef";
    int parallel_workers = 4;
    std::string camera_db;

    static ProcessingParameters load(const fs::path& path);
    static ProcessingParameters from_yaml(const YAML::Node& node);
    void save(const fs::path& path) const;
    YAML::Node to_yaml() const;

    // Throws ConfigError naming the offending key
    void validate() const;
};

struct MetadataDirective {
    enum class Kind { COPY_IF_STABLE, LITERAL };

    std::string field;
    Kind kind = Kind::COPY_IF_STABLE;
    std::string value; // LITERAL only
};

// Field directives in document order
struct MetadataSpec {
    std::vector<MetadataDirective> entries;

    bool contains(const std::string& field) const;
    void add_literal(const std::string& field, const std::string& value);
    void add_copy_if_stable(const std::string& field);

    static MetadataSpec load(const fs::path& path);
    static MetadataSpec from_yaml(const YAML::Node& node);
};

std::string get_schema_json();

} // namespace synthflat::config
