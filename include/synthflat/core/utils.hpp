#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace synthflat::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern = "*.nef");
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Sibling path used for write-then-rename output
fs::path temp_sibling(const fs::path& target, const std::string& run_id);
void commit_temp_file(const fs::path& tmp, const fs::path& target);
void remove_quietly(const fs::path& path) noexcept;

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
float median_of(std::vector<float>& v);
float compute_percentile(std::vector<float> values, float percentile);
double round_half_even(double value);
uint16_t quantize_sample(double value, uint16_t max_value);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::vector<std::string> split_ws(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Glob pattern matching (case-insensitive)
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace synthflat::core
