#pragma once

#include "synthflat/core/types.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace synthflat::io {
class FrameDecoder;
}

namespace synthflat::metadata {

struct FieldStats {
    std::vector<std::string> values;   // sorted, distinct
    size_t missing_count = 0;          // frames that do not carry the field
};

using MetadataReport = std::map<std::string, FieldStats>;

// Distinct values of every field seen anywhere in the batch
MetadataReport analyze_metadata(const std::vector<MetadataMap>& batch);

// Reads the metadata of every file on up to `workers` threads, in input
// order. Files that cannot be read are left out and named in `skipped`.
std::vector<MetadataMap> collect_metadata(const io::FrameDecoder& decoder,
                                          const std::vector<fs::path>& files, int workers,
                                          std::vector<std::string>* skipped = nullptr);

// {field: {distinct_values_count, values, missing_count}}
nlohmann::json report_to_json(const MetadataReport& report);
MetadataReport report_from_json(const nlohmann::json& j);

void write_report(const fs::path& path, const MetadataReport& report);
MetadataReport read_report(const fs::path& path);

// Fixed-width table: field, distinct count, the value or "multiple"
std::string summarize_report(const MetadataReport& report);

} // namespace synthflat::metadata
