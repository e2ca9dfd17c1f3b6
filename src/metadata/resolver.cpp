#include "synthflat/metadata/resolver.hpp"
#include "synthflat/core/utils.hpp"

namespace synthflat::metadata {

bool ResolvedMetadata::contains(const std::string& field) const {
    return get(field).has_value();
}

std::optional<std::string> ResolvedMetadata::get(const std::string& field) const {
    for (const auto& [key, value] : entries) {
        if (key == field) return value;
    }
    return std::nullopt;
}

ResolvedMetadata resolve(const config::MetadataSpec& spec, const MetadataReport& batch_report) {
    ResolvedMetadata out;

    for (const auto& d : spec.entries) {
        if (d.kind == config::MetadataDirective::Kind::LITERAL) {
            out.entries.emplace_back(d.field, d.value);
            continue;
        }

        auto it = batch_report.find(d.field);
        if (it == batch_report.end()) {
            out.warnings.push_back("metadata field '" + d.field +
                                   "' not present in source frames, omitted");
            continue;
        }

        const FieldStats& stats = it->second;
        if (stats.values.size() != 1) {
            out.warnings.push_back("metadata field '" + d.field + "' varies across source frames (" +
                                   std::to_string(stats.values.size()) +
                                   " distinct values: " + core::join(stats.values, ", ") +
                                   "), omitted");
            continue;
        }
        if (stats.missing_count > 0) {
            out.warnings.push_back("metadata field '" + d.field + "' missing in " +
                                   std::to_string(stats.missing_count) +
                                   " source frame(s), omitted");
            continue;
        }
        out.entries.emplace_back(d.field, stats.values.front());
    }
    return out;
}

} // namespace synthflat::metadata
