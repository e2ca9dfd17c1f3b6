#pragma once

#include "synthflat/config/configuration.hpp"
#include "synthflat/metadata/analysis.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace synthflat::metadata {

struct ResolvedMetadata {
    // metadata spec order; never contains a field it did not name
    std::vector<std::pair<std::string, std::string>> entries;
    std::vector<std::string> warnings;

    bool contains(const std::string& field) const;
    std::optional<std::string> get(const std::string& field) const;
};

/**
 * Literal fields are emitted as given. A copy-if-stable field is emitted
 * only when every source frame carries it with one and the same value;
 * otherwise it is dropped and a warning recorded.
 */
ResolvedMetadata resolve(const config::MetadataSpec& spec, const MetadataReport& batch_report);

} // namespace synthflat::metadata
