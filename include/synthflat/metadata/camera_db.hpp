#pragma once

#include "synthflat/config/configuration.hpp"
#include "synthflat/core/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace synthflat::metadata {

struct CameraEntry {
    std::string name;
    // metadata key -> required value
    std::vector<std::pair<std::string, std::string>> properties;
    std::string bayer_pattern_key;
    std::vector<std::string> master_flat_metadata;
};

/**
 * Camera database loaded from YAML:
 *
 *   - camera:
 *       name: Nikon D5600
 *       properties:
 *         - group: Exif.Image
 *           Make: NIKON CORPORATION
 *       bayer_pattern:
 *         - group: ""
 *           name: CFAPattern
 *       master_flat_metadata:
 *         - group: Exif.Photo
 *           name: ISOSpeedRatings
 *
 * A key is "<group>.<name>", or just the name when group is empty.
 */
class CameraDatabase {
public:
    static CameraDatabase load(const fs::path& path);
    static CameraDatabase from_yaml(const YAML::Node& node);

    const std::vector<CameraEntry>& cameras() const { return cameras_; }

    // First camera whose every property equals the frame's value
    std::optional<CameraEntry> match(const MetadataMap& metadata) const;

private:
    std::vector<CameraEntry> cameras_;
};

std::optional<std::string> camera_bayer_pattern(const CameraEntry& camera, const MetadataMap& metadata);

/**
 * Master-flat fields of the camera present in the frame metadata.
 * With allow_subset = false a missing field throws ValidationError.
 */
std::vector<std::string> master_flat_fields(const CameraEntry& camera, const MetadataMap& metadata,
                                            bool allow_subset = true);

// Appends every field the metadata spec does not name yet as copy-if-stable
void extend_spec(config::MetadataSpec& spec, const std::vector<std::string>& fields);

} // namespace synthflat::metadata
