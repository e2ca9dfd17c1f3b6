#include "synthflat/metadata/camera_db.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

namespace synthflat::metadata {

namespace {

std::string make_key(const std::string& group, const std::string& name) {
    return group.empty() ? name : group + "." + name;
}

std::vector<std::string> read_key_list(const YAML::Node& list, const std::string& what) {
    std::vector<std::string> keys;
    if (!list) return keys;
    if (!list.IsSequence()) {
        throw ConfigError("camera_db: " + what + " must be a list");
    }
    for (const auto& item : list) {
        if (!item["name"]) {
            throw ConfigError("camera_db: " + what + " entry without 'name'");
        }
        const std::string group = item["group"] ? item["group"].as<std::string>() : "";
        keys.push_back(make_key(group, item["name"].as<std::string>()));
    }
    return keys;
}

} // namespace

CameraDatabase CameraDatabase::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Camera database not found: " + path.string());
    }
    try {
        return from_yaml(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot parse " + path.string() + ": " + e.what());
    }
}

CameraDatabase CameraDatabase::from_yaml(const YAML::Node& root) {
    const YAML::Node list = (root && root.IsMap() && root["cameras"]) ? root["cameras"] : root;
    if (!list || !list.IsSequence()) {
        throw ConfigError("camera_db must be a list of camera entries");
    }

    CameraDatabase db;
    for (const auto& item : list) {
        const YAML::Node cam = item["camera"] ? item["camera"] : item;
        CameraEntry entry;
        entry.name = cam["name"] ? cam["name"].as<std::string>() : "camera #" + std::to_string(db.cameras_.size() + 1);

        const YAML::Node props = cam["properties"];
        if (!props || !props.IsSequence() || props.size() == 0) {
            throw ConfigError("camera_db: " + entry.name + " needs a non-empty 'properties' list");
        }
        for (const auto& prop : props) {
            const std::string group = prop["group"] ? prop["group"].as<std::string>() : "";
            for (const auto& kv : prop) {
                const std::string key = kv.first.as<std::string>();
                if (key == "group") continue;
                entry.properties.emplace_back(make_key(group, key), kv.second.as<std::string>());
            }
        }

        auto pattern_keys = read_key_list(cam["bayer_pattern"], "bayer_pattern");
        if (!pattern_keys.empty()) entry.bayer_pattern_key = pattern_keys.front();
        entry.master_flat_metadata = read_key_list(cam["master_flat_metadata"], "master_flat_metadata");

        db.cameras_.push_back(std::move(entry));
    }
    return db;
}

std::optional<CameraEntry> CameraDatabase::match(const MetadataMap& metadata) const {
    for (const auto& cam : cameras_) {
        bool all = true;
        for (const auto& [key, value] : cam.properties) {
            auto it = metadata.find(key);
            if (it == metadata.end() || core::trim(it->second) != core::trim(value)) {
                all = false;
                break;
            }
        }
        if (all) return cam;
    }
    return std::nullopt;
}

std::optional<std::string> camera_bayer_pattern(const CameraEntry& camera, const MetadataMap& metadata) {
    if (camera.bayer_pattern_key.empty()) return std::nullopt;
    auto it = metadata.find(camera.bayer_pattern_key);
    if (it == metadata.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> master_flat_fields(const CameraEntry& camera, const MetadataMap& metadata,
                                            bool allow_subset) {
    std::vector<std::string> present;
    std::vector<std::string> missing;
    for (const auto& key : camera.master_flat_metadata) {
        if (metadata.count(key)) {
            present.push_back(key);
        } else {
            missing.push_back(key);
        }
    }
    if (!allow_subset && !missing.empty()) {
        throw ValidationError(camera.name + ": source metadata lacks master-flat fields: " +
                              core::join(missing, ", "));
    }
    return present;
}

void extend_spec(config::MetadataSpec& spec, const std::vector<std::string>& fields) {
    for (const auto& f : fields) {
        if (!spec.contains(f)) spec.add_copy_if_stable(f);
    }
}

} // namespace synthflat::metadata
