#include "synthflat/pipeline/flat_encoder.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"
#include "synthflat/image/mosaic.hpp"
#include "synthflat/io/exif_metadata.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace synthflat::pipeline {

namespace {

const std::map<std::string, std::string>& exif_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"ISO", "Exif.Photo.ISOSpeedRatings"},
        {"ExposureTime", "Exif.Photo.ExposureTime"},
        {"FNumber", "Exif.Photo.FNumber"},
        {"FocalLength", "Exif.Photo.FocalLength"},
        {"DateTimeOriginal", "Exif.Photo.DateTimeOriginal"},
        {"LensModel", "Exif.Photo.LensModel"},
    };
    return aliases;
}

// Fields consumed by the DNG IFD itself
bool is_dng_field(const std::string& field) {
    static const char* fields[] = {"CFAPattern", "BlackLevel", "WhiteLevel", "ColorMatrix1",
                                   "AsShotNeutral", "CalibrationIlluminant1", "Make", "Model",
                                   "UniqueCameraModel", "DateTime"};
    for (const char* f : fields) {
        if (field == f) return true;
    }
    return false;
}

// IFD0 tags that may be overwritten without touching the raw layout
bool is_safe_image_tag(const std::string& key) {
    static const char* keys[] = {"Exif.Image.Artist", "Exif.Image.Copyright",
                                 "Exif.Image.ImageDescription", "Exif.Image.Make",
                                 "Exif.Image.Model", "Exif.Image.DateTime"};
    for (const char* k : keys) {
        if (key == k) return true;
    }
    return false;
}

bool is_injectable(const std::string& key) {
    if (key.find("MakerNote") != std::string::npos) return false;
    if (core::starts_with(key, "Exif.Image.")) return is_safe_image_tag(key);
    return core::starts_with(key, "Exif.Photo.") || core::starts_with(key, "Exif.GPSInfo.") ||
           core::starts_with(key, "Exif.Iop.") || core::starts_with(key, "Xmp.");
}

double parse_number(const std::string& field, const std::string& token) {
    try {
        size_t slash = token.find('/');
        if (slash != std::string::npos) {
            const double num = std::stod(token.substr(0, slash));
            const double den = std::stod(token.substr(slash + 1));
            if (den == 0.0) throw std::invalid_argument("zero denominator");
            return num / den;
        }
        size_t used = 0;
        const double v = std::stod(token, &used);
        if (used != token.size()) throw std::invalid_argument("trailing characters");
        return v;
    } catch (const std::logic_error&) {
        throw ValidationError(field + ": '" + token + "' is not a number");
    }
}

std::vector<double> parse_numbers(const std::string& field, const std::string& text) {
    std::string norm = text;
    for (char& c : norm) {
        if (c == ',' || c == ';' || c == '[' || c == ']') c = ' ';
    }
    std::vector<double> out;
    for (const auto& token : core::split_ws(norm)) {
        out.push_back(parse_number(field, token));
    }
    return out;
}

std::vector<double> require_count(const std::string& field, const std::string& text,
                                  std::initializer_list<size_t> allowed) {
    std::vector<double> v = parse_numbers(field, text);
    for (size_t n : allowed) {
        if (v.size() == n) return v;
    }
    std::ostringstream oss;
    oss << field << " has " << v.size() << " values, expected ";
    bool first = true;
    for (size_t n : allowed) {
        oss << (first ? "" : " or ") << n;
        first = false;
    }
    throw ValidationError(oss.str());
}

std::string dng_datetime_now() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y:%m:%d %H:%M:%S");
    return oss.str();
}

uint8_t cfa_code(char letter) {
    switch (letter) {
        case 'R': return 0;
        case 'G': return 1;
        default: return 2;
    }
}

} // namespace

FlatEncoder::FlatEncoder(std::string run_id, std::string software)
    : run_id_(std::move(run_id)), software_(std::move(software)) {}

const std::vector<std::string>& FlatEncoder::mandatory_fields() {
    static const std::vector<std::string> fields = {
        "CFAPattern", "BlackLevel", "WhiteLevel", "ColorMatrix1", "AsShotNeutral"};
    return fields;
}

io::DngImage FlatEncoder::prepare(const SyntheticFlat& flat) const {
    const auto& md = flat.metadata;

    std::vector<std::string> missing;
    for (const auto& field : mandatory_fields()) {
        if (!md.contains(field) || core::trim(*md.get(field)).empty()) missing.push_back(field);
    }
    if (!missing.empty()) {
        throw MissingRequiredMetadataError(core::join(missing, ", "));
    }

    if (flat.mosaic.size() == 0) {
        throw PipelineError("synthetic flat has no samples");
    }

    io::DngImage dng;
    dng.width = static_cast<uint32_t>(flat.mosaic.cols());
    dng.height = static_cast<uint32_t>(flat.mosaic.rows());

    const std::string pattern = image::standardize_pattern(*md.get("CFAPattern"));
    if (string_to_mosaic_pattern(pattern) != flat.pattern) {
        throw ValidationError("CFAPattern " + pattern + " does not match the flat's pattern " +
                              mosaic_pattern_to_string(flat.pattern));
    }
    for (size_t i = 0; i < 4; ++i) dng.cfa_pattern[i] = cfa_code(pattern[i]);

    const auto black = require_count("BlackLevel", *md.get("BlackLevel"), {1, 4});
    for (size_t i = 0; i < 4; ++i) {
        dng.black_level[i] = static_cast<float>(black.size() == 1 ? black[0] : black[i]);
    }

    const auto white = require_count("WhiteLevel", *md.get("WhiteLevel"), {1});
    if (!(white[0] >= 1.0 && white[0] <= 65535.0) || white[0] != std::floor(white[0])) {
        throw ValidationError("WhiteLevel must be an integer in [1, 65535]");
    }
    dng.white_level = static_cast<uint32_t>(white[0]);
    for (float b : dng.black_level) {
        if (b < 0.0f || b >= static_cast<float>(dng.white_level)) {
            throw ValidationError("BlackLevel must lie in [0, WhiteLevel)");
        }
    }

    const auto matrix = require_count("ColorMatrix1", *md.get("ColorMatrix1"), {9});
    for (size_t i = 0; i < 9; ++i) dng.color_matrix1[i] = static_cast<float>(matrix[i]);

    const auto neutral = require_count("AsShotNeutral", *md.get("AsShotNeutral"), {3});
    for (size_t i = 0; i < 3; ++i) {
        if (!(neutral[i] > 0.0)) throw ValidationError("AsShotNeutral values must be > 0");
        dng.as_shot_neutral[i] = static_cast<float>(neutral[i]);
    }

    if (auto illum = md.get("CalibrationIlluminant1")) {
        dng.calibration_illuminant1 =
            static_cast<uint16_t>(require_count("CalibrationIlluminant1", *illum, {1})[0]);
    }
    dng.make = md.get("Make").value_or("");
    dng.model = md.get("Model").value_or("");
    dng.unique_camera_model = md.get("UniqueCameraModel").value_or("");
    dng.datetime = md.get("DateTime").value_or(dng_datetime_now());
    dng.software = software_;

    dng.samples.resize(static_cast<size_t>(flat.mosaic.size()));
    const uint16_t max_value = static_cast<uint16_t>(dng.white_level);
    for (Eigen::Index i = 0; i < flat.mosaic.size(); ++i) {
        dng.samples[static_cast<size_t>(i)] = core::quantize_sample(flat.mosaic.data()[i], max_value);
    }
    return dng;
}

std::vector<std::pair<std::string, std::string>> FlatEncoder::exif_entries(const SyntheticFlat& flat) const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [field, value] : flat.metadata.entries) {
        if (is_dng_field(field)) continue;
        auto alias = exif_aliases().find(field);
        const std::string key = alias != exif_aliases().end() ? alias->second : field;
        if (is_injectable(key)) out.emplace_back(key, value);
    }
    return out;
}

std::vector<std::string> FlatEncoder::encode(const SyntheticFlat& flat, const fs::path& destination) const {
    // validation happens before the first byte is written
    io::DngImage dng = prepare(flat);
    auto exif = exif_entries(flat);

    std::vector<std::string> warnings;
    for (const auto& [field, value] : flat.metadata.entries) {
        if (is_dng_field(field)) continue;
        auto alias = exif_aliases().find(field);
        const std::string key = alias != exif_aliases().end() ? alias->second : field;
        if (!is_injectable(key)) {
            warnings.push_back("metadata field '" + field + "' has no writable tag, not embedded");
        }
    }

    if (destination.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create " + destination.parent_path().string() + ": " + ec.message());
        }
    }
    const fs::path tmp = core::temp_sibling(destination, run_id_);
    try {
        io::write_dng(tmp, dng);
        for (const auto& key : io::inject_metadata(tmp, exif)) {
            warnings.push_back("metadata field '" + key + "' rejected by the tag writer");
        }
        core::commit_temp_file(tmp, destination);
    } catch (const std::exception&) {
        core::remove_quietly(tmp);
        throw;
    }
    return warnings;
}

} // namespace synthflat::pipeline
