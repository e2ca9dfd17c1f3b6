#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace synthflat {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using RawGrid = Eigen::Matrix<uint16_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Source metadata: field name -> value rendered as text
using MetadataMap = std::map<std::string, std::string>;

// 2x2 mosaic (Bayer) tiling
enum class MosaicPattern {
    UNKNOWN,
    RGGB,
    BGGR,
    GRBG,
    GBRG
};

inline std::string mosaic_pattern_to_string(MosaicPattern pattern) {
    switch (pattern) {
        case MosaicPattern::RGGB: return "RGGB";
        case MosaicPattern::BGGR: return "BGGR";
        case MosaicPattern::GRBG: return "GRBG";
        case MosaicPattern::GBRG: return "GBRG";
        default: return "UNKNOWN";
    }
}

inline MosaicPattern string_to_mosaic_pattern(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (norm == "RGGB") return MosaicPattern::RGGB;
    if (norm == "BGGR") return MosaicPattern::BGGR;
    if (norm == "GRBG") return MosaicPattern::GRBG;
    if (norm == "GBRG") return MosaicPattern::GBRG;
    return MosaicPattern::UNKNOWN;
}

// Color-filter position group. G1 sits on the red row, G2 on the blue row.
enum class ChannelLabel {
    R,
    G1,
    G2,
    B
};

inline constexpr std::array<ChannelLabel, 4> kAllChannels = {
    ChannelLabel::R, ChannelLabel::G1, ChannelLabel::G2, ChannelLabel::B};

inline std::string channel_label_to_string(ChannelLabel label) {
    switch (label) {
        case ChannelLabel::R: return "R";
        case ChannelLabel::G1: return "G1";
        case ChannelLabel::G2: return "G2";
        case ChannelLabel::B: return "B";
    }
    return "?";
}

// Multi-frame combination rule
enum class CombineRule {
    MEDIAN,
    MEAN
};

inline std::string combine_rule_to_string(CombineRule rule) {
    return rule == CombineRule::MEAN ? "mean" : "median";
}

// Output of the external raw decoder for one capture
struct DecodedFrame {
    fs::path source;
    std::string pattern;   // as reported by the decoder, e.g. "RGGB"
    int bit_depth = 16;
    RawGrid samples;       // unmodified, non-demosaiced sample grid
    MetadataMap metadata;
};

// Validated mosaic frame; read-only once extracted
struct RawFrame {
    fs::path source;
    MosaicPattern pattern = MosaicPattern::UNKNOWN;
    int bit_depth = 16;
    RawGrid samples;

    int width() const { return static_cast<int>(samples.cols()); }
    int height() const { return static_cast<int>(samples.rows()); }
};

// One channel sub-lattice at channel resolution
struct ChannelImage {
    ChannelLabel label = ChannelLabel::R;
    int row_offset = 0;   // parity of the channel inside the 2x2 tile
    int col_offset = 0;
    Matrix2Df data;

    int rows() const { return static_cast<int>(data.rows()); }
    int cols() const { return static_cast<int>(data.cols()); }
};

using ChannelSet = std::map<ChannelLabel, ChannelImage>;

// Pipeline phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    EXTRACTION = 1,
    AGGREGATION = 2,
    ARTIFACT_REMOVAL = 3,
    RECONSTRUCTION = 4,
    METADATA = 5,
    ENCODING = 6,
    DONE = 7
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::EXTRACTION: return "EXTRACTION";
        case Phase::AGGREGATION: return "AGGREGATION";
        case Phase::ARTIFACT_REMOVAL: return "ARTIFACT_REMOVAL";
        case Phase::RECONSTRUCTION: return "RECONSTRUCTION";
        case Phase::METADATA: return "METADATA";
        case Phase::ENCODING: return "ENCODING";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace synthflat
