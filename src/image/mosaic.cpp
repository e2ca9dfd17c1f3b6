#include "synthflat/image/mosaic.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

#include <algorithm>

namespace synthflat::image {

namespace {

size_t label_index(ChannelLabel label) {
    return static_cast<size_t>(label);
}

char component_letter(const std::string& token) {
    if (token == "R" || token == "RED" || token == "0") return 'R';
    if (token == "G" || token == "GREEN" || token == "1") return 'G';
    if (token == "B" || token == "BLUE" || token == "2") return 'B';
    return '\0';
}

} // namespace

std::vector<std::pair<int, int>> ChannelLattice::coordinates() const {
    std::vector<std::pair<int, int>> out;
    out.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols));
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            out.emplace_back(mosaic_row(r), mosaic_col(c));
        }
    }
    return out;
}

std::array<std::pair<int, int>, 4> pattern_layout(MosaicPattern pattern) {
    // {row, col} for R, G1 (red row), G2 (blue row), B
    switch (pattern) {
        case MosaicPattern::RGGB: return {{{0, 0}, {0, 1}, {1, 0}, {1, 1}}};
        case MosaicPattern::BGGR: return {{{1, 1}, {1, 0}, {0, 1}, {0, 0}}};
        case MosaicPattern::GRBG: return {{{0, 1}, {0, 0}, {1, 1}, {1, 0}}};
        case MosaicPattern::GBRG: return {{{1, 0}, {1, 1}, {0, 0}, {0, 1}}};
        default:
            throw UnsupportedPatternError(mosaic_pattern_to_string(pattern));
    }
}

ChannelLabel label_at(MosaicPattern pattern, int row, int col) {
    const auto layout = pattern_layout(pattern);
    for (ChannelLabel label : kAllChannels) {
        const auto& pos = layout[label_index(label)];
        if (pos.first == (row & 1) && pos.second == (col & 1)) return label;
    }
    throw UnsupportedPatternError(mosaic_pattern_to_string(pattern));
}

std::string standardize_pattern(const std::string& text) {
    std::string norm = text;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (char& c : norm) {
        if (c == '[' || c == ']' || c == ',' || c == ';' || c == '/') c = ' ';
    }

    std::vector<std::string> tokens = core::split_ws(norm);
    // single compact token such as "RGGB"
    if (tokens.size() == 1 && tokens[0].size() == 4) {
        std::vector<std::string> letters;
        for (char c : tokens[0]) letters.emplace_back(1, c);
        tokens = letters;
    }
    // Exif CFAPattern with its "2 2" repeat-dimension prefix
    if (tokens.size() == 6 && tokens[0] == "2" && tokens[1] == "2") {
        tokens.erase(tokens.begin(), tokens.begin() + 2);
    }
    if (tokens.size() != 4) {
        throw UnsupportedPatternError("'" + text + "' does not describe a 2x2 tile");
    }

    std::string out;
    for (const auto& t : tokens) {
        char letter = component_letter(t);
        if (letter == '\0') {
            throw UnsupportedPatternError("'" + text + "' has invalid component '" + t + "'");
        }
        out += letter;
    }

    if (string_to_mosaic_pattern(out) == MosaicPattern::UNKNOWN) {
        throw UnsupportedPatternError("'" + text + "' (" + out + ")");
    }
    return out;
}

MosaicPattern parse_pattern(const std::string& text) {
    return string_to_mosaic_pattern(standardize_pattern(text));
}

RawFrame extract(DecodedFrame&& decoded) {
    RawFrame frame;
    frame.source = decoded.source;
    try {
        frame.pattern = parse_pattern(decoded.pattern);
    } catch (const UnsupportedPatternError& e) {
        throw UnsupportedPatternError(std::string(e.what()) + " in " + decoded.source.string());
    }

    const auto h = decoded.samples.rows();
    const auto w = decoded.samples.cols();
    if (h == 0 || w == 0) {
        throw GeometryMismatchError(decoded.source.string() + " has an empty sample grid");
    }
    if (h % 2 != 0 || w % 2 != 0) {
        throw GeometryMismatchError(decoded.source.string() + " has odd dimensions " +
                                    std::to_string(w) + "x" + std::to_string(h));
    }
    if (decoded.bit_depth < 1 || decoded.bit_depth > 16) {
        throw GeometryMismatchError(decoded.source.string() + " reports bit depth " +
                                    std::to_string(decoded.bit_depth));
    }

    frame.bit_depth = decoded.bit_depth;
    frame.samples = std::move(decoded.samples);
    return frame;
}

RawFrame extract(const DecodedFrame& decoded) {
    DecodedFrame copy = decoded;
    return extract(std::move(copy));
}

std::vector<ChannelLattice> channel_lattices(MosaicPattern pattern, int height, int width) {
    const auto layout = pattern_layout(pattern);
    std::vector<ChannelLattice> out;
    for (ChannelLabel label : kAllChannels) {
        ChannelLattice lat;
        lat.label = label;
        lat.row_offset = layout[label_index(label)].first;
        lat.col_offset = layout[label_index(label)].second;
        lat.rows = (height - lat.row_offset + 1) / 2;
        lat.cols = (width - lat.col_offset + 1) / 2;
        out.push_back(lat);
    }
    return out;
}

ChannelSet split_channels(const RawFrame& frame) {
    ChannelSet out;
    for (const auto& lat : channel_lattices(frame.pattern, frame.height(), frame.width())) {
        ChannelImage ch;
        ch.label = lat.label;
        ch.row_offset = lat.row_offset;
        ch.col_offset = lat.col_offset;
        ch.data.resize(lat.rows, lat.cols);
        for (int r = 0; r < lat.rows; ++r) {
            for (int c = 0; c < lat.cols; ++c) {
                ch.data(r, c) = static_cast<float>(frame.samples(lat.mosaic_row(r), lat.mosaic_col(c)));
            }
        }
        out.emplace(lat.label, std::move(ch));
    }
    return out;
}

Matrix2Df reconstruct(const ChannelSet& channels, MosaicPattern pattern, int height, int width) {
    if (height <= 0 || width <= 0) {
        throw PatternCoverageError("target geometry " + std::to_string(width) + "x" +
                                   std::to_string(height) + " is empty");
    }
    if (channels.size() != kAllChannels.size()) {
        throw PatternCoverageError("expected 4 channel images, got " +
                                   std::to_string(channels.size()));
    }

    Matrix2Df mosaic = Matrix2Df::Zero(height, width);
    Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> hits =
        Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>::Zero(height, width);

    for (const auto& lat : channel_lattices(pattern, height, width)) {
        auto it = channels.find(lat.label);
        if (it == channels.end()) {
            throw PatternCoverageError("missing channel " + channel_label_to_string(lat.label));
        }
        const ChannelImage& ch = it->second;
        if (ch.label != lat.label) {
            throw PatternCoverageError("channel stored under " + channel_label_to_string(lat.label) +
                                       " is labelled " + channel_label_to_string(ch.label));
        }
        if (ch.row_offset != lat.row_offset || ch.col_offset != lat.col_offset) {
            throw PatternCoverageError("channel " + channel_label_to_string(lat.label) +
                                       " offset does not match pattern " +
                                       mosaic_pattern_to_string(pattern));
        }
        if (ch.rows() != lat.rows || ch.cols() != lat.cols || 2 * lat.rows != height ||
            2 * lat.cols != width) {
            throw PatternCoverageError("channel " + channel_label_to_string(lat.label) + " is " +
                                       std::to_string(ch.cols()) + "x" + std::to_string(ch.rows()) +
                                       ", cannot tile " + std::to_string(width) + "x" +
                                       std::to_string(height));
        }

        for (int r = 0; r < lat.rows; ++r) {
            for (int c = 0; c < lat.cols; ++c) {
                const int y = lat.mosaic_row(r);
                const int x = lat.mosaic_col(c);
                mosaic(y, x) = ch.data(r, c);
                ++hits(y, x);
            }
        }
    }

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (hits(y, x) != 1) {
                throw PatternCoverageError("position (" + std::to_string(y) + ", " +
                                           std::to_string(x) + ") covered " +
                                           std::to_string(static_cast<int>(hits(y, x))) + " times");
            }
        }
    }
    return mosaic;
}

Matrix2Df reconstruct(const ChannelSet& channels, MosaicPattern pattern) {
    if (channels.empty()) {
        throw PatternCoverageError("no channel images");
    }
    const ChannelImage& first = channels.begin()->second;
    return reconstruct(channels, pattern, 2 * first.rows(), 2 * first.cols());
}

} // namespace synthflat::image
