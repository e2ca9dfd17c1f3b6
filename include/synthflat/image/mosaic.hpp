#pragma once

#include "synthflat/core/types.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace synthflat::image {

// Sub-lattice of one channel inside the full mosaic
struct ChannelLattice {
    ChannelLabel label = ChannelLabel::R;
    int row_offset = 0;
    int col_offset = 0;
    int rows = 0;   // channel-resolution height
    int cols = 0;   // channel-resolution width

    int mosaic_row(int r) const { return 2 * r + row_offset; }
    int mosaic_col(int c) const { return 2 * c + col_offset; }

    // Full-resolution (row, col) pairs covered by this channel, row-major
    std::vector<std::pair<int, int>> coordinates() const;
};

/**
 * Tile position of every channel label for a 2x2 pattern, indexed by
 * ChannelLabel (R, G1, G2, B). Throws UnsupportedPatternError for UNKNOWN.
 */
std::array<std::pair<int, int>, 4> pattern_layout(MosaicPattern pattern);

ChannelLabel label_at(MosaicPattern pattern, int row, int col);

/**
 * Normalize the textual CFA descriptions found in raw headers to the
 * 4-letter form ("RGGB", "R G G B", "[Red,Green][Green,Blue]", "0 1 1 2").
 */
std::string standardize_pattern(const std::string& text);

MosaicPattern parse_pattern(const std::string& text);

/**
 * Validate a decoded frame and take its sample grid.
 * Throws UnsupportedPatternError for unrecognized patterns and
 * GeometryMismatchError for empty or odd-sized grids.
 */
RawFrame extract(DecodedFrame&& decoded);
RawFrame extract(const DecodedFrame& decoded);

std::vector<ChannelLattice> channel_lattices(MosaicPattern pattern, int height, int width);

// One ChannelImage per label at channel resolution
ChannelSet split_channels(const RawFrame& frame);

/**
 * Reassemble channel images into a full-resolution mosaic.
 * Every output position receives exactly one channel sample; any
 * gap, overlap, misplaced sub-lattice or size mismatch throws
 * PatternCoverageError.
 */
Matrix2Df reconstruct(const ChannelSet& channels, MosaicPattern pattern, int height, int width);
Matrix2Df reconstruct(const ChannelSet& channels, MosaicPattern pattern);

} // namespace synthflat::image
