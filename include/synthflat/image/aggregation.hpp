#pragma once

#include "synthflat/core/types.hpp"

#include <map>
#include <optional>
#include <vector>

namespace synthflat::image {

/**
 * Per-channel multi-frame combination.
 *
 * Frames are folded in one at a time and released by the caller; only the
 * per-channel sample stacks are retained. All frames must share the first
 * frame's geometry and pattern (GeometryMismatchError otherwise).
 */
class ChannelAggregator {
public:
    explicit ChannelAggregator(CombineRule rule,
                               std::optional<MosaicPattern> expected_pattern = std::nullopt);

    void add(const RawFrame& frame);

    size_t frame_count() const { return frame_count_; }
    MosaicPattern pattern() const { return pattern_; }
    int width() const { return width_; }
    int height() const { return height_; }

    // Throws EmptyBatchError when no frame was added
    ChannelSet finish() const;

private:
    CombineRule rule_;
    MosaicPattern pattern_ = MosaicPattern::UNKNOWN;
    int width_ = 0;
    int height_ = 0;
    size_t frame_count_ = 0;
    // frame-major sample stacks, one per channel label
    std::map<ChannelLabel, std::vector<uint16_t>> stacks_;
};

ChannelSet aggregate(const std::vector<RawFrame>& frames, MosaicPattern pattern,
                     CombineRule rule = CombineRule::MEDIAN);

CombineRule parse_combine_rule(const std::string& s);

} // namespace synthflat::image
