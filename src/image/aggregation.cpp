#include "synthflat/image/aggregation.hpp"
#include "synthflat/image/mosaic.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

namespace synthflat::image {

namespace {

std::string dims(int w, int h) {
    return std::to_string(w) + "x" + std::to_string(h);
}

} // namespace

ChannelAggregator::ChannelAggregator(CombineRule rule,
                                     std::optional<MosaicPattern> expected_pattern)
    : rule_(rule) {
    if (expected_pattern) pattern_ = *expected_pattern;
}

void ChannelAggregator::add(const RawFrame& frame) {
    if (frame_count_ == 0) {
        if (pattern_ == MosaicPattern::UNKNOWN) pattern_ = frame.pattern;
        width_ = frame.width();
        height_ = frame.height();
    }

    if (frame.pattern != pattern_) {
        throw GeometryMismatchError(frame.source.string() + " has pattern " +
                                    mosaic_pattern_to_string(frame.pattern) + ", batch uses " +
                                    mosaic_pattern_to_string(pattern_));
    }
    if (frame.width() != width_ || frame.height() != height_) {
        throw GeometryMismatchError(frame.source.string() + " is " +
                                    dims(frame.width(), frame.height()) + ", batch is " +
                                    dims(width_, height_));
    }

    for (const auto& lat : channel_lattices(pattern_, height_, width_)) {
        auto& stack = stacks_[lat.label];
        stack.reserve(stack.size() + static_cast<size_t>(lat.rows) * static_cast<size_t>(lat.cols));
        for (int r = 0; r < lat.rows; ++r) {
            for (int c = 0; c < lat.cols; ++c) {
                stack.push_back(frame.samples(lat.mosaic_row(r), lat.mosaic_col(c)));
            }
        }
    }
    ++frame_count_;
}

ChannelSet ChannelAggregator::finish() const {
    if (frame_count_ == 0) {
        throw EmptyBatchError("no frames to aggregate");
    }

    const size_t n = frame_count_;
    ChannelSet out;
    std::vector<float> column(n);

    for (const auto& lat : channel_lattices(pattern_, height_, width_)) {
        const auto& stack = stacks_.at(lat.label);
        const size_t plane = static_cast<size_t>(lat.rows) * static_cast<size_t>(lat.cols);

        ChannelImage ch;
        ch.label = lat.label;
        ch.row_offset = lat.row_offset;
        ch.col_offset = lat.col_offset;
        ch.data.resize(lat.rows, lat.cols);

        for (size_t p = 0; p < plane; ++p) {
            float value = 0.0f;
            if (rule_ == CombineRule::MEDIAN) {
                for (size_t f = 0; f < n; ++f) {
                    column[f] = static_cast<float>(stack[f * plane + p]);
                }
                value = core::median_of(column);
            } else {
                uint64_t sum = 0;
                for (size_t f = 0; f < n; ++f) sum += stack[f * plane + p];
                value = static_cast<float>(
                    core::round_half_even(static_cast<double>(sum) / static_cast<double>(n)));
            }
            ch.data.data()[p] = value;
        }
        out.emplace(lat.label, std::move(ch));
    }
    return out;
}

ChannelSet aggregate(const std::vector<RawFrame>& frames, MosaicPattern pattern, CombineRule rule) {
    if (frames.empty()) {
        throw EmptyBatchError("no frames to aggregate");
    }

    ChannelAggregator agg(rule, pattern);
    for (const auto& f : frames) {
        agg.add(f);
    }
    return agg.finish();
}

CombineRule parse_combine_rule(const std::string& s) {
    const std::string v = core::to_lower(core::trim(s));
    if (v == "median") return CombineRule::MEDIAN;
    if (v == "mean") return CombineRule::MEAN;
    throw ConfigError("combine_rule must be 'median' or 'mean', got '" + s + "'");
}

} // namespace synthflat::image
