#include "synthflat/removal/strategy.hpp"
#include "synthflat/image/filters.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

namespace synthflat::removal {

float ThresholdMedianSmoothing::resolve_threshold(const Matrix2Df& data,
                                                  const config::ProcessingParameters& params) {
    if (!params.threshold) {
        throw ConfigError("method threshold_median requires 'threshold'");
    }
    if (params.threshold_mode == "absolute") {
        return *params.threshold;
    }
    std::vector<float> values(data.data(), data.data() + data.size());
    return core::compute_percentile(std::move(values), *params.threshold);
}

ChannelImage ThresholdMedianSmoothing::apply(const ChannelImage& channel,
                                             const config::ProcessingParameters& params) const {
    if (!params.median_filter_size || !params.gaussian_blur_sigma) {
        throw ConfigError("method threshold_median requires 'median_filter_size' and "
                          "'gaussian_blur_sigma'");
    }

    ChannelImage out = channel;
    if (channel.data.size() == 0) return out;

    const float threshold = resolve_threshold(channel.data, params);
    const image::Mask2D marked = image::mark_at_or_above(channel.data, threshold);

    Matrix2Df cleaned = image::masked_median_replace(channel.data, marked, *params.median_filter_size);
    out.data = image::gaussian_blur(cleaned, *params.gaussian_blur_sigma);
    return out;
}

} // namespace synthflat::removal
