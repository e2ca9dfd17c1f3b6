#include "synthflat/removal/strategy.hpp"
#include "synthflat/core/errors.hpp"


namespace synthflat::removal {

namespace {

std::unique_ptr<ArtifactRemovalStrategy> make_single(const std::string& method,
                                                     const std::atomic<bool>* stop_flag) {
    if (method == config::kMethodNone) return std::make_unique<IdentityStrategy>();
    if (method == config::kMethodThresholdMedian) return std::make_unique<ThresholdMedianSmoothing>();
    if (method == config::kMethodExternal) return std::make_unique<ExternalToolDelegate>(stop_flag);
    throw ConfigError("unknown method '" + method + "'");
}

} // namespace

ChannelImage IdentityStrategy::apply(const ChannelImage& channel,
                                     const config::ProcessingParameters& params) const {
    (void)params;
    return channel;
}

FallbackStrategy::FallbackStrategy(std::unique_ptr<ArtifactRemovalStrategy> primary,
                                   std::unique_ptr<ArtifactRemovalStrategy> fallback,
                                   WarningSink warn)
    : primary_(std::move(primary)), fallback_(std::move(fallback)), warn_(std::move(warn)) {}

std::string FallbackStrategy::name() const {
    return primary_->name() + "|" + fallback_->name();
}

void FallbackStrategy::preflight(const config::ProcessingParameters& params) const {
    fallback_->preflight(params);
    try {
        primary_->preflight(params);
    } catch (const ExternalToolError& e) {
        primary_unusable_ = true;
        if (warn_) warn_(std::string(e.what()) + "; using fallback " + fallback_->name());
    }
}

ChannelImage FallbackStrategy::apply(const ChannelImage& channel,
                                     const config::ProcessingParameters& params) const {
    if (!primary_unusable_) {
        try {
            return primary_->apply(channel, params);
        } catch (const ExternalToolError& e) {
            if (warn_) {
                warn_("channel " + channel_label_to_string(channel.label) + ": " + e.what() +
                      "; using fallback " + fallback_->name());
            }
        }
    }
    return fallback_->apply(channel, params);
}

std::unique_ptr<ArtifactRemovalStrategy> make_strategy(const config::ProcessingParameters& params,
                                                       const std::atomic<bool>* stop_flag,
                                                       WarningSink warn) {
    params.validate();

    auto primary = make_single(params.method, stop_flag);
    if (!params.fallback_method) {
        return primary;
    }
    auto fallback = make_single(*params.fallback_method, stop_flag);
    return std::make_unique<FallbackStrategy>(std::move(primary), std::move(fallback), std::move(warn));
}

ChannelImage apply_checked(const ArtifactRemovalStrategy& strategy, const ChannelImage& channel,
                           const config::ProcessingParameters& params) {
    ChannelImage out = strategy.apply(channel, params);
    if (out.rows() != channel.rows() || out.cols() != channel.cols()) {
        throw PipelineError("strategy " + strategy.name() + " changed channel " +
                            channel_label_to_string(channel.label) + " from " +
                            std::to_string(channel.cols()) + "x" + std::to_string(channel.rows()) +
                            " to " + std::to_string(out.cols()) + "x" + std::to_string(out.rows()));
    }
    out.label = channel.label;
    out.row_offset = channel.row_offset;
    out.col_offset = channel.col_offset;
    return out;
}

} // namespace synthflat::removal
