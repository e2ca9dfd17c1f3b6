#pragma once

#include "synthflat/config/configuration.hpp"
#include "synthflat/core/types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace synthflat::removal {

using WarningSink = std::function<void(const std::string&)>;

// Per-channel star/artifact suppression. apply() must preserve dimensions.
class ArtifactRemovalStrategy {
public:
    virtual ~ArtifactRemovalStrategy() = default;

    virtual std::string name() const = 0;

    // Checks that need no channel data; called once before processing
    virtual void preflight(const config::ProcessingParameters& params) const { (void)params; }

    virtual ChannelImage apply(const ChannelImage& channel,
                               const config::ProcessingParameters& params) const = 0;
};

class IdentityStrategy : public ArtifactRemovalStrategy {
public:
    std::string name() const override { return config::kMethodNone; }
    ChannelImage apply(const ChannelImage& channel,
                       const config::ProcessingParameters& params) const override;
};

/**
 * Percentile or absolute threshold marks star candidates, each replaced
 * by the median of its unmarked k x k neighbors; a Gaussian pass then
 * smooths the whole channel.
 */
class ThresholdMedianSmoothing : public ArtifactRemovalStrategy {
public:
    std::string name() const override { return config::kMethodThresholdMedian; }
    ChannelImage apply(const ChannelImage& channel,
                       const config::ProcessingParameters& params) const override;

    // Sample value at or above which a sample is a star candidate
    static float resolve_threshold(const Matrix2Df& data, const config::ProcessingParameters& params);
};

/**
 * Hands the channel to an external executable through files:
 *   <tool> <input> <output> [external_tool_args...]
 * Nonzero exit, timeout, missing output or a size change throw
 * ExternalToolError. Cancellation kills the child and throws StopRequested.
 */
class ExternalToolDelegate : public ArtifactRemovalStrategy {
public:
    explicit ExternalToolDelegate(const std::atomic<bool>* stop_flag = nullptr)
        : stop_flag_(stop_flag) {}

    std::string name() const override { return config::kMethodExternal; }
    void preflight(const config::ProcessingParameters& params) const override;
    ChannelImage apply(const ChannelImage& channel,
                       const config::ProcessingParameters& params) const override;

    // Throws ExternalToolError unless path names an executable file
    static void check_executable(const std::string& path);

private:
    const std::atomic<bool>* stop_flag_;
};

// Primary strategy whose ExternalToolError is downgraded to a warning
class FallbackStrategy : public ArtifactRemovalStrategy {
public:
    FallbackStrategy(std::unique_ptr<ArtifactRemovalStrategy> primary,
                     std::unique_ptr<ArtifactRemovalStrategy> fallback,
                     WarningSink warn);

    std::string name() const override;
    void preflight(const config::ProcessingParameters& params) const override;
    ChannelImage apply(const ChannelImage& channel,
                       const config::ProcessingParameters& params) const override;

private:
    std::unique_ptr<ArtifactRemovalStrategy> primary_;
    std::unique_ptr<ArtifactRemovalStrategy> fallback_;
    WarningSink warn_;
    mutable std::atomic<bool> primary_unusable_{false};
};

/**
 * Validate params and build the strategy for params.method, wrapped in a
 * FallbackStrategy when fallback_method is set. Throws ConfigError.
 */
std::unique_ptr<ArtifactRemovalStrategy> make_strategy(const config::ProcessingParameters& params,
                                                       const std::atomic<bool>* stop_flag = nullptr,
                                                       WarningSink warn = {});

// strategy.apply() with the dimension postcondition enforced
ChannelImage apply_checked(const ArtifactRemovalStrategy& strategy, const ChannelImage& channel,
                           const config::ProcessingParameters& params);

} // namespace synthflat::removal
