#include "synthflat/removal/strategy.hpp"
#include "synthflat/io/tiff_io.hpp"
#include "synthflat/core/errors.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace synthflat;
using config::ProcessingParameters;

namespace {

ChannelImage channel_from(const Matrix2Df& data, ChannelLabel label = ChannelLabel::G1) {
  ChannelImage ch;
  ch.label = label;
  ch.row_offset = 0;
  ch.col_offset = 1;
  ch.data = data;
  return ch;
}

Matrix2Df sky(int rows, int cols) {
  Matrix2Df m(rows, cols);
  for (int y = 0; y < rows; ++y) {
    for (int x = 0; x < cols; ++x) {
      m(y, x) = 1000.0f + static_cast<float>((y * 7 + x * 3) % 5);
    }
  }
  return m;
}

ProcessingParameters threshold_params(float threshold, int k, float sigma) {
  ProcessingParameters p;
  p.method = config::kMethodThresholdMedian;
  p.threshold = threshold;
  p.median_filter_size = k;
  p.gaussian_blur_sigma = sigma;
  return p;
}

ProcessingParameters external_params(const fs::path& tool) {
  ProcessingParameters p;
  p.method = config::kMethodExternal;
  p.external_tool_path = tool.string();
  p.external_tool_timeout_seconds = 10;
  return p;
}

class ShrinkingStrategy : public removal::ArtifactRemovalStrategy {
public:
  std::string name() const override { return "shrink"; }
  ChannelImage apply(const ChannelImage& channel, const ProcessingParameters&) const override {
    ChannelImage out = channel;
    out.data = channel.data.topRows(channel.rows() - 1);
    return out;
  }
};

} // namespace

TEST_CASE("identity_returns_channel_unchanged") {
  ProcessingParameters p;
  auto strategy = removal::make_strategy(p);
  REQUIRE(strategy->name() == "none");

  ChannelImage in = channel_from(sky(6, 8), ChannelLabel::B);
  ChannelImage out = removal::apply_checked(*strategy, in, p);
  REQUIRE(out.data == in.data);
  REQUIRE(out.label == ChannelLabel::B);
  REQUIRE(out.col_offset == 1);
}

TEST_CASE("threshold_median_preserves_dimensions_for_any_window") {
  const Matrix2Df data = sky(6, 10);
  for (int k : {1, 3, 5, 7, 9, 15}) {
    ProcessingParameters p = threshold_params(90.0f, k, 1.5f);
    auto strategy = removal::make_strategy(p);
    ChannelImage out = removal::apply_checked(*strategy, channel_from(data), p);
    REQUIRE(out.rows() == 6);
    REQUIRE(out.cols() == 10);
  }
}

TEST_CASE("threshold_median_removes_a_point_source") {
  Matrix2Df data = Matrix2Df::Constant(16, 16, 1000.0f);
  data(8, 8) = 9000.0f;
  data(8, 9) = 4000.0f;
  data(2, 3) = 6000.0f;

  ProcessingParameters p = threshold_params(2000.0f, 5, 0.0f);
  p.threshold_mode = "absolute";
  auto strategy = removal::make_strategy(p);
  ChannelImage out = removal::apply_checked(*strategy, channel_from(data), p);

  REQUIRE((out.data.array() == 1000.0f).all());
}

TEST_CASE("threshold_median_blur_keeps_a_flat_field_flat") {
  Matrix2Df data = Matrix2Df::Constant(12, 12, 2500.0f);
  ProcessingParameters p = threshold_params(99.0f, 3, 2.0f);
  auto strategy = removal::make_strategy(p);
  ChannelImage out = removal::apply_checked(*strategy, channel_from(data), p);
  for (int y = 0; y < 12; ++y) {
    for (int x = 0; x < 12; ++x) {
      REQUIRE(out.data(y, x) == Catch::Approx(2500.0f).epsilon(1e-5));
    }
  }
}

TEST_CASE("percentile_threshold_is_taken_over_the_channel") {
  Matrix2Df data(10, 10);
  for (int i = 0; i < 100; ++i) data.data()[i] = static_cast<float>(i + 1);

  ProcessingParameters p = threshold_params(50.0f, 3, 0.0f);
  REQUIRE(removal::ThresholdMedianSmoothing::resolve_threshold(data, p) == Catch::Approx(50.5f));
  p.threshold_mode = "absolute";
  p.threshold = 42.0f;
  REQUIRE(removal::ThresholdMedianSmoothing::resolve_threshold(data, p) == Catch::Approx(42.0f));
}

TEST_CASE("strategy_construction_validates_parameters") {
  ProcessingParameters unknown;
  unknown.method = "wavelet";
  REQUIRE_THROWS_AS(removal::make_strategy(unknown), ConfigError);

  ProcessingParameters incomplete;
  incomplete.method = config::kMethodThresholdMedian;
  incomplete.threshold = 99.0f;
  REQUIRE_THROWS_AS(removal::make_strategy(incomplete), ConfigError);

  ProcessingParameters even = threshold_params(99.0f, 4, 1.0f);
  REQUIRE_THROWS_AS(removal::make_strategy(even), ConfigError);

  ProcessingParameters no_tool;
  no_tool.method = config::kMethodExternal;
  REQUIRE_THROWS_AS(removal::make_strategy(no_tool), ConfigError);
}

TEST_CASE("apply_checked_rejects_dimension_changes") {
  ShrinkingStrategy shrink;
  ProcessingParameters p;
  REQUIRE_THROWS_AS(removal::apply_checked(shrink, channel_from(sky(4, 4)), p), PipelineError);
}

TEST_CASE("external_tool_round_trips_the_channel") {
  core::ScopedTempDir dir("synthflat-ext");
  auto tool = testing::write_script(dir.path(), "copy.sh", "cp \"$1\" \"$2\"");

  const Matrix2Df data = sky(6, 8);
  for (const char* format : {"tiff", "fits"}) {
    ProcessingParameters p = external_params(tool);
    p.external_tool_format = format;
    auto strategy = removal::make_strategy(p);
    strategy->preflight(p);
    ChannelImage out = removal::apply_checked(*strategy, channel_from(data), p);
    REQUIRE(out.data.isApprox(data));
  }
}

TEST_CASE("external_tool_passes_extra_arguments") {
  core::ScopedTempDir dir("synthflat-ext");
  auto tool = testing::write_script(dir.path(), "args.sh",
                                    "[ \"$3\" = \"--strength\" ] && [ \"$4\" = \"0.8\" ] || exit 9\n"
                                    "cp \"$1\" \"$2\"");
  ProcessingParameters p = external_params(tool);
  p.external_tool_args = {"--strength", "0.8"};
  auto strategy = removal::make_strategy(p);
  REQUIRE_NOTHROW(strategy->apply(channel_from(sky(4, 4)), p));
}

TEST_CASE("external_tool_failures_raise_external_tool_error") {
  core::ScopedTempDir dir("synthflat-ext");
  const ChannelImage in = channel_from(sky(6, 8));

  SECTION("missing executable") {
    ProcessingParameters p = external_params(dir.path() / "no-such-tool");
    auto strategy = removal::make_strategy(p);
    REQUIRE_THROWS_AS(strategy->preflight(p), ExternalToolError);
    REQUIRE_THROWS_AS(strategy->apply(in, p), ExternalToolError);
  }
  SECTION("nonzero exit") {
    ProcessingParameters p = external_params(testing::write_script(dir.path(), "fail.sh", "exit 3"));
    REQUIRE_THROWS_AS(removal::make_strategy(p)->apply(in, p), ExternalToolError);
  }
  SECTION("no output written") {
    ProcessingParameters p = external_params(testing::write_script(dir.path(), "noop.sh", "exit 0"));
    REQUIRE_THROWS_AS(removal::make_strategy(p)->apply(in, p), ExternalToolError);
  }
  SECTION("unreadable output") {
    ProcessingParameters p =
        external_params(testing::write_script(dir.path(), "junk.sh", "echo junk > \"$2\""));
    REQUIRE_THROWS_AS(removal::make_strategy(p)->apply(in, p), ExternalToolError);
  }
  SECTION("output of the wrong size") {
    const fs::path small = dir.path() / "small.tif";
    io::write_tiff_gray16(small, sky(2, 2));
    ProcessingParameters p = external_params(
        testing::write_script(dir.path(), "small.sh", "cp \"" + small.string() + "\" \"$2\""));
    REQUIRE_THROWS_AS(removal::make_strategy(p)->apply(in, p), ExternalToolError);
  }
  SECTION("timeout") {
    ProcessingParameters p = external_params(testing::write_script(dir.path(), "slow.sh", "sleep 30"));
    p.external_tool_timeout_seconds = 1;
    REQUIRE_THROWS_AS(removal::make_strategy(p)->apply(in, p), ExternalToolError);
  }
}

TEST_CASE("external_tool_cancellation_raises_stop_requested") {
  core::ScopedTempDir dir("synthflat-ext");
  ProcessingParameters p = external_params(testing::write_script(dir.path(), "slow.sh", "sleep 30"));
  std::atomic<bool> stop{true};
  auto strategy = removal::make_strategy(p, &stop);
  REQUIRE_THROWS_AS(strategy->apply(channel_from(sky(4, 4)), p), StopRequested);
}

TEST_CASE("fallback_replaces_an_unavailable_external_tool") {
  core::ScopedTempDir dir("synthflat-ext");
  ProcessingParameters p = external_params(dir.path() / "no-such-tool");
  p.fallback_method = config::kMethodNone;

  std::vector<std::string> warnings;
  auto strategy = removal::make_strategy(p, nullptr, [&](const std::string& w) { warnings.push_back(w); });
  REQUIRE_NOTHROW(strategy->preflight(p));
  REQUIRE(warnings.size() == 1);

  const ChannelImage in = channel_from(sky(4, 6));
  ChannelImage out = removal::apply_checked(*strategy, in, p);
  REQUIRE(out.data == in.data);
}

TEST_CASE("fallback_covers_a_failing_run") {
  core::ScopedTempDir dir("synthflat-ext");
  ProcessingParameters p = external_params(testing::write_script(dir.path(), "fail.sh", "exit 1"));
  p.fallback_method = config::kMethodThresholdMedian;
  p.threshold = 99.0f;
  p.median_filter_size = 3;
  p.gaussian_blur_sigma = 0.0f;

  std::vector<std::string> warnings;
  auto strategy = removal::make_strategy(p, nullptr, [&](const std::string& w) { warnings.push_back(w); });
  strategy->preflight(p);
  REQUIRE(warnings.empty());

  ChannelImage out = removal::apply_checked(*strategy, channel_from(sky(4, 4)), p);
  REQUIRE(out.rows() == 4);
  REQUIRE(warnings.size() == 1);
}

TEST_CASE("fallback_is_rejected_for_non_external_methods") {
  ProcessingParameters p = threshold_params(99.0f, 3, 1.0f);
  p.fallback_method = config::kMethodNone;
  REQUIRE_THROWS_AS(removal::make_strategy(p), ConfigError);
}
