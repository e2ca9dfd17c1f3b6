#include "synthflat/config/configuration.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/process.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace synthflat;
using config::MetadataDirective;
using config::MetadataSpec;
using config::ProcessingParameters;

TEST_CASE("defaults_are_valid") {
  ProcessingParameters p;
  REQUIRE(p.method == "none");
  REQUIRE(p.combine_rule == "median");
  REQUIRE_NOTHROW(p.validate());
}

TEST_CASE("threshold_median_parameters_load_from_yaml") {
  auto p = ProcessingParameters::from_yaml(YAML::Load(R"(
method: Threshold_Median
threshold: 99.5
median_filter_size: 5
gaussian_blur_sigma: 1.5
combine_rule: MEAN
)"));
  REQUIRE(p.method == "threshold_median");
  REQUIRE(*p.threshold == Catch::Approx(99.5f));
  REQUIRE(*p.median_filter_size == 5);
  REQUIRE(*p.gaussian_blur_sigma == Catch::Approx(1.5f));
  REQUIRE(p.combine_rule == "mean");
  REQUIRE_NOTHROW(p.validate());
}

TEST_CASE("parameters_may_be_nested_under_process") {
  auto p = ProcessingParameters::from_yaml(YAML::Load(R"(
process:
  method: external
  external_tool_path: /opt/starnet/starnet++
  external_tool_args: ["--stride", "256"]
  external_tool_timeout_seconds: 120
  fallback_method: none
  strict: true
)"));
  REQUIRE(p.method == "external");
  REQUIRE(*p.external_tool_path == "/opt/starnet/starnet++");
  REQUIRE(p.external_tool_args == std::vector<std::string>{"--stride", "256"});
  REQUIRE(p.external_tool_timeout_seconds == 120);
  REQUIRE(*p.fallback_method == "none");
  REQUIRE(p.strict);
  REQUIRE_NOTHROW(p.validate());
}

TEST_CASE("validation_names_missing_and_invalid_keys") {
  auto invalid = [](const std::string& yaml) {
    return ProcessingParameters::from_yaml(YAML::Load(yaml));
  };

  REQUIRE_THROWS_AS(invalid("method: wavelet").validate(), ConfigError);
  REQUIRE_THROWS_AS(invalid("method: threshold_median\nthreshold: 99").validate(), ConfigError);
  REQUIRE_THROWS_AS(invalid("method: external").validate(), ConfigError);
  REQUIRE_THROWS_AS(invalid("method: threshold_median\nthreshold: 120\nmedian_filter_size: 3\n"
                            "gaussian_blur_sigma: 1").validate(),
                    ConfigError);
  REQUIRE_THROWS_AS(invalid("method: threshold_median\nthreshold: 99\nmedian_filter_size: 4\n"
                            "gaussian_blur_sigma: 1").validate(),
                    ConfigError);
  REQUIRE_THROWS_AS(invalid("method: threshold_median\nthreshold: 99\nmedian_filter_size: 3\n"
                            "gaussian_blur_sigma: -1").validate(),
                    ConfigError);
  REQUIRE_THROWS_AS(invalid("combine_rule: sigma_clip").validate(), ConfigError);
  REQUIRE_THROWS_AS(invalid("parallel_workers: 0").validate(), ConfigError);
  REQUIRE_THROWS_AS(invalid("fallback_method: none").validate(), ConfigError);

  // absolute thresholds are not bounded to a percentile range
  REQUIRE_NOTHROW(invalid("method: threshold_median\nthreshold: 12000\nthreshold_mode: absolute\n"
                          "median_filter_size: 3\ngaussian_blur_sigma: 0").validate());
}

TEST_CASE("malformed_documents_raise_config_error") {
  REQUIRE_THROWS_AS(ProcessingParameters::from_yaml(YAML::Load("threshold: [1, 2]")), ConfigError);
  REQUIRE_THROWS_AS(ProcessingParameters::from_yaml(YAML::Load("- a\n- b")), ConfigError);
  REQUIRE_THROWS_AS(ProcessingParameters::load("/nonexistent/params.yaml"), ConfigError);
}

TEST_CASE("parameters_survive_save_and_load") {
  core::ScopedTempDir dir("synthflat-config");
  ProcessingParameters p;
  p.method = config::kMethodThresholdMedian;
  p.threshold = 98.0f;
  p.median_filter_size = 7;
  p.gaussian_blur_sigma = 2.0f;
  p.parallel_workers = 2;
  p.save(dir.path() / "params.yaml");

  auto loaded = ProcessingParameters::load(dir.path() / "params.yaml");
  REQUIRE(loaded.method == p.method);
  REQUIRE(*loaded.median_filter_size == 7);
  REQUIRE(loaded.parallel_workers == 2);
  REQUIRE_NOTHROW(loaded.validate());
}

TEST_CASE("metadata_spec_keeps_document_order") {
  auto spec = MetadataSpec::from_yaml(YAML::Load(R"(
metadata:
  Model: {copy_if_stable: true}
  ISO: {copy_if_stable: true}
  ImageDescription: {value: "synthetic flat"}
  AsShotNeutral: {value: [0.5, 1, 0.7]}
  Lens: {copy_if_stable: false}
)"));
  REQUIRE(spec.entries.size() == 4);
  REQUIRE(spec.entries[0].field == "Model");
  REQUIRE(spec.entries[0].kind == MetadataDirective::Kind::COPY_IF_STABLE);
  REQUIRE(spec.entries[1].field == "ISO");
  REQUIRE(spec.entries[2].kind == MetadataDirective::Kind::LITERAL);
  REQUIRE(spec.entries[2].value == "synthetic flat");
  REQUIRE(spec.entries[3].value == "0.5 1 0.7");
  REQUIRE_FALSE(spec.contains("Lens"));
}

TEST_CASE("metadata_spec_rejects_bad_directives") {
  REQUIRE_THROWS_AS(MetadataSpec::from_yaml(YAML::Load("ISO: 400")), ConfigError);
  REQUIRE_THROWS_AS(MetadataSpec::from_yaml(YAML::Load("ISO: {copy_if_stable: maybe}")), ConfigError);
  REQUIRE_THROWS_AS(MetadataSpec::from_yaml(YAML::Load("ISO: {value: {a: 1}}")), ConfigError);
  REQUIRE_THROWS_AS(MetadataSpec::from_yaml(YAML::Load("- ISO")), ConfigError);
}

TEST_CASE("schema_is_valid_json") {
  auto schema = nlohmann::json::parse(config::get_schema_json());
  REQUIRE(schema.contains("properties"));
  REQUIRE(schema["properties"].contains("method"));
}

TEST_CASE("shipped_example_configs_are_valid") {
  const fs::path root = SYNTHFLAT_SOURCE_DIR;
  REQUIRE_NOTHROW(ProcessingParameters::load(root / "config/process_params.yaml").validate());
  REQUIRE_NOTHROW(ProcessingParameters::load(root / "config/process_params_external.yaml").validate());

  auto spec = MetadataSpec::load(root / "config/metadata_spec.yaml");
  for (const char* f : {"CFAPattern", "BlackLevel", "WhiteLevel", "ColorMatrix1", "AsShotNeutral"}) {
    REQUIRE(spec.contains(f));
  }
}
