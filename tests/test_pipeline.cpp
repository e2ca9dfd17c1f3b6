#include "synthflat/pipeline/flat_pipeline.hpp"
#include "synthflat/io/exif_metadata.hpp"
#include "synthflat/io/tiff_io.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/process.hpp"
#include "synthflat/core/utils.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace synthflat;
using pipeline::FlatPipeline;
using pipeline::FlatRequest;

namespace {

config::MetadataSpec flat_spec() {
  config::MetadataSpec spec;
  for (const char* f : {"CFAPattern", "BlackLevel", "WhiteLevel", "ColorMatrix1", "AsShotNeutral",
                        "Make", "Model", "ISO"}) {
    spec.add_copy_if_stable(f);
  }
  spec.add_literal("Exif.Image.ImageDescription", "synthetic flat");
  return spec;
}

// Three RGGB 4x4 frames; the per-position median is the middle ramp
testing::FakeDecoder three_frames(FlatRequest& req, const std::string& iso_c = "400") {
  testing::FakeDecoder decoder;
  decoder.add(testing::make_frame("a.nef", testing::ramp_grid(4, 4, 1000)));
  decoder.add(testing::make_frame("b.nef", testing::ramp_grid(4, 4, 2000)));
  decoder.add(testing::make_frame("c.nef", testing::ramp_grid(4, 4, 9000), "RGGB", iso_c));
  req.frames = {"/virtual/a.nef", "/virtual/b.nef", "/virtual/c.nef"};
  req.metadata_spec = flat_spec();
  return decoder;
}

std::vector<core::json> parse_events(const std::string& text) {
  std::vector<core::json> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) out.push_back(core::json::parse(line));
  }
  return out;
}

} // namespace

TEST_CASE("median_flat_from_three_frames") {
  core::ScopedTempDir dir("synthflat-pipe");
  FlatRequest req;
  auto decoder = three_frames(req);
  req.output = dir.path() / "flat.dng";

  std::ostringstream events_out;
  core::EventEmitter events("run-e2e", events_out);
  FlatPipeline pipe(decoder, events);
  auto report = pipe.run(req);

  REQUIRE(report.frames_used() == 3);
  REQUIRE(report.pattern == MosaicPattern::RGGB);
  REQUIRE(report.width == 4);
  REQUIRE(report.height == 4);
  REQUIRE(report.warnings.empty());

  Matrix2Df mosaic = io::read_tiff_gray(req.output);
  REQUIRE(mosaic.isApprox(testing::ramp_grid(4, 4, 2000).cast<float>()));
  auto run_report = core::json::parse(core::read_text(pipeline::report_path_for(req.output)));
  REQUIRE(run_report["frames_used"] == 3);
  REQUIRE(run_report["parameters"]["method"] == "none");
  REQUIRE(run_report["pattern"] == "RGGB");

  auto exif = io::read_exif_metadata(req.output);
  REQUIRE(exif.at("Exif.Photo.ISOSpeedRatings") == "400");

  auto lines = parse_events(events_out.str());
  REQUIRE_FALSE(lines.empty());
  REQUIRE(lines.back()["type"] == "phase_end");
  REQUIRE(lines.back()["phase_name"] == "DONE");
}

TEST_CASE("varying_iso_is_dropped_but_flat_is_written") {
  core::ScopedTempDir dir("synthflat-pipe");
  FlatRequest req;
  auto decoder = three_frames(req, "800");
  req.output = dir.path() / "flat.dng";

  std::ostringstream sink;
  core::EventEmitter events("run-iso", sink);
  auto report = FlatPipeline(decoder, events).run(req);

  REQUIRE(fs::exists(req.output));
  REQUIRE_FALSE(report.metadata.contains("ISO"));
  REQUIRE(report.metadata.get("Model") == std::optional<std::string>("D810A"));
  REQUIRE(report.warnings.size() == 1);
}

TEST_CASE("missing_external_tool_fails_before_any_output") {
  core::ScopedTempDir dir("synthflat-pipe");
  FlatRequest req;
  auto decoder = three_frames(req);
  req.output = dir.path() / "flat.dng";
  req.params.method = config::kMethodExternal;
  req.params.external_tool_path = (dir.path() / "no-such-tool").string();

  std::ostringstream sink;
  core::EventEmitter events("run-ext", sink);
  REQUIRE_THROWS_AS(FlatPipeline(decoder, events).run(req), ExternalToolError);
  REQUIRE(fs::is_empty(dir.path()));

  auto lines = parse_events(sink.str());
  REQUIRE(lines.back()["status"] == "error");
}

TEST_CASE("external_tool_runs_once_per_channel") {
  core::ScopedTempDir dir("synthflat-pipe");
  core::ScopedTempDir tools("synthflat-tools");
  const fs::path log = tools.path() / "calls.log";
  auto tool = testing::write_script(tools.path(), "copy.sh",
                                    "echo \"$1\" >> \"" + log.string() + "\"\ncp \"$1\" \"$2\"");

  FlatRequest req;
  auto decoder = three_frames(req);
  req.output = dir.path() / "flat.dng";
  req.params.method = config::kMethodExternal;
  req.params.external_tool_path = tool.string();

  std::ostringstream sink;
  core::EventEmitter events("run-ext", sink);
  FlatPipeline(decoder, events).run(req);

  Matrix2Df mosaic = io::read_tiff_gray(req.output);
  REQUIRE(mosaic.isApprox(testing::ramp_grid(4, 4, 2000).cast<float>()));
  REQUIRE(core::split(core::trim(core::read_text(log)), '\n').size() == 4);
}

TEST_CASE("missing_calibration_metadata_writes_nothing") {
  core::ScopedTempDir dir("synthflat-pipe");
  FlatRequest req;
  auto decoder = three_frames(req);
  req.output = dir.path() / "flat.dng";
  req.metadata_spec = config::MetadataSpec{};
  req.metadata_spec.add_copy_if_stable("ISO");

  std::ostringstream sink;
  core::EventEmitter events("run-md", sink);
  REQUIRE_THROWS_AS(FlatPipeline(decoder, events).run(req), MissingRequiredMetadataError);
  REQUIRE(fs::is_empty(dir.path()));
}

TEST_CASE("undecodable_frames_are_excluded_unless_strict") {
  core::ScopedTempDir dir("synthflat-pipe");
  FlatRequest req;
  auto decoder = three_frames(req);
  req.frames.push_back("/virtual/corrupt.nef");
  req.output = dir.path() / "flat.dng";

  std::ostringstream sink;
  core::EventEmitter events("run-ex", sink);
  auto report = FlatPipeline(decoder, events).run(req);
  REQUIRE(report.frames_used() == 3);
  REQUIRE_FALSE(report.frames[3].used);
  REQUIRE_FALSE(report.frames[3].excluded_reason.empty());

  fs::remove(req.output);
  req.params.strict = true;
  REQUIRE_THROWS_AS(FlatPipeline(decoder, events).run(req), FrameDecodeError);
  REQUIRE_FALSE(fs::exists(req.output));
}

TEST_CASE("unreadable_frame_is_excluded_unless_strict") {
  core::ScopedTempDir dir("synthflat-pipe");
  FlatRequest req;
  auto decoder = three_frames(req);

  // decodes, but the path is a directory and cannot be checksummed
  const fs::path folder = dir.path() / "folder.nef";
  fs::create_directory(folder);
  auto odd = testing::make_frame("folder.nef", testing::ramp_grid(4, 4, 500));
  odd.source = folder;
  decoder.add(odd);
  req.frames.push_back(folder);
  req.output = dir.path() / "out" / "flat.dng";

  std::ostringstream sink;
  core::EventEmitter events("run-io", sink);
  auto report = FlatPipeline(decoder, events).run(req);
  REQUIRE(fs::exists(req.output));
  REQUIRE(report.frames_used() == 3);
  REQUIRE_FALSE(report.frames[3].used);
  REQUIRE(report.frames[3].sha256.empty());
  REQUIRE(report.frames[3].excluded_reason.find("folder.nef") != std::string::npos);

  fs::remove(req.output);
  req.params.strict = true;
  REQUIRE_THROWS_AS(FlatPipeline(decoder, events).run(req), IOError);
  REQUIRE_FALSE(fs::exists(req.output));
}

TEST_CASE("batch_errors") {
  core::ScopedTempDir dir("synthflat-pipe");
  std::ostringstream sink;
  core::EventEmitter events("run-batch", sink);

  SECTION("no frames") {
    testing::FakeDecoder decoder;
    FlatRequest req;
    req.output = dir.path() / "flat.dng";
    REQUIRE_THROWS_AS(FlatPipeline(decoder, events).run(req), EmptyBatchError);
  }
  SECTION("every frame undecodable") {
    testing::FakeDecoder decoder;
    FlatRequest req;
    req.frames = {"/virtual/x.nef", "/virtual/y.nef"};
    req.output = dir.path() / "flat.dng";
    REQUIRE_THROWS_AS(FlatPipeline(decoder, events).run(req), EmptyBatchError);
  }
  SECTION("mixed geometry") {
    FlatRequest req;
    auto decoder = three_frames(req);
    decoder.add(testing::make_frame("big.nef", testing::ramp_grid(6, 4, 0)));
    req.frames.push_back("/virtual/big.nef");
    req.output = dir.path() / "flat.dng";
    REQUIRE_THROWS_AS(FlatPipeline(decoder, events).run(req), GeometryMismatchError);
  }
  SECTION("unsupported pattern") {
    FlatRequest req;
    auto decoder = three_frames(req);
    decoder.add(testing::make_frame("x.raf", testing::ramp_grid(4, 4, 0), "XTRANS"));
    req.frames.push_back("/virtual/x.raf");
    req.output = dir.path() / "flat.dng";
    REQUIRE_THROWS_AS(FlatPipeline(decoder, events).run(req), UnsupportedPatternError);
  }
  REQUIRE_FALSE(fs::exists(dir.path() / "flat.dng"));
}

TEST_CASE("camera_database_extends_copied_fields") {
  core::ScopedTempDir dir("synthflat-pipe");
  FlatRequest req;
  auto decoder = three_frames(req);
  req.output = dir.path() / "flat.dng";
  req.metadata_spec = config::MetadataSpec{};
  for (const char* f : {"CFAPattern", "BlackLevel", "WhiteLevel", "ColorMatrix1", "AsShotNeutral"}) {
    req.metadata_spec.add_copy_if_stable(f);
  }
  req.camera_db = metadata::CameraDatabase::from_yaml(YAML::Load(R"(
- camera:
    name: Nikon D810A
    properties:
      - group: Exif.Image
        Model: NIKON D810A
    master_flat_metadata:
      - group: ""
        name: ISO
      - group: ""
        name: Make
)"));

  std::ostringstream sink;
  core::EventEmitter events("run-db", sink);
  auto report = FlatPipeline(decoder, events).run(req);
  REQUIRE(report.metadata.get("ISO") == std::optional<std::string>("400"));
  REQUIRE(report.metadata.get("Make") == std::optional<std::string>("Nikon"));
}
