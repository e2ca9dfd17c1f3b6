#include "synthflat/image/mosaic.hpp"
#include "synthflat/core/errors.hpp"
#include "test_support.hpp"

#include <set>

#include <catch2/catch_test_macros.hpp>

using namespace synthflat;

namespace {

const MosaicPattern kPatterns[] = {MosaicPattern::RGGB, MosaicPattern::BGGR,
                                   MosaicPattern::GRBG, MosaicPattern::GBRG};

// Channel images whose samples encode (label, row, col)
ChannelSet tagged_channels(MosaicPattern pattern, int height, int width) {
  ChannelSet out;
  for (const auto& lat : image::channel_lattices(pattern, height, width)) {
    ChannelImage ch;
    ch.label = lat.label;
    ch.row_offset = lat.row_offset;
    ch.col_offset = lat.col_offset;
    ch.data.resize(lat.rows, lat.cols);
    for (int r = 0; r < lat.rows; ++r) {
      for (int c = 0; c < lat.cols; ++c) {
        ch.data(r, c) = static_cast<float>(1000 * (static_cast<int>(lat.label) + 1) + r * lat.cols + c);
      }
    }
    out.emplace(lat.label, ch);
  }
  return out;
}

} // namespace

TEST_CASE("pattern_layout_places_red_and_blue_per_pattern") {
  REQUIRE(image::label_at(MosaicPattern::RGGB, 0, 0) == ChannelLabel::R);
  REQUIRE(image::label_at(MosaicPattern::RGGB, 0, 1) == ChannelLabel::G1);
  REQUIRE(image::label_at(MosaicPattern::RGGB, 1, 0) == ChannelLabel::G2);
  REQUIRE(image::label_at(MosaicPattern::RGGB, 1, 1) == ChannelLabel::B);

  REQUIRE(image::label_at(MosaicPattern::BGGR, 0, 0) == ChannelLabel::B);
  REQUIRE(image::label_at(MosaicPattern::BGGR, 1, 1) == ChannelLabel::R);
  REQUIRE(image::label_at(MosaicPattern::GRBG, 0, 1) == ChannelLabel::R);
  REQUIRE(image::label_at(MosaicPattern::GRBG, 1, 0) == ChannelLabel::B);
  REQUIRE(image::label_at(MosaicPattern::GBRG, 1, 0) == ChannelLabel::R);
  REQUIRE(image::label_at(MosaicPattern::GBRG, 0, 1) == ChannelLabel::B);

  // G1 always shares a row with red
  for (MosaicPattern p : kPatterns) {
    const auto layout = image::pattern_layout(p);
    REQUIRE(layout[static_cast<size_t>(ChannelLabel::G1)].first ==
            layout[static_cast<size_t>(ChannelLabel::R)].first);
  }
}

TEST_CASE("standardize_pattern_accepts_common_notations") {
  REQUIRE(image::standardize_pattern("RGGB") == "RGGB");
  REQUIRE(image::standardize_pattern("rggb") == "RGGB");
  REQUIRE(image::standardize_pattern("R G G B") == "RGGB");
  REQUIRE(image::standardize_pattern("[Red,Green][Green,Blue]") == "RGGB");
  REQUIRE(image::standardize_pattern("[Blue,Green][Green,Red]") == "BGGR");
  REQUIRE(image::standardize_pattern("0 1 1 2") == "RGGB");
  REQUIRE(image::standardize_pattern("[1,2,0,1]") == "GBRG");
  REQUIRE(image::standardize_pattern("2 2 1 0 2 1") == "GRBG");
}

TEST_CASE("standardize_pattern_rejects_invalid_input") {
  REQUIRE_THROWS_AS(image::standardize_pattern("RGB"), UnsupportedPatternError);
  REQUIRE_THROWS_AS(image::standardize_pattern("RGXB"), UnsupportedPatternError);
  REQUIRE_THROWS_AS(image::standardize_pattern("0 1 1 3"), UnsupportedPatternError);
  REQUIRE_THROWS_AS(image::standardize_pattern("RGBG"), UnsupportedPatternError);
  REQUIRE_THROWS_AS(image::standardize_pattern("XTRANS"), UnsupportedPatternError);
  REQUIRE_THROWS_AS(image::standardize_pattern(""), UnsupportedPatternError);
}

TEST_CASE("extract_validates_pattern_and_geometry") {
  auto ok = testing::make_frame("a.nef", testing::ramp_grid(4, 6, 10), "[Red,Green][Green,Blue]");
  RawFrame frame = image::extract(ok);
  REQUIRE(frame.pattern == MosaicPattern::RGGB);
  REQUIRE(frame.width() == 6);
  REQUIRE(frame.height() == 4);
  REQUIRE(frame.bit_depth == 14);
  REQUIRE(frame.samples(3, 5) == ok.samples(3, 5));

  auto xtrans = testing::make_frame("b.raf", testing::ramp_grid(4, 4, 0), "XTRANS");
  REQUIRE_THROWS_AS(image::extract(xtrans), UnsupportedPatternError);

  auto odd = testing::make_frame("c.nef", testing::ramp_grid(3, 4, 0));
  REQUIRE_THROWS_AS(image::extract(odd), GeometryMismatchError);

  auto empty = testing::make_frame("d.nef", RawGrid(0, 0));
  REQUIRE_THROWS_AS(image::extract(empty), GeometryMismatchError);
}

TEST_CASE("channel_lattices_partition_the_mosaic") {
  for (MosaicPattern p : kPatterns) {
    std::set<std::pair<int, int>> seen;
    size_t total = 0;
    for (const auto& lat : image::channel_lattices(p, 6, 8)) {
      REQUIRE(lat.rows == 3);
      REQUIRE(lat.cols == 4);
      for (const auto& rc : lat.coordinates()) {
        REQUIRE(image::label_at(p, rc.first, rc.second) == lat.label);
        seen.insert(rc);
        ++total;
      }
    }
    REQUIRE(total == 48);
    REQUIRE(seen.size() == 48);
  }
}

TEST_CASE("reconstruct_covers_every_position_exactly_once") {
  for (MosaicPattern p : kPatterns) {
    const int h = 6, w = 8;
    ChannelSet channels = tagged_channels(p, h, w);
    Matrix2Df mosaic = image::reconstruct(channels, p, h, w);

    std::multiset<float> used;
    for (int y = 0; y < h; ++y) {
      for (int x = 0; x < w; ++x) {
        const ChannelLabel label = image::label_at(p, y, x);
        const ChannelImage& ch = channels.at(label);
        REQUIRE(mosaic(y, x) == ch.data(y / 2, x / 2));
        used.insert(mosaic(y, x));
      }
    }
    // every channel sample used once: no duplicates, no gaps
    REQUIRE(used.size() == static_cast<size_t>(h * w));
    REQUIRE(std::set<float>(used.begin(), used.end()).size() == used.size());
  }
}

TEST_CASE("split_then_reconstruct_restores_the_frame") {
  for (MosaicPattern p : kPatterns) {
    RawFrame frame;
    frame.pattern = p;
    frame.samples = testing::ramp_grid(4, 6, 100);

    ChannelSet channels = image::split_channels(frame);
    REQUIRE(channels.size() == 4);
    Matrix2Df mosaic = image::reconstruct(channels, p);
    REQUIRE(mosaic.isApprox(frame.samples.cast<float>()));
  }
}

TEST_CASE("reconstruct_rejects_bad_channel_sets") {
  const MosaicPattern p = MosaicPattern::RGGB;

  SECTION("missing channel") {
    ChannelSet channels = tagged_channels(p, 4, 4);
    channels.erase(ChannelLabel::G2);
    REQUIRE_THROWS_AS(image::reconstruct(channels, p, 4, 4), PatternCoverageError);
  }
  SECTION("channel does not tile the target") {
    ChannelSet channels = tagged_channels(p, 4, 4);
    REQUIRE_THROWS_AS(image::reconstruct(channels, p, 6, 4), PatternCoverageError);
    REQUIRE_THROWS_AS(image::reconstruct(channels, p, 5, 4), PatternCoverageError);
  }
  SECTION("channel offset outside its sub-lattice") {
    ChannelSet channels = tagged_channels(p, 4, 4);
    channels.at(ChannelLabel::B).row_offset = 0;
    REQUIRE_THROWS_AS(image::reconstruct(channels, p, 4, 4), PatternCoverageError);
  }
  SECTION("mismatched channel sizes") {
    ChannelSet channels = tagged_channels(p, 4, 4);
    channels.at(ChannelLabel::R).data.resize(3, 2);
    REQUIRE_THROWS_AS(image::reconstruct(channels, p, 4, 4), PatternCoverageError);
  }
}
