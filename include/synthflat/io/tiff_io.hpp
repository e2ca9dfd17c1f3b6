#pragma once

#include "synthflat/core/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace synthflat::io {

bool is_tiff_image_path(const fs::path& path);

// Single-channel 16-bit TIFF; samples rounded half-to-even and clamped to [0, 65535]
void write_tiff_gray16(const fs::path& path, const Matrix2Df& data);

/**
 * Read a TIFF as one float plane. Accepts 8/16-bit unsigned and 32-bit
 * float samples; for multi-sample images only the first sample is kept.
 */
Matrix2Df read_tiff_gray(const fs::path& path);

// Everything libtiff needs for one CFA DNG IFD
struct DngImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint16_t> samples;          // row-major, width * height
    std::array<uint8_t, 4> cfa_pattern{};   // 0 = red, 1 = green, 2 = blue
    std::array<float, 4> black_level{};     // per 2x2 tile position
    uint32_t white_level = 65535;
    std::array<float, 9> color_matrix1{};
    std::array<float, 3> as_shot_neutral{};
    uint16_t calibration_illuminant1 = 21;  // D65
    std::string make;
    std::string model;
    std::string unique_camera_model;
    std::string software;
    std::string datetime;                   // "YYYY:MM:DD HH:MM:SS"
};

// Throws TiffError; the file may be partial on failure
void write_dng(const fs::path& path, const DngImage& image);

} // namespace synthflat::io
