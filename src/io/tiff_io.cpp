#include "synthflat/io/tiff_io.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

#include <tiffio.h>
#include <memory>

namespace synthflat::io {

namespace {

struct TiffCloser {
    void operator()(TIFF* tif) const {
        if (tif) TIFFClose(tif);
    }
};
using TiffHandle = std::unique_ptr<TIFF, TiffCloser>;

TiffHandle open_tiff(const fs::path& path, const char* mode) {
    TiffHandle tif(TIFFOpen(path.string().c_str(), mode));
    if (!tif) {
        throw TiffError(std::string("Cannot open ") + path.string() +
                        (mode[0] == 'w' ? " for writing" : ""));
    }
    return tif;
}

void set_ascii(TIFF* tif, ttag_t tag, const std::string& value) {
    if (!value.empty()) TIFFSetField(tif, tag, value.c_str());
}

} // namespace

bool is_tiff_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".tif" || ext == ".tiff";
}

void write_tiff_gray16(const fs::path& path, const Matrix2Df& data) {
    const uint32_t width = static_cast<uint32_t>(data.cols());
    const uint32_t height = static_cast<uint32_t>(data.rows());
    TiffHandle tif = open_tiff(path, "w");

    TIFFSetField(tif.get(), TIFFTAG_IMAGEWIDTH, width);
    TIFFSetField(tif.get(), TIFFTAG_IMAGELENGTH, height);
    TIFFSetField(tif.get(), TIFFTAG_BITSPERSAMPLE, 16);
    TIFFSetField(tif.get(), TIFFTAG_SAMPLESPERPIXEL, 1);
    TIFFSetField(tif.get(), TIFFTAG_SAMPLEFORMAT, SAMPLEFORMAT_UINT);
    TIFFSetField(tif.get(), TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tif.get(), TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tif.get(), TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(tif.get(), TIFFTAG_ROWSPERSTRIP, height);

    std::vector<uint16_t> row(width);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            row[x] = core::quantize_sample(data(y, x), 65535);
        }
        if (TIFFWriteScanline(tif.get(), row.data(), y, 0) < 0) {
            throw TiffError("Cannot write scanline " + std::to_string(y) + " of " + path.string());
        }
    }
}

Matrix2Df read_tiff_gray(const fs::path& path) {
    TiffHandle tif = open_tiff(path, "r");

    uint32_t width = 0, height = 0;
    uint16_t bps = 0, spp = 1, fmt = SAMPLEFORMAT_UINT, planar = PLANARCONFIG_CONTIG;
    TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &width);
    TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &height);
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_BITSPERSAMPLE, &bps);
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_SAMPLESPERPIXEL, &spp);
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_SAMPLEFORMAT, &fmt);
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_PLANARCONFIG, &planar);

    if (width == 0 || height == 0) {
        throw TiffError("Empty image in " + path.string());
    }
    const bool supported = (fmt == SAMPLEFORMAT_UINT && (bps == 8 || bps == 16)) ||
                           (fmt == SAMPLEFORMAT_IEEEFP && bps == 32);
    if (!supported) {
        throw TiffError("Unsupported sample format (" + std::to_string(bps) + " bit, format " +
                        std::to_string(fmt) + ") in " + path.string());
    }

    // planar images: plane 0 holds the first sample
    const uint16_t stride = (planar == PLANARCONFIG_SEPARATE) ? 1 : spp;
    Matrix2Df data(height, width);
    std::vector<uint8_t> buf(static_cast<size_t>(TIFFScanlineSize(tif.get())));

    for (uint32_t y = 0; y < height; ++y) {
        if (TIFFReadScanline(tif.get(), buf.data(), y, 0) < 0) {
            throw TiffError("Cannot read scanline " + std::to_string(y) + " of " + path.string());
        }
        for (uint32_t x = 0; x < width; ++x) {
            const size_t i = static_cast<size_t>(x) * stride;
            float v = 0.0f;
            if (bps == 8) {
                v = static_cast<float>(buf[i]);
            } else if (bps == 16) {
                v = static_cast<float>(reinterpret_cast<const uint16_t*>(buf.data())[i]);
            } else {
                v = reinterpret_cast<const float*>(buf.data())[i];
            }
            data(y, x) = v;
        }
    }
    return data;
}

void write_dng(const fs::path& path, const DngImage& image) {
    if (image.samples.size() != static_cast<size_t>(image.width) * image.height) {
        throw TiffError("DNG sample buffer does not match " + std::to_string(image.width) + "x" +
                        std::to_string(image.height));
    }

    TiffHandle tif = open_tiff(path, "w");
    TIFF* t = tif.get();

    TIFFSetField(t, TIFFTAG_SUBFILETYPE, 0);
    TIFFSetField(t, TIFFTAG_IMAGEWIDTH, image.width);
    TIFFSetField(t, TIFFTAG_IMAGELENGTH, image.height);
    TIFFSetField(t, TIFFTAG_BITSPERSAMPLE, 16);
    TIFFSetField(t, TIFFTAG_SAMPLESPERPIXEL, 1);
    TIFFSetField(t, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(t, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_CFA);
    TIFFSetField(t, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(t, TIFFTAG_ORIENTATION, ORIENTATION_TOPLEFT);
    TIFFSetField(t, TIFFTAG_ROWSPERSTRIP, image.height);

    set_ascii(t, TIFFTAG_MAKE, image.make);
    set_ascii(t, TIFFTAG_MODEL, image.model);
    set_ascii(t, TIFFTAG_SOFTWARE, image.software);
    set_ascii(t, TIFFTAG_DATETIME, image.datetime);

    static const uint8_t dng_version[4] = {1, 4, 0, 0};
    static const uint8_t dng_backward_version[4] = {1, 1, 0, 0};
    TIFFSetField(t, TIFFTAG_DNGVERSION, dng_version);
    TIFFSetField(t, TIFFTAG_DNGBACKWARDVERSION, dng_backward_version);
    set_ascii(t, TIFFTAG_UNIQUECAMERAMODEL,
              image.unique_camera_model.empty() ? image.model : image.unique_camera_model);

    const uint16_t repeat_dim[2] = {2, 2};
    TIFFSetField(t, TIFFTAG_CFAREPEATPATTERNDIM, repeat_dim);
    TIFFSetField(t, TIFFTAG_CFAPATTERN, 4, image.cfa_pattern.data());
    static const uint8_t plane_color[3] = {0, 1, 2};
    TIFFSetField(t, TIFFTAG_CFAPLANECOLOR, 3, plane_color);
    TIFFSetField(t, TIFFTAG_CFALAYOUT, 1);

    TIFFSetField(t, TIFFTAG_BLACKLEVELREPEATDIM, repeat_dim);
    TIFFSetField(t, TIFFTAG_BLACKLEVEL, 4, image.black_level.data());
    uint32_t white = image.white_level;
    TIFFSetField(t, TIFFTAG_WHITELEVEL, 1, &white);

    TIFFSetField(t, TIFFTAG_COLORMATRIX1, 9, image.color_matrix1.data());
    TIFFSetField(t, TIFFTAG_ASSHOTNEUTRAL, 3, image.as_shot_neutral.data());
    TIFFSetField(t, TIFFTAG_CALIBRATIONILLUMINANT1, image.calibration_illuminant1);

    for (uint32_t y = 0; y < image.height; ++y) {
        auto* row = const_cast<uint16_t*>(image.samples.data() + static_cast<size_t>(y) * image.width);
        if (TIFFWriteScanline(t, row, y, 0) < 0) {
            throw TiffError("Cannot write scanline " + std::to_string(y) + " of " + path.string());
        }
    }

    if (!TIFFFlush(t)) {
        throw TiffError("Cannot flush DNG directory: " + path.string());
    }
}

} // namespace synthflat::io
