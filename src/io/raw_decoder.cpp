#include "synthflat/io/raw_decoder.hpp"
#include "synthflat/io/exif_metadata.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

#include <libraw/libraw.h>

#include <cmath>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace synthflat::io {

namespace {

std::string format_number(double v, int precision = 6) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << v;
    return oss.str();
}

// Exif-style rational text ("1/250", "28/10")
std::string format_rational(double v) {
    if (!(v > 0.0)) return "0/1";
    if (v < 1.0) {
        const double inv = 1.0 / v;
        if (std::fabs(inv - std::round(inv)) < 1e-3) {
            return "1/" + std::to_string(static_cast<long>(std::round(inv)));
        }
    }
    return std::to_string(static_cast<long>(std::round(v * 1000.0))) + "/1000";
}

std::string deduce_pattern(const libraw_data_t& lr) {
    const unsigned f = lr.idata.filters;
    if (f == 0) {
        throw FrameDecodeError("sensor has no color filter array");
    }
    if (f == 9) {
        throw UnsupportedPatternError("X-Trans 6x6 layout");
    }

    const int left = lr.rawdata.sizes.left_margin;
    const int top = lr.rawdata.sizes.top_margin;
    std::string pat;
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 2; ++c) {
            const int row = top + r;
            const int col = left + c;
            const int idx = (f >> ((((row) << 1 & 14) + (col & 1)) << 1)) & 3;
            char ch = lr.idata.cdesc[idx];
            // cdesc lists the second green as 'G' for RGBG cameras
            pat += (ch == 'G' || ch == 'R' || ch == 'B') ? ch : '?';
        }
    }
    return pat;
}

int bit_depth_from_maximum(unsigned maximum) {
    int bits = 1;
    while (bits < 16 && (1u << bits) <= maximum) ++bits;
    return bits;
}

struct LibRawDeleter {
    void operator()(LibRaw* p) const {
        if (p) {
            p->recycle();
            delete p;
        }
    }
};

std::unique_ptr<LibRaw, LibRawDeleter> open_raw(const fs::path& path) {
    // LibRaw carries large internal buffers; keep it on the heap
    std::unique_ptr<LibRaw, LibRawDeleter> raw(new LibRaw());
    int ret = raw->open_file(path.string().c_str());
    if (ret != LIBRAW_SUCCESS) {
        throw FrameDecodeError(path.string() + ": open failed: " + libraw_strerror(ret));
    }
    return raw;
}

void fill_libraw_metadata(const libraw_data_t& lr, const std::string& pattern, MetadataMap& out) {
    out["Make"] = core::trim(lr.idata.make);
    out["Model"] = core::trim(lr.idata.model);
    out["UniqueCameraModel"] = core::trim(std::string(lr.idata.make) + " " + lr.idata.model);
    out["CFAPattern"] = pattern;

    // black level per tile position: global + per-color + repeating pattern
    const unsigned f = lr.idata.filters;
    const int left = lr.rawdata.sizes.left_margin;
    const int top = lr.rawdata.sizes.top_margin;
    std::vector<std::string> black;
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 2; ++c) {
            const int row = top + r;
            const int col = left + c;
            const int idx = (f >> ((((row) << 1 & 14) + (col & 1)) << 1)) & 3;
            unsigned value = lr.color.black + lr.color.cblack[idx];
            const unsigned ph = lr.color.cblack[4];
            const unsigned pw = lr.color.cblack[5];
            if (ph > 0 && pw > 0 && 6 + ph * pw <= LIBRAW_CBLACK_SIZE) {
                value += lr.color.cblack[6 + (static_cast<unsigned>(r) % ph) * pw +
                                         static_cast<unsigned>(c) % pw];
            }
            black.push_back(std::to_string(value));
        }
    }
    out["BlackLevel"] = core::join(black, " ");

    out["WhiteLevel"] = std::to_string(lr.color.maximum);

    std::vector<std::string> matrix;
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            matrix.push_back(format_number(lr.color.cam_xyz[r][c]));
        }
    }
    out["ColorMatrix1"] = core::join(matrix, " ");

    const float g = lr.color.cam_mul[1];
    if (g > 0.0f && lr.color.cam_mul[0] > 0.0f && lr.color.cam_mul[2] > 0.0f) {
        out["AsShotNeutral"] = format_number(g / lr.color.cam_mul[0]) + " 1 " +
                               format_number(g / lr.color.cam_mul[2]);
    }

    if (lr.other.iso_speed > 0.0f) {
        out["ISO"] = std::to_string(static_cast<int>(std::lround(lr.other.iso_speed)));
    }
    if (lr.other.shutter > 0.0f) out["ExposureTime"] = format_rational(lr.other.shutter);
    if (lr.other.aperture > 0.0f) out["FNumber"] = format_rational(lr.other.aperture);
    if (lr.other.focal_len > 0.0f) out["FocalLength"] = format_rational(lr.other.focal_len);
    if (lr.other.timestamp > 0) {
        std::time_t ts = lr.other.timestamp;
        std::tm tm_buf;
        localtime_r(&ts, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y:%m:%d %H:%M:%S");
        out["DateTimeOriginal"] = oss.str();
    }
}

} // namespace

DecodedFrame LibRawDecoder::decode(const fs::path& path) const {
    auto raw = open_raw(path);
    int ret = raw->unpack();
    if (ret != LIBRAW_SUCCESS) {
        throw FrameDecodeError(path.string() + ": unpack failed: " + libraw_strerror(ret));
    }

    const libraw_data_t& lr = raw->imgdata;
    if (!lr.rawdata.raw_image) {
        throw FrameDecodeError(path.string() + ": no single-plane CFA data");
    }

    DecodedFrame frame;
    frame.source = path;
    frame.pattern = deduce_pattern(lr);

    const int raw_w = lr.rawdata.sizes.raw_width;
    const int left = lr.rawdata.sizes.left_margin;
    const int top = lr.rawdata.sizes.top_margin;
    const int vis_w = lr.rawdata.sizes.width;
    const int vis_h = lr.rawdata.sizes.height;
    const unsigned short* src = lr.rawdata.raw_image;

    frame.samples.resize(vis_h, vis_w);
    for (int y = 0; y < vis_h; ++y) {
        const unsigned short* row = src + static_cast<size_t>(y + top) * raw_w + left;
        for (int x = 0; x < vis_w; ++x) {
            frame.samples(y, x) = row[x];
        }
    }
    frame.bit_depth = bit_depth_from_maximum(lr.color.maximum);

    fill_libraw_metadata(lr, frame.pattern, frame.metadata);
    for (auto& [key, value] : read_exif_metadata(path)) {
        frame.metadata.emplace(key, value);
    }
    return frame;
}

MetadataMap LibRawDecoder::read_metadata(const fs::path& path) const {
    auto raw = open_raw(path);
    MetadataMap out;
    fill_libraw_metadata(raw->imgdata, deduce_pattern(raw->imgdata), out);
    for (auto& [key, value] : read_exif_metadata(path)) {
        out.emplace(key, value);
    }
    return out;
}

} // namespace synthflat::io
