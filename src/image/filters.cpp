#include "synthflat/image/filters.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cstring>
#include <vector>

namespace synthflat::image {

Mask2D mark_at_or_above(const Matrix2Df& data, float threshold) {
    return (data.array() >= threshold).cast<uint8_t>().matrix();
}

Matrix2Df masked_median_replace(const Matrix2Df& data, const Mask2D& marked, int k) {
    if (k < 1 || k % 2 == 0) {
        throw ConfigError("median_filter_size must be an odd integer >= 1");
    }
    if (marked.rows() != data.rows() || marked.cols() != data.cols()) {
        throw PipelineError("star mask does not match channel dimensions");
    }

    const int h = static_cast<int>(data.rows());
    const int w = static_cast<int>(data.cols());
    const int r = k / 2;
    const size_t sufficient = std::max<size_t>(1, static_cast<size_t>(k) * static_cast<size_t>(k) / 4);

    Matrix2Df out = data;
    std::vector<float> clean;
    std::vector<float> all;
    clean.reserve(static_cast<size_t>(k * k));
    all.reserve(static_cast<size_t>(k * k));

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (!marked(y, x)) continue;

            clean.clear();
            all.clear();
            for (int dy = -r; dy <= r; ++dy) {
                const int yy = std::clamp(y + dy, 0, h - 1);
                for (int dx = -r; dx <= r; ++dx) {
                    const int xx = std::clamp(x + dx, 0, w - 1);
                    const float v = data(yy, xx);
                    all.push_back(v);
                    if (!marked(yy, xx)) clean.push_back(v);
                }
            }
            out(y, x) = (clean.size() >= sufficient) ? core::median_of(clean)
                                                      : core::median_of(all);
        }
    }
    return out;
}

Matrix2Df gaussian_blur(const Matrix2Df& data, float sigma) {
    if (!(sigma > 0.0f) || data.size() == 0) {
        return data;
    }

    cv::Mat src(static_cast<int>(data.rows()), static_cast<int>(data.cols()), CV_32F,
                const_cast<float*>(data.data()));
    cv::Mat blurred;
    cv::GaussianBlur(src, blurred, cv::Size(0, 0), sigma, sigma, cv::BORDER_REPLICATE);

    Matrix2Df result(data.rows(), data.cols());
    std::memcpy(result.data(), blurred.ptr<float>(0), static_cast<size_t>(data.size()) * sizeof(float));
    return result;
}

} // namespace synthflat::image
