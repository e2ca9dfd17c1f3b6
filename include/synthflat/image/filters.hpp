#pragma once

#include "synthflat/core/types.hpp"

namespace synthflat::image {

using Mask2D = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// 1 where data >= threshold
Mask2D mark_at_or_above(const Matrix2Df& data, float threshold);

/**
 * Replace every marked sample with the median of its k x k neighborhood.
 *
 * Neighborhood sampling clamps coordinates to the image (replicate edge).
 * The median is taken over unmarked neighbors when at least max(1, k*k/4)
 * of them exist, otherwise over the whole window. Unmarked samples are
 * copied unchanged.
 */
Matrix2Df masked_median_replace(const Matrix2Df& data, const Mask2D& marked, int k);

// Separable Gaussian with replicate edges; sigma == 0 returns the input
Matrix2Df gaussian_blur(const Matrix2Df& data, float sigma);

} // namespace synthflat::image
