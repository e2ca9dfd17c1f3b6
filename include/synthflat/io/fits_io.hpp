#pragma once

#include "synthflat/core/types.hpp"
#include <map>
#include <string>

namespace synthflat::io {

bool is_fits_image_path(const fs::path& path);

// First image plane as float; row 0 is the first FITS row
Matrix2Df read_fits_float(const fs::path& path);

// Overwrites path; cards longer than 8 characters are skipped
void write_fits_float(const fs::path& path, const Matrix2Df& data,
                      const std::map<std::string, std::string>& cards = {});

} // namespace synthflat::io
