#pragma once

#include "synthflat/core/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace synthflat::io {

// Every Exif.* datum of a capture as text; throws FrameDecodeError
MetadataMap read_exif_metadata(const fs::path& path);

/**
 * Write Exif.* / Xmp.* entries into an existing image in place.
 * Returns the keys Exiv2 refused (unknown key or unparsable value);
 * throws IOError if the file cannot be rewritten.
 */
std::vector<std::string> inject_metadata(const fs::path& path,
                                         const std::vector<std::pair<std::string, std::string>>& tags);

} // namespace synthflat::io
