#pragma once

#include "synthflat/core/types.hpp"

namespace synthflat::io {

// Turns one capture file into its mosaic grid, pattern and metadata
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    // Throws FrameDecodeError for anything that prevents decoding this file
    virtual DecodedFrame decode(const fs::path& path) const = 0;

    // Metadata only, without unpacking the sample grid
    virtual MetadataMap read_metadata(const fs::path& path) const = 0;
};

/**
 * LibRaw-backed decoder. The visible area is cropped out of raw_image
 * without any scaling, black subtraction or demosaicing. Exif data is
 * added through Exiv2 under its "Exif." keys.
 */
class LibRawDecoder : public FrameDecoder {
public:
    DecodedFrame decode(const fs::path& path) const override;
    MetadataMap read_metadata(const fs::path& path) const override;
};

} // namespace synthflat::io
