#pragma once

#include "synthflat/core/types.hpp"
#include "synthflat/io/tiff_io.hpp"
#include "synthflat/metadata/resolver.hpp"

#include <string>
#include <vector>

namespace synthflat::pipeline {

// Reconstructed full-resolution mosaic plus its resolved metadata
struct SyntheticFlat {
    Matrix2Df mosaic;
    MosaicPattern pattern = MosaicPattern::UNKNOWN;
    metadata::ResolvedMetadata metadata;
};

/**
 * Writes a SyntheticFlat as a CFA DNG.
 *
 * CFAPattern, BlackLevel, WhiteLevel, ColorMatrix1 and AsShotNeutral must
 * be present in the resolved metadata; a missing one raises
 * MissingRequiredMetadataError before anything touches the disk. The file
 * is written to a temporary sibling and renamed on success.
 */
class FlatEncoder {
public:
    explicit FlatEncoder(std::string run_id, std::string software = "synthflat");

    static const std::vector<std::string>& mandatory_fields();

    // Builds the DNG description; throws on missing or malformed metadata
    io::DngImage prepare(const SyntheticFlat& flat) const;

    // Exif.* / Xmp.* entries injected after the DNG is written
    std::vector<std::pair<std::string, std::string>> exif_entries(const SyntheticFlat& flat) const;

    // Returns warnings (unmapped or rejected fields)
    std::vector<std::string> encode(const SyntheticFlat& flat, const fs::path& destination) const;

private:
    std::string run_id_;
    std::string software_;
};

} // namespace synthflat::pipeline
