#include "synthflat/io/exif_metadata.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

#include <exiv2/exiv2.hpp>
#include <iostream>

namespace synthflat::io {

namespace {

// Maker notes and thumbnails are not comparable metadata
constexpr long kMaxValueBytes = 256;

} // namespace

MetadataMap read_exif_metadata(const fs::path& path) {
    MetadataMap out;
    try {
        Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(path.string());
        image->readMetadata();
        for (const auto& datum : image->exifData()) {
            if (static_cast<long>(datum.size()) > kMaxValueBytes) continue;
            out[datum.key()] = core::trim(datum.toString());
        }
    } catch (const Exiv2::Error& e) {
        throw FrameDecodeError(path.string() + ": " + e.what());
    }
    return out;
}

std::vector<std::string> inject_metadata(const fs::path& path,
                                         const std::vector<std::pair<std::string, std::string>>& tags) {
    std::vector<std::string> rejected;
    if (tags.empty()) return rejected;

    try {
        Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(path.string());
        image->readMetadata();
        Exiv2::ExifData& exif = image->exifData();
        Exiv2::XmpData& xmp = image->xmpData();

        for (const auto& [key, value] : tags) {
            try {
                if (core::starts_with(key, "Exif.")) {
                    Exiv2::ExifKey k(key);
                    Exiv2::Exifdatum datum(k);
                    if (datum.setValue(value) != 0) {
                        rejected.push_back(key);
                        continue;
                    }
                    auto it = exif.findKey(k);
                    if (it != exif.end()) exif.erase(it);
                    exif.add(datum);
                } else if (core::starts_with(key, "Xmp.")) {
                    Exiv2::XmpKey k(key);
                    Exiv2::Xmpdatum datum(k);
                    if (datum.setValue(value) != 0) {
                        rejected.push_back(key);
                        continue;
                    }
                    auto it = xmp.findKey(k);
                    if (it != xmp.end()) xmp.erase(it);
                    xmp.add(datum);
                } else {
                    rejected.push_back(key);
                }
            } catch (const Exiv2::Error& e) {
                std::cerr << "[EXIF] rejected " << key << ": " << e.what() << std::endl;
                rejected.push_back(key);
            }
        }
        image->writeMetadata();
    } catch (const Exiv2::Error& e) {
        throw IOError("Cannot write metadata into " + path.string() + ": " + e.what());
    }
    return rejected;
}

} // namespace synthflat::io
