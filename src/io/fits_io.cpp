#include "synthflat/io/fits_io.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"

#include <fitsio.h>
#include <vector>

namespace synthflat::io {

namespace {

std::string fits_status_text(int status) {
    char text[FLEN_STATUS] = {0};
    fits_get_errstatus(status, text);
    return std::string(text);
}

} // namespace

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

Matrix2Df read_fits_float(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (naxis < 2) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];

    Matrix2Df data(height, width);
    long fpixel[3] = {1, 1, 1};
    fits_read_pix(fptr, TFLOAT, fpixel, width * height, nullptr, data.data(), nullptr, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    return data;
}

void write_fits_float(const fs::path& path, const Matrix2Df& data,
                      const std::map<std::string, std::string>& cards) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : cards) {
        if (key.size() > 8) continue;
        fits_update_key(fptr, TSTRING, key.c_str(),
                        const_cast<char*>(value.c_str()), nullptr, &status);
    }

    // RowMajor storage matches FITS pixel order
    std::vector<float> buffer(data.data(), data.data() + data.size());
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(data.size()), buffer.data(), &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot finalize FITS file: " + path.string());
    }
}

} // namespace synthflat::io
