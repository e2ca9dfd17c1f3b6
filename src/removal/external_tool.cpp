#include "synthflat/removal/strategy.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/process.hpp"
#include "synthflat/io/fits_io.hpp"
#include "synthflat/io/tiff_io.hpp"

#include <iostream>
#include <unistd.h>

namespace synthflat::removal {

void ExternalToolDelegate::check_executable(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        throw ExternalToolError("executable not found: '" + path + "'");
    }
    if (::access(path.c_str(), X_OK) != 0) {
        throw ExternalToolError("not executable: '" + path + "'");
    }
}

void ExternalToolDelegate::preflight(const config::ProcessingParameters& params) const {
    check_executable(params.external_tool_path.value_or(""));
}

ChannelImage ExternalToolDelegate::apply(const ChannelImage& channel,
                                         const config::ProcessingParameters& params) const {
    const std::string tool = params.external_tool_path.value_or("");
    check_executable(tool);

    const std::string label = channel_label_to_string(channel.label);
    const bool fits = params.external_tool_format == "fits";
    const std::string ext = fits ? ".fits" : ".tif";

    core::ScopedTempDir tmp("synthflat-" + label + "-");
    const fs::path input = tmp.path() / ("channel_" + label + "_in" + ext);
    const fs::path output = tmp.path() / ("channel_" + label + "_out" + ext);

    if (fits) {
        io::write_fits_float(input, channel.data, {{"CHANNEL", label}});
    } else {
        io::write_tiff_gray16(input, channel.data);
    }

    std::vector<std::string> args = {input.string(), output.string()};
    args.insert(args.end(), params.external_tool_args.begin(), params.external_tool_args.end());

    std::cerr << "[EXT] " << label << ": " << tool << " (timeout "
              << params.external_tool_timeout_seconds << "s)" << std::endl;
    const core::ProcessResult result =
        core::run_process(tool, args, std::chrono::seconds(params.external_tool_timeout_seconds),
                          stop_flag_);

    if (result.cancelled) {
        throw StopRequested();
    }
    if (result.timed_out) {
        throw ExternalToolError(tool + " timed out after " +
                                std::to_string(params.external_tool_timeout_seconds) +
                                "s on channel " + label);
    }
    if (result.exit_code != 0) {
        throw ExternalToolError(tool + " exited with code " + std::to_string(result.exit_code) +
                                " on channel " + label);
    }
    if (!fs::exists(output)) {
        throw ExternalToolError(tool + " produced no output file for channel " + label);
    }

    ChannelImage out = channel;
    try {
        out.data = fits ? io::read_fits_float(output) : io::read_tiff_gray(output);
    } catch (const IOError& e) {
        throw ExternalToolError("cannot read output of " + tool + " for channel " + label + ": " +
                                e.what());
    }

    if (out.rows() != channel.rows() || out.cols() != channel.cols()) {
        throw ExternalToolError(tool + " returned " + std::to_string(out.cols()) + "x" +
                                std::to_string(out.rows()) + " for channel " + label + ", expected " +
                                std::to_string(channel.cols()) + "x" + std::to_string(channel.rows()));
    }
    return out;
}

} // namespace synthflat::removal
