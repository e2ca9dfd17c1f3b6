#pragma once

#include "synthflat/config/configuration.hpp"
#include "synthflat/core/events.hpp"
#include "synthflat/io/raw_decoder.hpp"
#include "synthflat/metadata/camera_db.hpp"
#include "synthflat/metadata/resolver.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace synthflat::pipeline {

struct FlatRequest {
    std::vector<fs::path> frames;
    config::ProcessingParameters params;
    config::MetadataSpec metadata_spec;
    fs::path output;
    std::optional<metadata::CameraDatabase> camera_db;
};

struct FrameRecord {
    fs::path path;
    std::string sha256;
    bool used = false;
    std::string excluded_reason;
};

struct RunReport {
    std::string run_id;
    fs::path output;
    MosaicPattern pattern = MosaicPattern::UNKNOWN;
    int width = 0;
    int height = 0;
    std::string strategy;
    config::ProcessingParameters params;
    std::vector<FrameRecord> frames;
    metadata::ResolvedMetadata metadata;
    std::vector<std::string> warnings;

    size_t frames_used() const;
    core::json to_json() const;
};

// <output>.report.json
fs::path report_path_for(const fs::path& output);

/**
 * One synthetic-flat run: decode and fold frames, combine per channel,
 * remove artifacts per channel in parallel, reassemble, resolve metadata
 * and encode. Nothing is written at the output path unless every step
 * succeeds.
 */
class FlatPipeline {
public:
    FlatPipeline(const io::FrameDecoder& decoder, core::EventEmitter& events,
                 const std::atomic<bool>* stop_flag = nullptr);

    RunReport run(const FlatRequest& request);

private:
    void warn(RunReport& report, const std::string& message);
    void check_stop() const;

    const io::FrameDecoder& decoder_;
    core::EventEmitter& events_;
    const std::atomic<bool>* stop_flag_;
    std::mutex warn_mutex_;
};

} // namespace synthflat::pipeline
