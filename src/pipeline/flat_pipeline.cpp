#include "synthflat/pipeline/flat_pipeline.hpp"
#include "synthflat/core/errors.hpp"
#include "synthflat/core/utils.hpp"
#include "synthflat/image/aggregation.hpp"
#include "synthflat/image/mosaic.hpp"
#include "synthflat/metadata/analysis.hpp"
#include "synthflat/pipeline/flat_encoder.hpp"
#include "synthflat/removal/strategy.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

namespace synthflat::pipeline {

size_t RunReport::frames_used() const {
    return static_cast<size_t>(std::count_if(frames.begin(), frames.end(),
                                             [](const FrameRecord& f) { return f.used; }));
}

core::json RunReport::to_json() const {
    core::json frames_json = core::json::array();
    for (const auto& f : frames) {
        core::json entry = {{"path", f.path.string()}, {"sha256", f.sha256}, {"used", f.used}};
        if (!f.used) entry["excluded_reason"] = f.excluded_reason;
        frames_json.push_back(entry);
    }

    core::json md = core::json::array();
    for (const auto& [field, value] : metadata.entries) {
        md.push_back({{"field", field}, {"value", value}});
    }

    core::json parameters = {
        {"method", params.method},
        {"combine_rule", params.combine_rule},
        {"strict", params.strict},
        {"parallel_workers", params.parallel_workers}
    };
    if (params.threshold) parameters["threshold"] = *params.threshold;
    if (params.method == config::kMethodThresholdMedian) {
        parameters["threshold_mode"] = params.threshold_mode;
    }
    if (params.median_filter_size) parameters["median_filter_size"] = *params.median_filter_size;
    if (params.gaussian_blur_sigma) parameters["gaussian_blur_sigma"] = *params.gaussian_blur_sigma;
    if (params.external_tool_path) {
        parameters["external_tool_path"] = *params.external_tool_path;
        parameters["external_tool_args"] = params.external_tool_args;
        parameters["external_tool_timeout_seconds"] = params.external_tool_timeout_seconds;
    }
    if (params.fallback_method) parameters["fallback_method"] = *params.fallback_method;

    return {
        {"run_id", run_id},
        {"output", output.string()},
        {"pattern", mosaic_pattern_to_string(pattern)},
        {"width", width},
        {"height", height},
        {"strategy", strategy},
        {"parameters", parameters},
        {"frames_used", frames_used()},
        {"frames", frames_json},
        {"metadata", md},
        {"warnings", warnings}
    };
}

fs::path report_path_for(const fs::path& output) {
    fs::path p = output;
    p += ".report.json";
    return p;
}

FlatPipeline::FlatPipeline(const io::FrameDecoder& decoder, core::EventEmitter& events,
                           const std::atomic<bool>* stop_flag)
    : decoder_(decoder), events_(events), stop_flag_(stop_flag) {}

void FlatPipeline::warn(RunReport& report, const std::string& message) {
    std::lock_guard<std::mutex> lock(warn_mutex_);
    report.warnings.push_back(message);
    std::cerr << "[WARN] " << message << std::endl;
    events_.warning(message);
}

void FlatPipeline::check_stop() const {
    if (stop_flag_ && stop_flag_->load()) {
        throw StopRequested();
    }
}

RunReport FlatPipeline::run(const FlatRequest& request) {
    const auto& params = request.params;

    RunReport report;
    report.run_id = events_.run_id();
    report.output = request.output;
    report.params = params;

    Phase phase = Phase::SCAN_INPUT;
    try {
        events_.phase_start(phase);
        if (request.frames.empty()) {
            throw EmptyBatchError("no input frames");
        }
        if (request.output.empty()) {
            throw ConfigError("output path is empty");
        }

        // strategy selection and tool checks before any frame is touched
        auto strategy = removal::make_strategy(
            params, stop_flag_, [this, &report](const std::string& m) { warn(report, m); });
        strategy->preflight(params);
        report.strategy = strategy->name();
        const CombineRule rule = image::parse_combine_rule(params.combine_rule);
        events_.phase_end(phase, "ok", {{"frames", request.frames.size()}});

        // ---- extraction + folding -------------------------------------
        phase = Phase::EXTRACTION;
        events_.phase_start(phase);

        const size_t n = request.frames.size();
        report.frames.resize(n);
        std::vector<std::optional<MetadataMap>> frame_metadata(n);
        image::ChannelAggregator aggregator(rule);

        std::mutex fold_mutex;
        std::mutex log_mutex;
        std::atomic<size_t> next{0};
        std::atomic<size_t> done{0};
        std::atomic<bool> failed{false};
        std::exception_ptr first_error;

        auto worker = [&]() {
            while (!failed.load(std::memory_order_relaxed)) {
                const size_t fi = next.fetch_add(1);
                if (fi >= n) break;

                const fs::path& path = request.frames[fi];
                FrameRecord& record = report.frames[fi];
                record.path = path;
                try {
                    check_stop();

                    // unreadable or undecodable frames are excluded unless strict
                    DecodedFrame decoded;
                    try {
                        decoded = decoder_.decode(path);
                        if (fs::exists(path)) record.sha256 = core::sha256_file(path);
                    } catch (const IOError& e) {
                        if (params.strict) throw;
                        record.sha256.clear();
                        record.excluded_reason = e.what();
                        warn(report, "excluded " + path.filename().string() + ": " + e.what());
                        continue;
                    }

                    MetadataMap md = std::move(decoded.metadata);
                    RawFrame frame = image::extract(std::move(decoded));
                    {
                        std::lock_guard<std::mutex> lock(fold_mutex);
                        aggregator.add(frame);
                    }
                    frame_metadata[fi] = std::move(md);
                    record.used = true;

                    const size_t k = done.fetch_add(1) + 1;
                    events_.frame_processed(static_cast<int>(fi), static_cast<int>(n),
                                            path.filename().string());
                    std::lock_guard<std::mutex> lock(log_mutex);
                    std::cerr << "[EXTRACT] " << k << "/" << n << " " << path.filename().string()
                              << " " << frame.width() << "x" << frame.height() << " "
                              << mosaic_pattern_to_string(frame.pattern) << std::endl;
                } catch (const std::exception&) {
                    std::lock_guard<std::mutex> lock(log_mutex);
                    if (!first_error) first_error = std::current_exception();
                    failed.store(true, std::memory_order_relaxed);
                }
            }
        };

        const size_t workers = std::min(n, static_cast<size_t>(std::max(1, params.parallel_workers)));
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t i = 0; i < workers; ++i) pool.emplace_back(worker);
        for (auto& t : pool) t.join();
        if (first_error) std::rethrow_exception(first_error);
        check_stop();

        if (aggregator.frame_count() == 0) {
            throw EmptyBatchError("all " + std::to_string(n) + " input frames were excluded");
        }
        report.pattern = aggregator.pattern();
        report.width = aggregator.width();
        report.height = aggregator.height();
        events_.phase_end(phase, "ok", {{"used", aggregator.frame_count()},
                                        {"excluded", n - aggregator.frame_count()}});

        // ---- aggregation ----------------------------------------------
        phase = Phase::AGGREGATION;
        events_.phase_start(phase);
        ChannelSet channels = aggregator.finish();
        std::cerr << "[AGG] " << aggregator.frame_count() << " frames, rule="
                  << combine_rule_to_string(rule) << std::endl;
        events_.phase_end(phase, "ok", {{"combine_rule", combine_rule_to_string(rule)}});

        // ---- per-channel artifact removal -------------------------------
        phase = Phase::ARTIFACT_REMOVAL;
        events_.phase_start(phase);
        check_stop();
        {
            // each task owns exactly one entry of cleaned[]
            std::vector<ChannelLabel> labels;
            for (const auto& kv : channels) labels.push_back(kv.first);
            std::vector<ChannelImage> cleaned(labels.size());
            std::exception_ptr channel_error;
            std::mutex error_mutex;
            std::atomic<int> finished{0};

            std::vector<std::thread> tasks;
            for (size_t i = 0; i < labels.size(); ++i) {
                tasks.emplace_back([&, i]() {
                    try {
                        check_stop();
                        cleaned[i] = removal::apply_checked(*strategy, channels.at(labels[i]), params);
                        const int k = ++finished;
                        events_.phase_progress(phase, k, static_cast<int>(labels.size()),
                                               channel_label_to_string(labels[i]));
                    } catch (const std::exception&) {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (!channel_error) channel_error = std::current_exception();
                    }
                });
            }
            for (auto& t : tasks) t.join();
            if (channel_error) std::rethrow_exception(channel_error);

            for (size_t i = 0; i < labels.size(); ++i) {
                channels[labels[i]] = std::move(cleaned[i]);
            }
        }
        events_.phase_end(phase, "ok", {{"strategy", report.strategy}});

        // ---- reconstruction ------------------------------------------
        phase = Phase::RECONSTRUCTION;
        events_.phase_start(phase);
        check_stop();
        SyntheticFlat flat;
        flat.pattern = report.pattern;
        flat.mosaic = image::reconstruct(channels, report.pattern, report.height, report.width);
        channels.clear();
        events_.phase_end(phase, "ok");

        // ---- metadata --------------------------------------------------
        phase = Phase::METADATA;
        events_.phase_start(phase);
        std::vector<MetadataMap> batch;
        for (auto& md : frame_metadata) {
            if (md) batch.push_back(std::move(*md));
        }

        config::MetadataSpec spec = request.metadata_spec;
        if (request.camera_db && !batch.empty()) {
            if (auto camera = request.camera_db->match(batch.front())) {
                std::cerr << "[CAMDB] matched " << camera->name << std::endl;
                if (auto db_pattern = metadata::camera_bayer_pattern(*camera, batch.front())) {
                    MosaicPattern p = MosaicPattern::UNKNOWN;
                    try {
                        p = image::parse_pattern(*db_pattern);
                    } catch (const UnsupportedPatternError& e) {
                        warn(report, std::string("camera database pattern: ") + e.what());
                    }
                    if (p != MosaicPattern::UNKNOWN && p != report.pattern) {
                        warn(report, "camera database pattern " + mosaic_pattern_to_string(p) +
                                     " differs from decoded pattern " +
                                     mosaic_pattern_to_string(report.pattern));
                    }
                }
                metadata::extend_spec(spec, metadata::master_flat_fields(*camera, batch.front(),
                                                                         !params.strict));
            } else {
                warn(report, "no camera database entry matches the source frames");
            }
        }

        const metadata::MetadataReport analysis = metadata::analyze_metadata(batch);
        flat.metadata = metadata::resolve(spec, analysis);
        for (const auto& w : flat.metadata.warnings) warn(report, w);
        report.metadata = flat.metadata;
        events_.phase_end(phase, "ok", {{"fields", flat.metadata.entries.size()}});

        // ---- encoding --------------------------------------------------
        phase = Phase::ENCODING;
        events_.phase_start(phase);
        check_stop();
        FlatEncoder encoder(report.run_id);
        for (const auto& w : encoder.encode(flat, request.output)) warn(report, w);
        std::cerr << "[ENCODE] wrote " << request.output.string() << std::endl;
        events_.phase_end(phase, "ok", {{"output", request.output.string()}});

        phase = Phase::DONE;
        events_.phase_start(phase);
        try {
            core::write_text(report_path_for(request.output), report.to_json().dump(2) + "\n");
        } catch (const IOError& e) {
            warn(report, std::string("run report not written: ") + e.what());
        }
        events_.phase_end(phase, "ok", {{"warnings", report.warnings.size()}});
    } catch (const std::exception& e) {
        events_.phase_end(phase, "error", {{"error", e.what()}});
        throw;
    }
    return report;
}

} // namespace synthflat::pipeline
