#include "synthflat/core/events.hpp"
#include "synthflat/core/utils.hpp"

namespace synthflat::core {

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    emit(event);
}

void EventEmitter::phase_start(Phase phase) {
    json event = base_event("phase_start");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event);
}

void EventEmitter::phase_progress(Phase phase, int current, int total,
                                  const std::string& substep) {
    json event = base_event("phase_progress");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 1.0f;
    event["substep"] = substep;
    emit(event);
}

void EventEmitter::phase_end(Phase phase, const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::frame_processed(int frame_idx, int total_frames,
                                   const std::string& frame_name) {
    json event = base_event("frame_processed");
    event["phase"] = phase_to_int(Phase::EXTRACTION);
    event["frame_idx"] = frame_idx;
    event["total_frames"] = total_frames;
    event["frame_name"] = frame_name;
    emit(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    emit(event);
}

} // namespace synthflat::core
