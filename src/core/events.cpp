#include "ptsrc/core/events.hpp"
#include "ptsrc/core/utils.hpp"

namespace ptsrc::core {

namespace {

json stage_fields(Stage stage, const json& extra) {
    json data = extra.is_object() ? extra : json::object();
    data["stage"] = stage_to_int(stage);
    data["stage_name"] = stage_to_string(stage);
    return data;
}

} // namespace

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out) {
    json event = {{"type", type}, {"run_id", run_id}, {"ts", get_iso_timestamp()}};
    if (data.is_object()) event.update(data);
    // One line per event, flushed so a tail of the log follows the run
    out << event.dump() << '\n' << std::flush;
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    emit_event("run_start", run_id, extra, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    emit_event("run_end", run_id, {{"success", success}, {"status", status}}, out);
}

void EventEmitter::stage_start(const std::string& run_id, Stage stage,
                               const json& extra, std::ostream& out) {
    emit_event("stage_start", run_id, stage_fields(stage, extra), out);
}

void EventEmitter::stage_progress(const std::string& run_id, Stage stage, int current, int total,
                                  const std::string& message, std::ostream& out) {
    json data = stage_fields(stage, json::object());
    data["current"] = current;
    data["total"] = total;
    data["progress"] = total > 0 ? static_cast<double>(current) / total : 1.0;
    data["substep"] = message;
    emit_event("stage_progress", run_id, data, out);
}

void EventEmitter::stage_end(const std::string& run_id, Stage stage,
                             const std::string& status, const json& extra, std::ostream& out) {
    json data = stage_fields(stage, extra);
    data["status"] = status;
    emit_event("stage_end", run_id, data, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    emit_event("warning", run_id, {{"message", message}}, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    emit_event("error", run_id, {{"message", message}}, out);
}

} // namespace ptsrc::core
