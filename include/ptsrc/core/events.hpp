#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace ptsrc::core {

using json = nlohmann::json;

// Run and stage lifecycle events, one JSON object per line
class EventEmitter {
public:
    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void stage_start(const std::string& run_id, Stage stage, const json& extra, std::ostream& out);
    void stage_progress(const std::string& run_id, Stage stage, int current, int total,
                        const std::string& message, std::ostream& out);
    void stage_end(const std::string& run_id, Stage stage, const std::string& status,
                   const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);
};

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out);

// Destination handed to the numerical routines. A null out disables logging.
struct EventSink {
    std::string run_id;
    std::ostream* out = nullptr;

    void emit(const std::string& type, const json& data) const {
        if (out) emit_event(type, run_id, data, *out);
    }
};

} // namespace ptsrc::core
