#include "pitwall/replay/event_frames.hpp"

namespace pitwall::replay {

// Fields keep insertion order.
using json = nlohmann::ordered_json;

nlohmann::ordered_json event_payload(const ReplayEvent& event) {
    switch (event.kind) {
        case EventKind::Connected: {
            json payload = {
                {"vehicleId", event.vehicle_id},
                {"lap", nullptr},
                {"playbackSpeed", event.playback_speed},
            };
            if (event.lap) payload["lap"] = *event.lap;
            return payload;
        }
        case EventKind::Telemetry: {
            const TelemetryPoint& p = event.point;
            json payload = {
                {"id", p.id},
                {"vehicle_id", p.vehicle_id},
                {"lap", nullptr},
                {"timestamp", p.timestamp},
                {"telemetry_name", p.telemetry_name},
                {"telemetry_value", p.telemetry_value},
            };
            if (p.lap) payload["lap"] = *p.lap;
            return payload;
        }
        case EventKind::Complete:
            return json{{"message", event.message}};
        case EventKind::Error:
            return json{{"error", event.message}};
    }
    return json::object();
}

std::string format_frame(const ReplayEvent& event) {
    return "event: " + to_string(event.kind) + "\ndata: " + event_payload(event).dump() + "\n\n";
}

} // namespace pitwall::replay
