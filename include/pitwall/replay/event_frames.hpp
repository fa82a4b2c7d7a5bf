#pragma once

#include "pitwall/replay/replay_scheduler.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace pitwall::replay {

nlohmann::ordered_json event_payload(const ReplayEvent& event);

// `event: <kind>\ndata: <json>\n\n`
std::string format_frame(const ReplayEvent& event);

} // namespace pitwall::replay
