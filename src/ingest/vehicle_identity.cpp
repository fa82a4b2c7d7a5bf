#include "pitwall/ingest/vehicle_identity.hpp"

#include "pitwall/support/config.hpp"
#include "pitwall/support/text.hpp"

#include <utility>

namespace pitwall::ingest {

using support::ErrorKind;
using support::fail;

VehicleIdentityResolver::VehicleIdentityResolver(std::string prefix) : prefix_(std::move(prefix)) {}

std::string VehicleIdentityResolver::canonical_id(const std::string& prefix, int car_number) {
    return prefix + "-" + std::to_string(car_number);
}

bool VehicleIdentityResolver::resolve(int car_number, std::string* vehicle_id, support::Error* error) {
    if (car_number <= 0) {
        return fail(error, ErrorKind::Identity, "car number " + std::to_string(car_number) + " is not positive");
    }
    auto it = seen_.find(car_number);
    if (it == seen_.end()) {
        VehicleIdentity identity;
        identity.vehicle_id = canonical_id(prefix_, car_number);
        identity.car_number = car_number;
        it = seen_.emplace(car_number, std::move(identity)).first;
    }
    *vehicle_id = it->second.vehicle_id;
    return true;
}

bool VehicleIdentityResolver::resolve_id(const std::string& raw_vehicle_id, std::string* vehicle_id,
                                         int* car_number, support::Error* error) {
    const std::string raw = support::trim(raw_vehicle_id);
    const std::size_t dash = raw.rfind('-');
    const std::string tail = dash == std::string::npos ? raw : raw.substr(dash + 1);
    int number = 0;
    if (!support::parse_int(tail, &number)) {
        return fail(error, ErrorKind::Identity, "cannot derive a car number from vehicle id '" + raw + "'");
    }
    if (!resolve(number, vehicle_id, error)) return false;
    *car_number = number;
    return true;
}

void VehicleIdentityResolver::note_class(int car_number, const std::string& class_name) {
    const std::string label = support::trim(class_name);
    if (label.empty()) return;
    auto it = seen_.find(car_number);
    if (it == seen_.end() || it->second.class_name) return;
    it->second.class_name = label;
}

} // namespace pitwall::ingest
