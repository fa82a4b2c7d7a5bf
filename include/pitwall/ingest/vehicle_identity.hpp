#pragma once

#include "pitwall/support/error.hpp"

#include <map>
#include <optional>
#include <string>

namespace pitwall::ingest {

struct VehicleIdentity {
    std::string vehicle_id;
    int car_number = 0;
    std::optional<std::string> class_name;
};

// Maps a car number to `<prefix>-<number>`. The mapping is a fixed template so
// lap, telemetry, section and result rows of one car meet on the same id
// without a join table. Every resolved number is remembered for the current
// import run; the loader writes that set before any dependent row.
class VehicleIdentityResolver {
public:
    explicit VehicleIdentityResolver(std::string prefix);

    static std::string canonical_id(const std::string& prefix, int car_number);

    bool resolve(int car_number, std::string* vehicle_id, support::Error* error);
    // For sources that already carry an id text: the car number is the last
    // `-` separated segment, then re-resolved through the template.
    bool resolve_id(const std::string& raw_vehicle_id, std::string* vehicle_id, int* car_number,
                    support::Error* error);

    // First non-empty class label wins.
    void note_class(int car_number, const std::string& class_name);

    const std::map<int, VehicleIdentity>& seen() const { return seen_; }
    const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
    std::map<int, VehicleIdentity> seen_;
};

} // namespace pitwall::ingest
