#pragma once

#include "pitwall/ingest/records.hpp"
#include "pitwall/ingest/vehicle_identity.hpp"
#include "pitwall/store/race_store.hpp"
#include "pitwall/support/config.hpp"
#include "pitwall/support/error.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <ostream>
#include <vector>

struct sqlite3_stmt;

namespace pitwall::ingest {

// Writes normalized batches into the store. Vehicle identities always go in
// before the rows that reference them, and everything between begin() and
// commit() is one transaction, so a failed file leaves no rows behind.
//
// Statements are prepared on first use inside a transaction and finalized at
// commit or rollback.
class ReferentialLoader {
public:
    ReferentialLoader(store::RaceStore& store, const support::AppConfig& config, std::ostream& log);
    ~ReferentialLoader();
    ReferentialLoader(const ReferentialLoader&) = delete;
    ReferentialLoader& operator=(const ReferentialLoader&) = delete;

    bool begin(support::Error* error);
    // Inserts identities not yet written; an existing vehicle only gains a
    // class label when it had none.
    bool write_vehicles(const VehicleIdentityResolver& identities, support::Error* error);
    bool write_batch(const RecordBatch& batch, std::size_t* inserted, support::Error* error);
    bool commit(support::Error* error);
    void rollback();
    bool in_transaction() const { return in_transaction_; }

    // begin + write_vehicles + write_batch + commit, rolled back on failure.
    bool load(const RecordBatch& batch, const VehicleIdentityResolver& identities, std::size_t* inserted,
              support::Error* error);

private:
    enum Slot { kVehicles, kLaps, kTelemetry, kResults, kSections, kWeather, kSlotCount };

    sqlite3_stmt* statement(Slot slot, support::Error* error);
    bool step(sqlite3_stmt* stmt, const char* what, std::size_t* inserted, support::Error* error);
    void finalize_all();

    bool write_rows(const std::vector<LapRow>& rows, std::size_t* inserted, support::Error* error);
    bool write_rows(const std::vector<ResultRow>& rows, std::size_t* inserted, support::Error* error);
    bool write_rows(const std::vector<TelemetryRow>& rows, std::size_t* inserted, support::Error* error);
    bool write_rows(const std::vector<SectionRow>& rows, std::size_t* inserted, support::Error* error);
    bool write_rows(const std::vector<WeatherRow>& rows, std::size_t* inserted, support::Error* error);

    store::RaceStore& store_;
    const support::AppConfig& config_;
    std::ostream& log_;

    std::array<sqlite3_stmt*, kSlotCount> statements_{};
    bool in_transaction_ = false;
    std::size_t telemetry_in_transaction_ = 0;

    // car number -> whether the written row carried a class label
    std::map<int, bool> committed_vehicles_;
    std::map<int, bool> pending_vehicles_;
};

} // namespace pitwall::ingest
