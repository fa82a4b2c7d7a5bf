#include "pitwall/store/race_store.hpp"

#include <sqlite3.h>

#include <array>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace pitwall::store {

using support::Error;
using support::ErrorKind;
using support::fail;

namespace {

// Creation order follows the foreign keys: vehicles first.
constexpr std::array<const char*, 7> kCreateTables = {
    R"SQL(
        CREATE TABLE IF NOT EXISTS vehicles (
            vehicle_id TEXT PRIMARY KEY,
            car_number INTEGER UNIQUE,
            class TEXT,
            fastest_lap REAL,
            average_lap REAL,
            total_laps INTEGER,
            max_speed REAL,
            position INTEGER
        );
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS lap_times (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            vehicle_id TEXT NOT NULL,
            lap INTEGER NOT NULL,
            lap_time REAL NOT NULL,
            timestamp TEXT,
            FOREIGN KEY (vehicle_id) REFERENCES vehicles(vehicle_id)
        );
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS telemetry (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            vehicle_id TEXT NOT NULL,
            lap INTEGER,
            timestamp TEXT NOT NULL,
            telemetry_name TEXT NOT NULL,
            telemetry_value REAL NOT NULL,
            FOREIGN KEY (vehicle_id) REFERENCES vehicles(vehicle_id)
        );
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS race_results (
            vehicle_id TEXT PRIMARY KEY,
            position INTEGER NOT NULL,
            car_number INTEGER NOT NULL,
            laps INTEGER NOT NULL,
            total_time TEXT,
            gap_first TEXT,
            gap_previous TEXT,
            best_lap_time TEXT,
            class TEXT,
            FOREIGN KEY (vehicle_id) REFERENCES vehicles(vehicle_id)
        );
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS section_times (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            vehicle_id TEXT NOT NULL,
            lap INTEGER NOT NULL,
            s1 REAL,
            s2 REAL,
            s3 REAL,
            lap_time REAL,
            top_speed REAL,
            FOREIGN KEY (vehicle_id) REFERENCES vehicles(vehicle_id)
        );
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS weather (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL,
            air_temp REAL,
            track_temp REAL,
            humidity REAL,
            pressure REAL,
            wind_speed REAL,
            wind_direction REAL,
            rain REAL
        );
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY,
            applied_at TEXT NOT NULL
        );
    )SQL",
};

constexpr const char* kCreateIndexes = R"SQL(
    CREATE INDEX IF NOT EXISTS idx_vehicles_class ON vehicles(class);
    CREATE INDEX IF NOT EXISTS idx_vehicles_fastest_lap ON vehicles(fastest_lap);
    CREATE INDEX IF NOT EXISTS idx_lap_times_vehicle ON lap_times(vehicle_id);
    CREATE INDEX IF NOT EXISTS idx_lap_times_lap ON lap_times(lap);
    CREATE INDEX IF NOT EXISTS idx_telemetry_vehicle ON telemetry(vehicle_id);
    CREATE INDEX IF NOT EXISTS idx_telemetry_lap ON telemetry(vehicle_id, lap);
    CREATE INDEX IF NOT EXISTS idx_telemetry_vehicle_time ON telemetry(vehicle_id, timestamp, id);
    CREATE INDEX IF NOT EXISTS idx_telemetry_name ON telemetry(telemetry_name);
    CREATE INDEX IF NOT EXISTS idx_results_position ON race_results(position);
    CREATE INDEX IF NOT EXISTS idx_section_vehicle ON section_times(vehicle_id);
    CREATE INDEX IF NOT EXISTS idx_section_lap ON section_times(vehicle_id, lap);
    CREATE INDEX IF NOT EXISTS idx_weather_timestamp ON weather(timestamp);
)SQL";

constexpr std::array<const char*, 7> kTableNames = {
    "vehicles", "lap_times", "telemetry", "race_results", "section_times", "weather", "schema_version",
};

bool is_file_path(const std::string& path) {
    return path != ":memory:" && path.rfind("file:", 0) != 0;
}

std::string utc_now_iso() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

RaceStore::RaceStore() = default;

RaceStore::~RaceStore() {
    close();
}

bool RaceStore::open(const std::string& db_path, OpenMode mode, Error* error) {
    close();
    path_ = db_path;

    int flags = SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
    if (mode == OpenMode::ReadOnly) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        if (is_file_path(db_path)) {
            const std::filesystem::path parent = std::filesystem::path(db_path).parent_path();
            std::error_code ec;
            if (!parent.empty()) std::filesystem::create_directories(parent, ec);
            if (ec) {
                return fail(error, ErrorKind::Config, "cannot create database directory " + parent.string(), ec.message());
            }
        }
    }

    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        const std::string cause = db_ ? sqlite3_errmsg(db_) : "out of memory";
        close();
        return fail(error, ErrorKind::Config, "failed to open database " + db_path, cause);
    }
    sqlite3_busy_timeout(db_, 5000);

    if (mode == OpenMode::ReadOnly) {
        if (!check_schema_version(false, error)) {
            close();
            return false;
        }
        return true;
    }

    if (!exec("PRAGMA journal_mode = WAL;", ErrorKind::Config, error) ||
        !exec("PRAGMA foreign_keys = ON;", ErrorKind::Config, error) ||
        !create_schema(error)) {
        close();
        return false;
    }
    return true;
}

void RaceStore::close() {
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
}

bool RaceStore::exec(const char* sql, ErrorKind kind, Error* error) {
    if (!db_) return fail(error, kind, "database is not open");
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        const std::string cause = err ? err : "sqlite error";
        sqlite3_free(err);
        return fail(error, kind, "statement failed", cause);
    }
    return true;
}

bool RaceStore::begin(Error* error) {
    return exec("BEGIN IMMEDIATE;", ErrorKind::Import, error);
}

bool RaceStore::commit(Error* error) {
    return exec("COMMIT;", ErrorKind::Import, error);
}

void RaceStore::rollback() {
    if (db_ && !sqlite3_get_autocommit(db_)) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

bool RaceStore::create_schema(Error* error) {
    for (const char* sql : kCreateTables) {
        if (!exec(sql, ErrorKind::Config, error)) {
            if (error) error->message = "failed to create tables";
            return false;
        }
    }
    if (!exec(kCreateIndexes, ErrorKind::Config, error)) {
        if (error) error->message = "failed to create indexes";
        return false;
    }
    return check_schema_version(true, error);
}

bool RaceStore::schema_version(int* version, Error* error) {
    *version = 0;
    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1;";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(error, ErrorKind::Config, "database has no schema_version table", sqlite3_errmsg(db_));
    }
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) *version = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return fail(error, ErrorKind::Config, "failed to read schema version", sqlite3_errmsg(db_));
    }
    return true;
}

bool RaceStore::check_schema_version(bool stamp_if_missing, Error* error) {
    int existing = 0;
    if (!schema_version(&existing, error)) return false;

    if (existing > kSchemaVersion) {
        return fail(error, ErrorKind::Config,
                    "database schema version (" + std::to_string(existing) +
                        ") is newer than this program's version (" + std::to_string(kSchemaVersion) + ")");
    }
    if (existing != 0 || !stamp_if_missing) return true;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "INSERT INTO schema_version (version, applied_at) VALUES (?, ?);", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return fail(error, ErrorKind::Config, "failed to stamp schema version", sqlite3_errmsg(db_));
    }
    const std::string applied_at = utc_now_iso();
    sqlite3_bind_int(stmt, 1, kSchemaVersion);
    sqlite3_bind_text(stmt, 2, applied_at.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(error, ErrorKind::Config, "failed to stamp schema version", sqlite3_errmsg(db_));
    }
    return true;
}

bool RaceStore::count_rows(const std::string& table, std::int64_t* count, Error* error) {
    bool known = false;
    for (const char* name : kTableNames) known = known || table == name;
    if (!known) return fail(error, ErrorKind::Config, "unknown table " + table);

    const std::string sql = "SELECT COUNT(*) FROM " + table + ";";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(error, ErrorKind::Config, "failed to count " + table, sqlite3_errmsg(db_));
    }
    *count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) *count = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return true;
}

std::string RaceStore::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database is not open";
}

} // namespace pitwall::store
