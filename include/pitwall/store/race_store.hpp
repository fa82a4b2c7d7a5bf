#pragma once

#include "pitwall/support/error.hpp"

#include <cstdint>
#include <string>

struct sqlite3;

namespace pitwall::store {

constexpr int kSchemaVersion = 1;

enum class OpenMode {
    ReadWrite,
    ReadOnly,
};

// One SQLite connection. A ReadWrite open creates the six data tables, their
// indexes and the schema_version marker; a ReadOnly open only checks the marker.
// Replay subscriptions each open their own ReadOnly store.
class RaceStore {
public:
    RaceStore();
    ~RaceStore();
    RaceStore(const RaceStore&) = delete;
    RaceStore& operator=(const RaceStore&) = delete;

    bool open(const std::string& db_path, OpenMode mode, support::Error* error);
    void close();
    bool is_open() const { return db_ != nullptr; }
    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    bool exec(const char* sql, support::ErrorKind kind, support::Error* error);
    bool begin(support::Error* error);
    bool commit(support::Error* error);
    void rollback();

    bool schema_version(int* version, support::Error* error);
    // `table` must be one of the schema's table names.
    bool count_rows(const std::string& table, std::int64_t* count, support::Error* error);
    std::string last_error() const;

private:
    bool create_schema(support::Error* error);
    bool check_schema_version(bool stamp_if_missing, support::Error* error);

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace pitwall::store
