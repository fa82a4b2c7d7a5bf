#include "pitwall/replay/replay_scheduler.hpp"

#include "pitwall/support/time_codec.hpp"

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <sstream>
#include <utility>

namespace pitwall::replay {

using support::Error;
using support::ErrorKind;
using support::fail;

namespace {

// Suspensions at or below this are skipped.
constexpr double kMinDelayMs = 1.0;

void set_state(std::atomic<ReplayState>* state, ReplayState value) {
    if (state) state->store(value);
}

std::string page_query(std::size_t name_count) {
    std::string sql = R"SQL(
        SELECT id, vehicle_id, lap, timestamp, telemetry_name, telemetry_value
        FROM telemetry
        WHERE vehicle_id = ?1
          AND (?2 IS NULL OR lap = ?2)
          AND (timestamp, id) > (?3, ?4)
    )SQL";
    if (name_count > 0) {
        sql += "      AND telemetry_name IN (";
        for (std::size_t i = 0; i < name_count; ++i) {
            if (i) sql += ", ";
            sql += "?" + std::to_string(i + 6);
        }
        sql += ")\n";
    }
    sql += "        ORDER BY timestamp, id\n        LIMIT ?5;";
    return sql;
}

} // namespace

std::string to_string(ReplayState state) {
    switch (state) {
        case ReplayState::Idle: return "idle";
        case ReplayState::Connected: return "connected";
        case ReplayState::Streaming: return "streaming";
        case ReplayState::Completed: return "completed";
        case ReplayState::Aborted: return "aborted";
        case ReplayState::Errored: return "errored";
    }
    return "unknown";
}

std::string to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Connected: return "connected";
        case EventKind::Telemetry: return "telemetry";
        case EventKind::Complete: return "complete";
        case EventKind::Error: return "error";
    }
    return "unknown";
}

SqliteTelemetryPageReader::SqliteTelemetryPageReader(std::string db_path) : db_path_(std::move(db_path)) {}

bool SqliteTelemetryPageReader::next_page(const ReplayRequest& request, const PageCursor& after, std::size_t limit,
                                          std::vector<TelemetryPoint>* out, Error* error) {
    out->clear();
    if (!store_.is_open()) {
        Error open_error;
        if (!store_.open(db_path_, store::OpenMode::ReadOnly, &open_error)) {
            return fail(error, ErrorKind::Stream, open_error.message, open_error.cause);
        }
    }

    sqlite3* db = store_.handle();
    const std::string sql = page_query(request.telemetry_names.size());
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(error, ErrorKind::Stream, "failed to prepare telemetry page query", sqlite3_errmsg(db));
    }
    sqlite3_bind_text(stmt, 1, request.vehicle_id.c_str(), -1, SQLITE_TRANSIENT);
    if (request.lap) {
        sqlite3_bind_int(stmt, 2, *request.lap);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    sqlite3_bind_text(stmt, 3, after.timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, after.id);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(limit));
    for (std::size_t i = 0; i < request.telemetry_names.size(); ++i) {
        sqlite3_bind_text(stmt, static_cast<int>(i + 6), request.telemetry_names[i].c_str(), -1, SQLITE_TRANSIENT);
    }

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        TelemetryPoint p;
        p.id = sqlite3_column_int64(stmt, 0);
        const unsigned char* vid = sqlite3_column_text(stmt, 1);
        p.vehicle_id = vid ? reinterpret_cast<const char*>(vid) : "";
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) p.lap = sqlite3_column_int(stmt, 2);
        const unsigned char* ts = sqlite3_column_text(stmt, 3);
        p.timestamp = ts ? reinterpret_cast<const char*>(ts) : "";
        const unsigned char* name = sqlite3_column_text(stmt, 4);
        p.telemetry_name = name ? reinterpret_cast<const char*>(name) : "";
        p.telemetry_value = sqlite3_column_double(stmt, 5);
        out->push_back(std::move(p));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        out->clear();
        return fail(error, ErrorKind::Stream, "telemetry page query failed", sqlite3_errmsg(db));
    }
    return true;
}

ReplayScheduler::ReplayScheduler(const support::AppConfig& config, std::ostream& log) : config_(config), log_(log) {}

void ReplayScheduler::log_line(const std::string& text) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);
    log_ << "[replay] " << text << "\n";
}

ReplayState ReplayScheduler::run(const ReplayRequest& request, TelemetryPageReader& reader, CancellationToken& token,
                                 const EventCallback& emit, std::atomic<ReplayState>* state) {
    const double speed = support::clamp_playback_speed(request.playback_speed);
    const std::size_t page_size = request.page_size > 0 ? request.page_size : config_.replay_page_size;

    if (token.cancelled()) {
        set_state(state, ReplayState::Aborted);
        return ReplayState::Aborted;
    }

    ReplayEvent connected;
    connected.kind = EventKind::Connected;
    connected.vehicle_id = request.vehicle_id;
    connected.lap = request.lap;
    connected.playback_speed = speed;
    emit(connected);
    set_state(state, ReplayState::Connected);
    if (config_.verbose) {
        std::ostringstream line;
        line << request.vehicle_id << " connected at " << speed << "x";
        log_line(line.str());
    }

    PageCursor cursor;
    std::vector<TelemetryPoint> page;
    bool have_previous = false;
    std::int64_t previous_ms = 0;
    std::size_t emitted = 0;
    set_state(state, ReplayState::Streaming);

    for (;;) {
        if (token.cancelled()) {
            set_state(state, ReplayState::Aborted);
            return ReplayState::Aborted;
        }

        Error read_error;
        if (!reader.next_page(request, cursor, page_size, &page, &read_error)) {
            if (config_.verbose) log_line(request.vehicle_id + " " + read_error.describe(true));
            ReplayEvent failed;
            failed.kind = EventKind::Error;
            failed.vehicle_id = request.vehicle_id;
            failed.message = read_error.message;
            emit(failed);
            set_state(state, ReplayState::Errored);
            return ReplayState::Errored;
        }
        if (page.empty()) break;

        for (const auto& point : page) {
            if (token.cancelled()) {
                set_state(state, ReplayState::Aborted);
                return ReplayState::Aborted;
            }

            std::int64_t current_ms = 0;
            const bool timed = support::parse_iso8601_ms(point.timestamp, &current_ms);
            if (timed && have_previous) {
                const double delay_ms = static_cast<double>(current_ms - previous_ms) / speed;
                if (delay_ms > kMinDelayMs && !token.wait_for(std::chrono::duration<double, std::milli>(delay_ms))) {
                    set_state(state, ReplayState::Aborted);
                    return ReplayState::Aborted;
                }
            }
            if (timed) {
                previous_ms = current_ms;
                have_previous = true;
            }

            ReplayEvent event;
            event.kind = EventKind::Telemetry;
            event.vehicle_id = request.vehicle_id;
            event.lap = point.lap;
            event.playback_speed = speed;
            event.point = point;
            emit(event);
            ++emitted;
        }
        cursor.timestamp = page.back().timestamp;
        cursor.id = page.back().id;
        if (page.size() < page_size) break;
    }

    ReplayEvent done;
    done.kind = EventKind::Complete;
    done.vehicle_id = request.vehicle_id;
    done.message = "Stream completed";
    emit(done);
    set_state(state, ReplayState::Completed);
    if (config_.verbose) log_line(request.vehicle_id + " completed after " + std::to_string(emitted) + " rows");
    return ReplayState::Completed;
}

ReplaySession::ReplaySession(ReplayRequest request, std::unique_ptr<TelemetryPageReader> reader, EventCallback emit,
                             const support::AppConfig& config, std::ostream& log)
    : request_(std::move(request)), reader_(std::move(reader)), emit_(std::move(emit)), scheduler_(config, log) {}

ReplaySession::~ReplaySession() {
    cancel();
    join();
}

void ReplaySession::start() {
    if (running_.load() || th_.joinable()) return;
    running_.store(true);
    th_ = std::thread(&ReplaySession::thread_main_, this);
}

void ReplaySession::cancel() {
    token_.cancel();
}

void ReplaySession::join() {
    if (th_.joinable()) th_.join();
}

void ReplaySession::thread_main_() {
    scheduler_.run(request_, *reader_, token_, emit_, &state_);
    running_.store(false);
}

std::unique_ptr<ReplaySession> open_session(const std::string& db_path, ReplayRequest request, EventCallback emit,
                                            const support::AppConfig& config, std::ostream& log) {
    return std::make_unique<ReplaySession>(std::move(request), std::make_unique<SqliteTelemetryPageReader>(db_path),
                                           std::move(emit), config, log);
}

} // namespace pitwall::replay
