#pragma once

#include "pitwall/replay/cancellation.hpp"
#include "pitwall/store/race_store.hpp"
#include "pitwall/support/config.hpp"
#include "pitwall/support/error.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace pitwall::replay {

enum class ReplayState {
    Idle,
    Connected,
    Streaming,
    Completed,
    Aborted,
    Errored,
};

std::string to_string(ReplayState state);

struct ReplayRequest {
    std::string vehicle_id;
    std::optional<int> lap;
    // Empty means every channel.
    std::vector<std::string> telemetry_names;
    double playback_speed = 1.0;
    std::size_t page_size = 100;
};

struct TelemetryPoint {
    std::int64_t id = 0;
    std::string vehicle_id;
    std::optional<int> lap;
    std::string timestamp;
    std::string telemetry_name;
    double telemetry_value = 0.0;
};

enum class EventKind {
    Connected,
    Telemetry,
    Complete,
    Error,
};

std::string to_string(EventKind kind);

// Connected carries the request echo, Telemetry the point, Complete and Error
// a message.
struct ReplayEvent {
    EventKind kind = EventKind::Connected;
    std::string vehicle_id;
    std::optional<int> lap;
    double playback_speed = 1.0;
    TelemetryPoint point;
    std::string message;
};

using EventCallback = std::function<void(const ReplayEvent& event)>;

// Position after the last row handed out; an empty timestamp means the start.
struct PageCursor {
    std::string timestamp;
    std::int64_t id = 0;
};

class TelemetryPageReader {
public:
    virtual ~TelemetryPageReader() = default;

    // Up to `limit` rows of the request's series strictly after `after` in
    // (timestamp, id) order. An empty page ends the series.
    virtual bool next_page(const ReplayRequest& request, const PageCursor& after, std::size_t limit,
                           std::vector<TelemetryPoint>* out, support::Error* error) = 0;
};

// Opens its own read-only connection on the first page.
class SqliteTelemetryPageReader : public TelemetryPageReader {
public:
    explicit SqliteTelemetryPageReader(std::string db_path);

    bool next_page(const ReplayRequest& request, const PageCursor& after, std::size_t limit,
                   std::vector<TelemetryPoint>* out, support::Error* error) override;

private:
    std::string db_path_;
    store::RaceStore store_;
};

// Emits connected, then every row at its recorded spacing divided by the
// playback speed, then complete. A read failure ends the run with one error
// event; a cancellation ends it with no further events.
class ReplayScheduler {
public:
    ReplayScheduler(const support::AppConfig& config, std::ostream& log);

    // `state`, when given, follows the run through its transitions.
    ReplayState run(const ReplayRequest& request, TelemetryPageReader& reader, CancellationToken& token,
                    const EventCallback& emit, std::atomic<ReplayState>* state = nullptr);

private:
    // Verbose lines; writes from every scheduler are serialized, so sessions
    // may share one log stream.
    void log_line(const std::string& text);

    const support::AppConfig& config_;
    std::ostream& log_;
};

// One subscription: its reader, liveness flag and worker thread. Events are
// delivered on the worker thread.
class ReplaySession {
public:
    ReplaySession(ReplayRequest request, std::unique_ptr<TelemetryPageReader> reader, EventCallback emit,
                  const support::AppConfig& config, std::ostream& log);
    ~ReplaySession();
    ReplaySession(const ReplaySession&) = delete;
    ReplaySession& operator=(const ReplaySession&) = delete;

    void start();
    void cancel();
    void join();

    bool running() const { return running_.load(); }
    ReplayState state() const { return state_.load(); }

private:
    void thread_main_();

    ReplayRequest request_;
    std::unique_ptr<TelemetryPageReader> reader_;
    EventCallback emit_;
    ReplayScheduler scheduler_;
    CancellationToken token_;

    std::thread th_;
    std::atomic<bool> running_{false};
    std::atomic<ReplayState> state_{ReplayState::Idle};
};

// A session reading from the store at `db_path`.
std::unique_ptr<ReplaySession> open_session(const std::string& db_path, ReplayRequest request, EventCallback emit,
                                            const support::AppConfig& config, std::ostream& log);

} // namespace pitwall::replay
