#include "pitwall/replay/event_frames.hpp"
#include "pitwall/replay/replay_scheduler.hpp"
#include "pitwall/support/config.hpp"
#include "pitwall/support/error.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) {
    g_interrupted = 1;
}

struct CliArgs {
    std::string vehicle_id;
    std::string db_path;
    std::string names;
    int lap = 0;
    bool has_lap = false;
    double speed = 0.0;
    bool has_speed = false;
    std::size_t page_size = 0;
    bool verbose = false;
};

void print_usage() {
    std::cout << "pitwall_replay <vehicle-id> [--db PATH] [--lap N] [--speed X] [--names a,b] [--page-size N]"
                 " [-v]\n";
}

bool parse_args(int argc, char** argv, CliArgs* args) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const std::string& flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << "\n";
                return nullptr;
            }
            return argv[++i];
        };
        if (a == "--db" || a == "--database") {
            const char* v = need(a);
            if (!v) return false;
            args->db_path = v;
        } else if (a == "--lap") {
            const char* v = need(a);
            if (!v || !pitwall::support::parse_int(v, &args->lap) || args->lap < 1) {
                std::cerr << "--lap needs a positive integer\n";
                return false;
            }
            args->has_lap = true;
        } else if (a == "--speed") {
            const char* v = need(a);
            if (!v || !pitwall::support::parse_double(v, &args->speed) ||
                args->speed < pitwall::support::kMinPlaybackSpeed ||
                args->speed > pitwall::support::kMaxPlaybackSpeed) {
                std::cerr << "--speed must be between " << pitwall::support::kMinPlaybackSpeed << " and "
                          << pitwall::support::kMaxPlaybackSpeed << "\n";
                return false;
            }
            args->has_speed = true;
        } else if (a == "--names") {
            const char* v = need(a);
            if (!v) return false;
            args->names = v;
        } else if (a == "--page-size") {
            const char* v = need(a);
            if (!v || !pitwall::support::parse_size(v, &args->page_size) || args->page_size == 0) {
                std::cerr << "--page-size needs a positive integer\n";
                return false;
            }
        } else if (a == "-v" || a == "--verbose") {
            args->verbose = true;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            return false;
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "Unknown argument: " << a << "\n";
            return false;
        } else if (args->vehicle_id.empty()) {
            args->vehicle_id = a;
        } else {
            std::cerr << "Unexpected argument: " << a << "\n";
            return false;
        }
    }
    if (args->vehicle_id.empty()) {
        std::cerr << "Missing vehicle id\n";
        print_usage();
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, &args)) return 1;

    pitwall::support::AppConfig config;
    pitwall::support::Error error;
    if (!pitwall::support::apply_environment(&config, &error)) {
        std::cerr << error.describe(true) << "\n";
        return 1;
    }
    if (!args.db_path.empty()) config.db_path = args.db_path;
    config.verbose = args.verbose;

    pitwall::replay::ReplayRequest request;
    request.vehicle_id = args.vehicle_id;
    if (args.has_lap) request.lap = args.lap;
    request.telemetry_names = pitwall::support::split_list(args.names, ',');
    request.playback_speed = args.has_speed ? args.speed : config.playback_speed;
    request.page_size = args.page_size > 0 ? args.page_size : config.replay_page_size;

    std::signal(SIGINT, on_sigint);

    auto session = pitwall::replay::open_session(
        config.db_path, request,
        [](const pitwall::replay::ReplayEvent& event) {
            std::cout << pitwall::replay::format_frame(event) << std::flush;
        },
        config, std::cerr);
    session->start();
    while (session->running()) {
        if (g_interrupted) session->cancel();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    session->join();

    const auto state = session->state();
    if (config.verbose) std::cerr << "[replay] finished: " << pitwall::replay::to_string(state) << "\n";
    return state == pitwall::replay::ReplayState::Errored ? 1 : 0;
}
