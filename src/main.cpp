/**
 * @file main.cpp
 * @brief livegate_replay: run a recorded landmark stream through one liveness session
 *
 * Usage:
 *   livegate_replay <samples.jsonl> [--config <file>] [--log <file>] [--realtime] [--verbose]
 *
 * Exit codes: 0 live, 2 not live / cancelled, 1 setup error, 3 contract error.
 */

#include "AsyncQueue.hpp"
#include "LandmarkSource.hpp"
#include "LivenessGuidance.hpp"
#include "LivenessSession.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> cancel_requested{false};

void signal_handler(int /* signum */) {
    cancel_requested.store(true);
}

// Redirect stdout/stderr to a log file
bool setup_logging(const std::string& log_file) {
    try {
        std::filesystem::path log_path(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to create log directory: " << e.what() << std::endl;
        return false;
    }

    if (!freopen(log_file.c_str(), "a", stdout)) {
        perror("Failed to redirect stdout");
        return false;
    }
    if (!freopen(log_file.c_str(), "a", stderr)) {
        perror("Failed to redirect stderr");
        return false;
    }
    setvbuf(stdout, NULL, _IONBF, 0);
    setvbuf(stderr, NULL, _IONBF, 0);
    return true;
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <samples.jsonl> [--config <file>] [--log <file>] [--realtime] [--verbose]"
              << std::endl;
}

void print_events(livegate::LivenessSession& session) {
    for (const auto& event : session.drain_events()) {
        std::cout << "   " << livegate::describe(event) << std::endl;
    }
}

// Feeds samples in capture order, paced by their timestamps when realtime is set
void produce_samples(livegate::LandmarkSource* source,
                     livegate::AsyncQueue<livegate::LandmarkSample>* queue,
                     bool realtime) {
    livegate::LandmarkSample sample;
    bool have_previous = false;
    livegate::TimestampMs previous = 0;

    while (!cancel_requested.load() && source->next(sample)) {
        if (realtime && have_previous && sample.timestamp > previous) {
            std::this_thread::sleep_for(std::chrono::milliseconds(sample.timestamp - previous));
        }
        previous = sample.timestamp;
        have_previous = true;

        if (!queue->push(sample)) break;  // consumer finished early
    }
    queue->close();
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace livegate;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string samples_path;
    std::string config_path;
    std::string log_path;
    bool realtime = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            log_path = argv[++i];
        } else if (arg == "--realtime") {
            realtime = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (samples_path.empty() && arg[0] != '-') {
            samples_path = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }
    if (samples_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (!log_path.empty() && !setup_logging(log_path)) {
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // Config: command line, then LIVEGATE_CONFIG, then built-in defaults
    if (config_path.empty()) {
        const char* env_path = std::getenv("LIVEGATE_CONFIG");
        if (env_path) config_path = env_path;
    }
    LivenessConfig config;
    if (!config_path.empty() && !load_config_file(config_path, config)) {
        return 1;
    }
    if (verbose) config.verbose_logging = true;

    auto source = create_landmark_source(samples_path);
    if (!source) {
        return 1;
    }

    std::cout << "\n📋 Liveness check instructions:" << std::endl;
    for (const auto& line : guidance::get_instructions()) {
        std::cout << "   • " << line << std::endl;
    }

    std::unique_ptr<LivenessSession> session_ptr;
    try {
        session_ptr = std::make_unique<LivenessSession>(config);
    } catch (const std::exception& e) {
        std::cerr << "❌ Cannot create liveness session: " << e.what() << std::endl;
        return 1;
    }
    LivenessSession& session = *session_ptr;

    AsyncQueue<LandmarkSample> queue(32);
    std::thread producer(produce_samples, source.get(), &queue, realtime);

    int exit_code = 2;
    try {
        while (true) {
            if (cancel_requested.load()) {
                if (session.is_running()) session.cancel();
                break;
            }

            auto sample = queue.pop(100);
            if (!sample) {
                if (queue.is_drained()) break;
                continue;
            }

            // The first sample opens the window on the landmark clock
            if (session.state() == SessionState::IDLE) {
                session.start(sample->timestamp);
            }

            session.ingest(*sample);
            session.tick(sample->timestamp);
            print_events(session);

            if (session.is_finished()) break;
        }

        if (session.is_running()) {
            std::cout << "⚠ Landmark stream ended before the window elapsed" << std::endl;
            session.tick(session.started_at() + session.duration_ms());
        }
        print_events(session);

        if (session.has_verdict()) {
            LivenessResult result = session.finalize();
            std::cout << to_json(result).dump(2) << std::endl;
            exit_code = result.is_live ? 0 : 2;
        } else if (session.state() == SessionState::CANCELLED) {
            std::cout << "🛑 Liveness check cancelled" << std::endl;
        } else {
            std::cout << "⚠ No samples in " << samples_path << std::endl;
            exit_code = 1;
        }
    } catch (const LivenessContractError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        exit_code = 3;
    } catch (const std::exception& e) {
        std::cerr << "❌ Replay aborted: " << e.what() << std::endl;
        exit_code = 1;
    }

    queue.close();
    producer.join();
    return exit_code;
}
