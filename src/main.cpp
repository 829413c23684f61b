#include "resq/command_handler.hpp"
#include "resq/config.hpp"
#include "resq/errors.hpp"
#include "resq/heartbeat_monitor.hpp"
#include "resq/job_store.hpp"
#include "resq/worker.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [options]\n"
              << "Commands:\n"
              << "  init-schema                       Create schema, table and indexes\n"
              << "  create --batch-spec-id N [--allow-unsupported] [--allow-ignored]\n"
              << "  get (--id N | --batch-spec-id N)\n"
              << "  list [--state STATE] [--worker HOST] [--limit N]\n"
              << "  stats                             Job counts per state\n"
              << "  reset --id N                      Reset a processing job\n"
              << "  reclaim                           Run one stale-lease sweep\n"
              << "  monitor                           Reclaim stale leases until interrupted\n"
              << "  worker --exec CMD [--permanent-exit-code N] [--with-monitor]\n"
              << "Options:\n"
              << "  --debug                           Enable debug logging\n"
              << "  --help                            Show this help message\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST, PG_PORT, PG_DB, PG_USER, PG_PASSWORD, PG_SCHEMA\n"
              << "  DB_POOL_SIZE                      Database pool size (default: 10)\n"
              << "  RESQ_MAX_RESETS                   Reclaims before a job errors (default: 3)\n"
              << "  RESQ_MAX_FAILURES                 Failures before a job errors (default: 3)\n"
              << "  RESQ_HEARTBEAT_TIMEOUT_MS         Lease length (default: 60000)\n"
              << "  RESQ_BACKOFF_FUNCTION             constant, linear or exponential\n"
              << "  RESQ_WORKER_HOSTNAME              Worker identity (default: host name)\n"
              << "  LOG_LEVEL, LOG_FORMAT             Logging (info, text|json)\n"
              << std::endl;
}

void setup_logging(const resq::LoggingConfig& logging, bool debug) {
    auto level = spdlog::level::from_str(logging.log_level);
    spdlog::set_level(debug ? spdlog::level::debug : level);

    if (logging.log_format == "json") {
        spdlog::set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})");
    } else {
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    }
}

struct Arguments {
    std::string command;
    std::optional<int64_t> id;
    std::optional<int64_t> batch_spec_id;
    bool allow_unsupported = false;
    bool allow_ignored = false;
    std::optional<resq::JobState> state;
    std::optional<std::string> worker;
    std::optional<int> limit;
    std::string exec;
    int permanent_exit_code = 0;
    bool with_monitor = false;
    bool debug = false;
    bool help = false;
};

int64_t parse_int64(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--debug") {
            args.debug = true;
        } else if (arg == "--id") {
            args.id = parse_int64(arg, next());
        } else if (arg == "--batch-spec-id") {
            args.batch_spec_id = parse_int64(arg, next());
        } else if (arg == "--allow-unsupported") {
            args.allow_unsupported = true;
        } else if (arg == "--allow-ignored") {
            args.allow_ignored = true;
        } else if (arg == "--state") {
            std::string value = next();
            args.state = resq::parse_job_state(value);
            if (!args.state) throw std::invalid_argument("Unknown state '" + value + "'");
        } else if (arg == "--worker") {
            args.worker = next();
        } else if (arg == "--limit") {
            args.limit = static_cast<int>(parse_int64(arg, next()));
        } else if (arg == "--exec") {
            args.exec = next();
        } else if (arg == "--permanent-exit-code") {
            args.permanent_exit_code = static_cast<int>(parse_int64(arg, next()));
        } else if (arg == "--with-monitor") {
            args.with_monitor = true;
        } else if (args.command.empty() && arg.rfind("--", 0) != 0) {
            args.command = arg;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return args;
}

// Returns when a signal arrives or keep_running() turns false
void wait_for_shutdown(const std::function<bool()>& keep_running = nullptr) {
    while (!g_shutdown) {
        if (keep_running && !keep_running()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Received shutdown signal, stopping...");
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

int run(const Arguments& args, const resq::Config& config) {
    auto db_pool = std::make_shared<resq::DatabasePool>(
        config.database.connection_string(),
        config.database.pool_size,
        config.database.pool_acquisition_timeout,
        config.database.statement_timeout,
        config.database.lock_timeout,
        config.database.idle_in_transaction_timeout
    );
    auto store = std::make_shared<resq::JobStore>(db_pool, config.queue, config.database.schema);
    if (!store->health_check()) {
        spdlog::error("Database health check failed");
        return 1;
    }

    if (args.command == "init-schema") {
        if (!store->initialize_schema()) {
            spdlog::error("Failed to initialize schema");
            return 1;
        }
        spdlog::info("Schema {} ready", store->table_name());
        return 0;
    }

    if (args.command == "create") {
        if (!args.batch_spec_id) throw std::invalid_argument("create requires --batch-spec-id");
        resq::JobDescriptor descriptor;
        descriptor.batch_spec_id = *args.batch_spec_id;
        descriptor.allow_unsupported = args.allow_unsupported;
        descriptor.allow_ignored = args.allow_ignored;
        auto jobs = store->create(std::vector<resq::JobDescriptor>{descriptor});
        print_json(jobs.front().to_json());
        return 0;
    }

    if (args.command == "get") {
        resq::GetJobOptions options;
        options.id = args.id;
        options.batch_spec_id = args.batch_spec_id;
        auto job = store->get_by_filter(options);
        if (!job) {
            std::cerr << "Job not found" << std::endl;
            return 2;
        }
        print_json(job->to_json());
        return 0;
    }

    if (args.command == "list") {
        resq::ListJobsOptions options;
        options.state = args.state;
        options.worker_hostname = args.worker;
        options.limit = args.limit;
        nlohmann::json jobs = nlohmann::json::array();
        for (const auto& job : store->list_by_filter(options)) {
            jobs.push_back(job.to_json());
        }
        print_json(jobs);
        return 0;
    }

    if (args.command == "stats") {
        nlohmann::json stats = nlohmann::json::object();
        for (const auto& entry : store->count_by_state()) {
            stats[resq::to_string(entry.first)] = entry.second;
        }
        print_json(stats);
        return 0;
    }

    if (args.command == "reset") {
        if (!args.id) throw std::invalid_argument("reset requires --id");
        if (!store->reset(*args.id)) {
            std::cerr << "Job " << *args.id << " is not processing" << std::endl;
            return 2;
        }
        print_json(store->get_by_id(*args.id).value().to_json());
        return 0;
    }

    if (args.command == "reclaim") {
        auto result = store->reclaim_stale(std::chrono::milliseconds(config.queue.heartbeat_timeout_ms));
        print_json({{"requeued", result.requeued}, {"errored", result.errored}});
        return 0;
    }

    if (args.command == "monitor") {
        resq::HeartbeatMonitor monitor(store, config.monitor,
                                       std::chrono::milliseconds(config.queue.heartbeat_timeout_ms));
        monitor.start();
        wait_for_shutdown();
        monitor.stop();
        return 0;
    }

    if (args.command == "worker") {
        if (args.exec.empty()) throw std::invalid_argument("worker requires --exec");

        auto handler = std::make_shared<resq::CommandHandler>(args.exec, args.permanent_exit_code);
        resq::Worker worker(store, handler, config.worker,
                            std::chrono::milliseconds(config.queue.claim_timeout_ms));

        std::unique_ptr<resq::HeartbeatMonitor> monitor;
        if (args.with_monitor) {
            monitor = std::make_unique<resq::HeartbeatMonitor>(
                store, config.monitor, std::chrono::milliseconds(config.queue.heartbeat_timeout_ms));
            monitor->start();
        }

        worker.start();
        wait_for_shutdown([&worker] { return worker.is_running(); });
        worker.stop();
        if (monitor) monitor->stop();
        worker.rethrow_fatal_error();
        return 0;
    }

    throw std::invalid_argument("Unknown command: " + args.command);
}

} // namespace

int main(int argc, char* argv[]) {
    resq::Config config = resq::Config::load();

    Arguments args;
    try {
        args = parse_arguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || args.command.empty()) {
        print_usage(argv[0]);
        return args.help ? 0 : 1;
    }

    setup_logging(config.logging, args.debug);

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            spdlog::error("Invalid configuration: {}", problem);
        }
        return 1;
    }

    // Set up signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        return run(args, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const resq::StoreError& e) {
        spdlog::error("Database error{}: {}",
                      e.sqlstate().empty() ? "" : " (" + e.sqlstate() + ")", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
