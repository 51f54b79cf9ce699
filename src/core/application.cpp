/*
 * kanboard C++ - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <kanboard/core/application.hpp>
#include <kanboard/core/board_tool.hpp>
#include <kanboard/core/stdio_server.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>
#include <kanboard/board/engine.hpp>
#include <kanboard/board/lock_manager.hpp>
#include <kanboard/board/webhook.hpp>
#include <kanboard/store/sqlite_store.hpp>
#include <kanboard/store/memory_store.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <unistd.h>
#include <curl/curl.h>

namespace kanboard {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Kanban boards for humans and AI agents\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Serves JSON-RPC 2.0 (MCP) on stdin/stdout, one request per line.\n\n"
              << "Options:\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version\n"
              << "  --config <file>        Configuration file (default: " << AppInfo::DEFAULT_CONFIG << ")\n"
              << "  --db <path>            SQLite database path (overrides store.path)\n"
              << "  --log-level <level>    debug, info, warn or error\n\n"
              << "Example:\n"
              << "  " << prog << " --config kanboard.json --db ~/.kanboard/boards.db\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }

    // No SA_RESTART: a blocked read on stdin returns so the server loop ends
    void install_signal(int sig) {
        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = signal_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(sig, &sa, nullptr);
    }

    std::string default_db_path() {
        const char* home = getenv("HOME");
        if (home && home[0] != '\0') {
            return std::string(home) + "/.kanboard/boards.db";
        }
        return ".kanboard/boards.db";
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(false)
    , exit_code_(0)
    , curl_ready_(false)
    , config_file_(AppInfo::DEFAULT_CONFIG)
    , config_explicit_(false)
    , server_(nullptr)
{}

Application::~Application() {}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_override_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level_override_ = std::string(argv[++i]);
            continue;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n\n";
        print_usage(argv[0]);
        exit_code_ = 2;
        return false;
    }
    return true;
}

bool Application::load_config() {
    if (access(config_file_.c_str(), R_OK) != 0) {
        if (config_explicit_) {
            LOG_ERROR("Config file %s is not readable", config_file_.c_str());
            return false;
        }
        LOG_INFO("No %s found, using defaults", config_file_.c_str());
        return true;
    }

    if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config from %s: %s",
                  config_file_.c_str(), config_.last_error().c_str());
        return false;
    }
    LOG_INFO("Loaded config from %s", config_file_.c_str());
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_color(isatty(STDERR_FILENO) != 0);

    std::string log_level = log_level_override_.empty()
        ? config_.get_string("log_level", "info")
        : log_level_override_;
    Logger::instance().set_level(parse_log_level(log_level));
}

bool Application::setup_store() {
    std::string backend = to_lower(config_.get_string("store.backend", "sqlite"));

    if (backend == "memory") {
        store_.reset(new InMemoryBoardStore());
        LOG_WARN("[App] Using the in-memory store; boards are lost on exit");
        return true;
    }
    if (backend != "sqlite") {
        LOG_ERROR("[App] Unknown store.backend '%s' (expected sqlite or memory)", backend.c_str());
        return false;
    }

    std::string path = db_override_.empty()
        ? config_.get_string("store.path", default_db_path())
        : db_override_;

    SqliteBoardStore* sqlite = new SqliteBoardStore();
    store_.reset(sqlite);
    if (!sqlite->open(path)) {
        LOG_ERROR("[App] Could not open board database %s", path.c_str());
        return false;
    }
    LOG_INFO("[App] Board database: %s", path.c_str());
    return true;
}

bool Application::setup_engine() {
    router_.configure(config_);

    int64_t lease_ms = config_.get_int("lock.lease_ms", 30000);
    locks_.reset(new LockManager(store_.get(), lease_ms));

    EngineOptions options = EngineOptions::from_config(config_);
    engine_.reset(new BoardEngine(store_.get(), locks_.get(), events_.get(), &router_, options));

    tool_.reset(new BoardTool(engine_.get()));
    if (!tool_->init(config_)) {
        LOG_ERROR("[App] Board tool failed to initialize");
        return false;
    }

    LOG_INFO("[App] Default board '%s', WIP policy %s, lock timeout %lldms",
             router_.default_board().c_str(), wip_policy_name(options.wip_policy),
             (long long)options.lock_timeout_ms);
    return true;
}

void Application::setup_events() {
    std::string url = config_.get_string("events.webhook_url", "");
    if (!url.empty()) {
        int timeout_s = static_cast<int>(config_.get_int("events.webhook_timeout_s", 5));
        webhook_.reset(new WebhookSink(url, timeout_s));
        webhook_->attach(events_.get());
    }
    events_->start();
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before threads start)
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ready_ = true;

    // Parse command line
    if (!parse_args(argc, argv)) {
        return false;
    }

    // Provisional level so config errors are visible
    if (!log_level_override_.empty()) {
        Logger::instance().set_level(parse_log_level(log_level_override_));
    }

    // Setup signal handlers
    install_signal(SIGINT);
    install_signal(SIGTERM);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!load_config()) {
        exit_code_ = 1;
        return false;
    }
    setup_logging();

    size_t queue_size = static_cast<size_t>(config_.get_int("events.queue_size", 1024));
    events_.reset(new EventBroadcaster(queue_size));

    if (!setup_store() || !setup_engine()) {
        exit_code_ = 1;
        return false;
    }
    setup_events();

    running_.store(true);
    return true;
}

void Application::run_maintenance() {
    if (!engine_) return;

    int stale_days = engine_->options().stale_days;
    if (stale_days > 0) {
        Result<int> archived = engine_->archive_stale(stale_days);
        if (!archived.success) {
            LOG_WARN("[Maintenance] archive_stale failed: %s", archived.error.c_str());
        } else if (archived.value > 0) {
            LOG_INFO("[Maintenance] Archived %d stale tasks", archived.value);
        }
    }

    Result<int64_t> rotated = engine_->rotate_archive();
    if (!rotated.success) {
        LOG_WARN("[Maintenance] rotate_archive failed: %s", rotated.error.c_str());
    } else if (rotated.value > 0) {
        LOG_INFO("[Maintenance] Removed %lld expired archive entries", (long long)rotated.value);
    }
}

void Application::maintenance_loop() {
    int64_t interval_ms = config_.get_int("maintenance.interval_s", 3600) * 1000;
    if (interval_ms <= 0) {
        LOG_INFO("[Maintenance] Disabled (maintenance.interval_s <= 0)");
        return;
    }

    LOG_DEBUG("[Maintenance] Running every %llds", (long long)(interval_ms / 1000));
    run_maintenance();

    int64_t next_run = current_timestamp_ms() + interval_ms;
    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (running_.load()) {
        // Short waits: stop() may be called from a signal handler
        maintenance_cv_.wait_for(lock, std::chrono::seconds(1));
        if (!running_.load()) break;
        if (current_timestamp_ms() < next_run) continue;

        lock.unlock();
        run_maintenance();
        lock.lock();
        next_run = current_timestamp_ms() + interval_ms;
    }
}

int Application::run() {
    maintenance_ = std::thread(&Application::maintenance_loop, this);

    StdioServer server(*tool_, events_.get(), std::cin, std::cout);
    server_.store(&server);

    if (running_.load()) {
        server.run();
    }

    server_.store(nullptr);
    running_.store(false);
    maintenance_cv_.notify_all();
    if (maintenance_.joinable()) {
        maintenance_.join();
    }

    // Deliver pending notifications while the server is still alive
    if (!events_->flush(2000)) {
        LOG_WARN("[App] Event queue did not drain before exit");
    }

    return 0;
}

void Application::stop() {
    running_.store(false);
    StdioServer* server = server_.load();
    if (server) {
        server->stop();
    }
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    if (events_) {
        events_->stop();
        LOG_DEBUG("[App] Event broadcaster stopped (%llu published, %llu dropped)",
                  (unsigned long long)events_->published(),
                  (unsigned long long)events_->dropped());
    }
    if (webhook_) {
        webhook_->detach();
    }
    if (tool_) {
        tool_->shutdown();
    }

    tool_.reset();
    engine_.reset();
    locks_.reset();
    store_.reset();
    webhook_.reset();
    events_.reset();

    // Cleanup libcurl
    if (curl_ready_) {
        curl_global_cleanup();
        curl_ready_ = false;
    }

    LOG_INFO("Goodbye!");
}

} // namespace kanboard
