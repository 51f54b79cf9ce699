/*
 * kanboard C++ - Application
 * 
 * Process singleton: parses the command line, loads the configuration,
 * wires store, locks, events, engine and tool surface together, then
 * serves JSON-RPC on stdin/stdout while a maintenance thread archives
 * stale tasks and rotates the archive.
 */
#ifndef kanboard_CORE_APPLICATION_HPP
#define kanboard_CORE_APPLICATION_HPP

#include <kanboard/core/config.hpp>
#include <kanboard/board/events.hpp>
#include <kanboard/board/router.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace kanboard {

class BoardStore;
class LockManager;
class BoardEngine;
class BoardTool;
class StdioServer;
class WebhookSink;

struct AppInfo {
    static constexpr const char* NAME = "kanboard";
    static constexpr const char* VERSION = "1.0.0";
    static constexpr const char* DEFAULT_CONFIG = "kanboard.json";
};

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();
    
    // False when the process should exit without serving (see exit_code())
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();
    
    void stop();
    bool is_running() const { return running_.load(); }
    int exit_code() const { return exit_code_; }
    
    // One maintenance pass: archive stale Done tasks, rotate the archive
    void run_maintenance();
    
    Config& config() { return config_; }
    BoardEngine* engine() { return engine_.get(); }

private:
    Application();
    ~Application();
    Application(const Application&);
    Application& operator=(const Application&);
    
    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_store();
    bool setup_engine();
    void setup_events();
    
    void maintenance_loop();
    
    std::atomic<bool> running_;
    int exit_code_;
    bool curl_ready_;
    
    std::string config_file_;
    bool config_explicit_;
    std::string db_override_;
    std::string log_level_override_;
    
    Config config_;
    InstanceRouter router_;
    std::unique_ptr<EventBroadcaster> events_;
    std::unique_ptr<BoardStore> store_;
    std::unique_ptr<LockManager> locks_;
    std::unique_ptr<BoardEngine> engine_;
    std::unique_ptr<BoardTool> tool_;
    std::unique_ptr<WebhookSink> webhook_;
    std::atomic<StdioServer*> server_;
    
    std::thread maintenance_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
};

} // namespace kanboard

#endif // kanboard_CORE_APPLICATION_HPP
