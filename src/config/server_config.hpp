//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// config/server_config.hpp
//
// Server configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include "backend/backend_connector.hpp"
#include "pool/pool_config.hpp"
#include <map>
#include <string>
#include <thread>
#include <iostream>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace pgmux {

struct ServerConfig {
    // Listener
    std::string host = "0.0.0.0";
    uint16_t port = 6432;

    // Backend
    std::string backend_host = "127.0.0.1";
    uint16_t backend_port = 5432;
    uint32_t backend_connect_timeout_ms = 5000;
    std::string backend_password;                    // used when a user has no entry below
    std::map<std::string, std::string> credentials;  // user -> password

    // Logging
    std::string log_file;
    std::string log_level = "info";

    // Process
    std::string pid_file;
    std::string config_file;
    std::string user;  // User to run as (privilege dropping)
    bool daemon = false;

    // Threading
    uint32_t io_threads = 0;  // 0 = auto
    uint32_t executor_threads = 0;  // 0 = auto

    // Limits
    uint32_t max_client_connections = DEFAULT_MAX_CLIENT_CONNECTIONS;
    uint64_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
    uint32_t max_open_files = 0;  // 0 = system default

    // Pool
    uint32_t pool_min_size = 0;
    uint32_t pool_max_size = 20;
    uint32_t pool_acquire_timeout_ms = 5000;
    uint32_t pool_idle_timeout_seconds = 300;
    uint32_t pool_max_lifetime_seconds = 3600;
    uint32_t pool_health_check_interval_ms = 30000;
    uint32_t pool_probe_timeout_ms = 2000;
    uint32_t pool_shutdown_grace_ms = 10000;
    std::string pool_transaction_policy = "rollback";
    std::string pool_reset_query;
    std::string prewarm_user;
    std::string prewarm_database;

    uint32_t GetIoThreadCount() const {
        if (io_threads == 0) {
            return std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        return io_threads;
    }

    uint32_t GetExecutorThreadCount() const {
        if (executor_threads == 0) {
            // Handshakes and cleanup block on the backend
            return std::max(4u, std::thread::hardware_concurrency());
        }
        return executor_threads;
    }

    PoolConfig ToPoolConfig() const {
        PoolConfig pool;
        pool.min_size = pool_min_size;
        pool.max_size = pool_max_size;
        pool.acquire_timeout = std::chrono::milliseconds(pool_acquire_timeout_ms);
        pool.idle_timeout = std::chrono::seconds(pool_idle_timeout_seconds);
        pool.max_connection_lifetime = std::chrono::seconds(pool_max_lifetime_seconds);
        pool.health_check_interval = std::chrono::milliseconds(pool_health_check_interval_ms);
        pool.probe_timeout = std::chrono::milliseconds(pool_probe_timeout_ms);
        pool.shutdown_grace = std::chrono::milliseconds(pool_shutdown_grace_ms);
        ParseTransactionPolicy(pool_transaction_policy, pool.transaction_policy);
        pool.reset_query = pool_reset_query;
        return pool;
    }

    BackendEndpoint ToBackendEndpoint() const {
        BackendEndpoint endpoint;
        endpoint.host = backend_host;
        endpoint.port = backend_port;
        endpoint.connect_timeout = std::chrono::milliseconds(backend_connect_timeout_ms);
        endpoint.max_frame_size = static_cast<size_t>(max_frame_size);
        return endpoint;
    }

    bool Validate(std::string& error) const {
        if (port == 0) {
            error = "Invalid port number";
            return false;
        }
        if (backend_port == 0) {
            error = "Invalid backend port number";
            return false;
        }
        if (backend_host.empty()) {
            error = "Backend host must be set";
            return false;
        }
        if (max_client_connections == 0) {
            error = "Max client connections must be greater than 0";
            return false;
        }
        if (max_frame_size < 1024) {
            error = "Max frame size must be at least 1024 bytes";
            return false;
        }
        TransactionPolicy policy;
        if (!ParseTransactionPolicy(pool_transaction_policy, policy)) {
            error = "Unknown transaction policy: " + pool_transaction_policy +
                    " (expected rollback or discard)";
            return false;
        }
        if (prewarm_user.empty() != prewarm_database.empty()) {
            error = "prewarm requires both user and database";
            return false;
        }
        return ToPoolConfig().Validate(error);
    }

    // Load from config file (auto-detects format by extension)
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }

        if (ext == ".yaml" || ext == ".yml") {
            return LoadFromYaml(path, error);
        } else {
            return LoadFromIni(path, error);
        }
    }

    // INI: same dotted keys as YAML, written as [section] headers
    bool LoadFromIni(const std::string& path, std::string& error) {
        ConfigFile cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }
        ApplySettings(cfg);
        for (const auto& kv : cfg.GetSection("credentials")) {
            credentials[kv.first] = kv.second;
        }
        return true;
    }

    bool LoadFromYaml(const std::string& path, std::string& error) {
        YamlConfig cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }
        ApplySettings(cfg);
        for (const auto& kv : cfg.GetStringMap("credentials")) {
            credentials[kv.first] = kv.second;
        }
        return true;
    }

private:
    template<typename Source>
    void ApplySettings(const Source& cfg) {
        // Server section
        if (cfg.Has("server.host")) host = cfg.GetString("server.host");
        if (cfg.Has("server.port")) port = static_cast<uint16_t>(cfg.GetInt("server.port"));
        if (cfg.Has("server.max_client_connections")) max_client_connections = static_cast<uint32_t>(cfg.GetInt("server.max_client_connections"));
        if (cfg.Has("server.max_frame_size")) max_frame_size = static_cast<uint64_t>(cfg.GetInt64("server.max_frame_size"));

        // Backend section
        if (cfg.Has("backend.host")) backend_host = cfg.GetString("backend.host");
        if (cfg.Has("backend.port")) backend_port = static_cast<uint16_t>(cfg.GetInt("backend.port"));
        if (cfg.Has("backend.connect_timeout_ms")) backend_connect_timeout_ms = static_cast<uint32_t>(cfg.GetInt("backend.connect_timeout_ms"));
        if (cfg.Has("backend.password")) backend_password = cfg.GetString("backend.password");

        // Logging section
        if (cfg.Has("logging.file")) log_file = cfg.GetString("logging.file");
        if (cfg.Has("logging.level")) log_level = cfg.GetString("logging.level");

        // Process section
        if (cfg.Has("process.daemon")) daemon = cfg.GetBool("process.daemon");
        if (cfg.Has("process.pid_file")) pid_file = cfg.GetString("process.pid_file");
        if (cfg.Has("process.user")) user = cfg.GetString("process.user");
        if (cfg.Has("process.max_open_files")) max_open_files = static_cast<uint32_t>(cfg.GetInt("process.max_open_files"));

        // Threads section
        if (cfg.Has("threads.io")) io_threads = static_cast<uint32_t>(cfg.GetInt("threads.io"));
        if (cfg.Has("threads.executor")) executor_threads = static_cast<uint32_t>(cfg.GetInt("threads.executor"));

        // Pool section
        if (cfg.Has("pool.min_size")) pool_min_size = static_cast<uint32_t>(cfg.GetInt("pool.min_size"));
        if (cfg.Has("pool.max_size")) pool_max_size = static_cast<uint32_t>(cfg.GetInt("pool.max_size"));
        if (cfg.Has("pool.acquire_timeout_ms")) pool_acquire_timeout_ms = static_cast<uint32_t>(cfg.GetInt("pool.acquire_timeout_ms"));
        if (cfg.Has("pool.idle_timeout_seconds")) pool_idle_timeout_seconds = static_cast<uint32_t>(cfg.GetInt("pool.idle_timeout_seconds"));
        if (cfg.Has("pool.max_lifetime_seconds")) pool_max_lifetime_seconds = static_cast<uint32_t>(cfg.GetInt("pool.max_lifetime_seconds"));
        if (cfg.Has("pool.health_check_interval_ms")) pool_health_check_interval_ms = static_cast<uint32_t>(cfg.GetInt("pool.health_check_interval_ms"));
        if (cfg.Has("pool.probe_timeout_ms")) pool_probe_timeout_ms = static_cast<uint32_t>(cfg.GetInt("pool.probe_timeout_ms"));
        if (cfg.Has("pool.shutdown_grace_ms")) pool_shutdown_grace_ms = static_cast<uint32_t>(cfg.GetInt("pool.shutdown_grace_ms"));
        if (cfg.Has("pool.transaction_policy")) pool_transaction_policy = cfg.GetString("pool.transaction_policy");
        if (cfg.Has("pool.reset_query")) pool_reset_query = cfg.GetString("pool.reset_query");
        if (cfg.Has("pool.prewarm_user")) prewarm_user = cfg.GetString("pool.prewarm_user");
        if (cfg.Has("pool.prewarm_database")) prewarm_database = cfg.GetString("pool.prewarm_database");
    }
};

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>          Config file path (.yaml, .yml or INI)\n"
              << "  -h, --host <host>            Host to bind (default: 0.0.0.0)\n"
              << "  -p, --port <port>            Port to bind (default: 6432)\n"
              << "  --backend-host <host>        PostgreSQL server host (default: 127.0.0.1)\n"
              << "  --backend-port <port>        PostgreSQL server port (default: 5432)\n"
              << "  --backend-password <pw>      Password for backend authentication\n"
              << "  --daemon                     Run as daemon (background)\n"
              << "  --pid-file <path>            PID file path\n"
              << "  --user <name>                User to run as (drops privileges)\n"
              << "  --log-file <path>            Log file path\n"
              << "  --log-level <level>          Log level (trace, debug, info, warn, error)\n"
              << "  --io-threads <n>             IO thread count (default: auto)\n"
              << "  --executor-threads <n>       Executor thread count (default: auto)\n"
              << "  --max-client-connections <n> Max client connections (default: 10000)\n"
              << "  --max-frame-size <bytes>     Largest accepted protocol message\n"
              << "  --max-open-files <n>         Max open file descriptors\n"
              << "  --pool-min <n>               Connections kept per prewarmed key (default: 0)\n"
              << "  --pool-max <n>               Backend connection budget (default: 20)\n"
              << "  --acquire-timeout <ms>       Wait for a backend connection (default: 5000)\n"
              << "  --idle-timeout <s>           Close idle connections after (default: 300)\n"
              << "  --max-lifetime <s>           Close connections older than (default: 3600)\n"
              << "  --transaction-policy <p>     rollback or discard (default: rollback)\n"
              << "  --reset-query <sql>          Run before a connection is reused\n"
              << "  --version                    Show version info\n"
              << "  --help                       Show this help\n";
}

inline ServerConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    ServerConfig config;
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
        config.config_file = config_file_path;
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;  // Already processed
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--backend-host" && i + 1 < argc) {
            config.backend_host = argv[++i];
        } else if (arg == "--backend-port" && i + 1 < argc) {
            config.backend_port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--backend-password" && i + 1 < argc) {
            config.backend_password = argv[++i];
        } else if (arg == "--daemon") {
            config.daemon = true;
        } else if (arg == "--pid-file" && i + 1 < argc) {
            config.pid_file = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            config.user = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--io-threads" && i + 1 < argc) {
            config.io_threads = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--executor-threads" && i + 1 < argc) {
            config.executor_threads = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-client-connections" && i + 1 < argc) {
            config.max_client_connections = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-frame-size" && i + 1 < argc) {
            config.max_frame_size = static_cast<uint64_t>(std::stoll(argv[++i]));
        } else if (arg == "--max-open-files" && i + 1 < argc) {
            config.max_open_files = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--pool-min" && i + 1 < argc) {
            config.pool_min_size = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--pool-max" && i + 1 < argc) {
            config.pool_max_size = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--acquire-timeout" && i + 1 < argc) {
            config.pool_acquire_timeout_ms = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--idle-timeout" && i + 1 < argc) {
            config.pool_idle_timeout_seconds = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-lifetime" && i + 1 < argc) {
            config.pool_max_lifetime_seconds = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--transaction-policy" && i + 1 < argc) {
            config.pool_transaction_policy = argv[++i];
        } else if (arg == "--reset-query" && i + 1 < argc) {
            config.pool_reset_query = argv[++i];
        }
    }

    return config;
}

} // namespace pgmux
