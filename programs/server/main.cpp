//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// main.cpp
//
// Server main entry point
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/server_config.hpp"
#include "backend/backend_connector.hpp"
#include "backend/credential_provider.hpp"
#include "executor/executor_pool.hpp"
#include "network/io_context_pool.hpp"
#include "network/tcp_server.hpp"
#include "pool/pool_manager.hpp"
#include "proxy/session_registry.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <fstream>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/resource.h>
#include <fcntl.h>
#include <pwd.h>
#include <grp.h>

#ifdef WITH_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

using namespace pgmux;

// Global state
static std::shared_ptr<TcpServer> g_server;
static std::string g_pid_file;
static ServerConfig g_config;

//===----------------------------------------------------------------------===//
// Version Info
//===----------------------------------------------------------------------===//
void PrintVersion() {
    std::cout << "PgMux Server " << PGMUX_VERSION << "\n"
              << "Git commit: " << PGMUX_GIT_COMMIT << "\n"
              << "Build type: " << PGMUX_BUILD_TYPE << "\n"
              << "Build time: " << PGMUX_BUILD_TIME << "\n";
}

//===----------------------------------------------------------------------===//
// Daemon Mode
//===----------------------------------------------------------------------===//
bool Daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "Failed to fork: " << strerror(errno) << std::endl;
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }

    if (setsid() < 0) {
        std::cerr << "Failed to create new session: " << strerror(errno) << std::endl;
        return false;
    }

    // Second fork so the daemon can never reacquire a terminal
    pid = fork();
    if (pid < 0) {
        std::cerr << "Failed to fork (second): " << strerror(errno) << std::endl;
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }

    umask(0);

    if (chdir("/") < 0) {
        std::cerr << "Failed to chdir to /: " << strerror(errno) << std::endl;
    }

    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        if (null_fd > STDERR_FILENO) {
            close(null_fd);
        }
    }

    return true;
}

//===----------------------------------------------------------------------===//
// PID File
//===----------------------------------------------------------------------===//
bool WritePidFile(const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Failed to open PID file: " << path << std::endl;
        return false;
    }
    file << getpid();
    file.close();
    return true;
}

void RemovePidFile(const std::string& path) {
    if (!path.empty()) {
        std::remove(path.c_str());
    }
}

//===----------------------------------------------------------------------===//
// Privilege Dropping
//===----------------------------------------------------------------------===//
bool DropPrivileges(const std::string& username) {
    if (username.empty()) return true;
    if (getuid() != 0) {
        LOG_WARN("main", "Not running as root, cannot drop privileges");
        return true;
    }

    struct passwd* pw = getpwnam(username.c_str());
    if (!pw) {
        std::cerr << "User not found: " << username << std::endl;
        return false;
    }

    if (initgroups(username.c_str(), pw->pw_gid) < 0) {
        std::cerr << "Failed to set supplementary groups: " << strerror(errno) << std::endl;
        return false;
    }

    if (setgid(pw->pw_gid) < 0) {
        std::cerr << "Failed to set GID: " << strerror(errno) << std::endl;
        return false;
    }

    if (setuid(pw->pw_uid) < 0) {
        std::cerr << "Failed to set UID: " << strerror(errno) << std::endl;
        return false;
    }

    LOG_INFO("main", "Dropped privileges to user: " + username);
    return true;
}

//===----------------------------------------------------------------------===//
// Resource Limits
//===----------------------------------------------------------------------===//
void SetResourceLimits(const ServerConfig& config) {
    // Every client and every backend connection holds a descriptor
    if (config.max_open_files > 0) {
        struct rlimit rlim;
        rlim.rlim_cur = config.max_open_files;
        rlim.rlim_max = config.max_open_files;
        if (setrlimit(RLIMIT_NOFILE, &rlim) < 0) {
            LOG_WARN("main", "Failed to set RLIMIT_NOFILE: " + std::string(strerror(errno)));
        } else {
            LOG_INFO("main", "Set max open files to " + std::to_string(config.max_open_files));
        }
    }
}

//===----------------------------------------------------------------------===//
// Config Reload
//===----------------------------------------------------------------------===//
void ReloadConfig() {
    if (g_config.config_file.empty()) {
        LOG_WARN("main", "No config file specified, cannot reload");
        return;
    }

    LOG_INFO("main", "Reloading configuration from: " + g_config.config_file);

    ServerConfig new_config;
    std::string error;
    if (!new_config.LoadFromFile(g_config.config_file, error)) {
        LOG_ERROR("main", "Failed to reload config: " + error);
        return;
    }

    // Only the log level changes at runtime
    if (new_config.log_level != g_config.log_level) {
        Logger::SetLevel(new_config.log_level);
        g_config.log_level = new_config.log_level;
        LOG_INFO("main", "Log level changed to: " + new_config.log_level);
    }

    LOG_INFO("main", "Configuration reloaded (pool and backend settings require restart)");
}

//===----------------------------------------------------------------------===//
// Systemd Integration
//===----------------------------------------------------------------------===//
void NotifySystemd(const char* state) {
#ifdef WITH_SYSTEMD
    sd_notify(0, state);
#else
    (void)state;
#endif
}

void LogPoolStats(const PoolManager& pool) {
    auto stats = pool.GetStats();
    LOG_INFO("main", "Pool: created=" + std::to_string(stats.total_created) +
             " destroyed=" + std::to_string(stats.total_destroyed) +
             " acquires=" + std::to_string(stats.acquire_count) +
             " timeouts=" + std::to_string(stats.acquire_timeout_count) +
             " handshake_failures=" + std::to_string(stats.handshake_failure_count) +
             " leaked=" + std::to_string(stats.leaked_lease_count));
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    try {
        bool show_version;
        g_config = ParseCommandLine(argc, argv, show_version);

        if (show_version) {
            PrintVersion();
            return 0;
        }

        std::string error;
        if (!g_config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        if (g_config.daemon) {
            if (!Daemonize()) {
                return 1;
            }
        }

        Logger::Initialize(g_config.log_file, g_config.log_level);

        if (!g_config.pid_file.empty()) {
            g_pid_file = g_config.pid_file;
            if (!WritePidFile(g_pid_file)) {
                return 1;
            }
        }

        // Resource limits before dropping privileges
        SetResourceLimits(g_config);

        if (!DropPrivileges(g_config.user)) {
            return 1;
        }

        // Block SIGINT/SIGTERM/SIGHUP so they are handled synchronously via
        // sigwait() in the main loop. Threads created after this inherit the
        // mask.
        sigset_t shutdown_mask;
        sigemptyset(&shutdown_mask);
        sigaddset(&shutdown_mask, SIGINT);
        sigaddset(&shutdown_mask, SIGTERM);
        sigaddset(&shutdown_mask, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &shutdown_mask, nullptr);

        std::signal(SIGPIPE, SIG_IGN);

        PoolConfig pool_config = g_config.ToPoolConfig();

        LOG_INFO("main", "Starting PgMux Server " + std::string(PGMUX_VERSION));
        LOG_INFO("main", "Configuration:");
        LOG_INFO("main", "  Listen: " + g_config.host + ":" + std::to_string(g_config.port));
        LOG_INFO("main", "  Backend: " + g_config.backend_host + ":" + std::to_string(g_config.backend_port));
        LOG_INFO("main", "  IO Threads: " + std::to_string(g_config.GetIoThreadCount()));
        LOG_INFO("main", "  Executor Threads: " + std::to_string(g_config.GetExecutorThreadCount()));
        LOG_INFO("main", "  Max Client Connections: " + std::to_string(g_config.max_client_connections));
        LOG_INFO("main", "  Connection Pool: min=" + std::to_string(pool_config.min_size) +
                 ", max=" + std::to_string(pool_config.max_size) +
                 ", transaction policy=" + TransactionPolicyToString(pool_config.transaction_policy));

        auto executor_pool = std::make_shared<ExecutorPool>(g_config.GetExecutorThreadCount());
        executor_pool->Start();

        auto io_pool = std::make_shared<IoContextPool>(g_config.GetIoThreadCount());
        io_pool->Start();

        auto credentials = std::make_shared<StaticCredentialProvider>(g_config.backend_password,
                                                                      g_config.credentials);
        auto connector = std::make_shared<TcpBackendConnector>(*io_pool, g_config.ToBackendEndpoint(),
                                                               credentials);

        auto pool = PoolManager::Create(pool_config, connector, executor_pool);
        if (!g_config.prewarm_user.empty()) {
            ConnectionKey key(g_config.prewarm_user, g_config.prewarm_database);
            LOG_INFO("main", "Prewarming " + std::to_string(pool_config.min_size) +
                     " connections for " + key.ToString());
            pool->Prewarm(key);
        }

        auto registry = std::make_shared<SessionRegistry>(g_config.max_client_connections);

        g_server = std::make_shared<TcpServer>(g_config, io_pool, pool, registry);
        g_server->Start();

        LOG_INFO("main", "PgMux Server is ready to accept connections");

        NotifySystemd("READY=1");

        // Main loop: wait for signals synchronously
        {
            int sig;
            while (sigwait(&shutdown_mask, &sig) == 0) {
                if (sig == SIGHUP) {
                    LOG_INFO("main", "Reload signal received");
                    ReloadConfig();
                    LogPoolStats(*pool);
                } else {
                    LOG_INFO("main", "Shutdown signal received");
                    break;
                }
            }
        }

        NotifySystemd("STOPPING=1");

        LOG_INFO("main", "Shutting down...");

        // Stop accepting and close client sessions; their leases come back
        // to the pool, which waits up to the grace period for stragglers
        g_server->Stop();
        pool->Shutdown(pool_config.shutdown_grace);
        LogPoolStats(*pool);

        executor_pool->Stop();
        io_pool->Stop();
        g_server.reset();

        RemovePidFile(g_pid_file);

        LOG_INFO("main", "PgMux Server stopped");

        Logger::Shutdown();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        RemovePidFile(g_pid_file);
        return 1;
    }
}
