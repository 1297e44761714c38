#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> passphrase;
    int timeout = 30;
};

// Process-wide libssh2 setup. Safe to call from any thread, any number of times.
Result<void> init_ssh_library();

// SessionManager: one authenticated SSH transport to one host.
// Commands run on short-lived exec channels; the session itself stays open
// until close(). Every libssh2 call takes a brief hold of io_mutex_ so
// concurrent run() calls can interleave on the same session.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Connect, handshake and authenticate. `cancel` aborts between steps.
    SSHResult establish(StatusCallback callback = nullptr,
                        const std::atomic<bool>* cancel = nullptr);

    // Run one command on a fresh exec channel. exit_code -1 = transport error.
    SSHResult exec(const std::string& command, int timeout_secs = 0);

    void close();
    bool is_active() const;
    bool check_alive();

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    std::atomic<bool> active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult ssh_userauth(StatusCallback callback);
    SSHResult fail_and_reset(const std::string& reason, const std::string& error);
    LIBSSH2_CHANNEL* open_exec_channel(int timeout_secs);
};
