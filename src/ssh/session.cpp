#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <filesystem>
#include <chrono>
#include <cstring>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = data->password.length();
    }
    data->prompt_round++;
}

static std::string last_ssh_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    libssh2_session_last_error(session, &msg, nullptr, 0);
    return msg ? msg : "no error information available";
}

Result<void> init_ssh_library() {
    // libssh2_init is not thread-safe; the static is initialized by exactly one thread.
    // Never paired with libssh2_exit; sessions can be freed during static destruction.
    static const int rc = libssh2_init(0);
    if (rc != 0) {
        return Result<void>::Err(fmt::format("Failed to initialize libssh2 (rc={})", rc));
    }
    return Result<void>::Ok();
}

static bool is_canceled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(SHELLPOOL_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::fail_and_reset(const std::string& reason, const std::string& error) {
    if (session_) {
        libssh2_session_disconnect(session_, reason.c_str());
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = SHELLPOOL_INVALID_SOCKET;
    }
    return SSHResult{-1, "", error};
}

SSHResult SessionManager::establish(StatusCallback callback, const std::atomic<bool>* cancel) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));
    }

    auto ready = init_ssh_library();
    if (ready.is_err()) {
        return SSHResult{-1, "", ready.error};
    }

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return SSHResult{-1, "", sock.error};
    }
    sock_ = sock.value;

    if (is_canceled(cancel)) {
        return fail_and_reset("Canceled", "Canceled after TCP connect");
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail_and_reset("", "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() > deadline || is_canceled(cancel)) break;
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }

    if (ret != 0) {
        std::string err = ret == LIBSSH2_ERROR_EAGAIN
            ? "SSH handshake timed out"
            : "SSH handshake failed: " + last_ssh_error(session_);
        return fail_and_reset("Handshake failed", err);
    }

    platform::enable_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        return fail_and_reset("Authentication failed", auth_result.stderr_data);
    }

    if (is_canceled(cancel)) {
        return fail_and_reset("Canceled", "Canceled after authentication");
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;

    if (callback) {
        callback("Connected to " + target_.host);
    }
    shellpool_log(fmt::format("[ssh] session established: {}:{}", target_str_, target_.port));

    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              target_.user.length())) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    // Key file takes precedence over password
    if (target_.ssh_key_path.has_value()) {
        const std::string& key = *target_.ssh_key_path;
        std::string pub = key + ".pub";
        const char* pub_path = std::filesystem::exists(pub) ? pub.c_str() : nullptr;
        const char* passphrase = target_.passphrase ? target_.passphrase->c_str() : nullptr;

        if (callback) callback("Using public key auth (" + key + ")...");

        while ((ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                pub_path, key.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_POLL_INTERVAL_MS);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        return SSHResult{-1, "", fmt::format("Public key authentication failed for {} with {}: {}",
                                             target_.user, key, last_ssh_error(session_))};
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = target_.password;
        kbd_data.prompt_round = 0;

        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_POLL_INTERVAL_MS);
        }

        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }

        if (callback) callback("Keyboard-interactive failed, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_POLL_INTERVAL_MS);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check username/password)"};
}

LIBSSH2_CHANNEL* SessionManager::open_exec_channel(int timeout_secs) {
    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!session_) return nullptr;
            ch = libssh2_channel_open_session(session_);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN)
                return nullptr;
        }
        if (ch) break;
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
    return ch;
}

SSHResult SessionManager::exec(const std::string& command, int timeout_secs) {
    if (!active_) {
        return SSHResult{-1, "", "Session is not active"};
    }

    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    LIBSSH2_CHANNEL* ch = open_exec_channel(effective_timeout);
    if (!ch) {
        return SSHResult{-1, "", "Failed to open exec channel"};
    }

    int ret;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ret = libssh2_channel_exec(ch, command.c_str());
        }
        if (ret != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }

    std::string out, err;
    std::string error;

    if (ret != 0) {
        error = "Failed to start remote command";
    } else {
        char buf[SSH_READ_BUF_SIZE];
        bool eof = false;
        while (!eof) {
            if (std::chrono::steady_clock::now() > deadline) {
                error = fmt::format("Command timed out after {}s", effective_timeout);
                break;
            }
            ssize_t n, m;
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                n = libssh2_channel_read(ch, buf, sizeof(buf));
                if (n > 0) out.append(buf, n);
                m = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
                if (m > 0) err.append(buf, m);
                eof = libssh2_channel_eof(ch) != 0;
            }
            if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) ||
                (m < 0 && m != LIBSSH2_ERROR_EAGAIN)) {
                error = "SSH channel read error";
                break;
            }
            if (n <= 0 && m <= 0 && !eof) {
                platform::sleep_ms(SSH_POLL_INTERVAL_MS);
            }
        }
    }

    int exit_code = -1;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ret = libssh2_channel_close(ch);
        }
        if (ret != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (ret == 0 && error.empty()) exit_code = libssh2_channel_get_exit_status(ch);
        libssh2_channel_free(ch);
    }

    if (!error.empty()) {
        if (!err.empty()) error += ": " + err;
        return SSHResult{-1, out, error};
    }
    return SSHResult{exit_code, out, err};
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    bool was_open = session_ != nullptr;
    active_ = false;

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
            session_ = nullptr;
        }
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = SHELLPOOL_INVALID_SOCKET;
    }

    if (was_open) {
        shellpool_log(fmt::format("[ssh] session closed: {}", target_str_));
    }
}

bool SessionManager::is_active() const {
    return active_;
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    return true;
}
