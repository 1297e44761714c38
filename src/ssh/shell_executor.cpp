#include "shell_executor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <pool/host_descriptor.hpp>
#include <fmt/format.h>
#include <mutex>

ShellExecutor::ShellExecutor(int capacity, int default_timeout_secs)
    : ExecutionChannel(capacity),
      default_timeout_secs_(default_timeout_secs > 0 ? default_timeout_secs
                                                     : SSH_CONNECT_TIMEOUT_SECS) {}

ShellExecutor::~ShellExecutor() {
    auto closed = close();
    if (closed.is_err()) {
        shellpool_log(fmt::format("[executor {}] close on destruction failed: {}", label_, closed.error));
    }
}

std::string ShellExecutor::with_path_prefix(const std::string& command,
                                            const std::string& path_prefix) {
    if (path_prefix.empty()) return command;
    return fmt::format("export PATH={}:$PATH && {}", shell_quote(path_prefix), command);
}

Result<void> ShellExecutor::initialize(const RemoteHostDescriptor& host, const ChannelInit& init) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (closed_) {
        return Result<void>::Err("Executor already closed", ErrorCode::ConstructionFailed);
    }
    if (session_) {
        return Result<void>::Err("Executor already initialized", ErrorCode::InvalidArgument);
    }

    SessionTarget target;
    target.host = host.ip();
    target.port = host.port();
    target.user = host.username();
    target.password = host.password();
    target.ssh_key_path = host.ssh_key_path();
    target.passphrase = host.passphrase();
    target.timeout = init.timeout_secs > 0 ? init.timeout_secs : default_timeout_secs_;

    label_ = fmt::format("{}@{}#{}", host.username(), host.ip(), id());

    auto session = std::make_unique<SessionManager>(target);
    auto connected = session->establish(init.callback, init.cancel);
    if (connected.failed()) {
        return Result<void>::Err(connected.stderr_data, ErrorCode::ConstructionFailed);
    }

    // Remote environment probe
    auto os = session->exec("uname -s", SSH_PROBE_TIMEOUT_SECS);
    shellpool_log_ssh("[executor " + label_ + "]", "uname -s", os);
    if (os.failed()) {
        session->close();
        return Result<void>::Err("Remote probe failed: " + os.get_output(),
                                 ErrorCode::ConstructionFailed);
    }
    remote_os_ = os.stdout_data;
    trim(remote_os_);

    temp_path_ = fmt::format(REMOTE_CHANNEL_DIR, host.username(), id());
    std::string mkdir_cmd = "mkdir -p " + shell_quote(temp_path_);
    auto made = session->exec(mkdir_cmd, SSH_PROBE_TIMEOUT_SECS);
    shellpool_log_ssh("[executor " + label_ + "]", mkdir_cmd, made);
    if (made.failed()) {
        session->close();
        return Result<void>::Err("Failed to create remote scratch directory " + temp_path_ +
                                 ": " + made.get_output(), ErrorCode::ConstructionFailed);
    }

    path_prefix_ = host.python_path().value_or("");
    session_ = std::move(session);

    if (init.callback)
        init.callback(fmt::format("[executor] Ready on {} ({})", host.key(), remote_os_));
    return Result<void>::Ok();
}

SSHResult ShellExecutor::run(const std::string& command, int timeout_secs) {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (closed_) {
        return SSHResult{-1, "", "Executor is closed"};
    }
    if (!session_) {
        return SSHResult{-1, "", "Executor is not initialized"};
    }
    if (!session_->check_alive()) {
        shellpool_log(fmt::format("[executor {}] session lost", label_));
        return SSHResult{-1, "", "SSH session is no longer alive"};
    }

    std::string full = with_path_prefix(command, path_prefix_);
    auto result = session_->exec(full, timeout_secs);
    shellpool_log_ssh("[executor " + label_ + "]", full, result);
    return result;
}

Result<void> ShellExecutor::close() {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (closed_.exchange(true)) {
        return Result<void>::Ok();
    }
    if (!session_) {
        return Result<void>::Ok();
    }

    std::string cleanup_error;
    if (!temp_path_.empty() && session_->is_active()) {
        std::string rm_cmd = "rm -rf " + shell_quote(temp_path_);
        auto removed = session_->exec(rm_cmd, SSH_PROBE_TIMEOUT_SECS);
        if (removed.failed()) {
            cleanup_error = fmt::format("failed to remove {}: {}", temp_path_, removed.get_output());
        }
    }

    session_->close();
    session_.reset();
    shellpool_log(fmt::format("[executor {}] closed", label_));

    if (!cleanup_error.empty()) {
        return Result<void>::Err(cleanup_error);
    }
    return Result<void>::Ok();
}
