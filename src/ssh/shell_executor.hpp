#pragma once

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <pool/execution_channel.hpp>
#include "session.hpp"

// ShellExecutor: an ExecutionChannel backed by one SSH session.
//
// initialize() connects and authenticates, then probes the remote side:
// `uname -s` fixes the OS name and a private scratch directory is created
// under /tmp/shellpool-<user>. When the host sets python_path, every command
// runs with that directory at the front of PATH.
//
// close() waits for commands already running on this executor, removes the
// scratch directory and drops the session. Later run() calls fail at once.
class ShellExecutor : public ExecutionChannel {
public:
    explicit ShellExecutor(int capacity, int default_timeout_secs = 0);
    ~ShellExecutor() override;

    Result<void> initialize(const RemoteHostDescriptor& host, const ChannelInit& init) override;
    SSHResult run(const std::string& command, int timeout_secs = 0) override;
    Result<void> close() override;
    bool is_closed() const override { return closed_.load(); }

    // Wrap a command with the PATH prefix (exposed for tests)
    static std::string with_path_prefix(const std::string& command,
                                        const std::string& path_prefix);

private:
    int default_timeout_secs_;
    std::unique_ptr<SessionManager> session_;
    std::shared_mutex state_mutex_;     // shared: run(), exclusive: close()
    std::atomic<bool> closed_{false};
    std::string remote_os_;
    std::string temp_path_;
    std::string path_prefix_;
    std::string label_;                 // "user@host#id" for logs
};
