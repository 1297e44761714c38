#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Error categories carried by Result. Callers branch on these; the message
// is for humans.
enum class ErrorCode {
    None,
    Generic,
    ConstructionFailed,   // channel could not be built, initialized, or was canceled
    NotFound,             // lookup of an unassigned consumer / unknown host
    InvalidArgument,
    ConfigError,
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err, ErrorCode code = ErrorCode::Generic) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err, ErrorCode code = ErrorCode::Generic) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// One entry of the `machines:` list
struct HostConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_file;
    std::optional<std::string> ssh_passphrase;
    std::optional<std::vector<int>> gpu_indices;  // unset = every GPU
    bool use_active_gpu = false;
    int max_trial_number_per_gpu = 1;
    std::optional<std::string> python_path;       // prepended to PATH remotely
};

struct PoolSettings {
    int channel_capacity = 5;    // consumers sharing one channel
    int connect_timeout = 30;    // seconds
    std::string log_file;        // empty = default debug log
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
