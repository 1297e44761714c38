#pragma once

#include <string>
#include "types.hpp"

// Debug log path: <tmp>/shellpool_debug.log unless overridden.
std::string shellpool_log_path();

// Redirect the debug log (config `pool.log_file`). Empty restores the default.
void set_log_path(const std::string& path);

// Append a "[HH:MM:SS.mmm] msg" line to the debug log. Thread-safe.
void shellpool_log(const std::string& msg);

// Trace a remote command and its result.
void shellpool_log_ssh(const std::string& label, const std::string& cmd,
                       const SSHResult& r);
