#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Debug log path. Defaults to <temp dir>/sgerun_debug.log.
std::string sgerun_log_path();
void set_log_path(const std::string& path);

// When enabled every log line is echoed to stderr as well.
void set_log_verbose(bool verbose);
bool log_verbose();

// Append a timestamped line to the debug log. Never throws.
void sgerun_log(const std::string& msg);

// Like sgerun_log, but always echoed to stderr.
void sgerun_warn(const std::string& msg);

// Record an external command invocation and its (truncated) output.
void sgerun_log_command(const std::string& label, const std::string& program,
                        const std::vector<std::string>& args, const CommandResult& r);
