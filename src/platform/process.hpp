#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <functional>
#include <core/types.hpp>

namespace platform {

// Run a program (looked up on PATH, no shell) and wait for it to exit.
// stdout and stderr are captured separately; stdin is /dev/null.
// exit_code is -1 if the program could not be spawned or died on a signal;
// 127 if exec failed in the child.
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args);

// Search PATH for an executable file named `name`. A name containing '/'
// is checked as-is.
std::optional<std::filesystem::path> find_executable(const std::string& name);

// Signature of run_command, used to inject canned output in tests.
using CommandRunner = std::function<CommandResult(const std::string& program,
                                                  const std::vector<std::string>& args)>;

} // namespace platform
