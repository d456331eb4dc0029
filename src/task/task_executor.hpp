#pragma once

#include <string>
#include <ostream>
#include <filesystem>

// Remote side of a job. Loads the parameter file, checks that every declared
// dependency is on PATH, resolves the task in the registry, runs it and writes
// the result artifact. Errors go to `err`; the result file is only written on
// success. Returns the process exit code (0 on success, 1 otherwise).
int execute_task_file(const std::filesystem::path& params_file,
                      const std::filesystem::path& results_file,
                      std::ostream& err);
