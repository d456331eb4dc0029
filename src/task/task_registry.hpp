#pragma once

#include <string>
#include <vector>
#include <functional>
#include <yaml-cpp/yaml.h>

// A task body: positional argument + keyword mapping in, YAML value out.
// Throwing std::exception marks the task as failed.
using TaskFn = std::function<YAML::Node(const YAML::Node& args, const YAML::Node& kwargs)>;

// Register (or replace) a task under `name`.
void register_task(const std::string& name, TaskFn fn);

// Returns an empty function if the name is unknown.
TaskFn find_task(const std::string& name);

// Sorted names of every registered task (built-ins included).
std::vector<std::string> list_tasks();
