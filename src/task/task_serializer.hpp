#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <yaml-cpp/yaml.h>

class Workspace;

// Transportable description of one unit of work. The executor resolves `name`
// in its task registry; args/kwargs are kept as YAML text so descriptors can
// be copied across threads without sharing yaml-cpp nodes.
struct TaskDescriptor {
    std::string name;
    std::string args_yaml = "~";
    std::string kwargs_yaml = "{}";
    std::vector<std::string> dependencies;   // executables required on the remote PATH

    static TaskDescriptor make(const std::string& name, const YAML::Node& args,
                               const YAML::Node& kwargs = YAML::Node(YAML::NodeType::Map),
                               std::vector<std::string> dependencies = {});

    YAML::Node args() const;
    YAML::Node kwargs() const;
};

// Write the parameter file for `task` (task, args, kwargs, dependencies).
void write_params_file(const std::filesystem::path& path, const TaskDescriptor& task);

// Read a parameter file back. Throws YAML::Exception / std::runtime_error.
TaskDescriptor read_params_file(const std::filesystem::path& path);

// Produces everything a Worker needs in its workspace before submission:
// parameter file, executor script and submission wrapper script.
class TaskSerializer {
public:
    virtual ~TaskSerializer() = default;

    // Throws SgerunError if a file cannot be written.
    virtual void write(const TaskDescriptor& task, const Workspace& ws) = 0;
};

struct ScriptSettings {
    std::string executor;     // binary providing the `exec` subcommand
    std::string conda_env;    // empty = no environment bootstrap
    std::string conda_path;   // PATH prefix used when ~/.bashrc has no conda hook
};

// Bash scripts: the submission wrapper bootstraps the conda environment and
// runs the executor script, which hands the parameter file to `<executor> exec`.
class ScriptTaskSerializer : public TaskSerializer {
public:
    explicit ScriptTaskSerializer(ScriptSettings settings);

    void write(const TaskDescriptor& task, const Workspace& ws) override;

    std::string exec_script(const Workspace& ws) const;
    std::string submit_script(const Workspace& ws) const;

private:
    ScriptSettings settings_;
};
