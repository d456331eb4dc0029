#include "task_serializer.hpp"
#include <managers/workspace.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <stdexcept>

// ── TaskDescriptor ──────────────────────────────────────────

TaskDescriptor TaskDescriptor::make(const std::string& name, const YAML::Node& args,
                                    const YAML::Node& kwargs,
                                    std::vector<std::string> dependencies) {
    TaskDescriptor t;
    t.name = name;
    t.args_yaml = YAML::Dump(args);
    t.kwargs_yaml = (kwargs && !kwargs.IsNull()) ? YAML::Dump(kwargs) : "{}";
    t.dependencies = std::move(dependencies);
    return t;
}

YAML::Node TaskDescriptor::args() const {
    return YAML::Load(args_yaml);
}

YAML::Node TaskDescriptor::kwargs() const {
    return YAML::Load(kwargs_yaml);
}

// ── Parameter file ──────────────────────────────────────────

void write_params_file(const std::filesystem::path& path, const TaskDescriptor& task) {
    YAML::Node root;
    root["task"] = task.name;
    root["args"] = task.args();
    root["kwargs"] = task.kwargs();
    YAML::Node deps(YAML::NodeType::Sequence);
    for (const auto& d : task.dependencies) deps.push_back(d);
    root["dependencies"] = deps;

    if (!write_file(path, YAML::Dump(root) + "\n")) {
        throw SgerunError(fmt::format("Failed to write {}", path.string()));
    }
}

TaskDescriptor read_params_file(const std::filesystem::path& path) {
    YAML::Node root = YAML::LoadFile(path.string());
    if (!root.IsMap() || !root["task"]) {
        throw std::runtime_error(fmt::format("{}: missing 'task' key", path.string()));
    }

    TaskDescriptor t;
    t.name = root["task"].as<std::string>();
    t.args_yaml = root["args"] ? YAML::Dump(root["args"]) : "~";
    t.kwargs_yaml = root["kwargs"] ? YAML::Dump(root["kwargs"]) : "{}";
    if (root["dependencies"] && root["dependencies"].IsSequence()) {
        for (const auto& d : root["dependencies"]) {
            t.dependencies.push_back(d.as<std::string>());
        }
    }
    return t;
}

// ── Script templates ────────────────────────────────────────

// Environment bootstrap: prefer the conda hook in ~/.bashrc, else put the
// configured conda bin directory on PATH.
static const char* CONDA_BOOTSTRAP =
    "if [[ -f ~/.bashrc && $(grep -c \"__conda_setup=\" ~/.bashrc) -gt 0 && "
    "$(grep -c \"unset __conda_setup\" ~/.bashrc) -gt 0 ]]; then\n"
    "   echo \"Sourcing .bashrc\" 1>&2\n"
    "   . ~/.bashrc\n"
    "else\n"
    "   echo \"Exporting conda PATH\" 1>&2\n"
    "   export PATH={conda_path}:$PATH\n"
    "fi\n"
    "\n"
    "conda activate {conda_env}\n";

// ── ScriptTaskSerializer ────────────────────────────────────

ScriptTaskSerializer::ScriptTaskSerializer(ScriptSettings settings)
    : settings_(std::move(settings)) {}

std::string ScriptTaskSerializer::exec_script(const Workspace& ws) const {
    return fmt::format(
        "#!/bin/bash\n"
        "exec {} exec {} {}\n",
        shell_quote(settings_.executor),
        shell_quote(ws.params_file().string()),
        shell_quote(ws.results_file().string()));
}

std::string ScriptTaskSerializer::submit_script(const Workspace& ws) const {
    std::string s =
        "#!/bin/bash\n"
        "export OMP_NUM_THREADS=1\n";
    if (!settings_.conda_env.empty()) {
        s += fmt::format(fmt::runtime(CONDA_BOOTSTRAP),
                         fmt::arg("conda_path", shell_quote(settings_.conda_path)),
                         fmt::arg("conda_env", shell_quote(settings_.conda_env)));
    }
    s += fmt::format("\nbash {}\n", shell_quote(ws.exec_script().string()));
    return s;
}

void ScriptTaskSerializer::write(const TaskDescriptor& task, const Workspace& ws) {
    if (settings_.executor.empty()) {
        throw SgerunError("No executor configured for the remote side");
    }

    write_params_file(ws.params_file(), task);
    sgerun_log(fmt::format("File written: {}", ws.params_file().string()));

    if (!write_file(ws.exec_script(), exec_script(ws))) {
        throw SgerunError(fmt::format("Failed to write {}", ws.exec_script().string()));
    }
    sgerun_log(fmt::format("File written: {}", ws.exec_script().string()));

    if (!write_file(ws.submit_script(), submit_script(ws))) {
        throw SgerunError(fmt::format("Failed to write {}", ws.submit_script().string()));
    }
    sgerun_log(fmt::format("File written: {}", ws.submit_script().string()));
}
