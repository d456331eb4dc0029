#include "task_executor.hpp"
#include "result_codec.hpp"
#include "task_registry.hpp"
#include "task_serializer.hpp"
#include <platform/process.hpp>
#include <fmt/format.h>

int execute_task_file(const std::filesystem::path& params_file,
                      const std::filesystem::path& results_file,
                      std::ostream& err) {
    TaskDescriptor task;
    try {
        task = read_params_file(params_file);
    } catch (const std::exception& e) {
        err << fmt::format("sgerun exec: cannot load {}: {}\n", params_file.string(), e.what());
        return 1;
    }

    for (const auto& dep : task.dependencies) {
        if (!platform::find_executable(dep)) {
            err << fmt::format("sgerun exec: missing dependency '{}' for task '{}'\n",
                               dep, task.name);
            return 1;
        }
    }

    TaskFn fn = find_task(task.name);
    if (!fn) {
        err << fmt::format("sgerun exec: unknown task '{}'\n", task.name);
        return 1;
    }

    try {
        YAML::Node result = fn(task.args(), task.kwargs());
        write_result_file(results_file, task.name, result);
    } catch (const std::exception& e) {
        err << fmt::format("sgerun exec: task '{}' failed: {}\n", task.name, e.what());
        return 1;
    }
    return 0;
}
