#include "sandbox/executor.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"

namespace hindsight {
using namespace std;

sandboxed_executor::sandboxed_executor(const sandbox_config &config, size_t capture_limit)
    : config(config), capture_limit(capture_limit) {}

void sandboxed_executor::probe() const {
    sandbox_context::probe(config);
}

void sandboxed_executor::classify(const runguard_result &meta, const resource_limits &limits, execution_result &result) {
    result.wall_time = meta.wall_time;
    result.cpu_time = meta.cpu_time;
    result.peak_memory = meta.memory;
    result.exit_status = meta.exitcode;

    // runguard 因墙钟超时杀死选手程序时，signal 为 SIGALRM，返回值为 128 + SIGKILL
    bool signaled = meta.signal > 0;
    if (signaled)
        result.signal = meta.exitcode > 128 ? meta.exitcode - 128 : meta.signal;

    if (!meta.time_result.empty()) {
        result.status = termination::TIME_LIMIT;
        result.exceeded_resource = meta.cpu_time > limits.cpu_time ? "cpu-time" : "wall-time";
    } else if (meta.memory_result == "oom" || (meta.memory_result == "max" && (signaled || meta.exitcode != 0))) {
        result.status = termination::MEMORY_LIMIT;
        result.exceeded_resource = "memory";
    } else if (meta.output_result == "exceeded") {
        result.status = termination::OUTPUT_LIMIT;
        result.exceeded_resource = "output";
    } else if (signaled) {
        result.status = termination::SIGNALED;
    } else {
        result.status = termination::EXITED;
    }
}

execution_result sandboxed_executor::execute(const sandbox_request &request, const atomic_bool *cancelled,
                                             const function<void(const filesystem::path &)> &inspect) const {
    sandbox_context context(config);
    runguard_result meta = context.run(request, cancelled);

    execution_result result;
    classify(meta, request.limits, result);
    if (result.status != termination::EXITED)
        LOG(INFO) << "Program " << request.program << " terminated: " << to_string(result.status)
                  << (result.exceeded_resource.empty() ? "" : " (" + result.exceeded_resource + ")");

    result.stdout_capture = read_file_prefix(request.stdout_file, capture_limit, result.stdout_truncated);
    result.stderr_capture = read_file_prefix(context.stderr_file(), capture_limit, result.stderr_truncated);
    if (inspect) inspect(context.run_dir());
    return result;
}

}  // namespace hindsight
