#include "hindsight/execution_result.hpp"

namespace hindsight {
using namespace std;
using namespace nlohmann;

const char *to_string(termination status) {
    switch (status) {
        case termination::EXITED: return "exited";
        case termination::SIGNALED: return "signaled";
        case termination::TIME_LIMIT: return "time-limit";
        case termination::MEMORY_LIMIT: return "memory-limit";
        case termination::OUTPUT_LIMIT: return "output-limit";
        case termination::ENVIRONMENT_ERROR: return "environment-error";
        default: return "unknown";
    }
}

verdict execution_result::outcome() const {
    switch (status) {
        case termination::TIME_LIMIT:
            return verdict::TIME_LIMIT_EXCEEDED;
        case termination::MEMORY_LIMIT:
            return verdict::MEMORY_LIMIT_EXCEEDED;
        case termination::OUTPUT_LIMIT:
            return verdict::OUTPUT_LIMIT_EXCEEDED;
        case termination::SIGNALED:
            return verdict::RUNTIME_ERROR;
        case termination::ENVIRONMENT_ERROR:
            return verdict::SYSTEM_ERROR;
        default:
            break;
    }

    if (exit_status != 0) return verdict::RUNTIME_ERROR;
    switch (comparison) {
        case comparison_result::PASS:
            return verdict::ACCEPTED;
        case comparison_result::FAIL:
            return verdict::WRONG_ANSWER;
        default:
            return verdict::SYSTEM_ERROR;
    }
}

void to_json(json &j, const execution_result &result) {
    j = {{"test_case", result.test_case_id},
         {"outcome", get_verdict_tag(result.outcome())},
         {"termination", to_string(result.status)},
         {"exit_status", result.exit_status},
         {"signal", result.signal},
         {"wall_time", result.wall_time},
         {"cpu_time", result.cpu_time},
         {"peak_memory", result.peak_memory},
         {"stdout", result.stdout_capture},
         {"stdout_truncated", result.stdout_truncated},
         {"stderr", result.stderr_capture},
         {"stderr_truncated", result.stderr_truncated},
         {"comparison", result.comparison},
         {"instrumented", result.instrumented},
         {"instrumentation_diagnostics", result.instrumentation_diagnostics}};
    if (!result.exceeded_resource.empty())
        j["exceeded_resource"] = result.exceeded_resource;
    if (!result.environment_error.empty())
        j["environment_error"] = result.environment_error;
}

}  // namespace hindsight
