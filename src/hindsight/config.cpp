#include "hindsight/config.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace hindsight {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, resource_limits &limits) {
    if (j.count("wall_time")) j.at("wall_time").get_to(limits.wall_time);
    if (j.count("cpu_time")) j.at("cpu_time").get_to(limits.cpu_time);
    if (j.count("memory")) j.at("memory").get_to(limits.memory);
    if (j.count("output")) j.at("output").get_to(limits.output);
    if (j.count("stack")) j.at("stack").get_to(limits.stack);
    if (j.count("processes")) j.at("processes").get_to(limits.processes);
    if (j.count("open_files")) j.at("open_files").get_to(limits.open_files);
}

void to_json(json &j, const resource_limits &limits) {
    j = {{"wall_time", limits.wall_time},
         {"cpu_time", limits.cpu_time},
         {"memory", limits.memory},
         {"output", limits.output},
         {"stack", limits.stack},
         {"processes", limits.processes},
         {"open_files", limits.open_files}};
}

void from_json(const json &j, comparison_config &config) {
    if (j.count("mode")) {
        string mode = j.at("mode").get<string>();
        if (mode == "exact")
            config.mode = comparison_mode::EXACT;
        else if (mode == "whitespace")
            config.mode = comparison_mode::WHITESPACE;
        else if (mode == "numeric")
            config.mode = comparison_mode::NUMERIC;
        else
            throw configuration_error("unknown comparison mode " + mode);
    }
    if (j.count("absolute_tolerance"))
        j.at("absolute_tolerance").get_to(config.absolute_tolerance);
    if (j.count("relative_tolerance"))
        j.at("relative_tolerance").get_to(config.relative_tolerance);
}

void from_json(const json &j, toolchain_config &config) {
    if (j.count("compiler")) j.at("compiler").get_to(config.compiler);
    if (j.count("compiler_args")) j.at("compiler_args").get_to(config.compiler_args);
    if (j.count("instrument_args")) j.at("instrument_args").get_to(config.instrument_args);
    if (j.count("compile_time_limit")) j.at("compile_time_limit").get_to(config.compile_time_limit);
    if (j.count("clang_tidy")) j.at("clang_tidy").get_to(config.clang_tidy);
    if (j.count("clang")) j.at("clang").get_to(config.clang);
    if (j.count("enabled_rules")) j.at("enabled_rules").get_to(config.enabled_rules);
    if (j.count("catalog_path")) config.catalog_path = j.at("catalog_path").get<string>();
    if (j.count("runguard_path")) config.runguard_path = j.at("runguard_path").get<string>();
    if (j.count("work_root")) config.work_root = j.at("work_root").get<string>();
    if (j.count("limits")) j.at("limits").get_to(config.limits);
    if (j.count("sandbox_user")) j.at("sandbox_user").get_to(config.sandbox_user);
    if (j.count("sandbox_group")) j.at("sandbox_group").get_to(config.sandbox_group);
    if (j.count("capture_limit")) j.at("capture_limit").get_to(config.capture_limit);
    if (j.count("comparison")) j.at("comparison").get_to(config.comparison);
    if (j.count("aggregation")) {
        string aggregation = j.at("aggregation").get<string>();
        if (aggregation == "sum")
            config.aggregation = score_aggregation::SUM;
        else if (aggregation == "max")
            config.aggregation = score_aggregation::MAX;
        else
            throw configuration_error("unknown score aggregation " + aggregation);
    }
    if (j.count("sanitizer_options")) j.at("sanitizer_options").get_to(config.sanitizer_options);
}

}  // namespace hindsight
