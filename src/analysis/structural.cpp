#include "analysis/structural.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cstring>
#include <deque>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include "analysis/source_index.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace hindsight {
using namespace std;
namespace fs = std::filesystem;

const char call_graph::GLOBAL_INIT[] = "<global-init>";

static const int64_t DEFAULT_STACK_LIMIT = 8ll << 20;

static const set<string> FUNCTION_KINDS = {
    "FunctionDecl", "CXXMethodDecl", "CXXConstructorDecl", "CXXDestructorDecl", "CXXConversionDecl"};

static const set<string> LOOP_KINDS = {"ForStmt", "WhileStmt", "DoStmt", "CXXForRangeStmt"};

static const set<string> TEMPLATE_KINDS = {
    "FunctionTemplateDecl", "ClassTemplateDecl", "ClassTemplateSpecializationDecl",
    "ClassTemplatePartialSpecializationDecl"};

static bool is_function(const ast_node &node) {
    return FUNCTION_KINDS.count(node.kind) > 0;
}

static bool has_body(const ast_node &node) {
    for (auto &child : node.children)
        if (child.kind == "CompoundStmt" || child.kind == "CXXTryStmt") return true;
    return false;
}

namespace {

struct visit_context {
    /**
     * @brief 当前所在的函数定义，位于全局作用域时为 nullptr
     */
    const ast_node *function = nullptr;

    /**
     * @brief 当前函数中包围该节点的循环层数
     */
    int loop_depth = 0;

    bool in_template = false;
};

using visitor = std::function<void(const ast_node &, const visit_context &)>;

void traverse(const ast_node &node, visit_context ctx, const visitor &visit) {
    visit(node, ctx);
    if (TEMPLATE_KINDS.count(node.kind)) ctx.in_template = true;
    if (is_function(node) && has_body(node)) {
        ctx.function = &node;
        ctx.loop_depth = 0;
    }
    if (LOOP_KINDS.count(node.kind)) ++ctx.loop_depth;
    for (auto &child : node.children)
        traverse(child, ctx, visit);
}

void traverse(const vector<translation_unit> &units, const visitor &visit) {
    for (auto &unit : units)
        traverse(unit.ast, visit_context(), visit);
}

diagnostic make_diagnostic(const string &rule_id, const ast_node &node, const fs::path &source_dir, const string &message) {
    diagnostic diag;
    diag.rule_id = rule_id;
    diag.source = diagnostic_source::STRUCTURAL;
    diag.message = message;
    if (node.location)
        diag.location = source_location{display_path(node.location->file, source_dir), node.location->line, node.location->column};
    return diag;
}

}  // namespace

string call_graph::key_of(const ast_node &decl) {
    return decl.mangled_name.empty() ? decl.name + "|" + decl.type : decl.mangled_name;
}

call_graph call_graph::build(const vector<translation_unit> &units) {
    call_graph graph;
    function &global = graph.functions[GLOBAL_INIT];
    global.key = global.name = GLOBAL_INIT;
    global.implicit_entry = true;

    for (auto &unit : units) {
        // 节点编号只在同一个翻译单元中唯一
        map<string, string> id_keys;
        traverse(unit.ast, visit_context(), [&](const ast_node &node, const visit_context &ctx) {
            if (!is_function(node)) return;
            string key = key_of(node);
            id_keys[node.id] = key;
            if (!has_body(node) || graph.functions.count(key)) return;

            function &fn = graph.functions[key];
            fn.key = key;
            fn.name = node.name;
            fn.decl = &node;
            fn.in_template = ctx.in_template;
            fn.implicit_entry = node.kind == "CXXConstructorDecl" || node.kind == "CXXDestructorDecl" ||
                                node.kind == "CXXConversionDecl" || node.is_virtual ||
                                boost::algorithm::starts_with(node.name, "operator");
        });

        traverse(unit.ast, visit_context(), [&](const ast_node &node, const visit_context &ctx) {
            if (node.kind != "DeclRefExpr" && node.kind != "MemberExpr") return;
            auto callee = id_keys.find(node.referenced_id);
            if (callee == id_keys.end()) return;

            auto caller = graph.functions.find(ctx.function ? key_of(*ctx.function) : string(GLOBAL_INIT));
            if (caller != graph.functions.end())
                caller->second.callees.insert(callee->second);
        });
    }
    return graph;
}

bool call_graph::has_main() const {
    for (auto &[key, fn] : functions)
        if (fn.decl && fn.decl->kind == "FunctionDecl" && fn.name == "main") return true;
    return false;
}

static set<string> reach(const map<string, call_graph::function> &functions, deque<string> queue) {
    set<string> seen(queue.begin(), queue.end());
    while (!queue.empty()) {
        string key = queue.front();
        queue.pop_front();
        for (auto &callee : functions.at(key).callees)
            if (functions.count(callee) && seen.insert(callee).second)
                queue.push_back(callee);
    }
    return seen;
}

set<string> call_graph::reachable() const {
    deque<string> roots;
    for (auto &[key, fn] : functions)
        if (fn.implicit_entry || (fn.decl && fn.decl->kind == "FunctionDecl" && fn.name == "main"))
            roots.push_back(key);
    return reach(functions, roots);
}

set<string> call_graph::recursive() const {
    // Tarjan 强连通分量算法
    map<string, int> index, low;
    vector<string> stack;
    set<string> on_stack, result;
    int counter = 0;

    std::function<void(const string &)> connect = [&](const string &v) {
        index[v] = low[v] = counter++;
        stack.push_back(v);
        on_stack.insert(v);

        for (auto &w : functions.at(v).callees) {
            if (!functions.count(w)) continue;
            if (!index.count(w)) {
                connect(w);
                low[v] = min(low[v], low[w]);
            } else if (on_stack.count(w)) {
                low[v] = min(low[v], index[w]);
            }
        }

        if (low[v] == index[v]) {
            vector<string> component;
            string w;
            do {
                w = stack.back();
                stack.pop_back();
                on_stack.erase(w);
                component.push_back(w);
            } while (w != v);

            if (component.size() > 1 || functions.at(v).callees.count(v))
                result.insert(component.begin(), component.end());
        }
    };

    for (auto &[key, fn] : functions)
        if (!index.count(key)) connect(key);
    return result;
}

set<string> call_graph::reachable_from_recursion() const {
    set<string> rec = recursive();
    return reach(functions, deque<string>(rec.begin(), rec.end()));
}

static void check_unreachable_functions(const vector<translation_unit> &units, const fs::path &source_dir, vector<diagnostic> &result) {
    call_graph graph = call_graph::build(units);
    // 没有 main 函数的提交（比如只提交了函数实现）无法判断可达性
    if (!graph.has_main()) return;

    set<string> reachable = graph.reachable();
    vector<const ast_node *> unreachable;
    for (auto &[key, fn] : graph.functions) {
        if (!fn.decl || reachable.count(key) || fn.in_template || fn.decl->implicit) continue;
        if (fn.decl->kind != "FunctionDecl" && fn.decl->kind != "CXXMethodDecl") continue;
        unreachable.push_back(fn.decl);
    }

    sort(unreachable.begin(), unreachable.end(), [](const ast_node *a, const ast_node *b) {
        return a->location < b->location;
    });
    for (const ast_node *decl : unreachable)
        result.push_back(make_diagnostic("unreachable-func", *decl, source_dir,
                                         fmt::format("function '{}' is defined but never called from main", decl->name)));
}

static string strip_qualifiers(string type) {
    boost::algorithm::trim(type);
    bool stripped = true;
    while (stripped) {
        stripped = false;
        for (const char *prefix : {"const ", "volatile ", "struct ", "class "}) {
            if (boost::algorithm::starts_with(type, prefix)) {
                type.erase(0, strlen(prefix));
                stripped = true;
            }
        }
    }
    return type;
}

static bool passed_indirectly(const string &type) {
    string t = boost::algorithm::trim_copy(type);
    return t.empty() || t.back() == '&' || t.back() == '*' ||
           t.find("(&") != string::npos || t.find("(*") != string::npos;
}

static const regex STD_CONTAINER(
    R"(^(::)?(std::)?(__cxx11::)?(basic_string|string|wstring|vector|deque|list|forward_list|set|multiset|map|multimap|unordered_set|unordered_multiset|unordered_map|unordered_multimap|queue|priority_queue|stack|valarray|array|bitset)\b)");

/**
 * @brief 按值传递该类型的参数是否需要调用非平凡的拷贝构造函数
 * @param records 用户定义的类名到是否为 POD 的映射
 */
static bool costly_by_value(const string &type, const map<string, bool> &records) {
    if (passed_indirectly(type)) return false;
    string base = strip_qualifiers(type);
    if (regex_search(base, STD_CONTAINER)) return true;
    auto it = records.find(base);
    return it != records.end() && !it->second;
}

static void check_nonpod_by_value(const vector<translation_unit> &units, const fs::path &source_dir, vector<diagnostic> &result) {
    call_graph graph = call_graph::build(units);
    set<string> recursive = graph.reachable_from_recursion();

    map<string, bool> records;
    traverse(units, [&](const ast_node &node, const visit_context &) {
        if (node.kind == "CXXRecordDecl" && node.complete_definition && !node.implicit && !node.name.empty())
            records[node.name] = node.is_pod;
    });

    traverse(units, [&](const ast_node &node, const visit_context &) {
        if ((node.kind != "FunctionDecl" && node.kind != "CXXMethodDecl") || node.implicit || !has_body(node)) return;
        bool in_recursion = recursive.count(call_graph::key_of(node)) > 0;

        for (auto &param : node.children) {
            if (param.kind != "ParmVarDecl") continue;
            if (!costly_by_value(param.type, records) && !costly_by_value(param.desugared_type, records)) continue;

            string name = param.name.empty() ? "<unnamed>" : param.name;
            if (in_recursion)
                result.push_back(make_diagnostic("nonpod-by-value-rec", param, source_dir,
                                                 fmt::format("parameter '{}' of type '{}' is copied on every recursive call of '{}'", name, param.type, node.name)));
            else
                result.push_back(make_diagnostic("nonpod-by-value", param, source_dir,
                                                 fmt::format("parameter '{}' of type '{}' of '{}' is passed by value", name, param.type, node.name)));
        }
    });
}

static void check_endl_in_loop(const vector<translation_unit> &units, const fs::path &source_dir, vector<diagnostic> &result) {
    traverse(units, [&](const ast_node &node, const visit_context &ctx) {
        if (!ctx.function || ctx.loop_depth == 0) return;
        if (node.kind == "DeclRefExpr" && node.referenced_name == "endl")
            result.push_back(make_diagnostic("endl-in-loop", node, source_dir,
                                             "std::endl inside a loop flushes the output stream at every iteration"));
    });
}

static void check_cin_without_sync(const vector<translation_unit> &units, const fs::path &source_dir, vector<diagnostic> &result) {
    bool synced = false;
    const ast_node *first_read = nullptr;
    traverse(units, [&](const ast_node &node, const visit_context &ctx) {
        if (node.name == "sync_with_stdio" || node.referenced_name == "sync_with_stdio")
            synced = true;
        if (!first_read && ctx.function && ctx.loop_depth > 0 && node.kind == "DeclRefExpr" && node.referenced_name == "cin")
            first_read = &node;
    });

    if (!synced && first_read)
        result.push_back(make_diagnostic("cin-without-sync", *first_read, source_dir,
                                         "std::cin is read inside a loop while synchronized with C stdio"));
}

static int64_t saturating_mul(int64_t a, int64_t b) {
    if (a > 0 && b > numeric_limits<int64_t>::max() / a)
        return numeric_limits<int64_t>::max();
    return a * b;
}

static int64_t parse_extent(const string &digits) {
    int64_t value;
    if (!boost::conversion::try_lexical_convert(digits, value))
        return numeric_limits<int64_t>::max();
    return value;
}

static int64_t element_size(const string &type) {
    static const map<string, int64_t> sizes = {
        {"char", 1}, {"signed char", 1}, {"unsigned char", 1}, {"bool", 1}, {"_Bool", 1}, {"char8_t", 1},
        {"int8_t", 1}, {"uint8_t", 1},
        {"short", 2}, {"unsigned short", 2}, {"short int", 2}, {"char16_t", 2}, {"int16_t", 2}, {"uint16_t", 2},
        {"int", 4}, {"unsigned int", 4}, {"unsigned", 4}, {"float", 4}, {"wchar_t", 4}, {"char32_t", 4},
        {"int32_t", 4}, {"uint32_t", 4},
        {"long", 8}, {"unsigned long", 8}, {"long long", 8}, {"unsigned long long", 8}, {"double", 8},
        {"size_t", 8}, {"int64_t", 8}, {"uint64_t", 8},
        {"long double", 16}, {"__int128", 16}, {"unsigned __int128", 16}};

    string base = strip_qualifiers(type);
    if (!base.empty() && base.back() == '*') return 8;
    auto it = sizes.find(base);
    // 无法确定大小的类型按 8 字节估计
    return it == sizes.end() ? 8 : it->second;
}

int64_t estimate_array_size(const string &type) {
    static const regex STD_ARRAY(R"(^(?:::)?(?:std::)?array<(.+),\s*(\d+)[uUlL]*>$)");
    static const regex EXTENT(R"(\[(\d+)\])");

    string t = strip_qualifiers(type);
    smatch m;
    if (regex_match(t, m, STD_ARRAY)) {
        int64_t inner = estimate_array_size(m[1].str());
        if (inner == 0) inner = element_size(m[1].str());
        return saturating_mul(inner, parse_extent(m[2].str()));
    }

    size_t bracket = t.find('[');
    if (bracket == string::npos) return 0;
    // 数组的指针或引用，如 "int (*)[10]"
    size_t paren = t.find('(');
    if (paren != string::npos && paren < bracket) return 0;

    int64_t count = 1;
    for (sregex_iterator it(t.begin() + bracket, t.end(), EXTENT), end; it != end; ++it)
        count = saturating_mul(count, parse_extent((*it)[1].str()));
    return saturating_mul(count, element_size(t.substr(0, bracket)));
}

static void check_large_stack_arrays(int64_t stack_limit, const vector<translation_unit> &units, const fs::path &source_dir, vector<diagnostic> &result) {
    traverse(units, [&](const ast_node &node, const visit_context &ctx) {
        if (node.kind != "VarDecl" || !ctx.function) return;
        if (node.storage_class == "static" || node.storage_class == "extern") return;

        int64_t size = max(estimate_array_size(node.type), estimate_array_size(node.desugared_type));
        if (size <= stack_limit) return;
        result.push_back(make_diagnostic("large-stack-array", node, source_dir,
                                         fmt::format("local array '{}' of type '{}' needs about {} KiB of stack, the stack limit is {} KiB",
                                                     node.name, node.type, size / 1024, stack_limit / 1024)));
    });
}

vector<diagnostic> parse_compiler_warnings(const string &output, const fs::path &source_dir) {
    static const regex WARNING(R"(^(.+?):(\d+):(\d+): warning: (.*) \[-W([^\],]+)[^\]]*\]$)");

    vector<diagnostic> result;
    istringstream ss(output);
    string line;
    while (getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        smatch m;
        if (!regex_match(line, m, WARNING)) continue;

        string file = m[1].str();
        if (!is_under_directory(file, source_dir)) continue;

        diagnostic diag;
        diag.rule_id = "clang-diagnostic-" + m[5].str();
        diag.source = diagnostic_source::STRUCTURAL;
        diag.message = m[4].str();
        diag.location = source_location{display_path(file, source_dir), stoi(m[2].str()), stoi(m[3].str())};
        result.push_back(diag);
    }
    return result;
}

vector<structural_rule> structural_analyzer::default_rules(int64_t stack_limit) {
    if (stack_limit <= 0) stack_limit = DEFAULT_STACK_LIMIT;
    return {
        {"unreachable-func", check_unreachable_functions},
        {"nonpod-by-value", check_nonpod_by_value},
        {"endl-in-loop", check_endl_in_loop},
        {"cin-without-sync", check_cin_without_sync},
        {"large-stack-array", [stack_limit](const vector<translation_unit> &units, const fs::path &source_dir, vector<diagnostic> &result) {
             check_large_stack_arrays(stack_limit, units, source_dir, result);
         }},
        {"compiler-warnings", [](const vector<translation_unit> &units, const fs::path &source_dir, vector<diagnostic> &result) {
             for (auto &unit : units)
                 for (auto &diag : parse_compiler_warnings(unit.compiler_output, source_dir))
                     result.push_back(diag);
         }}};
}

structural_analyzer::structural_analyzer(const string &clang, double timeout, int64_t stack_limit)
    : structural_analyzer(clang, timeout, default_rules(stack_limit)) {}

structural_analyzer::structural_analyzer(const string &clang, double timeout, vector<structural_rule> rules)
    : clang(clang), timeout(timeout), rules(move(rules)) {}

diagnostic_source structural_analyzer::kind() const {
    return diagnostic_source::STRUCTURAL;
}

vector<diagnostic> structural_analyzer::analyze(const vector<translation_unit> &units, const fs::path &source_dir) const {
    vector<diagnostic> result;
    for (auto &rule : rules) {
        vector<diagnostic> found;
        try {
            rule.check(units, source_dir, found);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Structural rule " << rule.name << " failed: " << ex.what();
            diagnostic error;
            error.rule_id = INTERNAL_ANALYSIS_ERROR;
            error.source = diagnostic_source::STRUCTURAL;
            error.message = fmt::format("rule {} failed: {}", rule.name, ex.what());
            found = {error};
        }

        for (auto &diag : found)
            if (find(result.begin(), result.end(), diag) == result.end())
                result.push_back(diag);
    }

    source_index index;
    for (auto &diag : result)
        if (diag.location && diag.code.empty())
            diag.code = index.line_of(source_dir / diag.location->file, diag.location->line);
    return result;
}

vector<diagnostic> structural_analyzer::produce(const analysis_input &input) const {
    fs::path exe = find_executable(clang);
    if (exe.empty())
        throw analysis_unavailable_error(fmt::format("clang not found: {}", clang));

    vector<translation_unit> units;
    vector<diagnostic> markers;
    for (size_t i = 0; i < input.sources.size(); ++i) {
        const fs::path &source = input.sources[i];
        fs::path dump = input.output_dir / fmt::format("clang-ast-{}.json", i);
        fs::path log = input.output_dir / fmt::format("clang-ast-{}.log", i);
        defer {
            error_code ec;
            fs::remove(dump, ec);
        };

        process_options options;
        options.stdout_file = dump;
        options.stderr_file = log;
        options.timeout = timeout;

        LOG(INFO) << "Parsing " << source << " with " << exe;
        process_result proc;
        try {
            proc = call_process_opt(options, exe, "-fsyntax-only", "-Xclang", "-ast-dump=json", "-Wall", "-Wextra",
                                    "-fno-color-diagnostics", "-fdiagnostics-show-option", input.compiler_args, source);
        } catch (system_error &ex) {
            throw analysis_unavailable_error(fmt::format("unable to run {}: {}", exe.string(), ex.what()));
        }

        translation_unit unit;
        unit.source = source;
        unit.compiler_output = read_file_content(log, "");
        check_rejected_arguments("clang", unit.compiler_output);

        bool complete = !proc.timed_out && proc.exitcode == 0;
        if (!complete) {
            string reason = proc.timed_out ? "timed out"
                            : proc.exitcode < 0 ? fmt::format("was killed by signal {}", proc.signal)
                                                : fmt::format("exited with code {}", proc.exitcode);
            LOG(WARNING) << "clang " << reason << " on " << source;

            diagnostic marker;
            marker.rule_id = SOURCE_INCOMPLETE;
            marker.source = diagnostic_source::STRUCTURAL;
            marker.location = source_location{display_path(source, input.source_dir), 0, 0};
            marker.message = fmt::format("clang {}, structural findings for this file may be incomplete", reason);
            markers.push_back(marker);
        }

        error_code ec;
        auto size = fs::file_size(dump, ec);
        if (ec || size == 0) {
            if (complete)
                throw analysis_parse_error(fmt::format("clang produced no AST for {}", source.string()));
            continue;
        }

        ifstream is(dump);
        try {
            unit.ast = parse_clang_ast(is, input.source_dir);
        } catch (analysis_parse_error &ex) {
            // 超时或崩溃时语法树可能被截断，已经记录了 source-incomplete
            if (complete) throw;
            LOG(WARNING) << "Discarding truncated AST of " << source << ": " << ex.what();
            continue;
        }
        units.push_back(move(unit));
    }

    vector<diagnostic> result = analyze(units, input.source_dir);
    result.insert(result.end(), markers.begin(), markers.end());
    return result;
}

}  // namespace hindsight
