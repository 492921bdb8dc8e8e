#include "analysis/clang_ast.hpp"
#include <fmt/core.h>
#include <map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace hindsight {
using namespace std;
using json = nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace {

/**
 * @brief 按文档顺序还原增量编码的位置信息
 */
struct location_tracker {
    optional<source_location> bare(const json &loc) {
        if (!loc.is_object()) return nullopt;
        auto file_it = loc.find("file");
        if (file_it != loc.end()) last_file = file_it->get<string>();
        auto line_it = loc.find("line");
        if (line_it != loc.end()) last_line = line_it->get<int>();

        // 无效位置输出为空对象
        auto col_it = loc.find("col");
        if (col_it == loc.end() || last_file.empty()) return nullopt;
        return source_location{last_file, last_line, col_it->get<int>()};
    }

    optional<source_location> update(const json &loc) {
        if (!loc.is_object()) return nullopt;
        if (!loc.contains("spellingLoc") && !loc.contains("expansionLoc"))
            return bare(loc);

        // 宏展开时依次输出拼写位置和展开位置，两者都会更新增量编码的状态
        optional<source_location> result;
        for (auto it = loc.begin(); it != loc.end(); ++it) {
            if (it.key() == "spellingLoc") {
                auto spelling = bare(it.value());
                if (!result) result = spelling;
            } else if (it.key() == "expansionLoc") {
                auto expansion = bare(it.value());
                if (expansion) result = expansion;
            }
        }
        return result;
    }

private:
    string last_file;
    int last_line = 0;
};

struct ast_loader {
    explicit ast_loader(const fs::path &source_dir) : source_dir(source_dir) {}

    bool is_user_file(const string &file) {
        auto it = user_files.find(file);
        if (it != user_files.end()) return it->second;
        return user_files[file] = is_under_directory(file, source_dir);
    }

    /**
     * @param out 为 nullptr 时只更新位置信息，不保存节点
     * @param top_level 顶层声明不在用户代码中时丢弃
     * @return 节点是否被保留
     */
    bool walk(const json &j, ast_node *out, bool top_level) {
        if (!j.is_object())
            throw analysis_parse_error("AST node is not an object");

        for (auto it = j.begin(); it != j.end(); ++it) {
            const string &key = it.key();
            const json &value = it.value();

            if (key == "loc") {
                auto location = tracker.update(value);
                if (out) {
                    out->location = location;
                    if (top_level && (!location || !is_user_file(location->file)))
                        out = nullptr;
                }
            } else if (key == "range") {
                if (!value.is_object()) continue;
                for (auto r = value.begin(); r != value.end(); ++r) {
                    auto location = tracker.update(r.value());
                    // 表达式没有 loc，使用范围的起点
                    if (out && !out->location && r.key() == "begin")
                        out->location = location;
                }
            } else if (key == "inner") {
                if (!value.is_array())
                    throw analysis_parse_error("AST node children is not an array");
                for (const json &child : value) {
                    if (out) {
                        ast_node node;
                        walk(child, &node, false);
                        out->children.push_back(move(node));
                    } else {
                        walk(child, nullptr, false);
                    }
                }
            } else if (out) {
                read_field(*out, key, value);
            }
        }
        return out != nullptr;
    }

    static void read_field(ast_node &node, const string &key, const json &value) {
        if (key == "id") {
            node.id = value.get<string>();
        } else if (key == "kind") {
            node.kind = value.get<string>();
        } else if (key == "name") {
            node.name = value.get<string>();
        } else if (key == "type") {
            node.type = value.value("qualType", "");
            node.desugared_type = value.value("desugaredQualType", "");
        } else if (key == "referencedDecl") {
            node.referenced_id = value.value("id", "");
            node.referenced_name = value.value("name", "");
            node.referenced_kind = value.value("kind", "");
        } else if (key == "referencedMemberDecl") {
            node.referenced_id = value.get<string>();
        } else if (key == "previousDecl") {
            node.previous_decl = value.get<string>();
        } else if (key == "mangledName") {
            node.mangled_name = value.get<string>();
        } else if (key == "storageClass") {
            node.storage_class = value.get<string>();
        } else if (key == "isImplicit") {
            node.implicit = value.get<bool>();
        } else if (key == "virtual") {
            node.is_virtual = value.get<bool>();
        } else if (key == "completeDefinition") {
            node.complete_definition = value.get<bool>();
        } else if (key == "definitionData") {
            // definitionData 中的标记只在为真时输出
            node.complete_definition = true;
            node.is_pod = value.contains("isPOD");
        }
    }

    fs::path source_dir;
    location_tracker tracker;
    map<string, bool> user_files;
};

}  // namespace

ast_node load_clang_ast(const json &doc, const fs::path &source_dir) {
    try {
        if (!doc.is_object() || doc.value("kind", "") != "TranslationUnitDecl")
            throw analysis_parse_error("AST root is not a TranslationUnitDecl");

        ast_loader loader(source_dir);
        ast_node root;
        root.id = doc.value("id", "");
        root.kind = "TranslationUnitDecl";

        auto inner = doc.find("inner");
        if (inner == doc.end()) return root;
        if (!inner->is_array())
            throw analysis_parse_error("AST node children is not an array");

        for (const json &child : *inner) {
            ast_node node;
            if (loader.walk(child, &node, true))
                root.children.push_back(move(node));
        }
        return root;
    } catch (json::exception &ex) {
        throw analysis_parse_error(fmt::format("unexpected clang AST structure: {}", ex.what()));
    }
}

ast_node parse_clang_ast(istream &is, const fs::path &source_dir) {
    json doc;
    try {
        doc = json::parse(is);
    } catch (json::exception &ex) {
        throw analysis_parse_error(fmt::format("malformed clang AST: {}", ex.what()));
    }
    return load_clang_ast(doc, source_dir);
}

void check_rejected_arguments(const string &tool, const string &output) {
    static const char *patterns[] = {
        "error: unknown argument",
        "error: unsupported option",
        "error: invalid value",
        "error: invalid argument"};

    for (const char *pattern : patterns) {
        size_t pos = output.find(pattern);
        if (pos == string::npos) continue;
        size_t end = output.find('\n', pos);
        throw configuration_error(fmt::format("compiler arguments rejected by {}: {}", tool,
                                              output.substr(pos, end == string::npos ? string::npos : end - pos)));
    }
}

}  // namespace hindsight
