#include "patch_file.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>

#include "kernel/param_utils.hpp"
#include "kernel/services/path_expression.hpp"

namespace oxp {

namespace {

bool has_operation(const YAML::Node& node) {
    return node.IsMap() && (node["operation"] || node["kind"]);
}

bool is_set(const YAML::Node& node, const char* key) {
    return node[key] && !node[key].IsNull();
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) out += (out.empty() ? "" : ", ") + s;
    return out;
}

YAML::Node substitute(const YAML::Node& node,
                      const std::map<std::string, std::string>& variables,
                      std::vector<ParseIssue>& warnings) {
    static const std::regex kVariable(R"(\$\{([^}]+)\})");
    switch (node.Type()) {
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            if (text.find("${") == std::string::npos) return node;
            std::string out;
            auto begin = std::sregex_iterator(text.begin(), text.end(), kVariable);
            size_t last = 0;
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const std::smatch& m = *it;
                out.append(text, last, static_cast<size_t>(m.position(0)) - last);
                auto var = variables.find(m[1].str());
                if (var != variables.end()) {
                    out += var->second;
                } else {
                    warnings.push_back({"Undefined variable: ${" + m[1].str() + "}", false});
                    out += m[0].str();
                }
                last = static_cast<size_t>(m.position(0) + m.length(0));
            }
            out.append(text, last, std::string::npos);
            return YAML::Node(out);
        }
        case YAML::NodeType::Sequence: {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : node) seq.push_back(substitute(item, variables, warnings));
            return seq;
        }
        case YAML::NodeType::Map: {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& kv : node) map[kv.first.Scalar()] = substitute(kv.second, variables, warnings);
            return map;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return node;
}

} // namespace

const char* to_string(ValidationLevel level) {
    switch (level) {
        case ValidationLevel::Strict: return "strict";
        case ValidationLevel::Lenient: return "lenient";
        case ValidationLevel::Permissive: return "permissive";
    }
    return "lenient";
}

std::optional<ValidationLevel> parse_validation_level(const std::string& name) {
    if (name == "strict") return ValidationLevel::Strict;
    if (name == "lenient") return ValidationLevel::Lenient;
    if (name == "permissive") return ValidationLevel::Permissive;
    return std::nullopt;
}

PatchFileParser::PatchFileParser(ValidationLevel level) : level_(level) {}

const std::vector<std::string>& PatchFileParser::supported_formats() {
    static const std::vector<std::string> kFormats = {"potx", "dotx", "xltx", "pptx", "docx", "xlsx"};
    return kFormats;
}

PatchFileResult PatchFileParser::parse_file(const fs::path& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        PatchFileResult result;
        result.source_name = path.string();
        result.errors.push_back({"File not found: " + path.string(), true});
        return result;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        PatchFileResult result;
        result.source_name = path.string();
        result.errors.push_back({"Failed to read file: " + path.string(), true});
        return result;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_content(buffer.str(), path.string());
}

PatchFileResult PatchFileParser::parse_content(const std::string& content, const std::string& source_name) const {
    PatchFileResult result;
    result.source_name = source_name;

    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::ParserException& e) {
        result.errors.push_back({"YAML syntax error: " + e.msg + " (line " + std::to_string(e.mark.line + 1) +
                                     ", column " + std::to_string(e.mark.column + 1) + ")",
                                 true});
        return result;
    }
    if (!root || root.IsNull() || root.IsScalar()) {
        result.errors.push_back({"Empty or invalid YAML content", true});
        return result;
    }

    result.metadata = extract_metadata(root, result);
    std::vector<YAML::Node> patches = extract_patches(root, result);

    std::vector<bool> buildable(patches.size(), false);
    for (size_t i = 0; i < patches.size(); ++i) {
        buildable[i] = validate_patch(patches[i], i + 1, result);
    }

    for (size_t i = 0; i < patches.size(); ++i) {
        if (!buildable[i]) continue;
        YAML::Node descriptor = result.metadata.variables.empty()
                                    ? patches[i]
                                    : substitute(patches[i], result.metadata.variables, result.warnings);
        try {
            result.operations.push_back(PatchOperation::from_descriptor(descriptor));
        } catch (const PatchError& e) {
            result.errors.push_back({"Patch " + std::to_string(i + 1) + ": " + e.what(), false});
        }
    }

    result.success = determine_success(result);
    return result;
}

PatchMetadata PatchFileParser::extract_metadata(const YAML::Node& root, PatchFileResult& result) const {
    PatchMetadata meta;
    if (!root.IsMap()) return meta;
    meta.version = as_str(root, "version");
    meta.description = as_str(root, "description");
    meta.author = as_str(root, "author");
    meta.target_formats = as_str_list(root, "target_formats");
    meta.dependencies = as_str_list(root, "dependencies");

    const YAML::Node vars = root["variables"];
    if (vars && vars.IsMap()) {
        for (const auto& kv : vars) {
            if (!kv.second.IsScalar()) {
                result.warnings.push_back({"Variable '" + kv.first.Scalar() + "' is not a scalar and was ignored", false});
                continue;
            }
            meta.variables[kv.first.Scalar()] = kv.second.Scalar();
        }
    } else if (vars && !vars.IsNull()) {
        result.warnings.push_back({"Field 'variables' must be a mapping", false});
    }

    std::vector<std::string> unsupported;
    const auto& formats = supported_formats();
    for (const auto& f : meta.target_formats) {
        if (std::find(formats.begin(), formats.end(), f) == formats.end()) unsupported.push_back(f);
    }
    if (!unsupported.empty()) {
        result.warnings.push_back({"Unsupported target formats: " + join(unsupported) + ". Supported: " + join(formats),
                                   false});
    }
    return meta;
}

std::vector<YAML::Node> PatchFileParser::extract_patches(const YAML::Node& root, PatchFileResult& result) const {
    // Node assignment writes through to the referenced node; never reassign.
    std::vector<YAML::Node> items;
    auto take = [&items](const YAML::Node& data) {
        if (data.IsMap()) {
            items.push_back(data);
            return true;
        }
        if (data.IsSequence()) {
            for (const auto& item : data) items.push_back(item);
            return true;
        }
        return false;
    };

    bool shaped = true;
    if (root.IsSequence()) {
        take(root);
    } else if (root["patches"]) {
        shaped = take(root["patches"]);
    } else if (root["operations"]) {
        shaped = take(root["operations"]);
    } else if (has_operation(root)) {
        items.push_back(root);
    } else {
        for (const auto& kv : root) {
            const YAML::Node v = kv.second;
            if (has_operation(v)) {
                items.push_back(v);
            } else if (v.IsSequence() && v.size() > 0 &&
                       std::all_of(v.begin(), v.end(), [](const YAML::Node& item) { return has_operation(item); })) {
                take(v);
            }
        }
        if (items.empty()) {
            result.errors.push_back({"No patch operations found in YAML file", true});
            return {};
        }
    }
    if (!shaped) {
        result.errors.push_back({"Patches must be a list or single operation", true});
        return {};
    }

    std::vector<YAML::Node> patches;
    for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i].IsMap()) {
            result.errors.push_back({"Patch " + std::to_string(i + 1) + " must be a mapping", false});
            continue;
        }
        patches.push_back(items[i]);
    }
    return patches;
}

bool PatchFileParser::validate_patch(const YAML::Node& patch, size_t number, PatchFileResult& result) const {
    const std::string prefix = "Patch " + std::to_string(number) + ": ";
    const size_t errors_before = result.errors.size();

    const char* kind_key = patch["operation"] ? "operation" : "kind";
    if (!is_set(patch, kind_key)) {
        result.errors.push_back({prefix + "Missing required 'operation' field", true});
        return false;
    }
    const std::string op_name = as_str(patch, kind_key);
    auto kind = parse_patch_kind(op_name);
    if (!kind) {
        result.errors.push_back(
            {prefix + "Unsupported operation '" + op_name + "'. Supported: set, insert, extend, merge, relsAdd", true});
        return false;
    }

    for (const char* field : {"target", "value"}) {
        if (!is_set(patch, field)) {
            result.errors.push_back(
                {prefix + "Missing required field '" + field + "' for operation '" + op_name + "'", true});
        }
    }

    if (is_set(patch, "target")) {
        const YAML::Node target = patch["target"];
        if (!target.IsScalar()) {
            result.errors.push_back({prefix + "Target must be a string path expression", false});
        } else if (target.Scalar().find_first_not_of(" \t\r\n") == std::string::npos) {
            result.errors.push_back({prefix + "Target cannot be empty", false});
        }
    }

    const YAML::Node value = patch["value"];
    switch (*kind) {
        case PatchKind::Insert:
            if (is_set(patch, "position") && !parse_insert_position(as_str(patch, "position"))) {
                result.errors.push_back({prefix + "Invalid insert position '" + as_str(patch, "position") +
                                             "'. Valid: append, prepend, before, after",
                                         false});
            }
            break;
        case PatchKind::Extend:
            if (value && !value.IsNull() && !value.IsSequence()) {
                result.warnings.push_back({prefix + "Extend operation should have a list value", false});
            }
            break;
        case PatchKind::Merge:
            if (value && !value.IsNull() && !value.IsMap()) {
                result.warnings.push_back({prefix + "Merge operation should have a mapping value", false});
            }
            break;
        case PatchKind::RelationshipAdd:
            if (value && value.IsMap()) {
                std::vector<std::string> missing;
                for (const char* f : {"Id", "Type", "Target"}) {
                    if (!value[f]) missing.push_back(f);
                }
                if (!missing.empty()) {
                    result.errors.push_back({prefix + "relsAdd operation missing fields: " + join(missing), false});
                }
            }
            break;
        case PatchKind::Set:
            break;
    }

    return result.errors.size() == errors_before;
}

bool PatchFileParser::determine_success(const PatchFileResult& result) const {
    switch (level_) {
        case ValidationLevel::Strict:
            return result.errors.empty() && result.warnings.empty();
        case ValidationLevel::Lenient:
            return result.errors.empty();
        case ValidationLevel::Permissive:
            return std::none_of(result.errors.begin(), result.errors.end(),
                                [](const ParseIssue& e) { return e.critical; });
    }
    return result.errors.empty();
}

std::vector<ParseIssue> PatchFileParser::validate_targets(const PatchFileResult& result) const {
    std::vector<ParseIssue> issues;
    for (size_t i = 0; i < result.operations.size(); ++i) {
        const PatchOperation& op = result.operations[i];
        if (op.kind() == PatchKind::RelationshipAdd) continue;
        auto compiled = path::compile(op.target());
        if (auto fault = std::get_if<PatchFault>(&compiled)) {
            issues.push_back({"Patch " + std::to_string(i + 1) + ": " + fault->message, true});
        }
    }
    return issues;
}

} // namespace oxp
