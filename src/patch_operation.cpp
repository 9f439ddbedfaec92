#include "patch_operation.hpp"

#include <algorithm>
#include <cctype>

namespace oxp {

const char* to_string(PatchKind kind) {
    switch (kind) {
        case PatchKind::Set:             return "set";
        case PatchKind::Insert:          return "insert";
        case PatchKind::Extend:          return "extend";
        case PatchKind::Merge:           return "merge";
        case PatchKind::RelationshipAdd: return "relsAdd";
    }
    return "unknown";
}

const char* to_string(InsertPosition position) {
    switch (position) {
        case InsertPosition::Append:  return "append";
        case InsertPosition::Prepend: return "prepend";
        case InsertPosition::Before:  return "before";
        case InsertPosition::After:   return "after";
    }
    return "append";
}

const char* to_string(MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::Update: return "update";
        case MergeStrategy::Append: return "append";
    }
    return "update";
}

std::optional<PatchKind> parse_patch_kind(const std::string& name) {
    if (name == "set") return PatchKind::Set;
    if (name == "insert") return PatchKind::Insert;
    if (name == "extend") return PatchKind::Extend;
    if (name == "merge") return PatchKind::Merge;
    if (name == "relsAdd" || name == "relationship_add" || name == "rels_add") {
        return PatchKind::RelationshipAdd;
    }
    return std::nullopt;
}

std::optional<InsertPosition> parse_insert_position(const std::string& name) {
    if (name == "append") return InsertPosition::Append;
    if (name == "prepend") return InsertPosition::Prepend;
    if (name == "before") return InsertPosition::Before;
    if (name == "after") return InsertPosition::After;
    return std::nullopt;
}

std::optional<MergeStrategy> parse_merge_strategy(const std::string& name) {
    if (name == "update") return MergeStrategy::Update;
    if (name == "append") return MergeStrategy::Append;
    return std::nullopt;
}

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string scalar_field(const YAML::Node& descriptor, const char* key) {
    const YAML::Node n = descriptor[key];
    if (!n.IsScalar()) {
        throw PatchError(PatchErrc::Validation,
                         std::string("Field '") + key + "' must be a string");
    }
    return n.Scalar();
}

} // namespace

PatchOperation::PatchOperation(PatchKind kind, std::string target, PatchValue value, Options options)
    : kind_(kind), target_(std::move(target)), value_(std::move(value)), options_(std::move(options)) {}

PatchOperation PatchOperation::create(PatchKind kind, std::string target, PatchValue value) {
    return create(kind, std::move(target), std::move(value), Options{});
}

PatchOperation PatchOperation::create(PatchKind kind, std::string target, PatchValue value, Options options) {
    if (target.empty() || is_blank(target)) {
        throw PatchError(PatchErrc::Validation, "Patch target must be a non-empty path expression");
    }
    return PatchOperation(kind, std::move(target), std::move(value), std::move(options));
}

PatchOperation PatchOperation::from_descriptor(const YAML::Node& descriptor) {
    if (!descriptor || !descriptor.IsMap()) {
        throw PatchError(PatchErrc::Validation, "Patch descriptor must be a mapping");
    }

    const char* kind_key = descriptor["operation"] ? "operation" : "kind";
    std::vector<std::string> missing;
    if (!descriptor[kind_key] || descriptor[kind_key].IsNull()) missing.push_back("operation");
    if (!descriptor["target"] || descriptor["target"].IsNull()) missing.push_back("target");
    if (!descriptor["value"] || descriptor["value"].IsNull()) missing.push_back("value");
    if (!missing.empty()) {
        std::string joined;
        for (const auto& m : missing) joined += (joined.empty() ? "" : ", ") + m;
        throw PatchError(PatchErrc::Validation, "Patch descriptor missing required field(s): " + joined);
    }

    const std::string kind_name = scalar_field(descriptor, kind_key);
    auto kind = parse_patch_kind(kind_name);
    if (!kind) {
        throw PatchError(PatchErrc::Validation, "Unsupported operation: " + kind_name);
    }

    Options options;
    if (descriptor["position"] && !descriptor["position"].IsNull()) {
        const std::string pos = scalar_field(descriptor, "position");
        auto parsed = parse_insert_position(pos);
        if (!parsed) {
            throw PatchError(PatchErrc::Validation,
                             "Invalid position '" + pos + "'. Valid: append, prepend, before, after");
        }
        options.position = *parsed;
    }
    if (descriptor["merge_strategy"] && !descriptor["merge_strategy"].IsNull()) {
        const std::string ms = scalar_field(descriptor, "merge_strategy");
        auto parsed = parse_merge_strategy(ms);
        if (!parsed) {
            throw PatchError(PatchErrc::Validation,
                             "Invalid merge_strategy '" + ms + "'. Valid: update, append");
        }
        options.merge_strategy = *parsed;
    }
    if (const YAML::Node ns = descriptor["namespaces"]) {
        if (!ns.IsNull()) {
            if (!ns.IsMap()) {
                throw PatchError(PatchErrc::Validation, "Field 'namespaces' must be a prefix -> URI mapping");
            }
            try {
                for (const auto& kv : ns) {
                    options.namespace_overrides[kv.first.as<std::string>()] = kv.second.as<std::string>();
                }
            } catch (const YAML::Exception& e) {
                throw PatchError(PatchErrc::Validation,
                                 std::string("Field 'namespaces' holds a non-string entry: ") + e.what());
            }
        }
    }
    if (const YAML::Node inherit = descriptor["inherit_namespaces"]) {
        try {
            options.inherit_namespaces = inherit.as<bool>();
        } catch (const YAML::BadConversion&) {
            throw PatchError(PatchErrc::Validation, "Field 'inherit_namespaces' must be a boolean");
        }
    }

    return create(*kind, scalar_field(descriptor, "target"),
                  PatchValue::from_yaml(descriptor["value"]), std::move(options));
}

PatchOperation PatchOperation::with_target(std::string target) const {
    return create(kind_, std::move(target), value_, options_);
}

PatchOperation PatchOperation::with_value(PatchValue value) const {
    return PatchOperation(kind_, target_, std::move(value), options_);
}

YAML::Node PatchOperation::to_descriptor() const {
    YAML::Node d;
    d["operation"] = to_string(kind_);
    d["target"] = target_;
    d["value"] = value_.to_yaml();
    if (kind_ == PatchKind::Insert) d["position"] = to_string(options_.position);
    if (kind_ == PatchKind::Merge) d["merge_strategy"] = to_string(options_.merge_strategy);
    if (!options_.namespace_overrides.empty()) {
        for (const auto& kv : options_.namespace_overrides) d["namespaces"][kv.first] = kv.second;
    }
    if (options_.inherit_namespaces) d["inherit_namespaces"] = true;
    return d;
}

} // namespace oxp
