#pragma once
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

#include "oxp_types.hpp"
#include "patch_value.hpp"

namespace oxp {

enum class PatchKind { Set, Insert, Extend, Merge, RelationshipAdd };
enum class InsertPosition { Append, Prepend, Before, After };
enum class MergeStrategy { Update, Append };

OOXPATCH_API const char* to_string(PatchKind kind);
OOXPATCH_API const char* to_string(InsertPosition position);
OOXPATCH_API const char* to_string(MergeStrategy strategy);

// Accepts the descriptor spellings ("set", "relsAdd", "relationship_add", ...).
OOXPATCH_API std::optional<PatchKind> parse_patch_kind(const std::string& name);
OOXPATCH_API std::optional<InsertPosition> parse_insert_position(const std::string& name);
OOXPATCH_API std::optional<MergeStrategy> parse_merge_strategy(const std::string& name);

/**
 * @brief One validated, immutable patch instruction.
 *
 * Instances only come out of create() or from_descriptor(); both throw
 * PatchError(PatchErrc::Validation) for malformed input, so a PatchOperation
 * that exists is always well formed.
 */
class OOXPATCH_API PatchOperation {
public:
    struct Options {
        InsertPosition position = InsertPosition::Append;
        MergeStrategy merge_strategy = MergeStrategy::Update;
        NamespaceMap namespace_overrides;
        bool inherit_namespaces = false;
    };

    static PatchOperation create(PatchKind kind, std::string target, PatchValue value);
    static PatchOperation create(PatchKind kind, std::string target, PatchValue value, Options options);
    static PatchOperation from_descriptor(const YAML::Node& descriptor);

    PatchKind kind() const { return kind_; }
    const std::string& target() const { return target_; }
    const PatchValue& value() const { return value_; }
    InsertPosition position() const { return options_.position; }
    MergeStrategy merge_strategy() const { return options_.merge_strategy; }
    const NamespaceMap& namespace_overrides() const { return options_.namespace_overrides; }
    bool inherit_namespaces() const { return options_.inherit_namespaces; }

    PatchOperation with_target(std::string target) const;
    PatchOperation with_value(PatchValue value) const;

    YAML::Node to_descriptor() const;

private:
    PatchOperation(PatchKind kind, std::string target, PatchValue value, Options options);

    PatchKind kind_;
    std::string target_;
    PatchValue value_;
    Options options_;
};

} // namespace oxp
