#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "oxp_types.hpp"
#include "patch_operation.hpp"

namespace oxp {

enum class ValidationLevel {
    Strict,      // any error or warning fails the file
    Lenient,     // errors fail, warnings do not
    Permissive,  // only syntax, missing-field and unsupported-operation errors fail
};

OOXPATCH_API const char* to_string(ValidationLevel level);
OOXPATCH_API std::optional<ValidationLevel> parse_validation_level(const std::string& name);

struct ParseIssue {
    std::string message;
    bool critical = false;
};

struct PatchMetadata {
    std::string version;
    std::string description;
    std::string author;
    std::vector<std::string> target_formats;
    std::vector<std::string> dependencies;
    std::map<std::string, std::string> variables;
};

struct PatchFileResult {
    bool success = false;
    std::string source_name;
    std::vector<PatchOperation> operations;
    PatchMetadata metadata;
    std::vector<ParseIssue> errors;
    std::vector<ParseIssue> warnings;
};

/**
 * @brief Loads declarative YAML patch files.
 *
 * Operations are looked up under `patches`, `operations`, a root-level
 * single operation, or any root key holding one operation or a list of
 * them. `${name}` references are replaced with metadata variables before
 * the descriptors are turned into PatchOperation objects. Never throws for
 * bad input; every problem lands in the result's errors or warnings.
 */
class OOXPATCH_API PatchFileParser {
public:
    explicit PatchFileParser(ValidationLevel level = ValidationLevel::Lenient);

    PatchFileResult parse_file(const fs::path& path) const;
    PatchFileResult parse_content(const std::string& content, const std::string& source_name = "<string>") const;

    // Compiles every target; returns one error per malformed expression.
    std::vector<ParseIssue> validate_targets(const PatchFileResult& result) const;

    ValidationLevel level() const { return level_; }
    static const std::vector<std::string>& supported_formats();

private:
    PatchMetadata extract_metadata(const YAML::Node& root, PatchFileResult& result) const;
    std::vector<YAML::Node> extract_patches(const YAML::Node& root, PatchFileResult& result) const;
    // Returns false when the descriptor has errors and must not be built.
    bool validate_patch(const YAML::Node& patch, size_t number, PatchFileResult& result) const;
    bool determine_success(const PatchFileResult& result) const;

    ValidationLevel level_;
};

} // namespace oxp
