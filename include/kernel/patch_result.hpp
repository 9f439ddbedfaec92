#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "oxp_types.hpp"
#include "patch_operation.hpp"

namespace oxp {

enum class ErrorSeverity { Info = 0, Warning = 1, Error = 2, Critical = 3 };

enum class RecoveryStrategy { FailFast, SkipFailed, RetryWithFallback, BestEffort };

OOXPATCH_API const char* to_string(ErrorSeverity severity);
OOXPATCH_API const char* to_string(RecoveryStrategy strategy);
OOXPATCH_API std::optional<RecoveryStrategy> parse_recovery_strategy(const std::string& name);

// Structured description of the fault behind an unsuccessful (or recovered) result.
struct FaultInfo {
    PatchErrc code = PatchErrc::Unknown;
    std::string message;
    std::string detail;
    std::string recovery_error;
};

struct PatchResult {
    bool success = false;
    PatchKind kind = PatchKind::Set;
    std::string target;
    std::string message;
    int affected_elements = 0;
    ErrorSeverity severity = ErrorSeverity::Info;
    bool recovery_attempted = false;
    std::string recovery_strategy_used;
    bool fallback_applied = false;
    std::optional<FaultInfo> exception_info;
    std::vector<std::string> affected_files;
    std::vector<std::string> warnings;

    static PatchResult succeeded(const PatchOperation& op, int affected, std::string message);
    static PatchResult failed(const PatchOperation& op, ErrorSeverity severity, std::string message);
};

// Per-run accumulator; lives for the duration of one process() call.
struct ProcessingContext {
    std::string file_identity;
    DocumentKind document_kind = DocumentKind::Unknown;
    int operation_count = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

OOXPATCH_API void to_json(nlohmann::json& j, const FaultInfo& info);
OOXPATCH_API void to_json(nlohmann::json& j, const PatchResult& result);
OOXPATCH_API void to_json(nlohmann::json& j, const ProcessingContext& context);

} // namespace oxp
