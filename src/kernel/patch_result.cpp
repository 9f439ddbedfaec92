#include "kernel/patch_result.hpp"

namespace oxp {

const char* to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Info:     return "info";
        case ErrorSeverity::Warning:  return "warning";
        case ErrorSeverity::Error:    return "error";
        case ErrorSeverity::Critical: return "critical";
    }
    return "error";
}

const char* to_string(RecoveryStrategy strategy) {
    switch (strategy) {
        case RecoveryStrategy::FailFast:          return "fail_fast";
        case RecoveryStrategy::SkipFailed:        return "skip_failed";
        case RecoveryStrategy::RetryWithFallback: return "retry_with_fallback";
        case RecoveryStrategy::BestEffort:        return "best_effort";
    }
    return "best_effort";
}

std::optional<RecoveryStrategy> parse_recovery_strategy(const std::string& name) {
    if (name == "fail_fast") return RecoveryStrategy::FailFast;
    if (name == "skip_failed") return RecoveryStrategy::SkipFailed;
    if (name == "retry_with_fallback") return RecoveryStrategy::RetryWithFallback;
    if (name == "best_effort") return RecoveryStrategy::BestEffort;
    return std::nullopt;
}

PatchResult PatchResult::succeeded(const PatchOperation& op, int affected, std::string message) {
    PatchResult r;
    r.success = true;
    r.kind = op.kind();
    r.target = op.target();
    r.message = std::move(message);
    r.affected_elements = affected;
    r.severity = ErrorSeverity::Info;
    return r;
}

PatchResult PatchResult::failed(const PatchOperation& op, ErrorSeverity severity, std::string message) {
    PatchResult r;
    r.success = false;
    r.kind = op.kind();
    r.target = op.target();
    r.message = std::move(message);
    r.severity = severity;
    return r;
}

void to_json(nlohmann::json& j, const FaultInfo& info) {
    j = nlohmann::json{
        {"code", errc_name(info.code)},
        {"message", info.message},
    };
    if (!info.detail.empty()) j["detail"] = info.detail;
    if (!info.recovery_error.empty()) j["recovery_error"] = info.recovery_error;
}

void to_json(nlohmann::json& j, const PatchResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"operation", to_string(result.kind)},
        {"target", result.target},
        {"message", result.message},
        {"affected_elements", result.affected_elements},
        {"severity", to_string(result.severity)},
        {"recovery_attempted", result.recovery_attempted},
        {"recovery_strategy_used", result.recovery_strategy_used},
        {"fallback_applied", result.fallback_applied},
        {"affected_files", result.affected_files},
        {"warnings", result.warnings},
    };
    if (result.exception_info) {
        j["exception_info"] = *result.exception_info;
    } else {
        j["exception_info"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const ProcessingContext& context) {
    j = nlohmann::json{
        {"file", context.file_identity},
        {"document_kind", document_kind_name(context.document_kind)},
        {"operation_count", context.operation_count},
        {"errors", context.errors},
        {"warnings", context.warnings},
    };
}

} // namespace oxp
