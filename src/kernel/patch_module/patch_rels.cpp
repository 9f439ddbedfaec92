#include "kernel/patch_handlers.hpp"

namespace oxp {
namespace handlers {

// Relationship parts (.rels) live outside the XML part being patched, so the
// operation only checks that the descriptor is well formed.
HandlerOutcome apply_relationship_add(const PatchOperation& op, HandlerContext& /*ctx*/) {
    if (!op.value().as_mapping()) return type_mismatch(op, "a mapping");

    std::string missing;
    for (const char* key : {"Id", "Type", "Target"}) {
        const PatchValue* v = op.value().find(key);
        if (!v || !v->scalar() || v->scalar()->empty()) {
            missing += (missing.empty() ? "" : ", ") + std::string(key);
        }
    }
    if (!missing.empty()) {
        PatchResult r = PatchResult::failed(op, ErrorSeverity::Error,
                                            "relsAdd requires Id, Type and Target (missing: " + missing + ")");
        r.exception_info = FaultInfo{PatchErrc::Validation, r.message, missing, ""};
        return r;
    }

    if (const PatchValue* mode = op.value().find("TargetMode")) {
        const auto s = mode->scalar();
        if (!s || (*s != "Internal" && *s != "External")) {
            PatchResult r = PatchResult::failed(op, ErrorSeverity::Error,
                                                "relsAdd TargetMode must be Internal or External");
            r.exception_info = FaultInfo{PatchErrc::Validation, r.message, mode->display_string(), ""};
            return r;
        }
    }

    const std::string id = *op.value().find("Id")->scalar();
    PatchResult result = PatchResult::succeeded(
        op, 0, "Relationship " + id + " validated; relationship parts are not modified by the patch engine");
    result.severity = ErrorSeverity::Info;
    return result;
}

} // namespace handlers
} // namespace oxp
