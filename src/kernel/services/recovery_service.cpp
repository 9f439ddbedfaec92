#include "kernel/services/recovery_service.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

#include "kernel/services/namespace_resolver.hpp"
#include "kernel/services/path_expression.hpp"

namespace oxp {

const char* to_string(FallbackKind kind) {
    switch (kind) {
        case FallbackKind::LocalNamePath:    return "local_name_path";
        case FallbackKind::FragmentRepair:   return "fragment_repair";
        case FallbackKind::TargetCorrection: return "target_correction";
        case FallbackKind::ValueCoercion:    return "value_coercion";
    }
    return "none";
}

namespace {

constexpr FallbackKind kBestEffortOrder[] = {
    FallbackKind::LocalNamePath,
    FallbackKind::FragmentRepair,
    FallbackKind::TargetCorrection,
    FallbackKind::ValueCoercion,
};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Adds xmlns declarations for prefixes the fragment uses but does not declare.
// Returns the fragment unchanged when nothing could be added.
std::string repair_fragment(const std::string& xml, const NamespaceMap& namespaces, std::vector<std::string>& added) {
    static const std::regex kQualified(R"((?:<|</|\s)([A-Za-z_][A-Za-z0-9_.\-]*):[A-Za-z_])");
    std::set<std::string> used;
    for (std::sregex_iterator it(xml.begin(), xml.end(), kQualified), end; it != end; ++it) {
        const std::string prefix = (*it)[1].str();
        if (prefix != "xmlns" && prefix != "xml") used.insert(prefix);
    }

    std::string decls;
    for (const auto& prefix : used) {
        if (xml.find("xmlns:" + prefix + "=") != std::string::npos) continue;
        auto uri = namespaces.find(prefix);
        if (uri == namespaces.end()) continue;
        decls += " xmlns:" + prefix + "=\"" + uri->second + "\"";
        added.push_back(prefix);
    }
    if (decls.empty()) return xml;

    size_t open = xml.find('<');
    while (open != std::string::npos && open + 1 < xml.size() && (xml[open + 1] == '?' || xml[open + 1] == '!')) {
        open = xml.find('<', open + 1);
    }
    if (open == std::string::npos) {
        added.clear();
        return xml;
    }
    size_t name_end = open + 1;
    while (name_end < xml.size() && !std::isspace(static_cast<unsigned char>(xml[name_end])) &&
           xml[name_end] != '>' && xml[name_end] != '/') {
        ++name_end;
    }
    std::string repaired = xml;
    repaired.insert(name_end, decls);
    return repaired;
}

std::optional<PatchValue> repair_value(const PatchValue& value, const NamespaceMap& namespaces,
                                       std::vector<std::string>& added) {
    if (auto f = value.as_fragment()) {
        std::string repaired = repair_fragment(f->xml, namespaces, added);
        if (added.empty()) return std::nullopt;
        return PatchValue::fragment(std::move(repaired));
    }
    if (auto l = value.as_list()) {
        PatchValue::List items;
        bool changed = false;
        for (const auto& item : *l) {
            if (auto f = item.as_fragment()) {
                const size_t before = added.size();
                items.push_back(PatchValue::fragment(repair_fragment(f->xml, namespaces, added)));
                changed = changed || added.size() > before;
            } else {
                items.push_back(item);
            }
        }
        if (!changed) return std::nullopt;
        return PatchValue::list(std::move(items));
    }
    return std::nullopt;
}

std::optional<PatchValue> coerce_value(const PatchValue& value) {
    if (auto l = value.as_list()) {
        std::string joined;
        for (const auto& item : *l) {
            auto s = item.scalar();
            if (!s) return std::nullopt;
            if (!joined.empty()) joined += " ";
            joined += *s;
        }
        return PatchValue::text(joined);
    }
    if (value.as_mapping()) {
        const PatchValue* text = value.find("text");
        if (!text || !text->scalar()) return std::nullopt;
        return PatchValue::text(*text->scalar());
    }
    return std::nullopt;
}

std::string correct_prefix(const std::string& prefix, const RecoveryContext& ctx) {
    const auto& aliases = NamespaceResolver::prefix_aliases();
    auto alias = aliases.find(lowercase(prefix));
    if (alias != aliases.end() && ctx.namespaces.count(alias->second)) return alias->second;
    for (const NamespaceMap* scope : {&ctx.document_namespaces, &ctx.namespaces}) {
        for (const auto& kv : *scope) {
            if (kv.first != prefix && lowercase(kv.first) == lowercase(prefix)) return kv.first;
        }
    }
    return {};
}

} // namespace

ErrorSeverity ErrorRecoveryService::severity_for(PatchErrc code) {
    switch (code) {
        case PatchErrc::FragmentSyntax:
        case PatchErrc::DocumentParse:
            return ErrorSeverity::Critical;
        case PatchErrc::Namespace:
        case PatchErrc::TargetNotFound:
            return ErrorSeverity::Warning;
        default:
            return ErrorSeverity::Error;
    }
}

std::optional<FallbackKind> ErrorRecoveryService::fallback_for(PatchErrc code) {
    switch (code) {
        case PatchErrc::PathSyntax:     return FallbackKind::LocalNamePath;
        case PatchErrc::FragmentSyntax: return FallbackKind::FragmentRepair;
        case PatchErrc::Namespace:      return FallbackKind::TargetCorrection;
        case PatchErrc::TypeMismatch:   return FallbackKind::ValueCoercion;
        default:                        return std::nullopt;
    }
}

ErrorRecoveryService::Attempt ErrorRecoveryService::run_fallback(FallbackKind kind, const PatchOperation& op,
                                                                 const RecoveryContext& ctx) {
    Attempt attempt;
    std::optional<PatchOperation> rewritten;

    switch (kind) {
        case FallbackKind::LocalNamePath: {
            const std::string local = path::to_local_name_form(op.target());
            if (local == op.target()) return attempt;
            rewritten = op.with_target(local);
            attempt.note = "retried with namespace-agnostic target '" + local + "'";
            break;
        }
        case FallbackKind::FragmentRepair: {
            std::vector<std::string> added;
            auto repaired = repair_value(op.value(), ctx.namespaces, added);
            if (!repaired) return attempt;
            rewritten = op.with_value(std::move(*repaired));
            std::string list;
            for (const auto& p : added) list += (list.empty() ? "" : ", ") + p;
            attempt.note = "added missing namespace declarations: " + list;
            break;
        }
        case FallbackKind::TargetCorrection: {
            std::string target = op.target();
            std::vector<std::string> unresolved;
            for (const auto& prefix : path::referenced_prefixes(op.target())) {
                if (ctx.namespaces.count(prefix)) continue;
                const std::string corrected = correct_prefix(prefix, ctx);
                if (corrected.empty()) {
                    unresolved.push_back(prefix);
                    continue;
                }
                target = path::replace_prefix(target, prefix, corrected);
            }
            if (!unresolved.empty()) {
                // No binding to correct to: drop namespaces from the whole target.
                std::string list;
                for (const auto& p : unresolved) list += (list.empty() ? "" : ", ") + p;
                const std::string local = path::to_local_name_form(op.target());
                if (local == op.target()) {
                    attempt.note = "undeclared prefix(es) " + list + " and no local-name() form";
                    return attempt;
                }
                rewritten = op.with_target(local);
                attempt.note = "undeclared prefix(es) " + list + "; retried with namespace-agnostic target '" +
                               local + "'";
                break;
            }
            if (target == op.target()) return attempt;
            rewritten = op.with_target(target);
            attempt.note = "retried with corrected target '" + target + "'";
            break;
        }
        case FallbackKind::ValueCoercion: {
            auto coerced = coerce_value(op.value());
            if (!coerced) return attempt;
            attempt.note = "coerced " + std::string(op.value().type_name()) + " value to text '" +
                           coerced->display_string() + "'";
            rewritten = op.with_value(std::move(*coerced));
            break;
        }
    }

    attempt.applicable = true;
    HandlerOutcome outcome = ctx.retry(*rewritten);
    if (auto result = std::get_if<PatchResult>(&outcome)) {
        if (result->success) {
            attempt.result = *result;
        } else {
            attempt.note += " but: " + result->message;
        }
    } else {
        attempt.note += " but: " + std::get<PatchFault>(outcome).message;
    }
    return attempt;
}

RecoveryOutcome ErrorRecoveryService::recover(const PatchFault& fault, const PatchOperation& op,
                                              RecoveryStrategy strategy, const RecoveryContext& ctx) {
    ++total_errors_;

    PatchResult failure = PatchResult::failed(op, severity_for(fault.code), fault.message);
    failure.exception_info = FaultInfo{fault.code, fault.message, fault.detail, ""};
    failure.recovery_strategy_used = to_string(strategy);

    auto recovered = [&](PatchResult result, FallbackKind kind, const std::string& note) {
        ++successful_recoveries_;
        result.kind = op.kind();
        result.target = op.target();
        result.severity = ErrorSeverity::Warning;
        result.recovery_attempted = true;
        result.fallback_applied = true;
        result.recovery_strategy_used = std::string(to_string(strategy)) + ":" + to_string(kind);
        result.exception_info = FaultInfo{fault.code, fault.message, fault.detail, ""};
        result.warnings.push_back("Recovered from " + std::string(errc_name(fault.code)) + ": " + fault.message);
        result.warnings.push_back(note);
        return RecoveryOutcome{std::move(result), false};
    };

    switch (strategy) {
        case RecoveryStrategy::FailFast:
            ++unrecoverable_errors_;
            return RecoveryOutcome{std::move(failure), true};

        case RecoveryStrategy::SkipFailed:
            return RecoveryOutcome{std::move(failure), false};

        case RecoveryStrategy::RetryWithFallback: {
            auto kind = fallback_for(fault.code);
            if (!kind) {
                failure.warnings.push_back(std::string("No fallback handler for ") + errc_name(fault.code));
                return RecoveryOutcome{std::move(failure), false};
            }
            ++recovery_attempts_;
            failure.recovery_attempted = true;
            Attempt attempt = run_fallback(*kind, op, ctx);
            if (attempt.result) return recovered(std::move(*attempt.result), *kind, attempt.note);
            failure.exception_info->recovery_error =
                attempt.note.empty() ? std::string(to_string(*kind)) + " not applicable" : attempt.note;
            return RecoveryOutcome{std::move(failure), false};
        }

        case RecoveryStrategy::BestEffort: {
            std::string last_error;
            for (FallbackKind kind : kBestEffortOrder) {
                Attempt attempt = run_fallback(kind, op, ctx);
                if (!attempt.applicable) {
                    if (!attempt.note.empty()) failure.warnings.push_back(attempt.note);
                    continue;
                }
                if (!failure.recovery_attempted) {
                    failure.recovery_attempted = true;
                    ++recovery_attempts_;
                }
                if (attempt.result) return recovered(std::move(*attempt.result), kind, attempt.note);
                last_error = attempt.note;
            }
            failure.exception_info->recovery_error =
                last_error.empty() ? "no applicable fallback handler" : last_error;
            return RecoveryOutcome{std::move(failure), false};
        }
    }
    return RecoveryOutcome{std::move(failure), false};
}

RecoveryStats ErrorRecoveryService::stats() const {
    RecoveryStats s;
    s.total_errors = total_errors_.load();
    s.recovery_attempts = recovery_attempts_.load();
    s.successful_recoveries = successful_recoveries_.load();
    s.unrecoverable_errors = unrecoverable_errors_.load();
    s.success_rate = s.recovery_attempts
                         ? static_cast<double>(s.successful_recoveries) / static_cast<double>(s.recovery_attempts)
                         : 0.0;
    return s;
}

void ErrorRecoveryService::reset_stats() {
    total_errors_ = 0;
    recovery_attempts_ = 0;
    successful_recoveries_ = 0;
    unrecoverable_errors_ = 0;
}

} // namespace oxp
