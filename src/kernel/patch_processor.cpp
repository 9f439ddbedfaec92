#include "kernel/patch_processor.hpp"

#include <chrono>
#include <iostream>
#include <optional>

#include "kernel/patch_handlers.hpp"

namespace oxp {

namespace {

const char kPresentationMain[] = "http://schemas.openxmlformats.org/presentationml/2006/main";
const char kWordMain[] = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

bool is_named(xmlNodePtr node, const char* ns_uri, const char* local) {
    if (!node || node->type != XML_ELEMENT_NODE || !node->ns || !node->ns->href) return false;
    return xmlStrEqual(node->name, reinterpret_cast<const xmlChar*>(local)) &&
           xmlStrEqual(node->ns->href, reinterpret_cast<const xmlChar*>(ns_uri));
}

xmlNodePtr find_descendant(xmlNodePtr node, const char* ns_uri, const char* local) {
    for (xmlNodePtr child = node ? node->children : nullptr; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        if (is_named(child, ns_uri, local)) return child;
        if (xmlNodePtr hit = find_descendant(child, ns_uri, local)) return hit;
    }
    return nullptr;
}

xmlNodePtr find_child(xmlNodePtr node, const char* ns_uri, const char* local) {
    for (xmlNodePtr child = node ? node->children : nullptr; child; child = child->next) {
        if (is_named(child, ns_uri, local)) return child;
    }
    return nullptr;
}

// Drops the resolver session even if a handler throws.
class SessionGuard {
public:
    SessionGuard(NamespaceResolver& resolver, const XmlDocument& doc) : resolver_(resolver), doc_(doc) {}
    ~SessionGuard() { resolver_.release(doc_); }
    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

private:
    NamespaceResolver& resolver_;
    const XmlDocument& doc_;
};

std::string describe(const NamespaceCollision& c) {
    return "Namespace prefix '" + c.prefix + "' already bound to '" + c.existing_uri + "'; '" +
           c.incoming_uri + "' is reachable as '" + c.alias + "'";
}

} // namespace

PatchProcessor::PatchProcessor(ProcessorOptions options, std::shared_ptr<PerformanceOptimizer> optimizer)
    : options_(options), optimizer_(std::move(optimizer)) {
    if (!optimizer_) optimizer_ = std::make_shared<PerformanceOptimizer>();
    resolver_.attach_path_cache(optimizer_->paths());
}

void PatchProcessor::warn(const std::string& message) const {
    if (!options_.quiet) std::cerr << "Warning: " << message << std::endl;
}

std::vector<PatchResult> PatchProcessor::process(XmlDocument& doc,
                                                 const std::vector<PatchOperation>& operations,
                                                 const NamespaceMap& namespaces,
                                                 ProcessingContext* run) {
    if (!doc.root()) {
        throw PatchError(PatchErrc::DocumentParse, "Document has no root element: " + doc.source_name());
    }
    ProcessingContext context;
    context.file_identity = doc.source_name();
    context.document_kind = doc.kind();

    const size_t n = operations.size();
    if (n == 0) {
        if (run) *run = std::move(context);
        return {};
    }

    SessionGuard session(resolver_, doc);
    for (const auto& c : resolver_.register_namespaces(doc, namespaces)) {
        context.warnings.push_back(describe(c));
        warn(context.warnings.back());
    }
    const size_t run_level_warnings = context.warnings.size();

    // Effective namespace map per operation; inheriting operations see every
    // override declared by the operations submitted before them.
    std::vector<NamespaceMap> effective;
    std::vector<std::vector<std::string>> op_warnings(n);
    effective.reserve(n);
    NamespaceMap declared;
    for (size_t i = 0; i < n; ++i) {
        const PatchOperation& op = operations[i];
        std::vector<NamespaceCollision> collisions;
        static const NamespaceMap kNone;
        effective.push_back(resolver_.effective_namespaces(doc, op.namespace_overrides(),
                                                           op.inherit_namespaces() ? declared : kNone,
                                                           &collisions));
        for (const auto& c : collisions) op_warnings[i].push_back(describe(c));
        for (const auto& kv : op.namespace_overrides()) declared[kv.first] = kv.second;
    }

    const bool fail_fast = options_.recovery == RecoveryStrategy::FailFast;
    ExecutionPlan plan = optimizer_->plan(operations, effective, options_.optimize_order && !fail_fast);
    if (options_.enable_batching) optimizer_->precompile(operations);

    const NamespaceMap document_namespaces = resolver_.detect_document_namespaces(doc);

    std::vector<std::unique_ptr<ResolutionScope>> batch_scopes(plan.batches.size());
    auto scope_for = [&](size_t index) -> std::unique_ptr<ResolutionScope>& {
        return batch_scopes[plan.batch_of[index]];
    };

    std::vector<std::optional<PatchResult>> results(n);
    for (size_t index : plan.order) {
        const PatchOperation& op = operations[index];
        const auto started = std::chrono::steady_clock::now();
        const std::string& signature = plan.batches[plan.batch_of[index]].namespace_signature;

        std::unique_ptr<ResolutionScope> own_scope;
        std::unique_ptr<ResolutionScope>& scope_slot = options_.enable_batching ? scope_for(index) : own_scope;
        if (!scope_slot) scope_slot = std::make_unique<ResolutionScope>(doc, effective[index]);
        const ResolutionScope& scope = *scope_slot;

        std::string source = "handler";
        bool halt = false;
        std::optional<PatchResult> result;
        if (options_.enable_result_cache) {
            result = optimizer_->cached_result(op, doc, signature);
            if (result) source = "cache";
        }

        if (!result) {
            HandlerContext hctx{doc, scope, resolver_};
            HandlerOutcome outcome;
            try {
                outcome = handlers::dispatch(op, hctx);
            } catch (const PatchError& e) {
                outcome = PatchFault{e.code(), e.what(), op.target()};
            }

            if (auto fault = std::get_if<PatchFault>(&outcome)) {
                RecoveryContext rctx{scope.namespaces(), document_namespaces,
                                     [&](const PatchOperation& rewritten) -> HandlerOutcome {
                                         return handlers::dispatch(rewritten, hctx);
                                     }};
                RecoveryOutcome recovered = recovery_.recover(*fault, op, options_.recovery, rctx);
                halt = recovered.halt;
                result = std::move(recovered.result);
                source = result->success ? "recovery" : "failed";
            } else {
                result = std::move(std::get<PatchResult>(outcome));
                if (!result->success) source = "failed";
            }

            if (options_.enable_result_cache) optimizer_->remember(op, doc, signature, *result);
        }

        for (const auto& w : op_warnings[index]) {
            result->warnings.push_back(w);
            context.warnings.push_back(w);
        }

        ++processed_;
        ++context.operation_count;
        if (result->success) {
            ++applied_;
            elements_modified_ += static_cast<std::uint64_t>(result->affected_elements);
            if (result->affected_elements > 0 && result->affected_files.empty()) {
                result->affected_files.push_back(context.file_identity);
            }
        } else {
            ++errors_;
            context.errors.push_back("Operation " + std::to_string(index) + " (" + to_string(op.kind()) + " " +
                                     op.target() + ") failed: " + result->message);
            warn(context.errors.back());
        }

        const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        events_.push(index, to_string(op.kind()), op.target(), source, ms);

        const bool failed = !result->success;
        results[index] = std::move(result);
        if (fail_fast && (halt || failed)) break;
    }

    std::vector<PatchResult> ordered;
    ordered.reserve(n);
    for (auto& r : results) {
        if (!r) continue;
        ordered.push_back(std::move(*r));
    }
    if (!ordered.empty() && run_level_warnings > 0) {
        auto& first = ordered.front().warnings;
        first.insert(first.begin(), context.warnings.begin(),
                     context.warnings.begin() + static_cast<std::ptrdiff_t>(run_level_warnings));
    }
    if (run) *run = std::move(context);
    return ordered;
}

PatchResult PatchProcessor::apply(XmlDocument& doc, const PatchOperation& operation, const NamespaceMap& namespaces) {
    std::vector<PatchResult> results = process(doc, {operation}, namespaces);
    return std::move(results.front());
}

std::string PatchProcessor::process_xml(const std::string& xml,
                                        const std::vector<PatchOperation>& operations,
                                        const NamespaceMap& namespaces,
                                        std::vector<PatchResult>* results,
                                        bool pretty) {
    XmlDocument doc = XmlDocument::parse(xml);
    std::vector<PatchResult> out = process(doc, operations, namespaces);
    if (results) *results = std::move(out);
    return doc.to_string(pretty);
}

IntegrityReport PatchProcessor::validate_integrity(const XmlDocument& doc) const {
    IntegrityReport report;
    xmlNodePtr root = doc.root();
    if (!root) {
        report.valid = false;
        report.issues.push_back("Document has no root element");
        return report;
    }

    std::string error;
    xmlDocPtr reparsed = parse_xml_memory(doc.to_string(), doc.source_name(), error);
    if (!reparsed) {
        report.issues.push_back("Serialized document is not well formed: " + error);
    } else {
        xmlFreeDoc(reparsed);
    }

    switch (doc.kind()) {
        case DocumentKind::Presentation:
            if (xmlNodePtr csld = find_descendant(root, kPresentationMain, "cSld")) {
                if (!find_descendant(csld, kPresentationMain, "spTree")) {
                    report.issues.push_back("p:cSld is missing p:spTree");
                }
            }
            break;
        case DocumentKind::Word:
            if (is_named(root, kWordMain, "document") && !find_child(root, kWordMain, "body")) {
                report.issues.push_back("w:document is missing w:body");
            }
            break;
        case DocumentKind::Spreadsheet:
        case DocumentKind::Drawing:
        case DocumentKind::Relationships:
        case DocumentKind::Unknown:
            break;
    }

    report.valid = report.issues.empty();
    return report;
}

ProcessorStats PatchProcessor::stats() const {
    ProcessorStats s;
    s.operations_processed = processed_.load();
    s.operations_applied = applied_.load();
    s.errors_encountered = errors_.load();
    s.elements_modified = elements_modified_.load();
    if (s.operations_processed) {
        s.success_rate = static_cast<double>(s.operations_applied) / static_cast<double>(s.operations_processed);
        s.error_rate = static_cast<double>(s.errors_encountered) / static_cast<double>(s.operations_processed);
    }
    s.optimizer = optimizer_->stats();
    s.namespaces = resolver_.stats();
    s.recovery = recovery_.stats();
    return s;
}

void PatchProcessor::reset_stats() {
    processed_ = 0;
    applied_ = 0;
    errors_ = 0;
    elements_modified_ = 0;
    optimizer_->reset();
    resolver_.reset_stats();
    recovery_.reset_stats();
}

void to_json(nlohmann::json& j, const OptimizerStats& s) {
    j = nlohmann::json{
        {"cache_hits", s.cache_hits},
        {"cache_misses", s.cache_misses},
        {"cache_hit_rate", s.cache_hit_rate},
        {"cached_results", s.cached_results},
        {"cache_evictions", s.cache_evictions},
        {"compiled_paths", s.compiled_paths},
        {"path_cache_hits", s.path_cache_hits},
        {"path_cache_misses", s.path_cache_misses},
        {"plans_built", s.plans_built},
        {"batches_formed", s.batches_formed},
        {"batched_operations", s.batched_operations},
        {"reordered_plans", s.reordered_plans},
        {"reordered_operations", s.reordered_operations},
    };
}

void to_json(nlohmann::json& j, const NamespaceStats& s) {
    j = nlohmann::json{
        {"registrations", s.registrations},
        {"collisions", s.collisions},
        {"migrations", s.migrations},
        {"detections", s.detections},
        {"resolutions", s.resolutions},
        {"active_sessions", s.active_sessions},
    };
}

void to_json(nlohmann::json& j, const RecoveryStats& s) {
    j = nlohmann::json{
        {"total_errors", s.total_errors},
        {"recovery_attempts", s.recovery_attempts},
        {"successful_recoveries", s.successful_recoveries},
        {"unrecoverable_errors", s.unrecoverable_errors},
        {"success_rate", s.success_rate},
    };
}

void to_json(nlohmann::json& j, const ProcessorStats& s) {
    j = nlohmann::json{
        {"operations_processed", s.operations_processed},
        {"operations_applied", s.operations_applied},
        {"errors_encountered", s.errors_encountered},
        {"elements_modified", s.elements_modified},
        {"success_rate", s.success_rate},
        {"error_rate", s.error_rate},
        {"optimizer", s.optimizer},
        {"namespaces", s.namespaces},
        {"recovery", s.recovery},
    };
}

} // namespace oxp
