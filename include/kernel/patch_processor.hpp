#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "oxp_types.hpp"
#include "patch_operation.hpp"
#include "xml_document.hpp"
#include "kernel/patch_result.hpp"
#include "kernel/services/namespace_resolver.hpp"
#include "kernel/services/optimizer_service.hpp"
#include "kernel/services/patch_event_service.hpp"
#include "kernel/services/recovery_service.hpp"

namespace oxp {

struct ProcessorOptions {
    RecoveryStrategy recovery = RecoveryStrategy::RetryWithFallback;
    bool enable_result_cache = true;
    bool optimize_order = true;
    bool enable_batching = true;
    bool quiet = false;
};

struct ProcessorStats {
    std::uint64_t operations_processed = 0;
    std::uint64_t operations_applied = 0;
    std::uint64_t errors_encountered = 0;
    std::uint64_t elements_modified = 0;
    double success_rate = 0.0;
    double error_rate = 0.0;
    OptimizerStats optimizer;
    NamespaceStats namespaces;
    RecoveryStats recovery;
};

struct IntegrityReport {
    bool valid = true;
    std::vector<std::string> issues;
};

/**
 * @brief Applies ordered patch operations to one XML part at a time.
 *
 * process() yields exactly one result per operation, in submission order,
 * unless FailFast stops the run early. A single bad operation never throws;
 * only a document that cannot be parsed does.
 *
 * The optimizer may be shared between processors. Everything else the
 * processor owns is synchronized, so one instance can serve several
 * documents concurrently as long as each document is only in one call.
 */
class OOXPATCH_API PatchProcessor {
public:
    explicit PatchProcessor(ProcessorOptions options = {},
                            std::shared_ptr<PerformanceOptimizer> optimizer = nullptr);

    // `run`, when given, receives the run's ProcessingContext once it ends.
    std::vector<PatchResult> process(XmlDocument& doc,
                                     const std::vector<PatchOperation>& operations,
                                     const NamespaceMap& namespaces = {},
                                     ProcessingContext* run = nullptr);

    PatchResult apply(XmlDocument& doc, const PatchOperation& operation,
                      const NamespaceMap& namespaces = {});

    // Parse, patch, serialize. Throws PatchError(DocumentParse) for bad input.
    std::string process_xml(const std::string& xml,
                            const std::vector<PatchOperation>& operations,
                            const NamespaceMap& namespaces = {},
                            std::vector<PatchResult>* results = nullptr,
                            bool pretty = false);

    IntegrityReport validate_integrity(const XmlDocument& doc) const;

    ProcessorStats stats() const;
    void reset_stats();

    std::vector<PatchEventService::PatchEvent> drain_events() { return events_.drain(); }

    const ProcessorOptions& options() const { return options_; }
    void set_quiet(bool q) { options_.quiet = q; }
    bool is_quiet() const { return options_.quiet; }

    PerformanceOptimizer& optimizer() { return *optimizer_; }
    NamespaceResolver& resolver() { return resolver_; }
    ErrorRecoveryService& recovery() { return recovery_; }

private:
    void warn(const std::string& message) const;

    ProcessorOptions options_;
    std::shared_ptr<PerformanceOptimizer> optimizer_;
    NamespaceResolver resolver_;
    ErrorRecoveryService recovery_;
    PatchEventService events_;

    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> applied_{0};
    std::atomic<std::uint64_t> errors_{0};
    std::atomic<std::uint64_t> elements_modified_{0};
};

OOXPATCH_API void to_json(nlohmann::json& j, const OptimizerStats& s);
OOXPATCH_API void to_json(nlohmann::json& j, const NamespaceStats& s);
OOXPATCH_API void to_json(nlohmann::json& j, const RecoveryStats& s);
OOXPATCH_API void to_json(nlohmann::json& j, const ProcessorStats& s);

} // namespace oxp
