#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "oxp_types.hpp"
#include "patch_operation.hpp"
#include "kernel/patch_result.hpp"

namespace oxp {

using HandlerOutcome = std::variant<PatchResult, PatchFault>;

struct RecoveryContext {
  const NamespaceMap& namespaces;
  // Prefixes declared in the document itself, for case-insensitive correction.
  const NamespaceMap& document_namespaces;
  // Re-runs the real handler for a rewritten operation.
  std::function<HandlerOutcome(const PatchOperation&)> retry;
};

struct RecoveryOutcome {
  PatchResult result;
  bool halt = false;  // FailFast: caller must stop processing the queue
};

struct RecoveryStats {
  std::uint64_t total_errors = 0;
  std::uint64_t recovery_attempts = 0;
  std::uint64_t successful_recoveries = 0;
  std::uint64_t unrecoverable_errors = 0;
  double success_rate = 0.0;
};

enum class FallbackKind { LocalNamePath, FragmentRepair, TargetCorrection, ValueCoercion };

OOXPATCH_API const char* to_string(FallbackKind kind);

class ErrorRecoveryService {
 public:
  static ErrorSeverity severity_for(PatchErrc code);
  // Fallback used by RetryWithFallback for a fault category, if any.
  static std::optional<FallbackKind> fallback_for(PatchErrc code);

  RecoveryOutcome recover(const PatchFault& fault, const PatchOperation& op,
                          RecoveryStrategy strategy, const RecoveryContext& ctx);

  RecoveryStats stats() const;
  void reset_stats();

 private:
  struct Attempt {
    bool applicable = false;
    std::optional<PatchResult> result;  // set when the retried handler succeeded
    std::string note;                   // rewritten target/value or failure reason
  };

  Attempt run_fallback(FallbackKind kind, const PatchOperation& op, const RecoveryContext& ctx);

  std::atomic<std::uint64_t> total_errors_{0};
  std::atomic<std::uint64_t> recovery_attempts_{0};
  std::atomic<std::uint64_t> successful_recoveries_{0};
  std::atomic<std::uint64_t> unrecoverable_errors_{0};
};

}  // namespace oxp
