#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "oxp_types.hpp"
#include "patch_operation.hpp"
#include "xml_document.hpp"
#include "kernel/patch_result.hpp"
#include "kernel/services/path_expression.hpp"

namespace oxp {

// Compiled XPath expressions keyed by the raw target string. Shared by every
// document the owning optimizer sees; failed compilations are not stored.
class CompiledPathCache {
 public:
  std::variant<CompiledPath, PatchFault> get(const std::string& target);

  size_t size() const;
  std::uint64_t hits() const { return hits_.load(); }
  std::uint64_t misses() const { return misses_.load(); }
  void reset_counters();
  void clear();

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, CompiledPath> compiled_;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
};

/**
 * @brief Successful results of idempotent operations.
 *
 * Each entry remembers the document revision observed right after the
 * operation ran; a lookup only hits if the document has not been mutated
 * since. Entries older than the TTL are dropped on lookup and the oldest
 * entries are evicted once the cache grows past its capacity.
 */
class ResultCache {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Clock = std::function<TimePoint()>;

  ResultCache(size_t capacity, std::chrono::seconds ttl, Clock clock = {});

  std::optional<PatchResult> lookup(const std::string& key, std::uint64_t revision);
  void store(const std::string& key, const PatchResult& result, std::uint64_t revision);

  size_t size() const;
  size_t capacity() const { return capacity_; }
  std::uint64_t hits() const { return hits_.load(); }
  std::uint64_t misses() const { return misses_.load(); }
  std::uint64_t evictions() const { return evictions_.load(); }
  void reset_counters();
  void clear();

 private:
  struct Entry {
    PatchResult result;
    std::uint64_t revision;
    TimePoint stored_at;
    std::list<std::string>::iterator position;
  };

  TimePoint now() const;

  size_t capacity_;
  std::chrono::seconds ttl_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::list<std::string> insertion_order_;  // oldest first
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> evictions_{0};
};

struct ExecutionBatch {
  std::string namespace_signature;
  std::vector<size_t> operations;  // submission indices
};

struct ExecutionPlan {
  std::vector<size_t> order;     // execution order of submission indices
  std::vector<ExecutionBatch> batches;
  std::vector<size_t> batch_of;  // submission index -> batch index
  bool reordered = false;
};

struct OptimizerStats {
  std::uint64_t cache_hits = 0;
  std::uint64_t cache_misses = 0;
  double cache_hit_rate = 0.0;
  std::uint64_t cached_results = 0;
  std::uint64_t cache_evictions = 0;
  std::uint64_t compiled_paths = 0;
  std::uint64_t path_cache_hits = 0;
  std::uint64_t path_cache_misses = 0;
  std::uint64_t plans_built = 0;
  std::uint64_t batches_formed = 0;
  std::uint64_t batched_operations = 0;
  std::uint64_t reordered_plans = 0;
  std::uint64_t reordered_operations = 0;
};

struct OptimizerConfig {
  size_t cache_capacity = 1000;
  std::chrono::seconds cache_ttl{300};
  ResultCache::Clock clock;
};

class PerformanceOptimizer {
 public:
  explicit PerformanceOptimizer(OptimizerConfig config = {});

  static std::string namespace_signature(const NamespaceMap& namespaces);
  static bool cacheable(const PatchOperation& op);
  static std::string cache_key(const PatchOperation& op, std::uint64_t document_id,
                               const std::string& namespace_signature);

  std::optional<PatchResult> cached_result(const PatchOperation& op, const XmlDocument& doc,
                                           const std::string& namespace_signature);
  void remember(const PatchOperation& op, const XmlDocument& doc,
                const std::string& namespace_signature, const PatchResult& result);

  // Namespace-signature batches plus an execution order. With optimize_order
  // the order is a constrained stable reorder; results must still be reported
  // in submission order by the caller.
  ExecutionPlan plan(const std::vector<PatchOperation>& ops,
                     const std::vector<NamespaceMap>& effective_namespaces,
                     bool optimize_order);

  // Compiles every distinct target up front. Returns the number compiled now.
  size_t precompile(const std::vector<PatchOperation>& ops);

  ResultCache& results() { return results_; }
  const std::shared_ptr<CompiledPathCache>& paths() const { return paths_; }

  OptimizerStats stats() const;
  void reset();
  void clear();

 private:
  ResultCache results_;
  std::shared_ptr<CompiledPathCache> paths_;
  std::atomic<std::uint64_t> plans_built_{0};
  std::atomic<std::uint64_t> batches_formed_{0};
  std::atomic<std::uint64_t> batched_operations_{0};
  std::atomic<std::uint64_t> reordered_plans_{0};
  std::atomic<std::uint64_t> reordered_operations_{0};
};

}  // namespace oxp
