#include "kernel/services/optimizer_service.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <sstream>
#include <unordered_set>

namespace oxp {

// --- CompiledPathCache ------------------------------------------------------

std::variant<CompiledPath, PatchFault> CompiledPathCache::get(const std::string& target) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = compiled_.find(target);
        if (it != compiled_.end()) {
            ++hits_;
            return it->second;
        }
    }
    ++misses_;
    auto compiled = path::compile(target);
    if (auto comp = std::get_if<CompiledPath>(&compiled)) {
        std::lock_guard<std::mutex> lock(mutex_);
        compiled_.emplace(target, *comp);
    }
    return compiled;
}

size_t CompiledPathCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compiled_.size();
}

void CompiledPathCache::reset_counters() {
    hits_ = 0;
    misses_ = 0;
}

void CompiledPathCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    compiled_.clear();
}

// --- ResultCache ------------------------------------------------------------

ResultCache::ResultCache(size_t capacity, std::chrono::seconds ttl, Clock clock)
    : capacity_(capacity), ttl_(ttl), clock_(std::move(clock)) {}

ResultCache::TimePoint ResultCache::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

std::optional<PatchResult> ResultCache::lookup(const std::string& key, std::uint64_t revision) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    const bool expired = now() - it->second.stored_at > ttl_;
    if (expired || it->second.revision != revision) {
        insertion_order_.erase(it->second.position);
        entries_.erase(it);
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second.result;
}

void ResultCache::store(const std::string& key, const PatchResult& result, std::uint64_t revision) {
    if (!result.success || capacity_ == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        insertion_order_.erase(it->second.position);
        entries_.erase(it);
    }
    insertion_order_.push_back(key);
    entries_.emplace(key, Entry{result, revision, now(), std::prev(insertion_order_.end())});
    while (entries_.size() > capacity_) {
        entries_.erase(insertion_order_.front());
        insertion_order_.pop_front();
        ++evictions_;
    }
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResultCache::reset_counters() {
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertion_order_.clear();
}

// --- PerformanceOptimizer ---------------------------------------------------

namespace {

// Relative cost of the operations that may be moved; barriers never move.
int operation_cost(const PatchOperation& op) {
    switch (op.kind()) {
        case PatchKind::Set:             return 0;
        case PatchKind::RelationshipAdd: return 0;
        case PatchKind::Merge:           return op.merge_strategy() == MergeStrategy::Update ? 1 : 2;
        case PatchKind::Insert:          return 2;
        case PatchKind::Extend:          return 2;
    }
    return 2;
}

bool is_barrier(const PatchOperation& op) {
    return op.kind() == PatchKind::Insert || op.kind() == PatchKind::Extend ||
           (op.kind() == PatchKind::Merge && op.merge_strategy() == MergeStrategy::Append);
}

bool merge_touches_attribute(const PatchOperation& merge, const std::string& name) {
    auto entries = merge.value().as_mapping();
    if (!entries) return true;
    for (const auto& kv : *entries) {
        if (kv.first.empty() || kv.first[0] != '@') continue;
        const std::string key = kv.first.substr(1);
        const auto colon = key.find(':');
        const std::string local = colon == std::string::npos ? key : key.substr(colon + 1);
        if (name == "*" || local == name) return true;
    }
    return false;
}

// Whether `later` may run before `earlier` without changing the resulting tree.
// Relationship adds never touch the tree. Otherwise only a Set of one attribute
// and an attribute-only Merge of other attributes commute, and only when
// neither path has predicates.
bool commutes(const PatchOperation& earlier, const PatchOperation& later) {
    if (earlier.kind() == PatchKind::RelationshipAdd || later.kind() == PatchKind::RelationshipAdd) return true;
    if (earlier.target() == later.target()) return false;

    const PatchOperation* set = nullptr;
    const PatchOperation* merge = nullptr;
    for (const PatchOperation* op : {&earlier, &later}) {
        if (op->kind() == PatchKind::Set) set = op;
        if (op->kind() == PatchKind::Merge && op->merge_strategy() == MergeStrategy::Update) merge = op;
    }
    if (!set || !merge) return false;
    if (set->target().find('[') != std::string::npos || merge->target().find('[') != std::string::npos) {
        return false;
    }
    if (merge->value().find("text")) return false;
    const std::string attr = path::attribute_step_name(set->target());
    if (attr.empty()) return false;
    return !merge_touches_attribute(*merge, attr);
}

} // namespace

PerformanceOptimizer::PerformanceOptimizer(OptimizerConfig config)
    : results_(config.cache_capacity, config.cache_ttl, std::move(config.clock)),
      paths_(std::make_shared<CompiledPathCache>()) {}

std::string PerformanceOptimizer::namespace_signature(const NamespaceMap& namespaces) {
    std::ostringstream os;
    for (const auto& kv : namespaces) os << kv.first << '=' << kv.second << ';';
    return os.str();
}

bool PerformanceOptimizer::cacheable(const PatchOperation& op) {
    switch (op.kind()) {
        case PatchKind::Set:             return true;
        case PatchKind::RelationshipAdd: return true;
        case PatchKind::Merge:           return op.merge_strategy() == MergeStrategy::Update;
        case PatchKind::Insert:          return false;
        case PatchKind::Extend:          return false;
    }
    return false;
}

std::string PerformanceOptimizer::cache_key(const PatchOperation& op, std::uint64_t document_id,
                                            const std::string& namespace_signature) {
    std::ostringstream os;
    os << to_string(op.kind()) << ':' << op.target() << ':' << std::hex << op.value().hash() << ':'
       << std::dec << document_id << ':' << std::hash<std::string>{}(namespace_signature);
    return os.str();
}

std::optional<PatchResult> PerformanceOptimizer::cached_result(const PatchOperation& op, const XmlDocument& doc,
                                                               const std::string& namespace_signature) {
    if (!cacheable(op)) return std::nullopt;
    return results_.lookup(cache_key(op, doc.id(), namespace_signature), doc.revision());
}

void PerformanceOptimizer::remember(const PatchOperation& op, const XmlDocument& doc,
                                    const std::string& namespace_signature, const PatchResult& result) {
    if (!cacheable(op) || !result.success) return;
    results_.store(cache_key(op, doc.id(), namespace_signature), result, doc.revision());
}

ExecutionPlan PerformanceOptimizer::plan(const std::vector<PatchOperation>& ops,
                                         const std::vector<NamespaceMap>& effective_namespaces,
                                         bool optimize_order) {
    ExecutionPlan plan;
    const size_t n = ops.size();
    plan.batch_of.assign(n, 0);

    std::map<std::string, size_t> batch_index;
    for (size_t i = 0; i < n; ++i) {
        std::string sig = i < effective_namespaces.size() ? namespace_signature(effective_namespaces[i]) : "";
        auto it = batch_index.find(sig);
        if (it == batch_index.end()) {
            it = batch_index.emplace(sig, plan.batches.size()).first;
            plan.batches.push_back(ExecutionBatch{sig, {}});
        }
        plan.batches[it->second].operations.push_back(i);
        plan.batch_of[i] = it->second;
    }

    plan.order.reserve(n);
    if (!optimize_order) {
        for (size_t i = 0; i < n; ++i) plan.order.push_back(i);
    } else {
        std::vector<size_t> segment;
        auto flush = [&]() {
            std::vector<size_t> arranged;
            for (size_t idx : segment) {
                size_t pos = arranged.size();
                while (pos > 0 && operation_cost(ops[arranged[pos - 1]]) > operation_cost(ops[idx]) &&
                       commutes(ops[arranged[pos - 1]], ops[idx])) {
                    --pos;
                }
                arranged.insert(arranged.begin() + static_cast<std::ptrdiff_t>(pos), idx);
            }
            plan.order.insert(plan.order.end(), arranged.begin(), arranged.end());
            segment.clear();
        };
        for (size_t i = 0; i < n; ++i) {
            if (is_barrier(ops[i])) {
                flush();
                plan.order.push_back(i);
            } else {
                segment.push_back(i);
            }
        }
        flush();
    }

    size_t moved = 0;
    for (size_t i = 0; i < plan.order.size(); ++i) {
        if (plan.order[i] != i) ++moved;
    }
    plan.reordered = moved > 0;

    ++plans_built_;
    batches_formed_ += plan.batches.size();
    for (const auto& b : plan.batches) {
        if (b.operations.size() > 1) batched_operations_ += b.operations.size();
    }
    if (plan.reordered) {
        ++reordered_plans_;
        reordered_operations_ += moved;
    }
    return plan;
}

size_t PerformanceOptimizer::precompile(const std::vector<PatchOperation>& ops) {
    std::unordered_set<std::string> seen;
    const std::uint64_t misses_before = paths_->misses();
    for (const auto& op : ops) {
        if (op.kind() == PatchKind::RelationshipAdd) continue;
        if (!seen.insert(op.target()).second) continue;
        paths_->get(op.target());
    }
    return static_cast<size_t>(paths_->misses() - misses_before);
}

OptimizerStats PerformanceOptimizer::stats() const {
    OptimizerStats s;
    s.cache_hits = results_.hits();
    s.cache_misses = results_.misses();
    const std::uint64_t lookups = s.cache_hits + s.cache_misses;
    s.cache_hit_rate = lookups ? static_cast<double>(s.cache_hits) / static_cast<double>(lookups) : 0.0;
    s.cached_results = results_.size();
    s.cache_evictions = results_.evictions();
    s.compiled_paths = paths_->size();
    s.path_cache_hits = paths_->hits();
    s.path_cache_misses = paths_->misses();
    s.plans_built = plans_built_.load();
    s.batches_formed = batches_formed_.load();
    s.batched_operations = batched_operations_.load();
    s.reordered_plans = reordered_plans_.load();
    s.reordered_operations = reordered_operations_.load();
    return s;
}

void PerformanceOptimizer::reset() {
    results_.reset_counters();
    paths_->reset_counters();
    plans_built_ = 0;
    batches_formed_ = 0;
    batched_operations_ = 0;
    reordered_plans_ = 0;
    reordered_operations_ = 0;
}

void PerformanceOptimizer::clear() {
    results_.clear();
    paths_->clear();
}

} // namespace oxp
