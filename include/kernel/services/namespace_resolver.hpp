#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <libxml/xpath.h>

#include "oxp_types.hpp"
#include "xml_document.hpp"
#include "kernel/services/path_expression.hpp"

namespace oxp {

class CompiledPathCache;

struct NamespaceCollision {
  std::string prefix;
  std::string existing_uri;
  std::string incoming_uri;
  std::string alias;  // prefix now bound to the URI that lost the original prefix
};

/**
 * @brief prefix -> URI bindings for one resolution scope.
 *
 * bind() never overwrites a prefix that already maps to a different URI;
 * the incoming URI is parked on an alias (prefix_2, prefix_3, ...) and the
 * collision is recorded. bind_override() does the reverse: the incoming URI
 * takes the prefix and the displaced one moves to the alias.
 */
struct NamespaceContext {
  NamespaceMap bindings;
  std::vector<NamespaceCollision> collisions;
  std::uint64_t registrations = 0;

  std::string bind(const std::string& prefix, const std::string& uri);
  std::string bind_override(const std::string& prefix, const std::string& uri);
  std::string next_alias(const std::string& prefix) const;
  // Prefix currently bound to `uri`, or empty.
  std::string prefix_for(const std::string& uri) const;
};

struct NamespaceStats {
  std::uint64_t registrations = 0;
  std::uint64_t collisions = 0;
  std::uint64_t migrations = 0;
  std::uint64_t detections = 0;
  std::uint64_t resolutions = 0;
  std::uint64_t active_sessions = 0;
};

struct NamespaceInspection {
  std::string expression;
  NamespaceMap available_namespaces;
  std::vector<std::string> used_prefixes;
  std::vector<std::string> unresolved_prefixes;
  bool syntax_valid = false;
  int match_count = 0;
  std::string target_type;  // element | attribute | text | none
  std::vector<std::string> suggestions;
};

// One XPath evaluation context over a document with a fixed namespace map.
class ResolutionScope {
 public:
  ResolutionScope(const XmlDocument& doc, NamespaceMap namespaces);

  xmlXPathContextPtr context() const { return ctx_.get(); }
  const NamespaceMap& namespaces() const { return namespaces_; }
  const XmlDocument& document() const { return doc_; }

 private:
  struct FreeCtx {
    void operator()(xmlXPathContextPtr c) const { xmlXPathFreeContext(c); }
  };
  const XmlDocument& doc_;
  NamespaceMap namespaces_;
  std::unique_ptr<xmlXPathContext, FreeCtx> ctx_;
};

using NodeSet = std::vector<xmlNodePtr>;
using ResolveOutcome = std::variant<NodeSet, PatchFault>;

class NamespaceResolver {
 public:
  // Well-known OOXML prefixes; lowest precedence layer of every effective map.
  static const NamespaceMap& base_namespaces();
  // Loose prefix spellings ("drawing", "ppt", ...) -> canonical OOXML prefix.
  static const std::map<std::string, std::string>& prefix_aliases();

  void attach_path_cache(std::shared_ptr<CompiledPathCache> cache);

  NamespaceMap detect_document_namespaces(const XmlDocument& doc);

  // Session-scoped custom declarations. Returns the collisions this call caused.
  std::vector<NamespaceCollision> register_namespaces(const XmlDocument& doc, const NamespaceMap& namespaces);
  NamespaceContext session_context(const XmlDocument& doc);
  void release(const XmlDocument& doc);

  // base < document/session < inherited < overrides. Override collisions are
  // appended to `collisions` when given.
  NamespaceMap effective_namespaces(const XmlDocument& doc,
                                    const NamespaceMap& overrides,
                                    const NamespaceMap& inherited,
                                    std::vector<NamespaceCollision>* collisions = nullptr);

  // Zero matches is a successful, empty outcome.
  ResolveOutcome resolve(const std::string& target, const ResolutionScope& scope);

  NamespaceMap migrate_namespaces_for_format(const NamespaceMap& namespaces, const std::string& target_format);
  static NamespaceMap validate_namespace_uris(const NamespaceMap& namespaces);

  NamespaceInspection inspect(const XmlDocument& doc, const std::string& target);

  NamespaceStats stats() const;
  void reset_stats();

 private:
  NamespaceContext& session_locked(const XmlDocument& doc);

  mutable std::mutex mutex_;
  std::unordered_map<std::uint64_t, NamespaceContext> sessions_;
  // (prefix, incoming URI) override collisions already counted for a session.
  std::unordered_map<std::uint64_t, std::set<std::pair<std::string, std::string>>> counted_overrides_;
  std::shared_ptr<CompiledPathCache> path_cache_;

  std::atomic<std::uint64_t> registrations_{0};
  std::atomic<std::uint64_t> collisions_{0};
  std::atomic<std::uint64_t> migrations_{0};
  std::atomic<std::uint64_t> detections_{0};
  std::atomic<std::uint64_t> resolutions_{0};
};

}  // namespace oxp
