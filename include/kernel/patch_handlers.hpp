#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <libxml/tree.h>

#include "patch_operation.hpp"
#include "xml_document.hpp"
#include "kernel/patch_result.hpp"
#include "kernel/services/namespace_resolver.hpp"
#include "kernel/services/recovery_service.hpp"

namespace oxp {

struct HandlerContext {
    XmlDocument& doc;
    const ResolutionScope& scope;
    NamespaceResolver& resolver;
};

namespace handlers {

HandlerOutcome apply_set(const PatchOperation& op, HandlerContext& ctx);
HandlerOutcome apply_insert(const PatchOperation& op, HandlerContext& ctx);
HandlerOutcome apply_extend(const PatchOperation& op, HandlerContext& ctx);
HandlerOutcome apply_merge(const PatchOperation& op, HandlerContext& ctx);
// Validates the relationship descriptor only; never touches the tree.
HandlerOutcome apply_relationship_add(const PatchOperation& op, HandlerContext& ctx);

HandlerOutcome dispatch(const PatchOperation& op, HandlerContext& ctx);

// ---- shared helpers (patch_common.cpp) ----

struct FreeDoc {
    void operator()(xmlDocPtr d) const { xmlFreeDoc(d); }
};
using FragmentDoc = std::unique_ptr<xmlDoc, FreeDoc>;

// Nodes unlinked during one handler call. Freed when the handler returns so
// that pointers still held in the resolved node set stay valid until then.
class DetachedNodes {
public:
    DetachedNodes() = default;
    DetachedNodes(const DetachedNodes&) = delete;
    DetachedNodes& operator=(const DetachedNodes&) = delete;
    ~DetachedNodes();

    void keep(xmlNodePtr node) { nodes_.push_back(node); }
    // Stops tracking nodes that have been linked into the tree.
    void release_all() { nodes_.clear(); }

private:
    std::vector<xmlNodePtr> nodes_;
};

PatchResult no_match(const PatchOperation& op);
PatchResult type_mismatch(const PatchOperation& op, const std::string& expected);

std::variant<FragmentDoc, PatchFault> parse_fragment(const std::string& xml);

// Builds an unlinked element owned by `doc`. `scope_node` is where the element
// will live, for in-scope prefix lookup.
std::variant<xmlNodePtr, PatchFault> build_element(const PatchValue& value,
                                                   const std::string& default_tag,
                                                   const FragmentDoc* fragment,
                                                   xmlNodePtr scope_node,
                                                   HandlerContext& ctx);

// Namespace for a prefixed name on `owner`: declarations in scope at `owner`
// or `scope_node` first, then the effective map (declared on `owner`).
// Returns nullptr if the prefix is unknown everywhere.
xmlNsPtr namespace_for(const std::string& prefix, xmlNodePtr owner, xmlNodePtr scope_node, HandlerContext& ctx);

std::string leading_text(xmlNodePtr element);
void set_leading_text(xmlNodePtr element, const std::string& text, DetachedNodes& detached);

std::pair<std::string, std::string> split_qname(const std::string& name);

} // namespace handlers
} // namespace oxp
