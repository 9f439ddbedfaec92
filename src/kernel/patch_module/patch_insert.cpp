#include "kernel/patch_handlers.hpp"

namespace oxp {
namespace handlers {

namespace {

bool link_node(xmlNodePtr target, xmlNodePtr node, InsertPosition position) {
    switch (position) {
        case InsertPosition::Append:
            return xmlAddChild(target, node) != nullptr;
        case InsertPosition::Prepend:
            if (target->children) return xmlAddPrevSibling(target->children, node) != nullptr;
            return xmlAddChild(target, node) != nullptr;
        case InsertPosition::Before:
            return xmlAddPrevSibling(target, node) != nullptr;
        case InsertPosition::After:
            return xmlAddNextSibling(target, node) != nullptr;
    }
    return false;
}

} // namespace

HandlerOutcome apply_insert(const PatchOperation& op, HandlerContext& ctx) {
    const PatchValue& value = op.value();
    if (value.as_list()) {
        return PatchFault{PatchErrc::TypeMismatch,
                          "Insert operation requires text, an XML fragment or a tag mapping, got list",
                          value.display_string()};
    }

    FragmentDoc fragment;
    if (auto f = value.as_fragment()) {
        auto parsed = parse_fragment(f->xml);
        if (auto fault = std::get_if<PatchFault>(&parsed)) return *fault;
        fragment = std::move(std::get<FragmentDoc>(parsed));
    }

    auto resolved = ctx.resolver.resolve(op.target(), ctx.scope);
    if (auto fault = std::get_if<PatchFault>(&resolved)) return *fault;
    const NodeSet& nodes = std::get<NodeSet>(resolved);
    if (nodes.empty()) return no_match(op);

    const bool sibling = op.position() == InsertPosition::Before || op.position() == InsertPosition::After;
    std::vector<std::string> warnings;
    std::vector<std::pair<xmlNodePtr, xmlNodePtr>> planned;  // target, new node
    DetachedNodes pending;

    // Build everything first so a bad mapping leaves the tree untouched.
    for (xmlNodePtr target : nodes) {
        if (target->type != XML_ELEMENT_NODE) {
            warnings.push_back("Skipped non-element match for insert");
            continue;
        }
        if (sibling && (!target->parent || target->parent->type != XML_ELEMENT_NODE)) {
            warnings.push_back(std::string("Cannot insert ") + to_string(op.position()) + " the root element");
            continue;
        }
        xmlNodePtr scope_node = sibling ? target->parent : target;
        auto built = build_element(value, "text", &fragment, scope_node, ctx);
        if (auto fault = std::get_if<PatchFault>(&built)) return *fault;
        xmlNodePtr node = std::get<xmlNodePtr>(built);
        pending.keep(node);
        planned.emplace_back(target, node);
    }
    pending.release_all();

    int affected = 0;
    for (auto& entry : planned) {
        if (link_node(entry.first, entry.second, op.position())) {
            xmlReconciliateNs(ctx.doc.get(), entry.second);
            ++affected;
        } else {
            xmlFreeNode(entry.second);
            warnings.push_back("Could not link new node at target");
        }
    }

    if (affected > 0) ctx.doc.touch();
    PatchResult result = PatchResult::succeeded(
        op, affected, "Inserted " + std::to_string(affected) + " element(s) (" + to_string(op.position()) + ")");
    if (affected == 0) {
        result.success = false;
        result.severity = ErrorSeverity::Warning;
        result.message = "No insertable targets for: " + op.target();
    }
    result.warnings = std::move(warnings);
    return result;
}

} // namespace handlers
} // namespace oxp
