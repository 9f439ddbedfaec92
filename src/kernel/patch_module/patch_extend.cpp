#include "kernel/patch_handlers.hpp"

namespace oxp {
namespace handlers {

HandlerOutcome apply_extend(const PatchOperation& op, HandlerContext& ctx) {
    const PatchValue::List* items = op.value().as_list();
    if (!items) return type_mismatch(op, "a list");

    std::vector<FragmentDoc> fragments(items->size());
    for (size_t i = 0; i < items->size(); ++i) {
        if (auto f = (*items)[i].as_fragment()) {
            auto parsed = parse_fragment(f->xml);
            if (auto fault = std::get_if<PatchFault>(&parsed)) {
                PatchFault item_fault = *fault;
                item_fault.message = "List item " + std::to_string(i) + ": " + item_fault.message;
                return item_fault;
            }
            fragments[i] = std::move(std::get<FragmentDoc>(parsed));
        }
    }

    auto resolved = ctx.resolver.resolve(op.target(), ctx.scope);
    if (auto fault = std::get_if<PatchFault>(&resolved)) return *fault;
    const NodeSet& nodes = std::get<NodeSet>(resolved);
    if (nodes.empty()) return no_match(op);

    std::vector<std::string> warnings;
    std::vector<std::pair<xmlNodePtr, xmlNodePtr>> planned;
    DetachedNodes pending;
    int targets = 0;
    for (xmlNodePtr target : nodes) {
        if (target->type != XML_ELEMENT_NODE) {
            warnings.push_back("Skipped non-element match for extend");
            continue;
        }
        ++targets;
        for (size_t i = 0; i < items->size(); ++i) {
            auto built = build_element((*items)[i], "item", &fragments[i], target, ctx);
            if (auto fault = std::get_if<PatchFault>(&built)) return *fault;
            xmlNodePtr node = std::get<xmlNodePtr>(built);
            pending.keep(node);
            planned.emplace_back(target, node);
        }
    }
    pending.release_all();

    int affected = 0;
    for (auto& entry : planned) {
        if (xmlAddChild(entry.first, entry.second)) {
            xmlReconciliateNs(ctx.doc.get(), entry.second);
            ++affected;
        } else {
            xmlFreeNode(entry.second);
        }
    }

    if (affected > 0) ctx.doc.touch();
    PatchResult result = PatchResult::succeeded(
        op, affected,
        "Extended " + std::to_string(targets) + " element(s) with " + std::to_string(items->size()) + " item(s)");
    if (targets == 0) {
        result.success = false;
        result.severity = ErrorSeverity::Warning;
        result.message = "No element targets for: " + op.target();
    }
    result.warnings = std::move(warnings);
    return result;
}

} // namespace handlers
} // namespace oxp
