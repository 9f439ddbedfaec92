#include "kernel/patch_handlers.hpp"

namespace oxp {
namespace handlers {

HandlerOutcome apply_set(const PatchOperation& op, HandlerContext& ctx) {
    auto text = op.value().scalar();
    if (!text) {
        return PatchFault{PatchErrc::TypeMismatch,
                          std::string("Set operation requires a text value, got ") + op.value().type_name(),
                          op.value().display_string()};
    }

    auto resolved = ctx.resolver.resolve(op.target(), ctx.scope);
    if (auto fault = std::get_if<PatchFault>(&resolved)) return *fault;
    const NodeSet& nodes = std::get<NodeSet>(resolved);
    if (nodes.empty()) return no_match(op);

    const xmlChar* value = reinterpret_cast<const xmlChar*>(text->c_str());
    DetachedNodes detached;
    int affected = 0;
    for (xmlNodePtr node : nodes) {
        switch (node->type) {
            case XML_ATTRIBUTE_NODE: {
                xmlAttrPtr attr = reinterpret_cast<xmlAttrPtr>(node);
                xmlSetNsProp(attr->parent, attr->ns, attr->name, value);
                ++affected;
                break;
            }
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
            case XML_COMMENT_NODE:
            case XML_PI_NODE:
                xmlNodeSetContent(node, value);
                ++affected;
                break;
            case XML_ELEMENT_NODE:
                set_leading_text(node, *text, detached);
                ++affected;
                break;
            default:
                break;
        }
    }

    if (affected > 0) ctx.doc.touch();
    PatchResult result = PatchResult::succeeded(op, affected, "Set " + std::to_string(affected) + " node(s)");
    if (affected < static_cast<int>(nodes.size())) {
        result.warnings.push_back(std::to_string(nodes.size() - static_cast<size_t>(affected)) +
                                  " matched node(s) cannot hold a value and were skipped");
    }
    return result;
}

} // namespace handlers
} // namespace oxp
