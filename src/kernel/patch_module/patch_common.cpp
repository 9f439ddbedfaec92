#include "kernel/patch_handlers.hpp"

namespace oxp {
namespace handlers {

namespace {

const xmlChar* X(const std::string& s) { return reinterpret_cast<const xmlChar*>(s.c_str()); }

bool is_text_like(xmlNodePtr n) {
    return n && (n->type == XML_TEXT_NODE || n->type == XML_CDATA_SECTION_NODE);
}

} // namespace

DetachedNodes::~DetachedNodes() {
    for (xmlNodePtr n : nodes_) xmlFreeNode(n);
}

HandlerOutcome dispatch(const PatchOperation& op, HandlerContext& ctx) {
    switch (op.kind()) {
        case PatchKind::Set:             return apply_set(op, ctx);
        case PatchKind::Insert:          return apply_insert(op, ctx);
        case PatchKind::Extend:          return apply_extend(op, ctx);
        case PatchKind::Merge:           return apply_merge(op, ctx);
        case PatchKind::RelationshipAdd: return apply_relationship_add(op, ctx);
    }
    return PatchFault{PatchErrc::Unknown, "Unhandled operation kind", op.target()};
}

PatchResult no_match(const PatchOperation& op) {
    PatchResult r = PatchResult::failed(op, ErrorSeverity::Warning, "No elements found for target: " + op.target());
    r.exception_info = FaultInfo{PatchErrc::TargetNotFound, r.message, op.target(), ""};
    return r;
}

PatchResult type_mismatch(const PatchOperation& op, const std::string& expected) {
    PatchResult r = PatchResult::failed(op, ErrorSeverity::Error,
                                        std::string("Type mismatch: ") + to_string(op.kind()) +
                                            " operation requires " + expected + " value, got " +
                                            op.value().type_name());
    r.exception_info = FaultInfo{PatchErrc::TypeMismatch, r.message, "", ""};
    return r;
}

std::pair<std::string, std::string> split_qname(const std::string& name) {
    auto colon = name.find(':');
    if (colon == std::string::npos) return {"", name};
    return {name.substr(0, colon), name.substr(colon + 1)};
}

std::variant<FragmentDoc, PatchFault> parse_fragment(const std::string& xml) {
    std::string error;
    xmlDocPtr raw = parse_xml_memory(xml, "fragment", error);
    if (!raw) {
        return PatchFault{PatchErrc::FragmentSyntax, "Malformed XML fragment: " + error, xml};
    }
    return FragmentDoc(raw);
}

xmlNsPtr namespace_for(const std::string& prefix, xmlNodePtr owner, xmlNodePtr scope_node, HandlerContext& ctx) {
    xmlDocPtr doc = ctx.doc.get();
    if (xmlNsPtr ns = xmlSearchNs(doc, owner, X(prefix))) return ns;
    if (scope_node) {
        if (xmlNsPtr ns = xmlSearchNs(doc, scope_node, X(prefix))) return ns;
    }
    auto uri = ctx.scope.namespaces().find(prefix);
    if (uri == ctx.scope.namespaces().end()) return nullptr;
    return xmlNewNs(owner, X(uri->second), X(prefix));
}

std::variant<xmlNodePtr, PatchFault> build_element(const PatchValue& value,
                                                   const std::string& default_tag,
                                                   const FragmentDoc* fragment,
                                                   xmlNodePtr scope_node,
                                                   HandlerContext& ctx) {
    xmlDocPtr doc = ctx.doc.get();

    if (value.as_fragment()) {
        if (!fragment || !*fragment) {
            return PatchFault{PatchErrc::FragmentSyntax, "XML fragment was not parsed", ""};
        }
        xmlNodePtr copy = xmlDocCopyNode(xmlDocGetRootElement(fragment->get()), doc, 1);
        if (!copy) return PatchFault{PatchErrc::Unknown, "Could not copy XML fragment", ""};
        return copy;
    }

    const PatchValue* tag_value = value.find("tag");
    const std::string tag = (tag_value && tag_value->scalar()) ? *tag_value->scalar() : default_tag;
    auto qname = split_qname(tag);
    if (!path::is_ncname(qname.second) || (!qname.first.empty() && !path::is_ncname(qname.first))) {
        return PatchFault{PatchErrc::Validation, "Invalid element name '" + tag + "'", tag};
    }

    xmlNodePtr node = xmlNewDocNode(doc, nullptr, X(qname.second), nullptr);
    if (!node) return PatchFault{PatchErrc::Unknown, "Could not allocate element '" + tag + "'", tag};
    DetachedNodes guard;
    guard.keep(node);

    if (!qname.first.empty()) {
        xmlNsPtr ns = namespace_for(qname.first, node, scope_node, ctx);
        if (!ns) {
            return PatchFault{PatchErrc::Namespace,
                              "Undefined namespace prefix '" + qname.first + "' in element name '" + tag + "'",
                              qname.first};
        }
        xmlSetNs(node, ns);
    }

    if (auto text = value.as_text()) {
        xmlNodeAddContent(node, X(text->text));
    } else if (value.as_list()) {
        xmlNodeAddContent(node, X(value.display_string()));
    } else if (auto entries = value.as_mapping()) {
        for (const auto& kv : *entries) {
            if (kv.first == "tag") continue;
            const std::string content = kv.second.display_string();
            if (kv.first == "text") {
                xmlNodeAddContent(node, X(content));
                continue;
            }
            if (kv.first.empty() || kv.first[0] != '@') continue;
            auto attr = split_qname(kv.first.substr(1));
            if (!path::is_ncname(attr.second)) {
                return PatchFault{PatchErrc::Validation, "Invalid attribute name '" + kv.first + "'", kv.first};
            }
            xmlNsPtr ns = nullptr;
            if (!attr.first.empty()) {
                ns = namespace_for(attr.first, node, scope_node, ctx);
                if (!ns) {
                    return PatchFault{PatchErrc::Namespace,
                                      "Undefined namespace prefix '" + attr.first + "' in attribute '" +
                                          kv.first + "'",
                                      attr.first};
                }
            }
            xmlSetNsProp(node, ns, X(attr.second), X(content));
        }
    }

    guard.release_all();
    return node;
}

std::string leading_text(xmlNodePtr element) {
    std::string out;
    for (xmlNodePtr cur = element->children; is_text_like(cur); cur = cur->next) {
        if (cur->content) out += reinterpret_cast<const char*>(cur->content);
    }
    return out;
}

void set_leading_text(xmlNodePtr element, const std::string& text, DetachedNodes& detached) {
    xmlNodePtr first = element->children;
    if (is_text_like(first)) {
        xmlNodeSetContent(first, X(text));
        xmlNodePtr cur = first->next;
        while (is_text_like(cur)) {
            xmlNodePtr next = cur->next;
            xmlUnlinkNode(cur);
            detached.keep(cur);
            cur = next;
        }
        return;
    }
    if (text.empty()) return;
    xmlNodePtr node = xmlNewDocText(element->doc, X(text));
    if (first) {
        xmlAddPrevSibling(first, node);
    } else {
        xmlAddChild(element, node);
    }
}

} // namespace handlers
} // namespace oxp
