#include "kernel/patch_handlers.hpp"

namespace oxp {
namespace handlers {

namespace {

const char kAppendSeparator[] = " ";

std::string joined(const std::string& existing, const std::string& addition) {
    if (existing.empty()) return addition;
    return existing + kAppendSeparator + addition;
}

} // namespace

HandlerOutcome apply_merge(const PatchOperation& op, HandlerContext& ctx) {
    const PatchValue::Mapping* entries = op.value().as_mapping();
    if (!entries) return type_mismatch(op, "a mapping");

    // Every prefixed attribute key must be resolvable before the tree is touched.
    std::vector<std::string> ignored;
    for (const auto& kv : *entries) {
        if (kv.first == "text") continue;
        if (kv.first.empty() || kv.first[0] != '@') {
            ignored.push_back(kv.first);
            continue;
        }
        auto attr = split_qname(kv.first.substr(1));
        if (!path::is_ncname(attr.second)) {
            return PatchFault{PatchErrc::Validation, "Invalid attribute name '" + kv.first + "'", kv.first};
        }
        if (!attr.first.empty() && attr.first != "xml" && !ctx.scope.namespaces().count(attr.first)) {
            return PatchFault{PatchErrc::Namespace,
                              "Undefined namespace prefix '" + attr.first + "' in merge key '" + kv.first + "'",
                              attr.first};
        }
    }

    auto resolved = ctx.resolver.resolve(op.target(), ctx.scope);
    if (auto fault = std::get_if<PatchFault>(&resolved)) return *fault;
    const NodeSet& nodes = std::get<NodeSet>(resolved);
    if (nodes.empty()) return no_match(op);

    const bool append = op.merge_strategy() == MergeStrategy::Append;
    DetachedNodes detached;
    std::vector<std::string> warnings;
    int affected = 0;
    for (xmlNodePtr node : nodes) {
        if (node->type != XML_ELEMENT_NODE) {
            warnings.push_back("Skipped non-element match for merge");
            continue;
        }
        for (const auto& kv : *entries) {
            const std::string value = kv.second.display_string();
            if (kv.first == "text") {
                set_leading_text(node, append ? joined(leading_text(node), value) : value, detached);
                continue;
            }
            if (kv.first.empty() || kv.first[0] != '@') continue;

            auto attr = split_qname(kv.first.substr(1));
            xmlNsPtr ns = nullptr;
            if (!attr.first.empty()) {
                ns = namespace_for(attr.first, node, nullptr, ctx);
                if (!ns) {
                    warnings.push_back("Could not bind prefix '" + attr.first + "' for " + kv.first);
                    continue;
                }
            }
            const xmlChar* local = reinterpret_cast<const xmlChar*>(attr.second.c_str());
            std::string next = value;
            if (append) {
                xmlChar* existing = ns ? xmlGetNsProp(node, local, ns->href) : xmlGetNoNsProp(node, local);
                if (existing) {
                    next = joined(reinterpret_cast<const char*>(existing), value);
                    xmlFree(existing);
                }
            }
            xmlSetNsProp(node, ns, local, reinterpret_cast<const xmlChar*>(next.c_str()));
        }
        ++affected;
    }

    if (affected > 0) ctx.doc.touch();
    PatchResult result = PatchResult::succeeded(
        op, affected,
        "Merged " + std::to_string(entries->size()) + " key(s) into " + std::to_string(affected) +
            " element(s) (" + to_string(op.merge_strategy()) + ")");
    for (const auto& key : ignored) {
        warnings.push_back("Ignored merge key '" + key + "': expected '@attribute' or 'text'");
    }
    if (affected == 0) {
        result.success = false;
        result.severity = ErrorSeverity::Warning;
        result.message = "No element targets for: " + op.target();
    }
    result.warnings = std::move(warnings);
    return result;
}

} // namespace handlers
} // namespace oxp
