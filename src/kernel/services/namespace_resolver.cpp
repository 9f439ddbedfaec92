#include "kernel/services/namespace_resolver.hpp"

#include <algorithm>
#include <cctype>

#include <libxml/xmlerror.h>
#include <libxml/xpathInternals.h>

#include "kernel/services/optimizer_service.hpp"

namespace oxp {

namespace {

const char* kDrawingMain = "http://schemas.openxmlformats.org/drawingml/2006/main";
const char* kPresentationMain = "http://schemas.openxmlformats.org/presentationml/2006/main";
const char* kWordMain = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
const char* kSpreadsheetMain = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";

// Cross-reference of family-specific prefixes. Rows are roles (main part
// vocabulary, 2010 extensions, 2012 extensions); columns are families.
struct FamilyRole {
    const char* presentation;
    const char* word;
    const char* spreadsheet;
    const char* drawing;
};

const FamilyRole kFamilyRoles[] = {
    {"p", "w", "x", "a"},
    {"p14", "w14", "x14", nullptr},
    {nullptr, "w15", "x15", nullptr},
};

int family_index(const std::string& format) {
    if (format == "presentation" || format == "pptx" || format == "potx") return 0;
    if (format == "word" || format == "docx" || format == "dotx") return 1;
    if (format == "spreadsheet" || format == "xlsx" || format == "xltx") return 2;
    if (format == "drawing" || format == "theme") return 3;
    return -1;
}

const char* role_prefix(const FamilyRole& role, int family) {
    switch (family) {
        case 0: return role.presentation;
        case 1: return role.word;
        case 2: return role.spreadsheet;
        default: return role.drawing;
    }
}

// Row of the cross-reference table a prefix belongs to, or -1.
int role_of_prefix(const std::string& prefix) {
    for (size_t r = 0; r < sizeof(kFamilyRoles) / sizeof(kFamilyRoles[0]); ++r) {
        for (int f = 0; f < 4; ++f) {
            const char* p = role_prefix(kFamilyRoles[r], f);
            if (p && prefix == p) return static_cast<int>(r);
        }
    }
    return -1;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

void collect_declarations(xmlNodePtr node, NamespaceContext& ctx, std::vector<std::string>& defaults) {
    for (xmlNodePtr cur = node; cur; cur = cur->next) {
        if (cur->type != XML_ELEMENT_NODE) continue;
        for (xmlNsPtr ns = cur->nsDef; ns; ns = ns->next) {
            if (!ns->href) continue;
            const std::string uri = reinterpret_cast<const char*>(ns->href);
            if (!ns->prefix) {
                if (std::find(defaults.begin(), defaults.end(), uri) == defaults.end()) defaults.push_back(uri);
                continue;
            }
            ctx.bind(reinterpret_cast<const char*>(ns->prefix), uri);
        }
        collect_declarations(cur->children, ctx, defaults);
    }
}

// Declarations found anywhere in the tree; the default namespace is exposed
// as "default" when that prefix is free.
NamespaceContext document_context(const XmlDocument& doc) {
    NamespaceContext ctx;
    std::vector<std::string> defaults;
    collect_declarations(doc.root(), ctx, defaults);
    for (const auto& uri : defaults) {
        if (ctx.prefix_for(uri).empty()) ctx.bind("default", uri);
    }
    return ctx;
}

} // namespace

// --- NamespaceContext -------------------------------------------------------

std::string NamespaceContext::next_alias(const std::string& prefix) const {
    for (int n = 2;; ++n) {
        std::string candidate = prefix + "_" + std::to_string(n);
        if (bindings.find(candidate) == bindings.end()) return candidate;
    }
}

std::string NamespaceContext::prefix_for(const std::string& uri) const {
    for (const auto& kv : bindings) {
        if (kv.second == uri) return kv.first;
    }
    return {};
}

std::string NamespaceContext::bind(const std::string& prefix, const std::string& uri) {
    ++registrations;
    auto it = bindings.find(prefix);
    if (it == bindings.end()) {
        bindings[prefix] = uri;
        return prefix;
    }
    if (it->second == uri) return prefix;

    std::string alias = prefix_for(uri);
    if (alias.empty()) {
        alias = next_alias(prefix);
        bindings[alias] = uri;
    }
    collisions.push_back({prefix, it->second, uri, alias});
    return alias;
}

std::string NamespaceContext::bind_override(const std::string& prefix, const std::string& uri) {
    ++registrations;
    auto it = bindings.find(prefix);
    if (it == bindings.end() || it->second == uri) {
        bindings[prefix] = uri;
        return prefix;
    }
    const std::string displaced = it->second;
    it->second = uri;
    std::string alias = prefix_for(displaced);
    if (alias.empty()) {
        alias = next_alias(prefix);
        bindings[alias] = displaced;
    }
    collisions.push_back({prefix, displaced, uri, alias});
    return prefix;
}

// --- ResolutionScope --------------------------------------------------------

ResolutionScope::ResolutionScope(const XmlDocument& doc, NamespaceMap namespaces)
    : doc_(doc), namespaces_(std::move(namespaces)), ctx_(xmlXPathNewContext(doc.get())) {
    if (!ctx_) {
        throw PatchError(PatchErrc::Unknown, "Could not allocate XPath context");
    }
    path::silence_errors(ctx_.get());
    for (const auto& kv : namespaces_) {
        if (kv.second.empty() || !path::is_ncname(kv.first)) continue;
        xmlXPathRegisterNs(ctx_.get(), reinterpret_cast<const xmlChar*>(kv.first.c_str()),
                           reinterpret_cast<const xmlChar*>(kv.second.c_str()));
    }
}

// --- NamespaceResolver ------------------------------------------------------

const NamespaceMap& NamespaceResolver::base_namespaces() {
    static const NamespaceMap kBase = {
        {"a", kDrawingMain},
        {"r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships"},
        {"p", kPresentationMain},
        {"p14", "http://schemas.microsoft.com/office/powerpoint/2010/main"},
        {"w", kWordMain},
        {"w14", "http://schemas.microsoft.com/office/word/2010/wordml"},
        {"w15", "http://schemas.microsoft.com/office/word/2012/wordml"},
        {"x", kSpreadsheetMain},
        {"x14", "http://schemas.microsoft.com/office/spreadsheetml/2009/9/main"},
        {"x15", "http://schemas.microsoft.com/office/spreadsheetml/2010/11/main"},
        {"rel", "http://schemas.openxmlformats.org/package/2006/relationships"},
        {"pkg", "http://schemas.microsoft.com/office/2006/xmlPackage"},
        {"o", "urn:schemas-microsoft-com:office:office"},
        {"mc", "http://schemas.openxmlformats.org/markup-compatibility/2006"},
        {"ct", "http://schemas.openxmlformats.org/package/2006/content-types"},
    };
    return kBase;
}

const std::map<std::string, std::string>& NamespaceResolver::prefix_aliases() {
    static const std::map<std::string, std::string> kAliases = {
        {"drawing", "a"},     {"drawingml", "a"},
        {"ppt", "p"},         {"powerpoint", "p"}, {"presentation", "p"},
        {"word", "w"},        {"doc", "w"},
        {"excel", "x"},       {"xl", "x"},         {"spreadsheet", "x"},
        {"relationship", "r"},
    };
    return kAliases;
}

void NamespaceResolver::attach_path_cache(std::shared_ptr<CompiledPathCache> cache) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_cache_ = std::move(cache);
}

NamespaceMap NamespaceResolver::detect_document_namespaces(const XmlDocument& doc) {
    ++detections_;
    return document_context(doc).bindings;
}

NamespaceContext& NamespaceResolver::session_locked(const XmlDocument& doc) {
    auto it = sessions_.find(doc.id());
    if (it != sessions_.end()) return it->second;

    NamespaceContext ctx = document_context(doc);
    ++detections_;
    collisions_ += ctx.collisions.size();
    return sessions_.emplace(doc.id(), std::move(ctx)).first->second;
}

std::vector<NamespaceCollision> NamespaceResolver::register_namespaces(const XmlDocument& doc,
                                                                        const NamespaceMap& namespaces) {
    std::lock_guard<std::mutex> lock(mutex_);
    NamespaceContext& ctx = session_locked(doc);
    const size_t before = ctx.collisions.size();
    for (const auto& kv : namespaces) {
        if (!path::is_ncname(kv.first)) continue;
        ctx.bind(kv.first, kv.second);
        ++registrations_;
    }
    std::vector<NamespaceCollision> added(ctx.collisions.begin() + static_cast<std::ptrdiff_t>(before),
                                          ctx.collisions.end());
    collisions_ += added.size();
    return added;
}

NamespaceContext NamespaceResolver::session_context(const XmlDocument& doc) {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_locked(doc);
}

void NamespaceResolver::release(const XmlDocument& doc) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(doc.id());
    counted_overrides_.erase(doc.id());
}

NamespaceMap NamespaceResolver::effective_namespaces(const XmlDocument& doc,
                                                     const NamespaceMap& overrides,
                                                     const NamespaceMap& inherited,
                                                     std::vector<NamespaceCollision>* collisions) {
    NamespaceContext eff;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(doc.id());
        if (it != sessions_.end()) eff.bindings = it->second.bindings;
    }
    if (eff.bindings.empty()) {
        eff.bindings = detect_document_namespaces(doc);
    }
    for (const auto& kv : base_namespaces()) {
        if (eff.bindings.count(kv.first) || !eff.prefix_for(kv.second).empty()) continue;
        eff.bindings.insert(kv);
    }
    for (const auto& kv : inherited) {
        if (path::is_ncname(kv.first)) eff.bind_override(kv.first, kv.second);
    }
    for (const auto& kv : overrides) {
        if (path::is_ncname(kv.first)) eff.bind_override(kv.first, kv.second);
    }
    {
        // Inherited overrides re-collide on every later operation; count each once per run.
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(doc.id())) {
            auto& counted = counted_overrides_[doc.id()];
            for (const auto& c : eff.collisions) {
                if (counted.emplace(c.prefix, c.incoming_uri).second) ++collisions_;
            }
        } else {
            collisions_ += eff.collisions.size();
        }
    }
    if (collisions) {
        collisions->insert(collisions->end(), eff.collisions.begin(), eff.collisions.end());
    }
    return eff.bindings;
}

ResolveOutcome NamespaceResolver::resolve(const std::string& target, const ResolutionScope& scope) {
    ++resolutions_;
    std::shared_ptr<CompiledPathCache> cache;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache = path_cache_;
    }
    auto compiled = cache ? cache->get(target) : path::compile(target);
    if (auto fault = std::get_if<PatchFault>(&compiled)) return *fault;
    const CompiledPath& comp = std::get<CompiledPath>(compiled);

    xmlXPathContextPtr ctx = scope.context();
    xmlResetError(&ctx->lastError);
    ctx->node = scope.document().root();
    std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)> obj(xmlXPathCompiledEval(comp.get(), ctx),
                                                                        &xmlXPathFreeObject);
    if (!obj) {
        std::string reason = ctx->lastError.message ? ctx->lastError.message : "evaluation failed";
        while (!reason.empty() && reason.back() == '\n') reason.pop_back();
        if (ctx->lastError.code == XML_XPATH_UNDEF_PREFIX_ERROR) {
            std::string missing;
            for (const auto& p : path::referenced_prefixes(target)) {
                if (scope.namespaces().count(p)) continue;
                missing += (missing.empty() ? "" : ", ") + p;
            }
            return PatchFault{PatchErrc::Namespace,
                              "Undefined namespace prefix in target '" + target + "'" +
                                  (missing.empty() ? "" : ": " + missing),
                              missing};
        }
        return PatchFault{PatchErrc::PathSyntax, "Could not evaluate target '" + target + "': " + reason, target};
    }
    if (obj->type != XPATH_NODESET) {
        return PatchFault{PatchErrc::PathSyntax,
                          "Target '" + target + "' does not select nodes", target};
    }

    NodeSet nodes;
    if (obj->nodesetval) {
        nodes.reserve(static_cast<size_t>(obj->nodesetval->nodeNr));
        for (int i = 0; i < obj->nodesetval->nodeNr; ++i) {
            xmlNodePtr node = obj->nodesetval->nodeTab[i];
            if (!node || node->type == XML_NAMESPACE_DECL) continue;
            nodes.push_back(node);
        }
    }
    return nodes;
}

NamespaceMap NamespaceResolver::migrate_namespaces_for_format(const NamespaceMap& namespaces,
                                                              const std::string& target_format) {
    const int family = family_index(lowercase(target_format));
    if (family < 0) return namespaces;

    const NamespaceMap& base = base_namespaces();
    NamespaceMap out;
    for (const auto& kv : namespaces) {
        const int role = role_of_prefix(kv.first);
        const char* mapped = role >= 0 ? role_prefix(kFamilyRoles[role], family) : nullptr;
        if (!mapped || kv.first == mapped) {
            out.insert(kv);
            continue;
        }
        auto uri = base.find(mapped);
        if (uri == base.end()) {
            out.insert(kv);
            continue;
        }
        out[mapped] = uri->second;
        ++migrations_;
    }
    return out;
}

NamespaceMap NamespaceResolver::validate_namespace_uris(const NamespaceMap& namespaces) {
    NamespaceMap invalid;
    for (const auto& kv : namespaces) {
        const std::string& uri = kv.second;
        bool ok = !uri.empty() && std::isalpha(static_cast<unsigned char>(uri[0]));
        size_t colon = uri.find(':');
        if (ok) ok = colon != std::string::npos && colon + 1 < uri.size();
        for (size_t i = 1; ok && i < colon; ++i) {
            const unsigned char c = static_cast<unsigned char>(uri[i]);
            ok = std::isalnum(c) || c == '+' || c == '-' || c == '.';
        }
        if (ok) {
            ok = std::none_of(uri.begin(), uri.end(), [](unsigned char c) { return std::isspace(c); });
        }
        if (!ok) invalid.insert(kv);
    }
    return invalid;
}

NamespaceInspection NamespaceResolver::inspect(const XmlDocument& doc, const std::string& target) {
    NamespaceInspection info;
    info.expression = target;
    info.available_namespaces = effective_namespaces(doc, {}, {});
    info.used_prefixes = path::referenced_prefixes(target);
    for (const auto& p : info.used_prefixes) {
        if (!info.available_namespaces.count(p)) info.unresolved_prefixes.push_back(p);
    }

    auto compiled = path::compile(target);
    info.syntax_valid = std::holds_alternative<CompiledPath>(compiled);
    info.target_type = "none";
    if (!info.syntax_valid) {
        info.suggestions.push_back("Check the expression syntax: " + std::get<PatchFault>(compiled).message);
        return info;
    }

    for (const auto& p : info.unresolved_prefixes) {
        auto alias = prefix_aliases().find(lowercase(p));
        if (alias != prefix_aliases().end() && info.available_namespaces.count(alias->second)) {
            info.suggestions.push_back("Prefix '" + p + "' is not declared; did you mean '" + alias->second + "'?");
            continue;
        }
        bool matched = false;
        for (const auto& kv : info.available_namespaces) {
            if (lowercase(kv.first) == lowercase(p)) {
                info.suggestions.push_back("Prefix '" + p + "' is not declared; did you mean '" + kv.first + "'?");
                matched = true;
                break;
            }
        }
        if (!matched) {
            info.suggestions.push_back("Declare prefix '" + p + "' in the operation namespaces or use local-name()");
        }
    }
    if (!info.unresolved_prefixes.empty()) return info;

    ResolutionScope scope(doc, info.available_namespaces);
    auto outcome = resolve(target, scope);
    if (auto nodes = std::get_if<NodeSet>(&outcome)) {
        info.match_count = static_cast<int>(nodes->size());
        if (!nodes->empty()) {
            switch (nodes->front()->type) {
                case XML_ATTRIBUTE_NODE: info.target_type = "attribute"; break;
                case XML_TEXT_NODE:
                case XML_CDATA_SECTION_NODE: info.target_type = "text"; break;
                default: info.target_type = "element"; break;
            }
        } else {
            info.suggestions.push_back("No nodes matched; the namespace-agnostic form is: " +
                                       path::to_local_name_form(target));
        }
    } else {
        info.suggestions.push_back(std::get<PatchFault>(outcome).message);
    }
    return info;
}

NamespaceStats NamespaceResolver::stats() const {
    NamespaceStats s;
    s.registrations = registrations_.load();
    s.collisions = collisions_.load();
    s.migrations = migrations_.load();
    s.detections = detections_.load();
    s.resolutions = resolutions_.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.active_sessions = sessions_.size();
    }
    return s;
}

void NamespaceResolver::reset_stats() {
    registrations_ = 0;
    collisions_ = 0;
    migrations_ = 0;
    detections_ = 0;
    resolutions_ = 0;
}

} // namespace oxp
