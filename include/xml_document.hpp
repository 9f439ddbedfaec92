#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include <libxml/tree.h>

#include "oxp_types.hpp"

namespace oxp {

/**
 * @brief Owning handle for one parsed XML part.
 *
 * Every document gets a process-unique id at parse time and a revision
 * counter that the patch handlers bump after each mutation. Caches key on
 * (id, revision), never on the node pointers.
 */
class OOXPATCH_API XmlDocument {
public:
    // Throws PatchError(PatchErrc::DocumentParse) if the text is not well formed.
    static XmlDocument parse(const std::string& xml, const std::string& source_name = "<memory>");
    // Throws PatchError(PatchErrc::Io) if the file cannot be read.
    static XmlDocument load_file(const fs::path& path);

    XmlDocument(XmlDocument&&) noexcept = default;
    XmlDocument& operator=(XmlDocument&&) noexcept = default;
    XmlDocument(const XmlDocument&) = delete;
    XmlDocument& operator=(const XmlDocument&) = delete;

    xmlDocPtr get() const { return doc_.get(); }
    xmlNodePtr root() const;

    std::uint64_t id() const { return id_; }
    std::uint64_t revision() const { return revision_; }
    void touch() { ++revision_; }

    const std::string& source_name() const { return source_name_; }
    DocumentKind kind() const;

    std::string to_string(bool pretty = false) const;
    void save(const fs::path& path, bool pretty = false) const;

private:
    struct FreeDoc {
        void operator()(xmlDocPtr d) const { xmlFreeDoc(d); }
    };

    XmlDocument(xmlDocPtr doc, std::string source_name);

    std::unique_ptr<xmlDoc, FreeDoc> doc_;
    std::uint64_t id_ = 0;
    std::uint64_t revision_ = 0;
    std::string source_name_;
};

// Strict, network-free parse. Returns nullptr and fills `error` when the text is
// not well formed (including undeclared namespace prefixes).
OOXPATCH_API xmlDocPtr parse_xml_memory(const std::string& xml, const std::string& name, std::string& error);

// Concatenated text of a node (attribute value for attributes).
OOXPATCH_API std::string node_text(xmlNodePtr node);

} // namespace oxp
