#include "xml_document.hpp"

#include <atomic>
#include <fstream>
#include <sstream>

#include <libxml/parser.h>
#include <libxml/xmlerror.h>

namespace oxp {

namespace {

std::atomic<std::uint64_t> g_next_document_id{1};

struct FreeParserCtxt {
    void operator()(xmlParserCtxtPtr c) const { xmlFreeParserCtxt(c); }
};

std::string describe_last_error(xmlParserCtxtPtr ctxt) {
    const xmlError* err = xmlCtxtGetLastError(ctxt);
    if (!err || !err->message) return "document is not well formed";
    std::string msg = err->message;
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
    return "line " + std::to_string(err->line) + ": " + msg;
}

} // namespace

XmlDocument::XmlDocument(xmlDocPtr doc, std::string source_name)
    : doc_(doc), id_(g_next_document_id.fetch_add(1)), source_name_(std::move(source_name)) {}

xmlDocPtr parse_xml_memory(const std::string& xml, const std::string& name, std::string& error) {
    xmlInitParser();
    std::unique_ptr<xmlParserCtxt, FreeParserCtxt> ctxt(xmlNewParserCtxt());
    if (!ctxt) {
        error = "could not allocate XML parser context";
        return nullptr;
    }
    const int options = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
    xmlDocPtr raw = xmlCtxtReadMemory(ctxt.get(), xml.data(), static_cast<int>(xml.size()),
                                      name.c_str(), nullptr, options);
    if (!raw || !ctxt->wellFormed || !ctxt->nsWellFormed) {
        error = describe_last_error(ctxt.get());
        if (raw) xmlFreeDoc(raw);
        return nullptr;
    }
    if (!xmlDocGetRootElement(raw)) {
        error = "no root element";
        xmlFreeDoc(raw);
        return nullptr;
    }
    return raw;
}

XmlDocument XmlDocument::parse(const std::string& xml, const std::string& source_name) {
    std::string error;
    xmlDocPtr raw = parse_xml_memory(xml, source_name, error);
    if (!raw) {
        throw PatchError(PatchErrc::DocumentParse,
                         "Failed to parse XML document '" + source_name + "': " + error);
    }
    return XmlDocument(raw, source_name);
}

XmlDocument XmlDocument::load_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PatchError(PatchErrc::Io, "Cannot open XML file: " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse(ss.str(), path.string());
}

xmlNodePtr XmlDocument::root() const {
    return xmlDocGetRootElement(doc_.get());
}

DocumentKind XmlDocument::kind() const {
    xmlNodePtr r = root();
    if (!r || !r->ns || !r->ns->href) return DocumentKind::Unknown;
    const std::string href = reinterpret_cast<const char*>(r->ns->href);
    if (href.find("wordprocessingml") != std::string::npos) return DocumentKind::Word;
    if (href.find("presentationml") != std::string::npos) return DocumentKind::Presentation;
    if (href.find("spreadsheetml") != std::string::npos) return DocumentKind::Spreadsheet;
    if (href.find("package/2006/relationships") != std::string::npos) return DocumentKind::Relationships;
    if (href.find("drawingml") != std::string::npos) return DocumentKind::Drawing;
    return DocumentKind::Unknown;
}

std::string XmlDocument::to_string(bool pretty) const {
    xmlChar* buf = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc_.get(), &buf, &size, "UTF-8", pretty ? 1 : 0);
    if (!buf) return {};
    std::string out(reinterpret_cast<const char*>(buf), static_cast<size_t>(size));
    xmlFree(buf);
    return out;
}

void XmlDocument::save(const fs::path& path, bool pretty) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw PatchError(PatchErrc::Io, "Cannot write XML file: " + path.string());
    }
    out << to_string(pretty);
}

std::string node_text(xmlNodePtr node) {
    if (!node) return {};
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return {};
    std::string out(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return out;
}

} // namespace oxp
