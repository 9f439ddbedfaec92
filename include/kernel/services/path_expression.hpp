#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <libxml/xpath.h>

#include "oxp_types.hpp"

namespace oxp {

using CompiledPath = std::shared_ptr<xmlXPathCompExpr>;

namespace path {

// Prefixes referenced by name tests and function names, in order of first use.
OOXPATCH_API std::vector<std::string> referenced_prefixes(const std::string& expr);

// Rewrites every element/attribute name test into its namespace-agnostic
// form: "p:sp" -> "*[local-name()='sp']", "@r:id" -> "@*[local-name()='id']".
OOXPATCH_API std::string to_local_name_form(const std::string& expr);

OOXPATCH_API std::string replace_prefix(const std::string& expr, const std::string& from, const std::string& to);

// True when the last location step selects attributes.
OOXPATCH_API bool selects_attribute(const std::string& expr);
// Local name tested by that attribute step ("*" for wildcards), or empty.
OOXPATCH_API std::string attribute_step_name(const std::string& expr);

OOXPATCH_API bool is_ncname(const std::string& s);

// Routes libxml2 XPath errors into ctx->lastError instead of stderr.
OOXPATCH_API void silence_errors(xmlXPathContextPtr ctx);

// Compiles without namespace bindings; prefixes are resolved at evaluation time.
OOXPATCH_API std::variant<CompiledPath, PatchFault> compile(const std::string& expr);

} // namespace path
} // namespace oxp
