#include "oxp_types.hpp"

namespace oxp {

const char* errc_name(PatchErrc code) {
    switch (code) {
        case PatchErrc::Unknown:        return "unknown";
        case PatchErrc::Validation:     return "validation_error";
        case PatchErrc::TargetNotFound: return "target_not_found";
        case PatchErrc::PathSyntax:     return "path_syntax_error";
        case PatchErrc::Namespace:      return "namespace_error";
        case PatchErrc::TypeMismatch:   return "type_mismatch_error";
        case PatchErrc::FragmentSyntax: return "fragment_syntax_error";
        case PatchErrc::DocumentParse:  return "document_parse_error";
        case PatchErrc::Io:             return "io_error";
        case PatchErrc::InvalidYaml:    return "invalid_yaml";
    }
    return "unknown";
}

const char* document_kind_name(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Unknown:       return "unknown";
        case DocumentKind::Word:          return "word";
        case DocumentKind::Presentation:  return "presentation";
        case DocumentKind::Spreadsheet:   return "spreadsheet";
        case DocumentKind::Drawing:       return "drawing";
        case DocumentKind::Relationships: return "relationships";
    }
    return "unknown";
}

} // namespace oxp
