#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace oxp {
namespace fs = std::filesystem;

// prefix -> namespace URI. Ordered so that namespace signatures are stable.
using NamespaceMap = std::map<std::string, std::string>;

#if defined(_WIN32)
    #if defined(OOXPATCH_LIB_BUILD)
        #define OOXPATCH_API __declspec(dllexport)
    #else
        #define OOXPATCH_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(OOXPATCH_LIB_BUILD)
        #define OOXPATCH_API __attribute__((visibility("default")))
    #else
        #define OOXPATCH_API
    #endif
#endif

enum class PatchErrc {
    Unknown = 1, Validation, TargetNotFound, PathSyntax, Namespace,
    TypeMismatch, FragmentSyntax, DocumentParse, Io, InvalidYaml,
};

struct OOXPATCH_API PatchError : public std::runtime_error {
    explicit PatchError(const std::string& what)
        : std::runtime_error(what), code_(PatchErrc::Unknown) {}
    PatchError(PatchErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    PatchErrc code() const noexcept { return code_; }
private:
    PatchErrc code_;
};

// Recoverable failure raised inside a handler. Never thrown; handlers return it.
struct PatchFault {
    PatchErrc code = PatchErrc::Unknown;
    std::string message;
    std::string detail;
};

OOXPATCH_API const char* errc_name(PatchErrc code);

enum class DocumentKind { Unknown, Word, Presentation, Spreadsheet, Drawing, Relationships };

OOXPATCH_API const char* document_kind_name(DocumentKind kind);

} // namespace oxp
