#include "kernel/services/path_expression.hpp"

#include <algorithm>
#include <cctype>

#include <libxml/xmlerror.h>

namespace oxp {
namespace path {

namespace {

enum class Tok { Name, Star, Literal, Number, Punct };

struct Token {
    Tok type;
    size_t begin;
    size_t end;
    std::string text;
};

bool name_start(unsigned char c) { return std::isalpha(c) || c == '_' || c >= 0x80; }
bool name_char(unsigned char c) { return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c >= 0x80; }

std::vector<Token> lex(const std::string& s) {
    std::vector<Token> out;
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isspace(c)) { ++i; continue; }
        const size_t start = i;
        if (c == '\'' || c == '"') {
            size_t close = s.find(static_cast<char>(c), i + 1);
            i = (close == std::string::npos) ? n : close + 1;
            out.push_back({Tok::Literal, start, i, s.substr(start, i - start)});
        } else if (std::isdigit(c) || (c == '.' && i + 1 < n && std::isdigit(static_cast<unsigned char>(s[i + 1])))) {
            while (i < n && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) ++i;
            out.push_back({Tok::Number, start, i, s.substr(start, i - start)});
        } else if (name_start(c)) {
            while (i < n && name_char(static_cast<unsigned char>(s[i]))) ++i;
            if (i + 1 < n && s[i] == ':' && s[i + 1] != ':') {
                if (s[i + 1] == '*') {
                    i += 2;
                } else if (name_start(static_cast<unsigned char>(s[i + 1]))) {
                    ++i;
                    while (i < n && name_char(static_cast<unsigned char>(s[i]))) ++i;
                }
            }
            out.push_back({Tok::Name, start, i, s.substr(start, i - start)});
        } else if (c == '*') {
            ++i;
            out.push_back({Tok::Star, start, i, "*"});
        } else {
            static const char* two_char[] = {"//", "::", "..", "!=", "<=", ">="};
            size_t len = 1;
            for (const char* op : two_char) {
                if (s.compare(i, 2, op) == 0) { len = 2; break; }
            }
            i += len;
            out.push_back({Tok::Punct, start, i, s.substr(start, len)});
        }
    }
    return out;
}

bool ends_operand(const Token& t) {
    switch (t.type) {
        case Tok::Name:
        case Tok::Star:
        case Tok::Literal:
        case Tok::Number:
            return true;
        case Tok::Punct:
            return t.text == ")" || t.text == "]" || t.text == "." || t.text == "..";
    }
    return false;
}

enum class Role { NameTest, Function, Axis, Operator, Variable, Other };

// XPath 1.0 lexical disambiguation (section 3.7).
Role role_of(const std::vector<Token>& toks, size_t i) {
    const Token& t = toks[i];
    if (t.type != Tok::Name && t.type != Tok::Star) return Role::Other;
    if (i > 0) {
        const Token& prev = toks[i - 1];
        if (prev.type == Tok::Punct && prev.text == "$") return Role::Variable;
        bool prev_is_operand = ends_operand(prev);
        if (prev.type == Tok::Name) {
            Role pr = role_of(toks, i - 1);
            prev_is_operand = (pr == Role::NameTest || pr == Role::Variable);
        } else if (prev.type == Tok::Star) {
            prev_is_operand = role_of(toks, i - 1) == Role::NameTest;
        }
        if (prev_is_operand) return Role::Operator;
    }
    if (t.type == Tok::Star) return Role::NameTest;
    if (i + 1 < toks.size() && toks[i + 1].type == Tok::Punct) {
        if (toks[i + 1].text == "(") return Role::Function;
        if (toks[i + 1].text == "::") return Role::Axis;
    }
    return Role::NameTest;
}

std::pair<std::string, std::string> split_qname(const std::string& name) {
    auto colon = name.find(':');
    if (colon == std::string::npos) return {"", name};
    return {name.substr(0, colon), name.substr(colon + 1)};
}

template <typename Fn>
std::string rewrite(const std::string& expr, Fn&& fn) {
    const auto toks = lex(expr);
    std::string out;
    size_t cursor = 0;
    for (size_t i = 0; i < toks.size(); ++i) {
        out.append(expr, cursor, toks[i].begin - cursor);
        out += fn(toks, i);
        cursor = toks[i].end;
    }
    out.append(expr, cursor, std::string::npos);
    return out;
}

void silent_handler(void*, xmlErrorPtr) {}

} // namespace

std::vector<std::string> referenced_prefixes(const std::string& expr) {
    std::vector<std::string> prefixes;
    const auto toks = lex(expr);
    for (size_t i = 0; i < toks.size(); ++i) {
        if (toks[i].type != Tok::Name) continue;
        Role r = role_of(toks, i);
        if (r != Role::NameTest && r != Role::Function) continue;
        auto prefix = split_qname(toks[i].text).first;
        if (!prefix.empty() && std::find(prefixes.begin(), prefixes.end(), prefix) == prefixes.end()) {
            prefixes.push_back(prefix);
        }
    }
    return prefixes;
}

std::string to_local_name_form(const std::string& expr) {
    return rewrite(expr, [](const std::vector<Token>& toks, size_t i) -> std::string {
        const Token& t = toks[i];
        if (t.type != Tok::Name || role_of(toks, i) != Role::NameTest) return t.text;
        const std::string local = split_qname(t.text).second;
        if (local == "*") return "*";
        return "*[local-name()='" + local + "']";
    });
}

std::string replace_prefix(const std::string& expr, const std::string& from, const std::string& to) {
    return rewrite(expr, [&](const std::vector<Token>& toks, size_t i) -> std::string {
        const Token& t = toks[i];
        if (t.type != Tok::Name) return t.text;
        Role r = role_of(toks, i);
        if (r != Role::NameTest && r != Role::Function) return t.text;
        auto parts = split_qname(t.text);
        if (parts.first != from) return t.text;
        return to + ":" + parts.second;
    });
}

namespace {

// Index of the first token of the final top-level location step.
size_t last_step_start(const std::vector<Token>& toks) {
    size_t step_start = 0;
    int depth = 0;
    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];
        if (t.type != Tok::Punct) continue;
        if (t.text == "[" || t.text == "(") ++depth;
        else if (t.text == "]" || t.text == ")") --depth;
        else if (depth == 0 && (t.text == "/" || t.text == "//" || t.text == "|")) step_start = i + 1;
    }
    return step_start;
}

// Index of the name test of a final attribute step, or toks.size().
size_t attribute_test_index(const std::vector<Token>& toks) {
    const size_t start = last_step_start(toks);
    if (start >= toks.size()) return toks.size();
    const Token& first = toks[start];
    if (first.type == Tok::Punct && first.text == "@") return start + 1;
    if (first.type == Tok::Name && first.text == "attribute" && start + 1 < toks.size() &&
        toks[start + 1].text == "::") {
        return start + 2;
    }
    return toks.size();
}

} // namespace

bool selects_attribute(const std::string& expr) {
    const auto toks = lex(expr);
    return attribute_test_index(toks) < toks.size();
}

std::string attribute_step_name(const std::string& expr) {
    const auto toks = lex(expr);
    const size_t i = attribute_test_index(toks);
    if (i >= toks.size()) return {};
    if (toks[i].type == Tok::Star) return "*";
    if (toks[i].type != Tok::Name) return {};
    return split_qname(toks[i].text).second;
}

bool is_ncname(const std::string& s) {
    if (s.empty() || !name_start(static_cast<unsigned char>(s[0]))) return false;
    return std::all_of(s.begin(), s.end(), [](char c) { return name_char(static_cast<unsigned char>(c)); });
}

void silence_errors(xmlXPathContextPtr ctx) {
    ctx->error = silent_handler;
    ctx->userData = nullptr;
}

std::variant<CompiledPath, PatchFault> compile(const std::string& expr) {
    if (expr.empty()) {
        return PatchFault{PatchErrc::PathSyntax, "Empty path expression", ""};
    }
    std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)> ctx(xmlXPathNewContext(nullptr),
                                                                         &xmlXPathFreeContext);
    if (!ctx) {
        return PatchFault{PatchErrc::Unknown, "Could not allocate XPath context", expr};
    }
    silence_errors(ctx.get());
    xmlResetError(&ctx->lastError);
    xmlXPathCompExprPtr raw = xmlXPathCtxtCompile(ctx.get(), reinterpret_cast<const xmlChar*>(expr.c_str()));
    if (!raw) {
        std::string reason = ctx->lastError.message ? ctx->lastError.message : "invalid expression";
        while (!reason.empty() && reason.back() == '\n') reason.pop_back();
        return PatchFault{PatchErrc::PathSyntax, "Invalid path expression '" + expr + "': " + reason, expr};
    }
    return CompiledPath(raw, &xmlXPathFreeCompExpr);
}

} // namespace path
} // namespace oxp
