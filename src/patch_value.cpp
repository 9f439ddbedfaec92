#include "patch_value.hpp"

#include <cctype>
#include <sstream>

namespace oxp {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

void fnv_mix(std::uint64_t& h, const std::string& bytes) {
    for (unsigned char c : bytes) {
        h ^= c;
        h *= kFnvPrime;
    }
}

// Tag + length prefix keeps ("ab","c") distinct from ("a","bc").
void hash_into(std::uint64_t& h, const PatchValue& v) {
    if (auto t = v.as_text()) {
        fnv_mix(h, "T" + std::to_string(t->text.size()) + ":");
        fnv_mix(h, t->text);
    } else if (auto f = v.as_fragment()) {
        fnv_mix(h, "F" + std::to_string(f->xml.size()) + ":");
        fnv_mix(h, f->xml);
    } else if (auto l = v.as_list()) {
        fnv_mix(h, "L" + std::to_string(l->size()) + ":");
        for (const auto& item : *l) hash_into(h, item);
    } else if (auto m = v.as_mapping()) {
        fnv_mix(h, "M" + std::to_string(m->size()) + ":");
        for (const auto& kv : *m) {
            fnv_mix(h, std::to_string(kv.first.size()) + ":");
            fnv_mix(h, kv.first);
            hash_into(h, kv.second);
        }
    }
}

bool looks_like_markup(const std::string& s) {
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        return c == '<';
    }
    return false;
}

} // namespace

PatchValue PatchValue::text(std::string s) {
    PatchValue v;
    v.data = Text{std::move(s)};
    return v;
}

PatchValue PatchValue::fragment(std::string xml) {
    PatchValue v;
    v.data = XmlFragment{std::move(xml)};
    return v;
}

PatchValue PatchValue::list(List items) {
    PatchValue v;
    v.data = std::move(items);
    return v;
}

PatchValue PatchValue::mapping(Mapping entries) {
    PatchValue v;
    v.data = std::move(entries);
    return v;
}

PatchValue PatchValue::from_yaml(const YAML::Node& node) {
    if (!node || node.IsNull()) return text("");
    if (node.IsScalar()) {
        const std::string s = node.Scalar();
        return looks_like_markup(s) ? fragment(s) : text(s);
    }
    if (node.IsSequence()) {
        List items;
        items.reserve(node.size());
        for (const auto& item : node) items.push_back(from_yaml(item));
        return list(std::move(items));
    }
    Mapping entries;
    for (const auto& kv : node) {
        entries.emplace_back(kv.first.as<std::string>(), from_yaml(kv.second));
    }
    return mapping(std::move(entries));
}

YAML::Node PatchValue::to_yaml() const {
    if (auto t = as_text()) return YAML::Node(t->text);
    if (auto f = as_fragment()) return YAML::Node(f->xml);
    YAML::Node out;
    if (auto l = as_list()) {
        out = YAML::Node(YAML::NodeType::Sequence);
        for (const auto& item : *l) out.push_back(item.to_yaml());
        return out;
    }
    out = YAML::Node(YAML::NodeType::Map);
    for (const auto& kv : *as_mapping()) out[kv.first] = kv.second.to_yaml();
    return out;
}

std::optional<std::string> PatchValue::scalar() const {
    if (auto t = as_text()) return t->text;
    if (auto f = as_fragment()) return f->xml;
    return std::nullopt;
}

const PatchValue* PatchValue::find(const std::string& key) const {
    auto m = as_mapping();
    if (!m) return nullptr;
    for (const auto& kv : *m) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

const char* PatchValue::type_name() const {
    switch (data.index()) {
        case 0: return "text";
        case 1: return "xml_fragment";
        case 2: return "list";
        default: return "mapping";
    }
}

std::string PatchValue::display_string() const {
    if (auto s = scalar()) return *s;
    std::ostringstream os;
    if (auto l = as_list()) {
        os << "[";
        for (size_t i = 0; i < l->size(); ++i) {
            if (i) os << ", ";
            os << (*l)[i].display_string();
        }
        os << "]";
        return os.str();
    }
    os << "{";
    bool first = true;
    for (const auto& kv : *as_mapping()) {
        if (!first) os << ", ";
        first = false;
        os << kv.first << ": " << kv.second.display_string();
    }
    os << "}";
    return os.str();
}

std::uint64_t PatchValue::hash() const {
    std::uint64_t h = kFnvOffset;
    hash_into(h, *this);
    return h;
}

} // namespace oxp
