#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "oxp_types.hpp"

namespace oxp {

/**
 * @brief Payload carried by a patch operation.
 *
 * A closed variant: plain text, an XML fragment to be parsed on use,
 * an ordered list of values, or an ordered key/value mapping.
 */
struct OOXPATCH_API PatchValue {
    struct Text { std::string text; };
    struct XmlFragment { std::string xml; };
    using List = std::vector<PatchValue>;
    using Mapping = std::vector<std::pair<std::string, PatchValue>>;

    std::variant<Text, XmlFragment, List, Mapping> data;

    PatchValue() = default;

    static PatchValue text(std::string s);
    static PatchValue fragment(std::string xml);
    static PatchValue list(List items);
    static PatchValue mapping(Mapping entries);

    // Scalars whose trimmed text starts with '<' become fragments.
    static PatchValue from_yaml(const YAML::Node& node);
    YAML::Node to_yaml() const;

    const Text* as_text() const { return std::get_if<Text>(&data); }
    const XmlFragment* as_fragment() const { return std::get_if<XmlFragment>(&data); }
    const List* as_list() const { return std::get_if<List>(&data); }
    const Mapping* as_mapping() const { return std::get_if<Mapping>(&data); }

    // Text or fragment source; nullopt for containers.
    std::optional<std::string> scalar() const;
    // First entry with this key when the value is a mapping.
    const PatchValue* find(const std::string& key) const;

    const char* type_name() const;
    std::string display_string() const;
    std::uint64_t hash() const;
};

} // namespace oxp
