#ifndef SEMQ_EXTRACT_HPP
#define SEMQ_EXTRACT_HPP

#include <optional>
#include <semq/errors.hpp>
#include <semq/scanner.hpp>
#include <semq/types.hpp>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace semq
{

// ============================================================================
// Deserialization customization point
// ============================================================================

/// Attempts to turn a JSON-shaped span into a T.
///
/// The default parses the span with nlohmann::json and converts it with
/// `get<T>()`, so any type with `from_json` (for example one declared with
/// NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE) works out of the box. Any
/// nlohmann::json exception raised during conversion means "does not fit T".
/// Specialize this template to plug in a different decoder.
template <typename T>
struct Deserializer
{
    static std::optional<T> from_text(std::string_view text)
    {
        json j = json::parse(text.begin(), text.end(), nullptr, false);
        if (j.is_discarded())
            return std::nullopt;

        try
        {
            return j.get<T>();
        }
        catch (const json::exception&)
        {
            return std::nullopt;
        }
    }
};

// ============================================================================
// Extraction results
// ============================================================================

/// A structure that deserialized as T, with the node it came from
template <typename T>
struct Parsed
{
    T value;
    StructureNode node;
};

/// A closed structure that neither matched T nor contained a match
struct Unknown
{
    StructureNode node;
};

template <typename T>
using Extracted = std::variant<Parsed<T>, Unknown>;

template <typename T>
const StructureNode& extracted_node(const Extracted<T>& item)
{
    if (auto* parsed = std::get_if<Parsed<T>>(&item))
        return parsed->node;
    return std::get<Unknown>(item).node;
}

/// Slice of `text` covered by `node`. `origin` is the global offset of text[0].
inline std::string_view node_span(std::string_view text, const StructureNode& node,
                                  size_t origin = 0)
{
    return text.substr(node.start - origin, node.length());
}

namespace detail
{

template <typename T>
void extract_into(std::string_view text, const StructureNode& node, size_t origin,
                  std::vector<Extracted<T>>& out)
{
    if (auto value = Deserializer<T>::from_text(node_span(text, node, origin)))
    {
        // Parent wins: nested structures are not examined once the node matches
        out.push_back(Parsed<T>{std::move(*value), node});
        return;
    }

    const size_t mark = out.size();
    for (const auto& child : node.children)
        extract_into(text, child, origin, out);

    bool any_parsed = false;
    for (size_t i = mark; i < out.size(); ++i)
        any_parsed = any_parsed || std::holds_alternative<Parsed<T>>(out[i]);

    if (!any_parsed)
    {
        out.erase(out.begin() + static_cast<std::ptrdiff_t>(mark), out.end());
        out.push_back(Unknown{node});
    }
}

template <typename T>
void collect_into(std::string_view text, const StructureNode& node, std::vector<T>& out)
{
    const std::string_view span = node_span(text, node);

    if (auto many = Deserializer<std::vector<T>>::from_text(span))
    {
        for (auto& value : *many)
            out.push_back(std::move(value));
        return;
    }
    if (auto one = Deserializer<T>::from_text(span))
    {
        out.push_back(std::move(*one));
        return;
    }
    for (const auto& child : node.children)
        collect_into(text, child, out);
}

} // namespace detail

// ============================================================================
// Extraction entry points
// ============================================================================

/**
 * Extract T from one closed structure, parent first.
 *
 * The node's full span is tried first; on success exactly one Parsed is
 * returned and its children are never examined. Otherwise each child is
 * tried the same way, in order. If nothing inside the node matched, a single
 * Unknown for the node is returned, so no structure ever disappears.
 *
 * Returned items have disjoint spans in increasing offset order.
 *
 * @param text Text holding the node; text[0] is at global offset `origin`
 */
template <typename T>
std::vector<Extracted<T>> extract_node(std::string_view text, const StructureNode& node,
                                       size_t origin = 0)
{
    std::vector<Extracted<T>> out;
    detail::extract_into(text, node, origin, out);
    return out;
}

/// Scan a complete text and extract T from every root structure, in order
template <typename T>
std::vector<Extracted<T>> deserialize_stream_map(std::string_view text)
{
    std::vector<Extracted<T>> out;
    for (const auto& root : find_json_structures(text))
        detail::extract_into(text, root, 0, out);
    return out;
}

/**
 * Extract every instance of T from a text.
 *
 * The whole text is first tried as a JSON array of T. Otherwise each root
 * structure is tried as an array of T, then as a single T, before descending
 * into its children. A top-level array of T is therefore taken whole, while
 * individual T scattered through prose are still found.
 */
template <typename T>
std::vector<T> extract_all(std::string_view text)
{
    if (auto all = Deserializer<std::vector<T>>::from_text(text))
        return std::move(*all);

    std::vector<T> out;
    for (const auto& root : find_json_structures(text))
        detail::collect_into(text, root, out);
    return out;
}

/// First structure in the text that deserializes as T.
/// @throws NoMatchError if there is none
template <typename T>
T extract_first(std::string_view text)
{
    for (auto& item : deserialize_stream_map<T>(text))
    {
        if (auto* parsed = std::get_if<Parsed<T>>(&item))
            return std::move(parsed->value);
    }
    throw NoMatchError("No matching JSON structure found in response", std::string(text));
}

} // namespace semq

#endif // SEMQ_EXTRACT_HPP
