#ifndef SEMQ_TYPES_HPP
#define SEMQ_TYPES_HPP

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <semq/logging.hpp>
#include <string>
#include <variant>
#include <vector>

namespace semq
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Structural coordinates
// ============================================================================

/// Which bracket pair opened a structure
enum class StructureKind
{
    Object,
    Array
};

const char* to_string(StructureKind kind);

/// One matched {...} or [...] span of the logical stream.
///
/// Offsets are global byte positions in the fully accumulated text; `end` is
/// the position of the closing bracket (inclusive). Children are the structures
/// nested exactly one level inside, in the order their opening bracket appears.
struct StructureNode
{
    size_t start = 0;
    size_t end = 0;
    StructureKind kind = StructureKind::Object;
    std::vector<StructureNode> children;

    // Number of bytes covered, brackets included
    size_t length() const
    {
        return end - start + 1;
    }

    bool contains(size_t offset) const
    {
        return offset >= start && offset <= end;
    }
};

bool operator==(const StructureNode& lhs, const StructureNode& rhs);
bool operator!=(const StructureNode& lhs, const StructureNode& rhs);

// ============================================================================
// Stream items
// ============================================================================

/// Raw token forwarded as soon as it arrives (event-protocol streams only)
struct Token
{
    std::string text;
};

/// Free-form text, in stream order
struct TextContent
{
    std::string text;
};

/// A structure that deserialized as T
template <typename T>
struct Data
{
    T value;
    std::string source; // Matched span exactly as it appeared in the stream
};

template <typename T>
using StreamItem = std::variant<Token, TextContent, Data<T>>;

template <typename T>
bool is_token(const StreamItem<T>& item)
{
    return std::holds_alternative<Token>(item);
}

template <typename T>
bool is_text(const StreamItem<T>& item)
{
    return std::holds_alternative<TextContent>(item);
}

template <typename T>
bool is_data(const StreamItem<T>& item)
{
    return std::holds_alternative<Data<T>>(item);
}

// Text an item stands for in the original stream (Data renders its source span)
template <typename T>
const std::string& item_text(const StreamItem<T>& item)
{
    if (auto* token = std::get_if<Token>(&item))
        return token->text;
    if (auto* text = std::get_if<TextContent>(&item))
        return text->text;
    return std::get<Data<T>>(item).source;
}

// ============================================================================
// Options
// ============================================================================

constexpr size_t kMinReadBufferSize = 1024;
constexpr size_t kDefaultMaxBufferSize = 1024 * 1024;

// Configuration shared by the whole-text and incremental pipelines
struct StreamOptions
{
    /// Bytes requested from the source per read. Values below 1024 are raised to 1024.
    size_t read_buffer_size = 4096;

    /// Maximum pending (unresolved) text held by a stream, in bytes.
    /// Default: 1MB (1024 * 1024 bytes)
    /// Exceeding it terminates the stream with BufferLimitError.
    std::optional<size_t> max_buffer_size;

    /// Emit whitespace-only gaps between structures as Text items.
    /// With this set, concatenating item_text() over the stream reproduces the input exactly.
    bool preserve_whitespace = false;

    /// Callback receiving diagnostics. When unset, warnings go to stderr.
    std::optional<LogCallback> log_callback;

    size_t effective_read_buffer_size() const
    {
        return read_buffer_size < kMinReadBufferSize ? kMinReadBufferSize : read_buffer_size;
    }

    size_t effective_max_buffer_size() const
    {
        return max_buffer_size.value_or(kDefaultMaxBufferSize);
    }
};

} // namespace semq

#endif // SEMQ_TYPES_HPP
