#ifndef SEMQ_SCANNER_HPP
#define SEMQ_SCANNER_HPP

#include <cstddef>
#include <optional>
#include <semq/types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace semq
{

/**
 * Incremental brace/bracket scanner.
 *
 * Finds top-level JSON object and array spans inside arbitrary text, together
 * with their nesting trees, while the text arrives in chunks. The frame stack,
 * string-literal state and running offset persist between feed() calls, so a
 * structure may open in one chunk and close any number of chunks later.
 *
 * One instance per logical text stream. Only the bytes of the currently open
 * root are retained; callers that want to slice by the returned coordinates
 * must keep the accumulated text themselves.
 *
 * Bracket kinds are not validated: a closer always finishes whatever frame is
 * on top of the stack. A closer with no open frame is ignored. String
 * literals are only tracked inside an open structure, so stray quotes in
 * prose do not hide later structures.
 *
 * A brace quoted in prose (`type "{" to start`) opens a frame whose closing
 * quote then looks like the start of a key. Inside an object, a string in key
 * position must be followed by ':'. When it is not, the open root is
 * abandoned and scanning resumes one byte after its opening bracket, so the
 * structures that follow are still found.
 */
class JsonStreamScanner
{
  public:
    JsonStreamScanner() = default;

    // Scan the next chunk. Returns the root structures closed during this call,
    // in closing order, with offsets relative to the start of the stream.
    std::vector<StructureNode> feed(std::string_view chunk);

    // Global position of the next unseen byte
    size_t offset() const
    {
        return offset_;
    }

    // Number of structures currently open
    size_t depth() const
    {
        return stack_.size();
    }

    bool in_string() const
    {
        return in_string_;
    }

    bool has_open_structure() const
    {
        return !stack_.empty();
    }

    // Start offset of the outermost open structure, if any
    std::optional<size_t> open_start() const;

  private:
    struct Frame
    {
        size_t start;
        StructureKind kind;
        std::vector<StructureNode> children;
    };

    std::vector<Frame> stack_;
    bool in_string_ = false;
    bool escape_ = false;
    bool expect_key_ = false; // Next token of the top object frame is a key
    bool key_string_ = false; // The open string literal is an object key
    bool await_colon_ = false;
    size_t offset_ = 0;

    std::string text_;        // Bytes of the open root, kept for rescanning
    size_t text_origin_ = 0;  // Global offset of text_[0]

    // Scan one byte. Returns false when the open root has to be abandoned.
    bool scan_byte(char c, size_t pos, std::vector<StructureNode>& roots);
    void reset_frames();
};

// Scan a complete text in one shot and return its root structures
std::vector<StructureNode> find_json_structures(std::string_view text);

} // namespace semq

#endif // SEMQ_SCANNER_HPP
