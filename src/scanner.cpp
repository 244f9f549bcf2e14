#include <semq/scanner.hpp>
#include <utility>

namespace semq
{

std::vector<StructureNode> JsonStreamScanner::feed(std::string_view chunk)
{
    std::vector<StructureNode> roots;
    text_.append(chunk.data(), chunk.size());

    size_t pos = offset_;
    offset_ += chunk.size();

    while (pos < offset_)
    {
        if (scan_byte(text_[pos - text_origin_], pos, roots))
        {
            ++pos;
            continue;
        }

        // Not JSON after all: rescan what followed the root's opening bracket
        const size_t restart = stack_.front().start + 1;
        reset_frames();
        pos = restart;
    }

    if (stack_.empty())
    {
        text_.clear();
        text_origin_ = offset_;
    }
    else
    {
        const size_t keep = stack_.front().start;
        text_.erase(0, keep - text_origin_);
        text_origin_ = keep;
    }
    return roots;
}

bool JsonStreamScanner::scan_byte(char c, size_t pos, std::vector<StructureNode>& roots)
{
    if (escape_)
    {
        escape_ = false;
        return true;
    }

    if (in_string_)
    {
        if (c == '\\')
        {
            escape_ = true;
        }
        else if (c == '"')
        {
            in_string_ = false;
            await_colon_ = key_string_;
            key_string_ = false;
        }
        return true;
    }

    const bool space = c == ' ' || c == '\t' || c == '\n' || c == '\r';
    if (space)
        return true;

    if (await_colon_)
    {
        await_colon_ = false;
        return c == ':';
    }

    const bool at_key = expect_key_;
    expect_key_ = false;

    switch (c)
    {
    case '"':
        // Quotes only delimit string literals inside a structure
        if (!stack_.empty())
        {
            in_string_ = true;
            key_string_ = at_key;
        }
        break;
    case '{':
        stack_.push_back(Frame{pos, StructureKind::Object, {}});
        expect_key_ = true;
        break;
    case '[':
        stack_.push_back(Frame{pos, StructureKind::Array, {}});
        break;
    case ',':
        expect_key_ = !stack_.empty() && stack_.back().kind == StructureKind::Object;
        break;
    case '}':
    case ']':
    {
        if (stack_.empty())
            break;

        Frame frame = std::move(stack_.back());
        stack_.pop_back();

        StructureNode node;
        node.start = frame.start;
        node.end = pos;
        node.kind = frame.kind;
        node.children = std::move(frame.children);

        if (stack_.empty())
            roots.push_back(std::move(node));
        else
            stack_.back().children.push_back(std::move(node));
        break;
    }
    default:
        break;
    }
    return true;
}

void JsonStreamScanner::reset_frames()
{
    stack_.clear();
    in_string_ = false;
    escape_ = false;
    expect_key_ = false;
    key_string_ = false;
    await_colon_ = false;
}

std::optional<size_t> JsonStreamScanner::open_start() const
{
    if (stack_.empty())
        return std::nullopt;
    return stack_.front().start;
}

std::vector<StructureNode> find_json_structures(std::string_view text)
{
    JsonStreamScanner scanner;
    return scanner.feed(text);
}

} // namespace semq
