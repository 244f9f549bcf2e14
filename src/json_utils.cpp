#include <semq/json_utils.hpp>
#include <semq/types.hpp>

namespace semq
{

namespace
{

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(first, last - first + 1);
}

bool is_json(std::string_view text)
{
    return json::accept(text.begin(), text.end());
}

// Lines without their terminators ("\n" or "\r\n")
std::vector<std::string_view> split_lines(std::string_view text)
{
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

constexpr size_t kMaxJoinedLines = 50;

constexpr std::string_view kFence = "```";

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

struct FenceForm
{
    std::string_view opener;
    bool on_own_lines; // Opener ends its line and the closing fence starts one
};

// Body of the first fence opened by `opener` and closed by the next "```"
// that satisfies the form, untrimmed
std::optional<std::string_view> find_fence(std::string_view text, std::string_view opener,
                                           bool on_own_lines)
{
    for (size_t open = text.find(opener); open != std::string_view::npos;
         open = text.find(opener, open + 1))
    {
        size_t body = open + opener.size();

        if (!on_own_lines)
        {
            const size_t close = text.find(kFence, body);
            if (close == std::string_view::npos)
                return std::nullopt;
            return text.substr(body, close - body);
        }

        size_t line_break = std::string_view::npos;
        while (body < text.size() && is_space(text[body]))
        {
            if (text[body] == '\n' && line_break == std::string_view::npos)
                line_break = body;
            ++body;
        }
        if (line_break == std::string_view::npos)
            continue;

        for (size_t close = text.find(kFence, body); close != std::string_view::npos;
             close = text.find(kFence, close + 1))
        {
            // Only whitespace, including a line break of its own, may precede the closer
            bool starts_line = false;
            for (size_t i = close; i > line_break + 1 && is_space(text[i - 1]); --i)
            {
                if (text[i - 1] == '\n')
                {
                    starts_line = true;
                    break;
                }
            }
            if (starts_line)
                return text.substr(body, close - body);
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> extract_json_from_markdown(std::string_view response)
{
    // Tried in order: "```json\n...\n```", "```json...```", "```\n...\n```", "```...```"
    static constexpr FenceForm kForms[] = {
        {"```json", true},
        {"```json", false},
        {"```", true},
        {"```", false},
    };

    for (const auto& form : kForms)
    {
        if (auto body = find_fence(response, form.opener, form.on_own_lines))
            return std::string(trim(*body));
    }
    return std::nullopt;
}

std::optional<std::string> find_matching_json_object(std::string_view text)
{
    if (text.empty() || text.front() != '{')
        return std::nullopt;

    int depth = 0;
    bool in_string = false;
    bool escape = false;

    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (escape)
        {
            escape = false;
            continue;
        }

        if (c == '\\' && in_string)
            escape = true;
        else if (c == '"')
            in_string = !in_string;
        else if (c == '{' && !in_string)
            ++depth;
        else if (c == '}' && !in_string && --depth == 0)
            return std::string(text.substr(0, i + 1));
    }
    return std::nullopt;
}

std::optional<std::string> try_line_by_line_json(std::string_view response)
{
    const auto lines = split_lines(response);

    for (size_t i = 0; i < lines.size(); ++i)
    {
        const std::string_view line = trim(lines[i]);
        if (line.empty() || line.front() != '{')
            continue;

        if (is_json(line))
            return std::string(line);

        std::string combined(lines[i]);
        for (size_t end = i + 1; end < lines.size(); ++end)
        {
            combined += '\n';
            combined.append(lines[end].data(), lines[end].size());
            if (is_json(combined))
                return combined;
            if (end - i >= kMaxJoinedLines)
                break;
        }
    }
    return std::nullopt;
}

std::optional<std::string> extract_json_advanced(std::string_view response)
{
    for (size_t pos = response.find('{'); pos != std::string_view::npos;
         pos = response.find('{', pos + 1))
    {
        auto candidate = find_matching_json_object(response.substr(pos));
        if (candidate && is_json(*candidate))
            return candidate;
    }
    return try_line_by_line_json(response);
}

std::vector<std::string> segment_non_json_content(std::string_view raw_response,
                                                  std::string_view json_content)
{
    const size_t at = raw_response.find(json_content);
    if (at == std::string_view::npos)
        return {std::string(raw_response)};

    std::vector<std::string> segments;
    const std::string_view before = trim(raw_response.substr(0, at));
    if (!before.empty())
        segments.emplace_back(before);

    const std::string_view after = trim(raw_response.substr(at + json_content.size()));
    if (!after.empty())
        segments.emplace_back(after);

    return segments;
}

ExtractionResult process_response(std::string raw_response, const Logger& logger)
{
    ExtractionResult result;
    result.raw = std::move(raw_response);

    auto succeed = [&](std::string content, const char* method)
    {
        logger.debug(std::string("Extracted ") + std::to_string(content.size()) +
                     " bytes of JSON using method " + method);
        result.segmented = segment_non_json_content(result.raw, content);
        result.json_response = std::move(content);
        result.json_extraction_successful = true;
        result.extraction_method = method;
    };

    if (auto content = extract_json_from_markdown(result.raw))
    {
        succeed(std::move(*content), "markdown");
        return result;
    }
    if (auto content = extract_json_advanced(result.raw))
    {
        succeed(std::move(*content), "advanced");
        return result;
    }

    logger.debug("No JSON found, keeping the whole response");
    result.segmented = {result.raw};
    result.json_response = result.raw;
    result.extraction_method = "raw";
    return result;
}

std::string find_json(std::string_view response)
{
    ExtractionResult result = process_response(std::string(response));
    return result.json_response.value_or(std::string(response));
}

} // namespace semq
