#include <semq/errors.hpp>
#include <semq/event_stream.hpp>

namespace semq
{

// ============================================================================
// EventProtocol presets
// ============================================================================

EventProtocol EventProtocol::openai()
{
    return EventProtocol{};
}

EventProtocol EventProtocol::anthropic()
{
    EventProtocol protocol;
    protocol.done_sentinel.clear();
    protocol.token_pointer = "/delta/text";
    protocol.finish_pointer = "/delta/stop_reason";
    return protocol;
}

// ============================================================================
// EventDecoder implementation
// ============================================================================

namespace
{

json::json_pointer make_pointer(const std::string& path, const char* field)
{
    try
    {
        return json::json_pointer(path);
    }
    catch (const json::exception& e)
    {
        throw SemqError(std::string("Invalid ") + field + " \"" + path + "\": " + e.what());
    }
}

// Value at `pointer`, or nullptr when the payload has no such path
const json* lookup(const json& payload, const json::json_pointer& pointer)
{
    try
    {
        return &payload.at(pointer);
    }
    catch (const json::exception&)
    {
        return nullptr;
    }
}

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

EventDecoder::EventDecoder(EventProtocol protocol, Logger logger)
    : protocol_(std::move(protocol)), logger_(std::move(logger)),
      token_pointer_(make_pointer(protocol_.token_pointer, "token pointer")),
      finish_pointer_(make_pointer(protocol_.finish_pointer, "finish pointer"))
{
}

std::optional<DecodedEvent> EventDecoder::push_line(std::string_view line)
{
    if (line.empty())
        return complete_event();

    // Comment line
    if (line.front() == ':')
        return std::nullopt;

    std::string_view payload;
    const std::string& prefix = protocol_.data_prefix;
    if (line.substr(0, prefix.size()) == prefix)
    {
        payload = line.substr(prefix.size());
    }
    else if (!prefix.empty() && prefix.back() == ' ' &&
             line.substr(0, prefix.size() - 1) == std::string_view(prefix).substr(0, prefix.size() - 1))
    {
        // "data:value" without the optional space
        payload = line.substr(prefix.size() - 1);
    }
    else
    {
        return std::nullopt;
    }

    if (has_data_)
        data_ += '\n';
    data_.append(payload.data(), payload.size());
    has_data_ = true;
    return std::nullopt;
}

std::optional<DecodedEvent> EventDecoder::flush()
{
    return complete_event();
}

std::optional<DecodedEvent> EventDecoder::complete_event()
{
    if (!has_data_)
        return std::nullopt;

    std::string data = std::move(data_);
    data_.clear();
    has_data_ = false;

    DecodedEvent event;
    if (!protocol_.done_sentinel.empty() && trim(data) == protocol_.done_sentinel)
    {
        event.done = true;
        return event;
    }

    json payload = json::parse(data, nullptr, false);
    if (payload.is_discarded())
    {
        logger_.warning("Skipping event with non-JSON payload: " + data);
        return std::nullopt;
    }

    if (const json* token = lookup(payload, token_pointer_))
    {
        if (token->is_string())
            event.token = token->get<std::string>();
    }

    if (const json* finish = lookup(payload, finish_pointer_))
        event.finished = !finish->is_null();

    return event;
}

} // namespace semq
