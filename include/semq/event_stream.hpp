#ifndef SEMQ_EVENT_STREAM_HPP
#define SEMQ_EVENT_STREAM_HPP

#include <deque>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <semq/errors.hpp>
#include <semq/extract.hpp>
#include <semq/logging.hpp>
#include <semq/scanner.hpp>
#include <semq/source.hpp>
#include <semq/text_decoder.hpp>
#include <semq/types.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semq
{

// ============================================================================
// Event protocol configuration
// ============================================================================

// Where a provider's streaming events keep their token text and completion marker
struct EventProtocol
{
    /// Prefix of the line carrying an event's payload
    std::string data_prefix = "data: ";

    /// Payload that terminates the stream. Empty means the provider has none.
    std::string done_sentinel = "[DONE]";

    /// JSON pointer to the token text inside the payload
    std::string token_pointer = "/choices/0/delta/content";

    /// JSON pointer to the completion field. A non-null value flushes pending text.
    std::string finish_pointer = "/choices/0/finish_reason";

    // OpenAI chat completions (also DeepSeek and other compatible providers)
    static EventProtocol openai();

    // Anthropic messages: content_block_delta / message_delta events
    static EventProtocol anthropic();
};

/// One complete event, reduced to what the aggregator needs
struct DecodedEvent
{
    std::optional<std::string> token;
    bool finished = false; // Completion field present and non-null
    bool done = false;     // Terminal sentinel
};

/**
 * Splits an event stream into events and decodes their payloads.
 *
 * Lines are pushed one at a time (terminators already stripped). An event ends
 * at a blank line; its data lines are joined with "\n". Comment lines (":")
 * and other fields such as "event:" or "id:" are ignored.
 */
class EventDecoder
{
  public:
    /// @throws SemqError if a pointer in the protocol is not a valid JSON pointer
    explicit EventDecoder(EventProtocol protocol = EventProtocol{}, Logger logger = Logger{});

    // Push one line; returns the event it completes, if any
    std::optional<DecodedEvent> push_line(std::string_view line);

    // End of input: decode an event left without its closing blank line
    std::optional<DecodedEvent> flush();

    const EventProtocol& protocol() const
    {
        return protocol_;
    }

  private:
    EventProtocol protocol_;
    Logger logger_;
    json::json_pointer token_pointer_;
    json::json_pointer finish_pointer_;
    std::string data_;
    bool has_data_ = false;

    std::optional<DecodedEvent> complete_event();
};

// ============================================================================
// Token aggregation
// ============================================================================

/**
 * Reassembles per-event token fragments into Token/Text/Data items.
 *
 * Every token is forwarded as a Token right away and appended to a pending
 * buffer. Whenever a structure closes inside the buffer it is resolved against
 * T, parent first: each match is preceded by the trimmed text before it, then
 * emitted as Data, and the buffer is drained through its end. Independently,
 * text up to each paragraph break ("\n\n") is flushed as Text, and the whole
 * buffer is flushed when the event carries a completion marker. Text items are
 * trimmed and never empty.
 */
template <typename T>
class TokenAggregator
{
  public:
    explicit TokenAggregator(StreamOptions options = StreamOptions{})
        : options_(std::move(options)), logger_(options_.log_callback)
    {
    }

    std::vector<StreamItem<T>> on_event(const DecodedEvent& event)
    {
        std::vector<StreamItem<T>> items;
        if (done_)
            return items;

        if (event.token)
        {
            items.push_back(Token{*event.token});
            append(*event.token, items);
        }

        if (event.done)
        {
            flush_all(items);
            done_ = true;
            return items;
        }

        if (event.finished)
            flush_all(items);

        return items;
    }

    // End of input without a terminal event
    std::vector<StreamItem<T>> finish()
    {
        std::vector<StreamItem<T>> items;
        if (done_)
            return items;

        flush_all(items);
        done_ = true;
        return items;
    }

    bool done() const
    {
        return done_;
    }

    size_t buffered_bytes() const
    {
        return buffer_.size();
    }

  private:
    StreamOptions options_;
    Logger logger_;
    JsonStreamScanner scanner_;
    std::string buffer_;
    size_t buffer_origin_ = 0; // Scanner offset of buffer_[0]
    bool done_ = false; // Terminal event, end of input or buffer limit

    void append(const std::string& token, std::vector<StreamItem<T>>& items)
    {
        buffer_ += token;

        for (const auto& root : scanner_.feed(token))
            resolve_root(root, items);

        flush_paragraphs(items);
        check_limit();
    }

    void resolve_root(const StructureNode& root, std::vector<StreamItem<T>>& items)
    {
        size_t cursor = buffer_origin_;
        for (auto& extracted : extract_node<T>(buffer_, root, buffer_origin_))
        {
            auto* parsed = std::get_if<Parsed<T>>(&extracted);
            if (!parsed)
                continue;

            const StructureNode& node = parsed->node;
            emit_trimmed(slice(cursor, node.start), items);
            items.push_back(
                Data<T>{std::move(parsed->value), std::string(slice(node.start, node.end + 1))});
            cursor = node.end + 1;
        }
        drain_to(cursor);
    }

    void flush_paragraphs(std::vector<StreamItem<T>>& items)
    {
        size_t pos;
        while ((pos = buffer_.find("\n\n")) != std::string::npos)
        {
            const size_t at = buffer_origin_ + pos;
            auto open = scanner_.open_start();
            if (open && at >= *open)
            {
                if (logger_.debug_enabled())
                    logger_.debug("Paragraph break at offset " + std::to_string(at) +
                                  " is inside the structure opened at " +
                                  std::to_string(*open) + ", not split");
                return;
            }

            emit_trimmed(std::string_view(buffer_).substr(0, pos), items);
            drain_to(at + 2);
        }
    }

    void flush_all(std::vector<StreamItem<T>>& items)
    {
        auto open = scanner_.open_start();
        if (open && logger_.debug_enabled())
            logger_.debug("Unterminated structure at offset " + std::to_string(*open) +
                          " flushed as text");

        emit_trimmed(buffer_, items);
        buffer_.clear();
        buffer_origin_ = 0;
        scanner_ = JsonStreamScanner();
    }

    std::string_view slice(size_t from, size_t to) const
    {
        return std::string_view(buffer_).substr(from - buffer_origin_, to - from);
    }

    void drain_to(size_t offset)
    {
        buffer_.erase(0, offset - buffer_origin_);
        buffer_origin_ = offset;
    }

    static void emit_trimmed(std::string_view text, std::vector<StreamItem<T>>& items)
    {
        const auto first = text.find_first_not_of(" \t\r\n\f\v");
        if (first == std::string_view::npos)
            return;
        const auto last = text.find_last_not_of(" \t\r\n\f\v");
        items.push_back(TextContent{std::string(text.substr(first, last - first + 1))});
    }

    void check_limit()
    {
        const size_t limit = options_.effective_max_buffer_size();
        if (buffer_.size() <= limit)
            return;

        const size_t size = buffer_.size();
        buffer_.clear();
        done_ = true;
        throw BufferLimitError("Buffer exceeded maximum size of " + std::to_string(limit) +
                                   " bytes (was " + std::to_string(size) + ")",
                               limit);
    }
};

/**
 * Lazy sequence of Token/Text/Data items read from an event stream.
 *
 * Lines are pulled from the source only while the consumer asks for the next
 * item. Reading stops at the terminal sentinel; end of input without one is
 * treated the same way. Each line must be valid UTF-8.
 *
 * Errors are terminal, with the same semantics as ItemStream.
 */
template <typename T>
class EventItemStream
{
  public:
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = StreamItem<T>;
        using difference_type = std::ptrdiff_t;
        using pointer = const StreamItem<T>*;
        using reference = const StreamItem<T>&;

        Iterator() : stream_(nullptr), is_end_(true) {}
        explicit Iterator(EventItemStream* stream) : stream_(stream), is_end_(false)
        {
            fetch_next();
        }

        reference operator*() const
        {
            return *current_;
        }
        pointer operator->() const
        {
            return &*current_;
        }
        Iterator& operator++()
        {
            fetch_next();
            return *this;
        }

        bool operator==(const Iterator& other) const
        {
            return is_end_ == other.is_end_ && (is_end_ || stream_ == other.stream_);
        }
        bool operator!=(const Iterator& other) const
        {
            return !(*this == other);
        }

      private:
        EventItemStream* stream_;
        std::optional<StreamItem<T>> current_;
        bool is_end_;

        void fetch_next()
        {
            current_ = stream_->next();
            if (!current_)
                is_end_ = true;
        }
    };

    EventItemStream(std::unique_ptr<ByteSource> source, EventProtocol protocol = EventProtocol{},
                    StreamOptions options = StreamOptions{})
        : source_(std::move(source)),
          lines_(std::make_unique<LineReader>(*source_, options.effective_read_buffer_size())),
          decoder_(std::move(protocol), Logger(options.log_callback)),
          aggregator_(std::move(options))
    {
    }

    // No copy, move only
    EventItemStream(const EventItemStream&) = delete;
    EventItemStream& operator=(const EventItemStream&) = delete;
    EventItemStream(EventItemStream&&) = default;
    EventItemStream& operator=(EventItemStream&&) = default;

    std::optional<StreamItem<T>> next()
    {
        while (pending_.empty() && !source_done_ && !failed_)
            pump();

        if (pending_.empty())
            return std::nullopt;

        StreamItem<T> item = std::move(pending_.front());
        pending_.pop_front();
        return item;
    }

    Iterator begin()
    {
        return Iterator(this);
    }
    Iterator end()
    {
        return Iterator();
    }

    std::vector<StreamItem<T>> collect()
    {
        std::vector<StreamItem<T>> items;
        while (auto item = next())
            items.push_back(std::move(*item));
        return items;
    }

  private:
    std::unique_ptr<ByteSource> source_;
    std::unique_ptr<LineReader> lines_;
    EventDecoder decoder_;
    TokenAggregator<T> aggregator_;
    std::deque<StreamItem<T>> pending_;
    size_t line_offset_ = 0;
    bool source_done_ = false;
    bool failed_ = false;

    void pump()
    {
        try
        {
            auto line = lines_->read_line();
            if (!line)
            {
                if (auto event = decoder_.flush())
                    append(aggregator_.on_event(*event));
                append(aggregator_.finish());
                source_done_ = true;
                return;
            }

            check_utf8(*line);
            if (auto event = decoder_.push_line(*line))
            {
                append(aggregator_.on_event(*event));
                if (aggregator_.done())
                    source_done_ = true;
            }
        }
        catch (const SemqError&)
        {
            failed_ = true;
            throw;
        }
        catch (const std::exception& e)
        {
            failed_ = true;
            throw SourceError(std::string("Source read failed: ") + e.what());
        }
    }

    // Offsets count the stripped terminator as one byte
    void check_utf8(const std::string& line)
    {
        bool incomplete = false;
        const size_t valid = valid_utf8_prefix(line, incomplete);
        if (valid < line.size())
        {
            const size_t at = line_offset_ + valid;
            throw DecodeError("Invalid UTF-8 sequence at byte " + std::to_string(at), at);
        }
        line_offset_ += line.size() + 1;
    }

    void append(std::vector<StreamItem<T>> items)
    {
        for (auto& item : items)
            pending_.push_back(std::move(item));
    }
};

} // namespace semq

#endif // SEMQ_EVENT_STREAM_HPP
