#ifndef SEMQ_STREAM_HPP
#define SEMQ_STREAM_HPP

#include <algorithm>
#include <cctype>
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

inline bool is_blank(std::string_view text)
{
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

/**
 * Turns decoded text, fed in arbitrary pieces, into ordered Text/Data items.
 *
 * Every root structure closed by a feed() is resolved against T the moment its
 * closing bracket arrives: the text before it becomes a Text item, matched
 * spans become Data, and unmatched spans become Text verbatim. When a root does
 * not match but something inside it does, the bytes between the extracted
 * pieces are emitted as Text as well. Items come out in strictly increasing
 * offset order.
 *
 * Text that has been resolved is released immediately, so the buffer never
 * holds more than the pending text plus the currently open structure.
 */
template <typename T>
class ItemReconciler
{
  public:
    explicit ItemReconciler(StreamOptions options = StreamOptions{})
        : options_(std::move(options)), logger_(options_.log_callback)
    {
    }

    // Feed the next piece of decoded text; returns the items it resolved
    std::vector<StreamItem<T>> feed(std::string_view text)
    {
        std::vector<StreamItem<T>> items;
        if (failed_)
            return items;
        buffer_.append(text.data(), text.size());

        for (const auto& root : scanner_.feed(text))
            emit_root(root, items);

        release_consumed();
        check_limit();
        return items;
    }

    // End of input: whatever is still pending (including an unterminated
    // structure) becomes trailing text
    std::vector<StreamItem<T>> finish()
    {
        std::vector<StreamItem<T>> items;
        if (finished_ || failed_)
            return items;
        finished_ = true;

        auto open = scanner_.open_start();
        if (open && logger_.debug_enabled())
        {
            logger_.debug("Unterminated structure at offset " + std::to_string(*open) +
                          " (depth " + std::to_string(scanner_.depth()) +
                          ") kept as trailing text");
        }

        emit_text(last_offset_, scanner_.offset(), items);
        last_offset_ = scanner_.offset();
        release_consumed();
        return items;
    }

    // Bytes held for text and structures not resolved yet
    size_t buffered_bytes() const
    {
        return buffer_.size();
    }

    // Global offset of the next byte expected
    size_t offset() const
    {
        return scanner_.offset();
    }

  private:
    StreamOptions options_;
    Logger logger_;
    JsonStreamScanner scanner_;
    std::string buffer_;
    size_t buffer_origin_ = 0; // Global offset of buffer_[0]
    size_t last_offset_ = 0;   // Everything before this has been emitted
    bool finished_ = false;
    bool failed_ = false;      // Buffer limit hit; further input is ignored

    void emit_root(const StructureNode& root, std::vector<StreamItem<T>>& items)
    {
        emit_text(last_offset_, root.start, items);

        size_t cursor = root.start;
        size_t matched = 0;
        for (auto& extracted : extract_node<T>(buffer_, root, buffer_origin_))
        {
            const StructureNode& node = extracted_node<T>(extracted);
            emit_text(cursor, node.start, items);

            std::string span(node_span(buffer_, node, buffer_origin_));
            if (auto* parsed = std::get_if<Parsed<T>>(&extracted))
            {
                items.push_back(Data<T>{std::move(parsed->value), std::move(span)});
                ++matched;
            }
            else
            {
                items.push_back(TextContent{std::move(span)});
            }
            cursor = node.end + 1;
        }
        emit_text(cursor, root.end + 1, items);
        last_offset_ = root.end + 1;

        if (logger_.debug_enabled())
        {
            logger_.debug(std::string(to_string(root.kind)) + " at " + std::to_string(root.start) +
                          ".." + std::to_string(root.end) + " resolved with " +
                          std::to_string(matched) + " match(es)");
        }
    }

    void emit_text(size_t from, size_t to, std::vector<StreamItem<T>>& items) const
    {
        if (from >= to)
            return;

        std::string_view slice(buffer_);
        slice = slice.substr(from - buffer_origin_, to - from);
        if (!options_.preserve_whitespace && is_blank(slice))
            return;

        items.push_back(TextContent{std::string(slice)});
    }

    void release_consumed()
    {
        buffer_.erase(0, last_offset_ - buffer_origin_);
        buffer_origin_ = last_offset_;
    }

    void check_limit()
    {
        const size_t limit = options_.effective_max_buffer_size();
        if (buffer_.size() <= limit)
            return;

        const size_t size = buffer_.size();
        buffer_.clear();
        failed_ = true;
        throw BufferLimitError("Buffer exceeded maximum size of " + std::to_string(limit) +
                                   " bytes (was " + std::to_string(size) + ")",
                               limit);
    }
};

/// Build the ordered Text/Data item list for a complete text.
///
/// Any structure that deserializes as T becomes Data; non-matching JSON and
/// all surrounding text are kept as Text, in order.
template <typename T>
std::vector<StreamItem<T>> build_parsed_stream(std::string_view text,
                                               StreamOptions options = StreamOptions{})
{
    // The whole text is already in memory; the pending-buffer cap does not apply
    options.max_buffer_size = std::max(options.effective_max_buffer_size(), text.size());

    ItemReconciler<T> reconciler(std::move(options));
    std::vector<StreamItem<T>> items = reconciler.feed(text);
    for (auto& item : reconciler.finish())
        items.push_back(std::move(item));
    return items;
}

/**
 * Lazy, one-pass sequence of Text/Data items read from a ByteSource.
 *
 * Bytes are pulled from the source only while the consumer asks for the next
 * item; abandoning the stream stops reading. Chunks are UTF-8 validated
 * against the accumulated stream, so a multi-byte character split across
 * reads is accepted.
 *
 * Errors are terminal: DecodeError for invalid UTF-8, SourceError when the
 * source fails, BufferLimitError when pending text exceeds the configured cap.
 * Once an error has been thrown, next() returns nullopt. Items already
 * returned stay valid.
 */
template <typename T>
class ItemStream
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
        explicit Iterator(ItemStream* stream) : stream_(stream), is_end_(false)
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
        ItemStream* stream_;
        std::optional<StreamItem<T>> current_;
        bool is_end_;

        void fetch_next()
        {
            current_ = stream_->next();
            if (!current_)
                is_end_ = true;
        }
    };

    explicit ItemStream(std::unique_ptr<ByteSource> source,
                        StreamOptions options = StreamOptions{})
        : source_(std::move(source)), read_buffer_(options.effective_read_buffer_size()),
          reconciler_(std::move(options))
    {
    }

    // No copy, move only
    ItemStream(const ItemStream&) = delete;
    ItemStream& operator=(const ItemStream&) = delete;
    ItemStream(ItemStream&&) = default;
    ItemStream& operator=(ItemStream&&) = default;

    // Next item, reading from the source as needed; nullopt at the end
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

    // Drain the remaining items into a vector
    std::vector<StreamItem<T>> collect()
    {
        std::vector<StreamItem<T>> items;
        while (auto item = next())
            items.push_back(std::move(*item));
        return items;
    }

  private:
    std::unique_ptr<ByteSource> source_;
    std::vector<char> read_buffer_;
    TextDecoder decoder_;
    ItemReconciler<T> reconciler_;
    std::deque<StreamItem<T>> pending_;
    bool source_done_ = false;
    bool failed_ = false;

    void pump()
    {
        try
        {
            size_t n = source_->read(read_buffer_.data(), read_buffer_.size());
            if (n == 0)
            {
                decoder_.finish();
                append(reconciler_.finish());
                source_done_ = true;
                return;
            }

            std::string text = decoder_.decode(std::string_view(read_buffer_.data(), n));
            append(reconciler_.feed(text));
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

    void append(std::vector<StreamItem<T>> items)
    {
        for (auto& item : items)
            pending_.push_back(std::move(item));
    }
};

} // namespace semq

#endif // SEMQ_STREAM_HPP
