#ifndef SEMQ_RESPONSE_HPP
#define SEMQ_RESPONSE_HPP

#include <semq/stream.hpp>
#include <semq/types.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semq
{

/// A complete response split into text and typed data, in order.
template <typename T>
class ParsedResponse
{
  public:
    using const_iterator = typename std::vector<StreamItem<T>>::const_iterator;

    ParsedResponse() = default;
    explicit ParsedResponse(std::vector<StreamItem<T>> items) : items_(std::move(items)) {}

    const std::vector<StreamItem<T>>& items() const
    {
        return items_;
    }

    // Only the structured values, in order
    std::vector<const T*> data_only() const
    {
        std::vector<const T*> values;
        for (const auto& item : items_)
        {
            if (auto* data = std::get_if<Data<T>>(&item))
                values.push_back(&data->value);
        }
        return values;
    }

    // Every item's text joined with single spaces; data is rendered as its source span
    std::string text_content() const
    {
        std::string result;
        for (const auto& item : items_)
        {
            if (is_token(item))
                continue;
            if (!result.empty())
                result += ' ';
            result += item_text(item);
        }
        return result;
    }

    const T* first_data() const
    {
        for (const auto& item : items_)
        {
            if (auto* data = std::get_if<Data<T>>(&item))
                return &data->value;
        }
        return nullptr;
    }

    bool has_data() const
    {
        return first_data() != nullptr;
    }

    size_t data_count() const
    {
        size_t count = 0;
        for (const auto& item : items_)
            count += is_data(item) ? 1 : 0;
        return count;
    }

    size_t size() const
    {
        return items_.size();
    }

    bool empty() const
    {
        return items_.empty();
    }

    const_iterator begin() const
    {
        return items_.begin();
    }
    const_iterator end() const
    {
        return items_.end();
    }

  private:
    std::vector<StreamItem<T>> items_;
};

template <typename T>
ParsedResponse<T> parse_response(std::string_view text, StreamOptions options = StreamOptions{})
{
    return ParsedResponse<T>(build_parsed_stream<T>(text, std::move(options)));
}

} // namespace semq

#endif // SEMQ_RESPONSE_HPP
