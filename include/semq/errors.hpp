#ifndef SEMQ_ERRORS_HPP
#define SEMQ_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace semq
{

// Base exception
class SemqError : public std::runtime_error
{
  public:
    explicit SemqError(const std::string& message) : std::runtime_error(message) {}
};

// Stream bytes are not valid UTF-8
class DecodeError : public SemqError
{
  public:
    DecodeError(const std::string& message, size_t offset) : SemqError(message), offset_(offset)
    {
    }

    // Byte offset in the logical stream where decoding failed
    size_t offset() const
    {
        return offset_;
    }

  private:
    size_t offset_;
};

// Upstream byte or line source failed
class SourceError : public SemqError
{
  public:
    explicit SourceError(const std::string& message) : SemqError(message) {}
};

// Pending text grew past StreamOptions::max_buffer_size
class BufferLimitError : public SemqError
{
  public:
    BufferLimitError(const std::string& message, size_t limit)
        : SemqError(message), limit_(limit)
    {
    }

    size_t limit() const
    {
        return limit_;
    }

  private:
    size_t limit_;
};

// No structure in the text deserialized as the requested type
class NoMatchError : public SemqError
{
  public:
    NoMatchError(const std::string& message, std::string raw)
        : SemqError(message), raw_(std::move(raw))
    {
    }

    // The text that was searched
    const std::string& raw() const
    {
        return raw_;
    }

  private:
    std::string raw_;
};

} // namespace semq

#endif // SEMQ_ERRORS_HPP
