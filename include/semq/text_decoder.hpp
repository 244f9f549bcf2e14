#ifndef SEMQ_TEXT_DECODER_HPP
#define SEMQ_TEXT_DECODER_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace semq
{

// Incremental UTF-8 validator.
//
// Chunk boundaries may split a multi-byte sequence; the incomplete tail of a
// chunk is held back and validated together with the next chunk instead of
// being rejected.
class TextDecoder
{
  public:
    TextDecoder() = default;

    // Validate the next bytes of the stream and return the complete text they
    // finish. Throws DecodeError on an invalid sequence.
    std::string decode(std::string_view bytes);

    // Signal end of input. Throws DecodeError if a sequence is left incomplete.
    void finish();

    // Bytes returned by decode() so far
    size_t offset() const
    {
        return offset_;
    }

    bool has_pending() const
    {
        return !pending_.empty();
    }

  private:
    std::string pending_;
    size_t offset_ = 0;
};

// Length of the longest prefix of `bytes` made of complete, valid UTF-8
// sequences. Sets `incomplete` when the remainder is the valid start of a
// sequence cut short; otherwise a remainder marks an invalid byte.
size_t valid_utf8_prefix(std::string_view bytes, bool& incomplete);

bool is_valid_utf8(std::string_view bytes);

} // namespace semq

#endif // SEMQ_TEXT_DECODER_HPP
