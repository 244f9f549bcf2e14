#include <semq/errors.hpp>
#include <semq/text_decoder.hpp>

namespace semq
{

namespace
{

// Expected sequence length for a lead byte, 0 if it cannot start a sequence
size_t sequence_length(unsigned char lead)
{
    if (lead < 0x80)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 4;
    return 0;
}

// Checks the byte following the lead, which carries the overlong/surrogate/range limits
bool valid_second_byte(unsigned char lead, unsigned char second)
{
    switch (lead)
    {
    case 0xE0:
        return second >= 0xA0 && second <= 0xBF;
    case 0xED:
        return second >= 0x80 && second <= 0x9F;
    case 0xF0:
        return second >= 0x90 && second <= 0xBF;
    case 0xF4:
        return second >= 0x80 && second <= 0x8F;
    default:
        return (second & 0xC0) == 0x80;
    }
}

} // namespace

size_t valid_utf8_prefix(std::string_view bytes, bool& incomplete)
{
    incomplete = false;
    size_t i = 0;

    while (i < bytes.size())
    {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        const size_t len = sequence_length(lead);
        if (len == 0)
            return i;
        if (len == 1)
        {
            ++i;
            continue;
        }

        const size_t available = bytes.size() - i;
        const size_t check = available < len ? available : len;
        for (size_t k = 1; k < check; ++k)
        {
            const auto byte = static_cast<unsigned char>(bytes[i + k]);
            const bool ok = k == 1 ? valid_second_byte(lead, byte) : (byte & 0xC0) == 0x80;
            if (!ok)
                return i;
        }

        if (available < len)
        {
            incomplete = true;
            return i;
        }
        i += len;
    }

    return i;
}

bool is_valid_utf8(std::string_view bytes)
{
    bool incomplete = false;
    return valid_utf8_prefix(bytes, incomplete) == bytes.size();
}

std::string TextDecoder::decode(std::string_view bytes)
{
    pending_.append(bytes.data(), bytes.size());

    bool incomplete = false;
    const size_t valid = valid_utf8_prefix(pending_, incomplete);
    if (valid < pending_.size() && !incomplete)
    {
        const size_t at = offset_ + valid;
        pending_.clear();
        throw DecodeError("Invalid UTF-8 sequence at byte " + std::to_string(at), at);
    }

    std::string text = pending_.substr(0, valid);
    pending_.erase(0, valid);
    offset_ += valid;
    return text;
}

void TextDecoder::finish()
{
    if (pending_.empty())
        return;

    const size_t at = offset_;
    pending_.clear();
    throw DecodeError("Incomplete UTF-8 sequence at end of input (byte " + std::to_string(at) + ")",
                      at);
}

} // namespace semq
