#include <gtest/gtest.h>
#include <semq/errors.hpp>
#include <semq/text_decoder.hpp>
#include <string>

using namespace semq;

TEST(TextDecoderTest, AsciiPassesThrough)
{
    TextDecoder decoder;
    EXPECT_EQ(decoder.decode("plain {\"a\":1}"), "plain {\"a\":1}");
    EXPECT_EQ(decoder.offset(), 13);
    EXPECT_FALSE(decoder.has_pending());
    EXPECT_NO_THROW(decoder.finish());
}

TEST(TextDecoderTest, MultiByteCharacterSplitAcrossChunks)
{
    const std::string euro = "\xE2\x82\xAC"; // U+20AC
    TextDecoder decoder;

    EXPECT_EQ(decoder.decode("price: \xE2"), "price: ");
    EXPECT_TRUE(decoder.has_pending());
    EXPECT_EQ(decoder.decode("\x82"), "");
    EXPECT_EQ(decoder.decode("\xAC 5"), euro + " 5");
    EXPECT_FALSE(decoder.has_pending());
    EXPECT_EQ(decoder.offset(), 7 + euro.size() + 2);
}

TEST(TextDecoderTest, FourByteSequenceByteAtATime)
{
    const std::string emoji = "\xF0\x9F\x98\x80"; // U+1F600
    TextDecoder decoder;
    std::string out;

    for (char c : emoji)
        out += decoder.decode(std::string(1, c));

    EXPECT_EQ(out, emoji);
    EXPECT_NO_THROW(decoder.finish());
}

TEST(TextDecoderTest, InvalidByteThrowsWithOffset)
{
    TextDecoder decoder;
    decoder.decode("abc");

    try
    {
        decoder.decode("d\xFF");
        FAIL() << "Expected DecodeError";
    }
    catch (const DecodeError& e)
    {
        EXPECT_EQ(e.offset(), 4);
    }
}

TEST(TextDecoderTest, TruncatedSequenceAtEndThrows)
{
    TextDecoder decoder;
    EXPECT_EQ(decoder.decode("ok\xC3"), "ok");
    EXPECT_THROW(decoder.finish(), DecodeError);
}

TEST(TextDecoderTest, RejectsOverlongAndSurrogates)
{
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));         // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xE0\x80\xAF"));     // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));     // UTF-16 surrogate
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80")); // above U+10FFFF
    EXPECT_TRUE(is_valid_utf8("\xC3\xA9"));
    EXPECT_TRUE(is_valid_utf8("\xF4\x8F\xBF\xBF"));
}

TEST(TextDecoderTest, ValidPrefixReportsIncompleteTail)
{
    bool incomplete = false;

    EXPECT_EQ(valid_utf8_prefix("ab\xE2\x82", incomplete), 2);
    EXPECT_TRUE(incomplete);

    EXPECT_EQ(valid_utf8_prefix("ab\xE2\x41", incomplete), 2);
    EXPECT_FALSE(incomplete);

    EXPECT_EQ(valid_utf8_prefix("abc", incomplete), 3);
    EXPECT_FALSE(incomplete);
}
