#include "../test_utils.hpp"

#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <semq/event_stream.hpp>
#include <semq/source.hpp>
#include <semq/stream.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace semq;
using semq::test::Named;
using semq::test::ToolCall;

// ============================================================================
// End-to-end pipelines over a real pipe
// ============================================================================
//
// A writer thread plays the part of a model producing output: it writes
// small pieces with short pauses, so reads on the other end return partial
// structures, split escapes and split multi-byte characters.
// ============================================================================

namespace
{

class PipeWriter
{
  public:
    PipeWriter()
    {
        if (::pipe(fds_) != 0)
            throw std::runtime_error("pipe failed");
    }

    ~PipeWriter()
    {
        if (thread_.joinable())
            thread_.join();
        if (fds_[1] >= 0)
            ::close(fds_[1]);
    }

    // Read end, handed to an FdSource that takes ownership
    int release_read_end()
    {
        int fd = fds_[0];
        fds_[0] = -1;
        return fd;
    }

    void start(std::vector<std::string> pieces)
    {
        thread_ = std::thread(
            [this, pieces = std::move(pieces)]()
            {
                for (const auto& piece : pieces)
                {
                    size_t written = 0;
                    while (written < piece.size())
                    {
                        ssize_t n = ::write(fds_[1], piece.data() + written, piece.size() - written);
                        if (n <= 0)
                            break;
                        written += static_cast<size_t>(n);
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
                ::close(fds_[1]);
                fds_[1] = -1;
            });
    }

  private:
    int fds_[2] = {-1, -1};
    std::thread thread_;
};

} // namespace

TEST(PipePipelineTest, ItemStreamOverPipe)
{
    const std::string text = "Plan: caf\xC3\xA9 {\"name\":\"a \\\"b\\\" }\"} middle "
                             "[{\"name\":\"c\"}, 9] end";

    PipeWriter writer;
    ItemStream<Named> stream(std::make_unique<FdSource>(writer.release_read_end(), true));
    writer.start(semq::test::split_every(text, 3));
    auto items = stream.collect();

    std::vector<std::string> names;
    for (const auto& item : items)
    {
        if (auto* data = std::get_if<Data<Named>>(&item))
            names.push_back(data->value.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"a \"b\" }", "c"}));

    const auto expected = build_parsed_stream<Named>(text);
    ASSERT_EQ(items.size(), expected.size());
    for (size_t i = 0; i < items.size(); ++i)
        EXPECT_EQ(item_text(items[i]), item_text(expected[i]));
}

TEST(PipePipelineTest, EventStreamOverPipe)
{
    std::string wire;
    for (const auto& token : {"Calling ", "the tool", ":\n\n", "{\"name\":", "\"lookup\",",
                              "\"args\":{\"id\":", "42}}", " and done"})
        wire += semq::test::sse_event(token);
    wire += semq::test::sse_done();

    PipeWriter writer;
    EventItemStream<ToolCall> stream(std::make_unique<FdSource>(writer.release_read_end(), true));
    writer.start(semq::test::split_every(wire, 17));

    auto items = stream.collect();

    EXPECT_EQ(semq::test::tokens_of(items),
              "Calling the tool:\n\n{\"name\":\"lookup\",\"args\":{\"id\":42}} and done");

    auto events = semq::test::without_tokens(items);
    ASSERT_EQ(events.size(), 3);
    EXPECT_EQ(item_text(events[0]), "Calling the tool:");
    ASSERT_TRUE(is_data(events[1]));
    EXPECT_EQ(std::get<Data<ToolCall>>(events[1]).value.name, "lookup");
    EXPECT_EQ(std::get<Data<ToolCall>>(events[1]).value.args["id"], 42);
    EXPECT_EQ(item_text(events[2]), "and done");
}

TEST(PipePipelineTest, AbandonedStreamStopsReading)
{
    // Writes after the read end is closed must fail with EPIPE instead of killing the test
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> pieces;
    pieces.push_back("first {\"name\":\"1\"}");
    for (int i = 0; i < 20; ++i)
        pieces.push_back(" filler");

    PipeWriter writer;
    {
        ItemStream<Named> stream(std::make_unique<FdSource>(writer.release_read_end(), true));
        writer.start(pieces);

        auto first = stream.next();
        ASSERT_TRUE(first.has_value());
        EXPECT_EQ(item_text(*first), "first ");
    }
}
