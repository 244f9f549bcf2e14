#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <semq/errors.hpp>
#include <semq/extract.hpp>
#include <string>
#include <variant>
#include <vector>

using namespace semq;
using semq::test::Named;
using semq::test::Point;

namespace
{

struct Item
{
    int x = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Item, x)

struct Meta
{
    std::vector<std::string> tags;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Meta, tags)

struct ComplexItem
{
    unsigned id = 0;
    std::string name;
    Meta meta;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ComplexItem, id, name, meta)

// Internally tagged union: {"type":"Tool",...} or {"type":"Notice",...}
struct Tool
{
    std::string name;
    json args;
};

struct Notice
{
    std::string message;
};

using Event = std::variant<Tool, Notice>;

std::optional<Event> event_from_json(const json& j)
{
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string())
        return std::nullopt;

    try
    {
        const std::string type = j["type"].get<std::string>();
        if (type == "Tool")
            return Event(Tool{j.at("name").get<std::string>(), j.at("args")});
        if (type == "Notice")
            return Event(Notice{j.at("message").get<std::string>()});
    }
    catch (const json::exception&)
    {
    }
    return std::nullopt;
}

} // namespace

namespace semq
{

template <>
struct Deserializer<Event>
{
    static std::optional<Event> from_text(std::string_view text)
    {
        json j = json::parse(text.begin(), text.end(), nullptr, false);
        if (j.is_discarded())
            return std::nullopt;
        return event_from_json(j);
    }
};

template <>
struct Deserializer<std::vector<Event>>
{
    static std::optional<std::vector<Event>> from_text(std::string_view text)
    {
        json j = json::parse(text.begin(), text.end(), nullptr, false);
        if (j.is_discarded() || !j.is_array())
            return std::nullopt;

        std::vector<Event> events;
        for (const auto& element : j)
        {
            auto event = event_from_json(element);
            if (!event)
                return std::nullopt;
            events.push_back(std::move(*event));
        }
        return events;
    }
};

} // namespace semq

// ============================================================================
// Deserializer
// ============================================================================

TEST(DeserializerTest, DefaultUsesFromJson)
{
    auto point = Deserializer<Point>::from_text(R"({"x": 3, "y": -4, "extra": true})");
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(point->x, 3);
    EXPECT_EQ(point->y, -4);
}

TEST(DeserializerTest, MismatchIsNotAnError)
{
    EXPECT_FALSE(Deserializer<Point>::from_text(R"({"x": 3})").has_value());
    EXPECT_FALSE(Deserializer<Point>::from_text(R"({"x": "3", "y": 1})").has_value());
    EXPECT_FALSE(Deserializer<Point>::from_text("[1, 2]").has_value());
    EXPECT_FALSE(Deserializer<Point>::from_text(R"({"x": 1, "y": )").has_value());
    EXPECT_FALSE(Deserializer<Named>::from_text("not json").has_value());
}

// ============================================================================
// extract_node / deserialize_stream_map
// ============================================================================

TEST(ExtractNodeTest, ParentTakesPrecedence)
{
    const std::string text = R"({"name":"outer","inner":{"name":"inner"}})";
    auto roots = find_json_structures(text);
    ASSERT_EQ(roots.size(), 1);

    auto items = extract_node<Named>(text, roots[0]);

    ASSERT_EQ(items.size(), 1);
    auto* parsed = std::get_if<Parsed<Named>>(&items[0]);
    ASSERT_NE(parsed, nullptr);
    EXPECT_EQ(parsed->value.name, "outer");
    EXPECT_EQ(parsed->node, roots[0]);
}

TEST(ExtractNodeTest, DescendsWhenParentDoesNotMatch)
{
    const std::string text = R"([{"name":"a"},{"name":"b"}])";
    auto roots = find_json_structures(text);
    ASSERT_EQ(roots.size(), 1);

    auto items = extract_node<Named>(text, roots[0]);

    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(std::get<Parsed<Named>>(items[0]).value.name, "a");
    EXPECT_EQ(std::get<Parsed<Named>>(items[1]).value.name, "b");
}

TEST(ExtractNodeTest, UnmatchedSiblingsStayAsUnknown)
{
    const std::string text = R"({"wrapper":{"name":"x"},"other":[1]})";
    auto roots = find_json_structures(text);
    ASSERT_EQ(roots.size(), 1);

    auto items = extract_node<Named>(text, roots[0]);

    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(std::get<Parsed<Named>>(items[0]).value.name, "x");
    auto* unknown = std::get_if<Unknown>(&items[1]);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(node_span(text, unknown->node), "[1]");
}

TEST(ExtractNodeTest, NoMatchAnywhereYieldsSingleUnknown)
{
    const std::string text = R"({"a":{"b":[1,{"c":2}]}})";
    auto roots = find_json_structures(text);
    ASSERT_EQ(roots.size(), 1);

    auto items = extract_node<Named>(text, roots[0]);

    ASSERT_EQ(items.size(), 1);
    auto* unknown = std::get_if<Unknown>(&items[0]);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->node, roots[0]);
}

TEST(ExtractNodeTest, HonoursTextOrigin)
{
    const std::string text = R"({"x":1,"y":2})";
    StructureNode node;
    node.start = 100;
    node.end = 100 + text.size() - 1;

    auto items = extract_node<Point>(text, node, 100);

    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(std::get<Parsed<Point>>(items[0]).value.y, 2);
    EXPECT_EQ(extracted_node<Point>(items[0]).start, 100);
}

TEST(ExtractNodeTest, StreamMapKeepsEveryRoot)
{
    const std::string text = R"(noise {"name":"x"} {"other":1} [] tail)";

    auto items = deserialize_stream_map<Named>(text);

    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(std::get<Parsed<Named>>(items[0]).value.name, "x");
    EXPECT_EQ(node_span(text, std::get<Unknown>(items[1]).node), R"({"other":1})");
    EXPECT_EQ(node_span(text, std::get<Unknown>(items[2]).node), "[]");
}

TEST(ExtractNodeTest, OutputIsOrderedAndDisjoint)
{
    const std::string text = R"(a [{"name":"1"}, {"z":[{"name":"2"}]}, 7] b {"q":0} c {"name":"3"})";

    auto items = deserialize_stream_map<Named>(text);

    size_t previous_end = 0;
    bool first = true;
    for (const auto& item : items)
    {
        const auto& node = extracted_node<Named>(item);
        if (!first)
            EXPECT_GT(node.start, previous_end);
        previous_end = node.end;
        first = false;
    }

    std::vector<std::string> names;
    for (const auto& item : items)
    {
        if (auto* parsed = std::get_if<Parsed<Named>>(&item))
            names.push_back(parsed->value.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"1", "2", "3"}));
}

// ============================================================================
// extract_all / extract_first
// ============================================================================

TEST(ExtractAllTest, FromArray)
{
    auto v = extract_all<Item>(R"([{"x":1},{"x":2},{"x":3}])");
    ASSERT_EQ(v.size(), 3);
    EXPECT_EQ(v[0].x, 1);
    EXPECT_EQ(v[2].x, 3);
}

TEST(ExtractAllTest, MixedTextAndObjects)
{
    auto v = extract_all<Item>(R"(prefix {"x":10} middle {"y":99} tail {"x":20} end)");
    ASSERT_EQ(v.size(), 2);
    EXPECT_EQ(v[0].x, 10);
    EXPECT_EQ(v[1].x, 20);
}

TEST(ExtractAllTest, NestedArrayInText)
{
    auto v = extract_all<Item>(R"(noise [{"x":7},{"x":8}] more {"x":9})");
    ASSERT_EQ(v.size(), 3);
    EXPECT_EQ(v[0].x, 7);
    EXPECT_EQ(v[1].x, 8);
    EXPECT_EQ(v[2].x, 9);
}

TEST(ExtractAllTest, TaggedUnionsThroughCustomDeserializer)
{
    const std::string text = R"(
Start
{"type":"Notice","message":"warming up"}
[ {"type":"Tool","name":"open","args":{"path":"/tmp"}}, {"type":"Notice","message":"opened"} ]
End
{"type":"Tool","name":"close","args":{}}
)";

    auto events = extract_all<Event>(text);

    ASSERT_EQ(events.size(), 4);
    ASSERT_TRUE(std::holds_alternative<Notice>(events[0]));
    EXPECT_EQ(std::get<Notice>(events[0]).message, "warming up");
    ASSERT_TRUE(std::holds_alternative<Tool>(events[1]));
    EXPECT_EQ(std::get<Tool>(events[1]).name, "open");
    EXPECT_EQ(std::get<Tool>(events[1]).args["path"], "/tmp");
    ASSERT_TRUE(std::holds_alternative<Notice>(events[2]));
    EXPECT_EQ(std::get<Notice>(events[2]).message, "opened");
    ASSERT_TRUE(std::holds_alternative<Tool>(events[3]));
    EXPECT_EQ(std::get<Tool>(events[3]).name, "close");
}

TEST(ExtractAllTest, ComplexStructsArraysAndSingletons)
{
    const std::string text = R"(
prefix
[{"id":1,"name":"alpha","meta":{"tags":["x","y"]}},
 {"id":2,"name":"beta","meta":{"tags":["z"]}}]
tail {"id":3,"name":"gamma","meta":{"tags":[]}}
)";

    auto items = extract_all<ComplexItem>(text);

    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(items[0].id, 1u);
    EXPECT_EQ(items[1].meta.tags[0], "z");
    EXPECT_EQ(items[2].name, "gamma");
    EXPECT_TRUE(items[2].meta.tags.empty());
}

TEST(ExtractAllTest, NothingToExtract)
{
    EXPECT_TRUE(extract_all<Item>("no json here").empty());
    EXPECT_TRUE(extract_all<Item>(R"({"y":1} [2, 3])").empty());
}

TEST(ExtractFirstTest, ReturnsFirstMatch)
{
    auto named = extract_first<Named>(R"(Sure: {"id":1} then {"name":"first"} and {"name":"second"})");
    EXPECT_EQ(named.name, "first");
}

TEST(ExtractFirstTest, ThrowsWithRawTextWhenNothingMatches)
{
    const std::string text = R"(only {"id":1} here)";
    try
    {
        extract_first<Named>(text);
        FAIL() << "Expected NoMatchError";
    }
    catch (const NoMatchError& e)
    {
        EXPECT_EQ(e.raw(), text);
        EXPECT_NE(std::string(e.what()).find("No matching JSON"), std::string::npos);
    }
}
