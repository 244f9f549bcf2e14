#include <iostream>
#include <memory>
#include <semq/semq.hpp>
#include <string>
#include <vector>

// Replays a recorded chat-completions event stream. Tokens are printed live;
// text chunks and tool calls are reported once the aggregator resolves them.

struct ToolCall
{
    std::string name;
    semq::json args;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ToolCall, name, args)

static std::string event(const std::string& token)
{
    semq::json payload;
    payload["choices"][0]["delta"]["content"] = token;
    payload["choices"][0]["finish_reason"] = nullptr;
    return "data: " + payload.dump() + "\n\n";
}

int main()
{
    std::vector<std::string> tokens = {
        "Let me ", "check the docs.", "\n\n", "{\"name\":", " \"fetch_docs\", ",
        "\"args\": {\"q\": ", "\"tokio runtime\"}}", " Then I'll summarize.",
    };

    std::string wire;
    for (const auto& token : tokens)
        wire += event(token);
    wire += "data: [DONE]\n\n";

    semq::EventItemStream<ToolCall> stream(std::make_unique<semq::StringSource>(wire),
                                           semq::EventProtocol::openai());

    try
    {
        for (const auto& item : stream)
        {
            if (const auto* token = std::get_if<semq::Token>(&item))
            {
                std::cout << "token: " << semq::json(token->text).dump() << "\n";
            }
            else if (const auto* text = std::get_if<semq::TextContent>(&item))
            {
                std::cout << "  text chunk: " << text->text << "\n";
            }
            else
            {
                const auto& call = std::get<semq::Data<ToolCall>>(item).value;
                std::cout << "  tool call: " << call.name << " " << call.args.dump() << "\n";
            }
        }
    }
    catch (const semq::SemqError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
