#include <iostream>
#include <memory>
#include <semq/semq.hpp>
#include <string>
#include <unistd.h>

// Reads model output from stdin as it arrives and prints each item the moment
// it is resolved. Try:
//
//   (echo -n 'Checking {"tool": "ls", '; sleep 1; echo '"args": ["-l"]} done') | ./streaming_mode

struct ToolCall
{
    std::string tool;
    std::vector<std::string> args;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ToolCall, tool, args)

int main()
{
    semq::StreamOptions options;
    options.log_callback = [](semq::LogLevel level, const std::string& message)
    { std::cerr << "[" << semq::to_string(level) << "] " << message << "\n"; };

    semq::ItemStream<ToolCall> stream(std::make_unique<semq::FdSource>(STDIN_FILENO), options);

    try
    {
        for (const auto& item : stream)
        {
            if (const auto* data = std::get_if<semq::Data<ToolCall>>(&item))
            {
                std::cout << "\n>>> call " << data->value.tool;
                for (const auto& arg : data->value.args)
                    std::cout << " " << arg;
                std::cout << "\n";
            }
            else
            {
                std::cout << semq::item_text(item);
            }
            std::cout.flush();
        }
    }
    catch (const semq::DecodeError& e)
    {
        std::cerr << "\nError: input is not UTF-8 - " << e.what() << "\n";
        return 1;
    }
    catch (const semq::SemqError& e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n";
    return 0;
}
