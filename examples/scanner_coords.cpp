#include <iostream>
#include <semq/semq.hpp>
#include <string>
#include <vector>

// Prints the structural coordinates found while text arrives in pieces

static void print_node(const std::string& text, const semq::StructureNode& node, int indent)
{
    std::cout << std::string(static_cast<size_t>(indent) * 2, ' ') << semq::to_string(node.kind)
              << " [" << node.start << ", " << node.end << "] "
              << text.substr(node.start, node.length()) << "\n";
    for (const auto& child : node.children)
        print_node(text, child, indent + 1);
}

int main()
{
    const std::vector<std::string> chunks = {"Lead {\"x\": ", "{\"y\": [1,2,3]}",
                                             ", \"z\": \"} not a closer\"}", " tail [4, {}]"};

    semq::JsonStreamScanner scanner;
    std::string text;

    for (const auto& chunk : chunks)
    {
        text += chunk;
        auto roots = scanner.feed(chunk);
        std::cout << "fed " << chunk.size() << " bytes, offset " << scanner.offset() << ", depth "
                  << scanner.depth() << ", " << roots.size() << " root(s) closed\n";
        for (const auto& root : roots)
            print_node(text, root, 1);
    }

    return 0;
}
