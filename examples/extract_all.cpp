#include <iostream>
#include <semq/semq.hpp>
#include <string>

struct Item
{
    int id = 0;
    std::string label;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Item, id, label)

int main()
{
    const std::string response = R"(
Here are the first two:
[{"id": 1, "label": "alpha"}, {"id": 2, "label": "beta"}]
and one more, wrapped in metadata: {"page": 2, "item": {"id": 3, "label": "gamma"}}
)";

    std::cout << "extract_all:\n";
    for (const auto& item : semq::extract_all<Item>(response))
        std::cout << "  " << item.id << " " << item.label << "\n";

    // Single-document heuristics, for responses expected to hold one JSON value
    const std::string fenced = "Result:\n```json\n{\"id\": 7, \"label\": \"fenced\"}\n```\n";
    auto result = semq::process_response(fenced);
    std::cout << "\nprocess_response (" << result.extraction_method
              << "): " << result.json_response.value_or("") << "\n";

    return 0;
}
