#include <iostream>
#include <semq/semq.hpp>
#include <string>

// Target type: any struct nlohmann::json can convert to
struct Recipe
{
    std::string title;
    int minutes = 0;
    std::vector<std::string> ingredients;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Recipe, title, minutes, ingredients)

int main()
{
    std::cout << "semq version: " << semq::version_string() << "\n\n";

    const std::string response = R"(Sure! Here is a quick one:

{"title": "Pancakes", "minutes": 20, "ingredients": ["flour", "milk", "eggs"]}

If you want something savory instead, try this:
{"title": "Omelette", "minutes": 10, "ingredients": ["eggs", "cheese"]}

And a note for later: {"tip": "use a hot pan"}. Enjoy!)";

    auto parsed = semq::parse_response<Recipe>(response);

    std::cout << "Found " << parsed.data_count() << " recipes in " << parsed.size()
              << " items\n\n";

    for (const auto& item : parsed)
    {
        if (const auto* data = std::get_if<semq::Data<Recipe>>(&item))
        {
            std::cout << "[Data] " << data->value.title << " (" << data->value.minutes
                      << " min, " << data->value.ingredients.size() << " ingredients)\n";
        }
        else
        {
            std::cout << "[Text] " << semq::item_text(item) << "\n";
        }
    }

    try
    {
        auto first = semq::extract_first<Recipe>("no recipes here");
        std::cout << first.title << "\n";
    }
    catch (const semq::NoMatchError& e)
    {
        std::cout << "\nextract_first: " << e.what() << "\n";
    }

    return 0;
}
