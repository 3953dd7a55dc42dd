#include "svcagent/services/exercises.hpp"

#include <cassert>
#include <string>

using namespace svcagent;

int main()
{
    // No filters: default page size
    auto all = services::search_exercises(Json::object());
    assert(all["status"] == "success");
    assert(all["count"] == 10);
    assert(all["max_results"] == 10);
    assert(all["exercises"].size() == 10);

    // Muscle and difficulty filters, case-insensitive
    auto biceps = services::search_exercises(Json{{"muscle", "Biceps"}, {"difficulty", "BEGINNER"}});
    assert(biceps["status"] == "success");
    assert(biceps["count"] == 2);
    for (const auto& e : biceps["exercises"])
    {
        assert(e["muscle"] == "biceps");
        assert(e["difficulty"] == "beginner");
        assert(!e["instructions"].get<std::string>().empty());
    }
    assert(biceps["filters"]["muscle"] == "biceps");

    // French names are understood
    auto jambes = services::search_exercises(Json{{"muscle", "jambes"}, {"difficulty", "débutant"}});
    assert(jambes["count"].get<int>() >= 1);
    for (const auto& e : jambes["exercises"])
        assert(e["muscle"] == "legs");

    // Partial name search
    auto push = services::search_exercises(Json{{"name", "push"}});
    assert(push["count"] == 4);

    // max_results is clamped to 1..30
    assert(services::search_exercises(Json{{"max_results", 0}})["count"] == 1);
    auto capped = services::search_exercises(Json{{"max_results", 500}});
    assert(capped["max_results"] == 30);
    assert(capped["count"] == 28);
    assert(services::search_exercises(Json{{"max_results", "3"}})["count"] == 3);

    // Empty match carries a message
    auto none = services::search_exercises(Json{{"name", "zumba"}});
    assert(none["status"] == "success");
    assert(none["count"] == 0);
    assert(none.contains("message"));

    // Validation paths
    assert(services::search_exercises(Json{{"type", "yoga"}})["status"] == "error");
    assert(services::search_exercises(Json{{"difficulty", "legend"}})["status"] == "error");
    assert(services::search_exercises(Json{{"max_results", "many"}})["status"] == "error");
    assert(services::search_exercises(Json{{"max_results", 4294967297LL}})["status"] == "error");
    assert(services::search_exercises(Json{{"muscle", 7}})["status"] == "error");

    auto tool = services::exercises_tool();
    assert(tool.name() == "search_exercises");
    assert(tool.input_schema()["required"].empty());
    return 0;
}
