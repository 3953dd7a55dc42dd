#include "svcagent/services/health_advice.hpp"

#include <cassert>
#include <string>

using namespace svcagent;

static bool has_condition(const Json& result, const std::string& id)
{
    for (const auto& c : result["matched_conditions"])
        if (c["condition"] == id)
            return true;
    return false;
}

int main()
{
    // Accented and capitalised symptoms still match
    auto r = services::get_health_advice(Json{{"symptoms", "J'ai de la FIÈVRE et mal à la tête"}});
    assert(r["status"] == "success");
    assert(r["age"] == 30);
    assert(r["sex"] == "male");
    assert(has_condition(r, "fever"));
    assert(has_condition(r, "headache"));
    assert(!r["matched_conditions"][0]["advice"].empty());
    assert(r.contains("disclaimer"));
    assert(!r.contains("general_advice"));

    // Profile notes depend on age and sex
    auto child = services::get_health_advice(Json{{"symptoms", "toux"}, {"age", 3}});
    assert(has_condition(child, "cough"));
    assert(child["profile_notes"].size() == 1);
    auto woman = services::get_health_advice(
        Json{{"symptoms", "insomnie"}, {"age", 28}, {"sex", "femme"}});
    assert(woman["sex"] == "female");
    assert(woman["profile_notes"].size() == 1);

    // Unknown symptoms fall back to general advice
    auto unknown = services::get_health_advice(Json{{"symptoms", "xyzzy"}});
    assert(unknown["status"] == "success");
    assert(unknown["matched_conditions"].empty());
    assert(unknown["general_advice"].size() == 3);

    // Validation paths
    assert(services::get_health_advice(Json{{"symptoms", " a "}})["status"] == "error");
    assert(services::get_health_advice(Json::object())["status"] == "error");
    assert(services::get_health_advice(Json{{"symptoms", "toux"}, {"age", 200}})["status"] ==
           "error");
    // Integers that do not fit in an int are rejected, not wrapped into range
    assert(services::get_health_advice(
               Json{{"symptoms", "toux"}, {"age", 4294967326LL}})["status"] == "error");
    assert(services::get_health_advice(
               Json{{"symptoms", "toux"}, {"age", 18446744073709551615ULL}})["status"] == "error");
    assert(services::get_health_advice(Json{{"symptoms", "toux"}, {"age", "old"}})["status"] ==
           "error");
    assert(services::get_health_advice(Json{{"symptoms", 42}})["status"] == "error");
    assert(services::get_health_advice(Json{{"symptoms", "toux"}, {"sex", "robot"}})["status"] ==
           "error");

    // Tool descriptor
    auto tool = services::health_advice_tool();
    assert(tool.name() == "get_health_advice");
    assert(tool.input_schema()["required"] == Json::array({"symptoms"}));
    assert(tool.invoke(Json{{"symptoms", "courbatures"}, {"unused", true}})["status"] ==
           "success");
    return 0;
}
