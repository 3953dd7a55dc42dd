#include "svcagent/services/government_services.hpp"

#include <cassert>
#include <string>

using namespace svcagent;

static std::string service_for(const std::string& query)
{
    auto r = services::get_government_service_info(Json{{"service_name", query}});
    assert(r["status"] == "success");
    return r["service"].get<std::string>();
}

int main()
{
    auto passport = services::get_government_service_info(Json{{"service_name", "Passeport"}});
    assert(passport["status"] == "success");
    assert(passport["service"] == "Passeport");
    assert(!passport["required_documents"].empty());
    assert(!passport["procedure"].empty());
    assert(passport.contains("cost"));
    assert(passport.contains("delay"));
    assert(passport.contains("office"));

    // Aliases and accents
    assert(service_for("cnib") == "CNIB");
    assert(service_for("Carte d'identité") == "CNIB");
    assert(service_for("permis") == "Permis de conduire");
    assert(service_for("extrait d'acte de naissance") == "Acte de naissance");
    assert(service_for("CERTIFICAT DE NATIONALITÉ") == "Certificat de nationalité");
    assert(service_for("extrait de casier judiciaire") == "Casier judiciaire");
    assert(service_for("carte grise") == "Carte grise");
    assert(service_for("visa touristique") == "Visa");

    // Too short or missing
    auto short_name = services::get_government_service_info(Json{{"service_name", "a"}});
    assert(short_name["status"] == "error");
    assert(short_name["message"].get<std::string>().find("Passeport") != std::string::npos);
    assert(services::get_government_service_info(Json::object())["status"] == "error");

    // Aliases match anywhere in the query
    assert(service_for("permis de pêche") == "Permis de conduire");

    // Unknown service
    auto none = services::get_government_service_info(Json{{"service_name", "licence de taxi"}});
    assert(none["status"] == "error");
    assert(none["available_services"].size() == 8);

    assert(services::get_government_service_info(Json{{"service_name", true}})["status"] ==
           "error");

    auto tool = services::government_services_tool();
    assert(tool.name() == "get_government_service_info");
    assert(tool.input_schema()["required"] == Json::array({"service_name"}));
    return 0;
}
