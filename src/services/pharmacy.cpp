#include "svcagent/services/pharmacy.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/services/arguments.hpp"

#include <string>
#include <vector>

namespace svcagent::services
{

namespace
{

struct Pharmacy
{
    std::string name;
    std::string address;
    std::string phone;
};

struct City
{
    std::string name;
    std::vector<std::string> aliases; // folded
    std::vector<Pharmacy> pharmacies;
};

const std::vector<City>& directory()
{
    static const std::vector<City> cities = {
        {"Ouagadougou",
         {"ouagadougou", "ouaga"},
         {{"Pharmacie du Progrès", "Avenue Kwame N'Krumah, Ouagadougou", "+226 25 30 62 22"},
          {"Pharmacie Nouvelle", "Avenue de la Nation, Ouagadougou", "+226 25 31 11 50"},
          {"Pharmacie de l'Hôpital Yalgado", "Secteur 4, face CHU Yalgado, Ouagadougou",
           "+226 25 30 66 43"},
          {"Pharmacie Wend-Kuuni", "Quartier Tampouy, Ouagadougou", "+226 25 35 41 87"}}},
        {"Bobo-Dioulasso",
         {"bobo-dioulasso", "bobo dioulasso", "bobo"},
         {{"Pharmacie du Houet", "Avenue de la Nation, Bobo-Dioulasso", "+226 20 97 01 21"},
          {"Pharmacie Sya", "Rue du Commerce, Bobo-Dioulasso", "+226 20 97 32 15"},
          {"Pharmacie de la Gare", "Place de la Gare, Bobo-Dioulasso", "+226 20 98 14 63"}}},
        {"Koudougou",
         {"koudougou"},
         {{"Pharmacie du Boulkiemdé", "Centre-ville, Koudougou", "+226 25 44 00 58"},
          {"Pharmacie Teeg-Wendé", "Secteur 2, Koudougou", "+226 25 44 13 27"}}},
        {"Ouahigouya",
         {"ouahigouya"},
         {{"Pharmacie du Yatenga", "Avenue principale, Ouahigouya", "+226 24 55 02 41"},
          {"Pharmacie Naaba Kango", "Secteur 1, Ouahigouya", "+226 24 55 18 09"}}},
        {"Banfora",
         {"banfora"},
         {{"Pharmacie de la Comoé", "Route de Bobo, Banfora", "+226 20 91 01 77"},
          {"Pharmacie des Cascades", "Centre-ville, Banfora", "+226 20 91 05 32"}}},
        {"Fada N'Gourma",
         {"fada n'gourma", "fada ngourma", "fada"},
         {{"Pharmacie du Gourma", "Avenue de la Mairie, Fada N'Gourma", "+226 24 77 01 23"},
          {"Pharmacie de l'Est", "Secteur 3, Fada N'Gourma", "+226 24 77 12 44"}}},
    };
    return cities;
}

const City* find_city(const std::string& query)
{
    auto folded = fold(trim(query));
    for (const auto& city : directory())
        for (const auto& alias : city.aliases)
            if (folded == alias)
                return &city;
    return nullptr;
}

Json emergency_numbers()
{
    return Json::array({Json{{"service", "Police"}, {"number", "17"}},
                        Json{{"service", "Pompiers"}, {"number", "18"}},
                        Json{{"service", "SAMU"}, {"number", "112"}}});
}

std::string joined_cities()
{
    std::string out;
    for (const auto& name : supported_cities())
    {
        if (!out.empty())
            out += ", ";
        out += name;
    }
    return out;
}

} // namespace

std::vector<std::string> supported_cities()
{
    std::vector<std::string> names;
    for (const auto& city : directory())
        names.push_back(city.name);
    return names;
}

Json find_pharmacy(const Json& args)
{
    try
    {
        std::string query = string_or(args, "city", "Ouagadougou");
        bool emergency = bool_or(args, "emergency", false);
        if (trim(query).empty())
            query = "Ouagadougou";

        const City* city = find_city(query);
        if (!city)
        {
            Json result = error_result("Ville non prise en charge: " + trim(query) +
                                       ". Villes disponibles: " + joined_cities());
            result["supported_cities"] = supported_cities();
            if (emergency)
                result["emergency_numbers"] = emergency_numbers();
            return result;
        }

        Json pharmacies = Json::array();
        for (const auto& p : city->pharmacies)
            pharmacies.push_back(Json{{"name", p.name},
                                      {"address", p.address},
                                      {"phone", p.phone},
                                      {"on_duty", "24h/24"}});

        Json result = {{"status", "success"},
                       {"city", city->name},
                       {"count", pharmacies.size()},
                       {"pharmacies", pharmacies},
                       {"note", "Les gardes changent chaque semaine : appelez avant de vous "
                                "déplacer."}};
        if (emergency)
            result["emergency_numbers"] = emergency_numbers();
        return result;
    }
    catch (const ValidationError& e)
    {
        return error_result(e.what());
    }
}

tools::Tool pharmacy_tool()
{
    return tools::Tool{
        "find_pharmacy",
        "Trouve les pharmacies de garde (24h/24) et numéros d'urgence au Burkina Faso.\n\n"
        "VILLES SUPPORTÉES: Ouagadougou, Bobo-Dioulasso, Koudougou, Ouahigouya, Banfora, "
        "Fada N'Gourma\n\n"
        "NUMÉROS D'URGENCE: Police: 17, Pompiers: 18, SAMU: 112",
        tools::object_schema(
            Json{{"city",
                  tools::schema_property("string", "Ville du Burkina (défaut: Ouagadougou)")},
                 {"emergency", tools::schema_property(
                                   "boolean", "Si true, inclut aussi les numéros d'urgence")}}),
        find_pharmacy};
}

} // namespace svcagent::services
