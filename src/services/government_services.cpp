#include "svcagent/services/government_services.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/services/arguments.hpp"

#include <string>
#include <vector>

namespace svcagent::services
{

namespace
{

struct Procedure
{
    std::string name;
    std::vector<std::string> aliases; // folded; matched as substrings of the query
    std::vector<std::string> documents;
    std::vector<std::string> steps;
    std::string cost;
    std::string delay;
    std::string office;
};

const std::vector<Procedure>& procedures()
{
    static const std::vector<Procedure> table = {
        {"Passeport",
         {"passeport", "passport"},
         {"CNIB en cours de validité", "Extrait d'acte de naissance",
          "Ancien passeport (en cas de renouvellement)", "Quittance de paiement"},
         {"Pré-enrôlement en ligne", "Paiement des frais au Trésor public",
          "Enrôlement biométrique (photo et empreintes) à l'ONI",
          "Retrait du passeport sur présentation du récépissé"},
         "50 000 FCFA (passeport ordinaire)",
         "2 à 4 semaines",
         "Office National d'Identification (ONI) et ses antennes régionales"},
        {"CNIB",
         {"cnib", "carte d'identite", "carte nationale", "identite"},
         {"Extrait d'acte de naissance ou jugement supplétif", "Certificat de résidence",
          "Ancienne CNIB (renouvellement) ou déclaration de perte"},
         {"Dépôt du dossier au commissariat ou à l'antenne ONI",
          "Prise de photo et d'empreintes", "Retrait de la carte avec le récépissé"},
         "2 500 FCFA",
         "1 à 3 semaines",
         "Commissariats de police et antennes ONI"},
        {"Permis de conduire",
         {"permis", "conduire", "driving"},
         {"CNIB", "Certificat médical d'aptitude", "Quatre photos d'identité",
          "Attestation de réussite au code et à la conduite"},
         {"Inscription dans une auto-école agréée", "Examen du code de la route",
          "Examen pratique de conduite", "Établissement du permis au CCVA"},
         "Environ 30 000 FCFA de frais administratifs (hors auto-école)",
         "1 à 2 mois après l'examen",
         "Centre de Contrôle des Véhicules Automobiles (CCVA)"},
        {"Acte de naissance",
         {"acte de naissance", "naissance"},
         {"CNIB du demandeur", "Références de l'acte (numéro, année, centre d'état civil)"},
         {"Demande au centre d'état civil de la commune de naissance",
          "Vérification dans le registre", "Délivrance de l'extrait"},
         "Gratuit à 500 FCFA selon la commune",
         "Le jour même à 3 jours",
         "Mairie (centre d'état civil) du lieu de naissance"},
        {"Certificat de nationalité",
         {"nationalite", "certificat de nationalite"},
         {"Extrait d'acte de naissance", "CNIB", "Acte de naissance d'un parent burkinabè",
          "Timbre fiscal"},
         {"Dépôt de la demande au tribunal de grande instance",
          "Instruction du dossier par le greffe", "Retrait du certificat"},
         "1 500 FCFA de timbre",
         "1 à 2 semaines",
         "Tribunal de Grande Instance du lieu de résidence"},
        {"Casier judiciaire",
         {"casier", "judiciaire", "bulletin n°3", "bulletin 3"},
         {"Extrait d'acte de naissance", "CNIB", "Timbre fiscal"},
         {"Demande au greffe du tribunal du lieu de naissance",
          "Paiement du timbre", "Retrait du bulletin n°3"},
         "500 FCFA de timbre",
         "24 à 72 heures",
         "Greffe du Tribunal de Grande Instance du lieu de naissance"},
        {"Carte grise",
         {"carte grise", "immatriculation", "vehicule"},
         {"Certificat de mise en circulation ou ancienne carte grise",
          "Facture ou acte de vente", "CNIB du propriétaire", "Quitus fiscal"},
         {"Contrôle technique du véhicule", "Dépôt du dossier au CCVA",
          "Paiement des droits", "Retrait de la carte grise"},
         "Variable selon la puissance fiscale du véhicule",
         "1 à 2 semaines",
         "Centre de Contrôle des Véhicules Automobiles (CCVA)"},
        {"Visa",
         {"visa"},
         {"Passeport valide au moins 6 mois", "Formulaire de demande rempli",
          "Deux photos d'identité", "Certificat de vaccination contre la fièvre jaune",
          "Réservation d'hébergement ou lettre d'invitation"},
         {"Demande en ligne (e-visa) ou auprès de l'ambassade",
          "Paiement des frais", "Délivrance du visa ou de l'autorisation électronique"},
         "Selon la durée et le nombre d'entrées",
         "3 à 10 jours ouvrables",
         "Direction Générale de la Police Nationale, service des visas, ou ambassades"},
    };
    return table;
}

const Procedure* find_procedure(const std::string& query)
{
    auto folded = fold(trim(query));
    // Exact canonical name first, then aliases.
    for (const auto& p : procedures())
        if (fold(p.name) == folded)
            return &p;
    for (const auto& p : procedures())
        for (const auto& alias : p.aliases)
            if (folded.find(alias) != std::string::npos)
                return &p;
    return nullptr;
}

std::string services_sentence()
{
    std::string out;
    for (const auto& name : available_services())
    {
        if (!out.empty())
            out += ", ";
        out += name;
    }
    return out;
}

} // namespace

std::vector<std::string> available_services()
{
    std::vector<std::string> names;
    for (const auto& p : procedures())
        names.push_back(p.name);
    return names;
}

Json get_government_service_info(const Json& args)
{
    try
    {
        std::string service_name = trim(string_or(args, "service_name", ""));
        if (service_name.size() < 2)
            return error_result("Veuillez préciser le service recherché. Services disponibles: " +
                                services_sentence());

        const Procedure* p = find_procedure(service_name);
        if (!p)
        {
            Json result = error_result("Service non trouvé: " + service_name +
                                       ". Services disponibles: " + services_sentence());
            result["available_services"] = available_services();
            return result;
        }

        return Json{{"status", "success"},
                    {"service", p->name},
                    {"required_documents", p->documents},
                    {"procedure", p->steps},
                    {"cost", p->cost},
                    {"delay", p->delay},
                    {"office", p->office},
                    {"note", "Les tarifs et délais sont indicatifs et peuvent évoluer."}};
    }
    catch (const ValidationError& e)
    {
        return error_result(e.what());
    }
}

tools::Tool government_services_tool()
{
    return tools::Tool{
        "get_government_service_info",
        "Informations sur les démarches administratives au Burkina Faso.\n\n"
        "SERVICES DISPONIBLES:\n"
        "- Passeport\n"
        "- Carte d'identité nationale (CNIB)\n"
        "- Permis de conduire\n"
        "- Acte de naissance\n"
        "- Certificat de nationalité\n"
        "- Casier judiciaire\n"
        "- Carte grise\n"
        "- Visa\n\n"
        "Retourne documents requis, procédure, coûts et délais.",
        tools::object_schema(
            Json{{"service_name",
                  tools::schema_property("string",
                                         "Nom du service (ex: 'Passeport', 'CNIB', 'Permis')")}},
            {"service_name"}),
        get_government_service_info};
}

} // namespace svcagent::services
