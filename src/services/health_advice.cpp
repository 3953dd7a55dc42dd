#include "svcagent/services/health_advice.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/services/arguments.hpp"

#include <string>
#include <vector>

namespace svcagent::services
{

namespace
{

struct Condition
{
    std::string id;
    std::string label;
    std::vector<std::string> keywords; // folded (lower case, no accents)
    std::vector<std::string> advice;
    std::vector<std::string> remedies;
    std::string consult_when;
};

const std::vector<Condition>& conditions()
{
    static const std::vector<Condition> table = {
        {"headache",
         "Maux de tête",
         {"mal de tete", "maux de tete", "migraine", "cephalee", "headache", "tete"},
         {"Reposez-vous dans une pièce calme et peu éclairée",
          "Buvez au moins 1,5 litre d'eau par jour",
          "Limitez les écrans et le café"},
         {"Compresse froide sur le front pendant 15 minutes",
          "Infusion de gingembre ou de citronnelle"},
         "Consultez si la douleur est brutale et intense, dure plus de 72 heures ou "
         "s'accompagne de fièvre, de raideur de la nuque ou de troubles de la vision."},
        {"fever",
         "Fièvre",
         {"fievre", "temperature", "chaud", "frissons", "fever"},
         {"Hydratez-vous souvent (eau, solutions de réhydratation orale)",
          "Portez des vêtements légers et reposez-vous",
          "Le paludisme est fréquent : faites un test de diagnostic rapide en cas de fièvre"},
         {"Linge humide et tiède sur le front et la nuque",
          "Tisane de feuilles de citronnelle"},
         "Consultez dans les 24 heures si la fièvre dépasse 39°C, dure plus de 2 jours, "
         "ou immédiatement chez un nourrisson, une femme enceinte ou en cas de convulsions."},
        {"cough",
         "Toux",
         {"toux", "tousse", "tousser", "gorge", "cough"},
         {"Buvez des boissons chaudes", "Évitez la fumée et la poussière",
          "Humidifiez l'air de la chambre"},
         {"Miel et citron dans de l'eau tiède (pas avant 1 an)",
          "Inhalation de vapeur d'eau chaude"},
         "Consultez si la toux dure plus de 2 semaines, s'accompagne de sang, "
         "d'essoufflement ou de fièvre persistante."},
        {"bloating",
         "Ballonnement",
         {"ballonnement", "ballonne", "gaz", "flatulence", "ventre gonfle"},
         {"Mangez lentement et en petites quantités",
          "Évitez les boissons gazeuses et les aliments très gras",
          "Marchez 15 à 20 minutes après les repas"},
         {"Infusion de menthe ou de fenouil", "Tisane de gingembre"},
         "Consultez si le ballonnement est associé à une perte de poids, du sang dans "
         "les selles ou des vomissements."},
        {"abdominal_pain",
         "Douleur abdominale",
         {"mal au ventre", "douleur abdominale", "ventre", "estomac", "crampe", "diarrhee"},
         {"Privilégiez une alimentation légère (riz, bouillie, banane)",
          "Buvez de l'eau potable ou des solutions de réhydratation orale",
          "Évitez l'alcool et les épices"},
         {"Bouillotte tiède sur le ventre", "Eau de riz en cas de diarrhée"},
         "Consultez en urgence si la douleur est violente, localisée en bas à droite, "
         "ou accompagnée de fièvre, de vomissements répétés ou de sang."},
        {"fatigue",
         "Fatigue",
         {"fatigue", "epuise", "faiblesse", "manque d'energie"},
         {"Dormez 7 à 9 heures par nuit à heures régulières",
          "Mangez équilibré, avec fruits, légumes et légumineuses",
          "Pratiquez une activité physique modérée"},
         {"Jus de bissap ou de baobab riches en vitamines", "Courtes siestes de 20 minutes"},
         "Consultez si la fatigue dure plus de 3 semaines ou s'accompagne de "
         "pâleur, d'essoufflement ou d'amaigrissement."},
        {"insomnia",
         "Insomnie",
         {"insomnie", "dormir", "sommeil", "nuit blanche", "reveil"},
         {"Couchez-vous et levez-vous à heure fixe",
          "Évitez les écrans une heure avant le coucher",
          "Pas de café ni de thé après 16 heures"},
         {"Infusion de verveine ou de camomille", "Respiration lente 4-7-8 au coucher"},
         "Consultez si l'insomnie dure plus d'un mois ou retentit sur votre journée."},
        {"muscle_pain",
         "Douleurs musculaires",
         {"douleur musculaire", "douleurs musculaires", "courbature", "muscle", "dos",
          "contracture"},
         {"Reposez le muscle douloureux sans l'immobiliser totalement",
          "Étirez-vous doucement", "Hydratez-vous bien"},
         {"Massage au beurre de karité", "Bain ou compresse chaude"},
         "Consultez si la douleur suit un traumatisme, s'accompagne d'un gonflement "
         "important ou ne s'améliore pas en une semaine."},
    };
    return table;
}

Json condition_json(const Condition& c)
{
    return Json{{"condition", c.id},
                {"label", c.label},
                {"advice", c.advice},
                {"natural_remedies", c.remedies},
                {"consult_when", c.consult_when}};
}

std::vector<std::string> profile_notes(int age, const std::string& sex)
{
    std::vector<std::string> notes;
    if (age < 5)
        notes.push_back("Chez le jeune enfant, consultez rapidement un agent de santé : "
                        "les symptômes peuvent s'aggraver vite.");
    else if (age < 18)
        notes.push_back("Pour un enfant ou un adolescent, adaptez les doses de tout "
                        "médicament au poids et demandez conseil au pharmacien.");
    else if (age >= 65)
        notes.push_back("Après 65 ans, surveillez l'hydratation et consultez plus tôt en "
                        "cas de fièvre ou de fatigue inhabituelle.");
    if (sex == "female" && age >= 15 && age <= 49)
        notes.push_back("En cas de grossesse possible, demandez l'avis d'un professionnel "
                        "avant de prendre un médicament ou une plante.");
    return notes;
}

} // namespace

Json get_health_advice(const Json& args)
{
    try
    {
        std::string symptoms = trim(string_or(args, "symptoms", ""));
        if (symptoms.size() < 3)
            return error_result("Veuillez décrire vos symptômes (minimum 3 caractères). "
                                "Exemple: 'mal de tête', 'fièvre'");

        int age = int_or(args, "age", 30);
        if (age < 0 || age > 130)
            return error_result("L'âge doit être compris entre 0 et 130 ans");

        std::string sex = fold(trim(string_or(args, "sex", "male")));
        if (sex == "homme" || sex == "m")
            sex = "male";
        else if (sex == "femme" || sex == "f")
            sex = "female";
        if (sex != "male" && sex != "female")
            return error_result("Le sexe doit être 'male' ou 'female'");

        std::string folded = fold(symptoms);
        Json matched = Json::array();
        for (const auto& c : conditions())
        {
            for (const auto& kw : c.keywords)
            {
                if (folded.find(fold(kw)) != std::string::npos)
                {
                    matched.push_back(condition_json(c));
                    break;
                }
            }
        }

        Json result = {
            {"status", "success"},
            {"symptoms", symptoms},
            {"age", age},
            {"sex", sex},
            {"matched_conditions", matched},
            {"profile_notes", profile_notes(age, sex)},
            {"emergency_numbers", Json{{"SAMU", "112"}, {"Pompiers", "18"}}},
            {"disclaimer", "Conseils généraux uniquement. Consultez un médecin pour tout "
                           "problème sérieux."},
        };
        if (matched.empty())
        {
            result["general_advice"] = Json::array(
                {"Reposez-vous et hydratez-vous", "Surveillez l'évolution des symptômes",
                 "Consultez un centre de santé si les symptômes persistent ou s'aggravent"});
            result["message"] = "Symptômes non reconnus. Voici des conseils généraux.";
        }
        return result;
    }
    catch (const ValidationError& e)
    {
        return error_result(e.what());
    }
}

tools::Tool health_advice_tool()
{
    return tools::Tool{
        "get_health_advice",
        "Analyse des symptômes et conseils santé, remèdes et recommandations.\n\n"
        "SYMPTÔMES SUPPORTÉS:\n"
        "- Maux de tête, fièvre, toux\n"
        "- Ballonnement, douleur abdominale\n"
        "- Fatigue, insomnie\n"
        "- Douleurs musculaires\n\n"
        "⚠️ AVERTISSEMENT: Conseils généraux uniquement. Consulter un médecin pour tout "
        "problème sérieux.",
        tools::object_schema(
            Json{{"symptoms", tools::schema_property("string",
                                                     "Description des symptômes ressentis")},
                 {"age", tools::schema_property("integer",
                                                "Âge de la personne (pour conseils adaptés)")},
                 {"sex", tools::schema_property("string", "Sexe ('male' ou 'female')")}},
            {"symptoms"}),
        get_health_advice};
}

} // namespace svcagent::services
