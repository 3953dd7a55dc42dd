#include "svcagent/services/exercises.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/services/arguments.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace svcagent::services
{

namespace
{

constexpr int kDefaultMaxResults = 10;
constexpr int kMaxResultsCap = 30;

struct Exercise
{
    std::string name;
    std::string type;
    std::string muscle;
    std::string equipment;
    std::string difficulty;
    std::string instructions;
};

const std::vector<Exercise>& catalogue()
{
    static const std::vector<Exercise> items = {
        {"Push-ups", "strength", "chest", "body_only", "beginner",
         "Mains au sol largeur d'épaules, corps gainé. Descendez la poitrine près du sol puis "
         "repoussez."},
        {"Incline Push-ups", "strength", "chest", "body_only", "beginner",
         "Mains sur un banc ou une marche, corps droit. Fléchissez les coudes puis repoussez."},
        {"Dumbbell Bench Press", "strength", "chest", "dumbbell", "intermediate",
         "Allongé sur un banc, poussez les haltères au-dessus de la poitrine puis redescendez "
         "lentement."},
        {"Bicep Curl", "strength", "biceps", "dumbbell", "beginner",
         "Debout, coudes collés au corps, montez les haltères vers les épaules puis "
         "redescendez."},
        {"Hammer Curl", "strength", "biceps", "dumbbell", "beginner",
         "Prise neutre, pouces vers le haut. Fléchissez les coudes sans balancer le buste."},
        {"Chin-ups", "strength", "biceps", "body_only", "intermediate",
         "Suspendu à une barre, paumes vers vous. Tirez jusqu'à passer le menton au-dessus."},
        {"Bench Dips", "strength", "triceps", "body_only", "beginner",
         "Mains sur un banc derrière vous, descendez en fléchissant les coudes puis "
         "remontez."},
        {"Diamond Push-ups", "strength", "triceps", "body_only", "intermediate",
         "Pompes mains jointes en losange sous la poitrine, coudes près du corps."},
        {"Superman", "strength", "back", "body_only", "beginner",
         "Allongé sur le ventre, levez bras et jambes quelques secondes puis relâchez."},
        {"Pull-ups", "strength", "back", "body_only", "expert",
         "Suspendu à une barre, paumes vers l'avant. Tirez jusqu'au menton au-dessus de la "
         "barre."},
        {"Bodyweight Squat", "strength", "legs", "body_only", "beginner",
         "Pieds largeur d'épaules, descendez les fesses en arrière puis remontez."},
        {"Walking Lunges", "strength", "legs", "body_only", "intermediate",
         "Grand pas en avant, genou arrière vers le sol, puis enchaînez avec l'autre jambe."},
        {"Pistol Squat", "strength", "legs", "body_only", "expert",
         "Sur une jambe, l'autre tendue devant, descendez le plus bas possible et remontez."},
        {"Crunches", "strength", "abdominals", "body_only", "beginner",
         "Allongé, genoux fléchis, enroulez le buste vers les genoux sans tirer sur la nuque."},
        {"Plank", "strength", "abdominals", "body_only", "beginner",
         "En appui sur les avant-bras et les pointes de pieds, gardez le corps aligné."},
        {"Hanging Leg Raise", "strength", "abdominals", "body_only", "expert",
         "Suspendu à une barre, montez les jambes tendues jusqu'à l'horizontale."},
        {"Standing Calf Raises", "strength", "calves", "body_only", "beginner",
         "Sur une marche, montez sur la pointe des pieds puis redescendez lentement."},
        {"Glute Bridge", "strength", "glutes", "body_only", "beginner",
         "Allongé, pieds au sol, soulevez le bassin en serrant les fessiers."},
        {"Hip Thrust", "strength", "glutes", "barbell", "intermediate",
         "Haut du dos sur un banc, barre sur les hanches, poussez le bassin vers le haut."},
        {"Jumping Jacks", "cardio", "legs", "body_only", "beginner",
         "Sautez en écartant bras et jambes, puis revenez pieds joints."},
        {"Jump Rope", "cardio", "calves", "other", "beginner",
         "Sautez à la corde sur l'avant des pieds, 30 secondes à 1 minute par série."},
        {"Mountain Climbers", "cardio", "abdominals", "body_only", "intermediate",
         "En position de pompe, ramenez alternativement les genoux vers la poitrine."},
        {"Burpees", "plyometrics", "legs", "body_only", "intermediate",
         "Squat, mains au sol, jambes en arrière, pompe, retour et saut vertical."},
        {"Box Jump", "plyometrics", "legs", "other", "intermediate",
         "Sautez sur une caisse stable à deux pieds, réceptionnez-vous genoux fléchis."},
        {"Clap Push-ups", "plyometrics", "chest", "body_only", "expert",
         "Pompe explosive avec claquement des mains avant de se réceptionner."},
        {"Hamstring Stretch", "stretching", "legs", "body_only", "beginner",
         "Assis jambe tendue, penchez-vous vers le pied en gardant le dos droit."},
        {"Child's Pose", "stretching", "back", "body_only", "beginner",
         "À genoux, fesses sur les talons, allongez les bras devant vous au sol."},
        {"Chest Opener Stretch", "stretching", "chest", "body_only", "beginner",
         "Mains jointes dans le dos, ouvrez la poitrine et tirez les épaules en arrière."},
    };
    return items;
}

const std::vector<std::string>& known_types()
{
    static const std::vector<std::string> types = {"cardio", "strength", "stretching",
                                                   "plyometrics"};
    return types;
}

const std::vector<std::string>& known_difficulties()
{
    static const std::vector<std::string> levels = {"beginner", "intermediate", "expert"};
    return levels;
}

// French labels used by voice clients
std::string normalize_difficulty(const std::string& value)
{
    if (value == "debutant")
        return "beginner";
    if (value == "intermediaire")
        return "intermediate";
    if (value == "avance" || value == "expert")
        return "expert";
    return value;
}

std::string normalize_muscle(const std::string& value)
{
    if (value == "pectoraux" || value == "poitrine")
        return "chest";
    if (value == "dos")
        return "back";
    if (value == "jambes" || value == "cuisses")
        return "legs";
    if (value == "abdos" || value == "abdominaux")
        return "abdominals";
    if (value == "mollets")
        return "calves";
    if (value == "fessiers")
        return "glutes";
    return value;
}

std::optional<std::string> folded_filter(const Json& args, const std::string& key)
{
    auto v = optional_string(args, key);
    if (!v)
        return std::nullopt;
    auto folded = fold(trim(*v));
    if (folded.empty())
        return std::nullopt;
    return folded;
}

Json exercise_json(const Exercise& e)
{
    return Json{{"name", e.name},
                {"type", e.type},
                {"muscle", e.muscle},
                {"equipment", e.equipment},
                {"difficulty", e.difficulty},
                {"instructions", e.instructions}};
}

} // namespace

Json search_exercises(const Json& args)
{
    try
    {
        auto muscle = folded_filter(args, "muscle");
        auto type = folded_filter(args, "type");
        auto difficulty = folded_filter(args, "difficulty");
        auto name = folded_filter(args, "name");
        int max_results = std::clamp(int_or(args, "max_results", kDefaultMaxResults), 1,
                                     kMaxResultsCap);

        if (muscle)
            muscle = normalize_muscle(*muscle);
        if (difficulty)
        {
            difficulty = normalize_difficulty(*difficulty);
            const auto& levels = known_difficulties();
            if (std::find(levels.begin(), levels.end(), *difficulty) == levels.end())
                return error_result("Niveau inconnu. Valeurs acceptées: beginner, "
                                    "intermediate, expert");
        }
        if (type)
        {
            const auto& types = known_types();
            if (std::find(types.begin(), types.end(), *type) == types.end())
                return error_result("Type inconnu. Valeurs acceptées: cardio, strength, "
                                    "stretching, plyometrics");
        }

        Json found = Json::array();
        for (const auto& e : catalogue())
        {
            if (muscle && e.muscle != *muscle)
                continue;
            if (type && e.type != *type)
                continue;
            if (difficulty && e.difficulty != *difficulty)
                continue;
            if (name && !contains_folded(e.name, *name))
                continue;
            found.push_back(exercise_json(e));
            if (static_cast<int>(found.size()) >= max_results)
                break;
        }

        Json filters = Json::object();
        if (muscle)
            filters["muscle"] = *muscle;
        if (type)
            filters["type"] = *type;
        if (difficulty)
            filters["difficulty"] = *difficulty;
        if (name)
            filters["name"] = *name;

        Json result = {{"status", "success"},
                       {"count", found.size()},
                       {"filters", filters},
                       {"max_results", max_results},
                       {"exercises", found}};
        if (found.empty())
            result["message"] = "Aucun exercice ne correspond à ces critères.";
        return result;
    }
    catch (const ValidationError& e)
    {
        return error_result(e.what());
    }
}

tools::Tool exercises_tool()
{
    return tools::Tool{
        "search_exercises",
        "Recherche d'exercices de fitness avec filtres.\n\n"
        "MUSCLES: biceps, triceps, chest, back, legs, abdominals, calves, glutes\n"
        "TYPES: cardio, strength, stretching, plyometrics\n"
        "NIVEAUX: beginner, intermediate, expert\n\n"
        "EXEMPLES: muscle=\"biceps\", difficulty=\"beginner\" ",
        tools::object_schema(
            Json{{"muscle",
                  tools::schema_property("string", "Muscle ciblé (biceps, chest, legs, etc.)")},
                 {"type", tools::schema_property("string",
                                                 "Type d'exercice (cardio, strength, stretching)")},
                 {"difficulty",
                  tools::schema_property("string", "Niveau (beginner, intermediate, expert)")},
                 {"name", tools::schema_property("string", "Nom d'exercice (recherche partielle)")},
                 {"max_results",
                  tools::schema_property("integer", "Nombre maximum de résultats (1-30)")}}),
        search_exercises};
}

} // namespace svcagent::services
