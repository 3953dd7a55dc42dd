#include "svcagent/services/cv.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/services/arguments.hpp"
#include "svcagent/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace svcagent::services
{

namespace
{

const std::vector<std::string> kStyles = {"classique", "moderne", "minimaliste"};
const std::vector<std::string> kColors = {"bleu", "vert", "gris", "rouge"};

// Keywords are matched against fold(content).
const std::vector<std::string> kExperienceWords = {"travaille", "experience", "poste",
                                                   "emploi", "stage", "entreprise"};
const std::vector<std::string> kEducationWords = {"diplome", "licence", "master", "bac",
                                                  "universite", "formation", "etudie"};
const std::vector<std::string> kSkillWords = {"competence", "je sais", "maitrise", "langue",
                                              "logiciel"};

const std::vector<std::string> kNameIntros = {"je m'appelle ", "mon nom complet est ",
                                              "mon nom est ", "my name is "};

bool one_of(const std::vector<std::string>& values, const std::string& v)
{
    return std::find(values.begin(), values.end(), v) != values.end();
}

bool mentions_any(const std::string& folded, const std::vector<std::string>& words)
{
    for (const auto& w : words)
        if (folded.find(w) != std::string::npos)
            return true;
    return false;
}

// ASCII-only lower-casing keeps byte offsets aligned with the original text.
std::string ascii_lower(const std::string& text)
{
    std::string out = text;
    for (auto& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string extract_name(const std::string& content)
{
    auto lower = ascii_lower(content);
    for (const auto& intro : kNameIntros)
    {
        auto pos = lower.find(intro);
        if (pos == std::string::npos)
            continue;
        auto start = pos + intro.size();
        auto end = content.find_first_of(".,;!?\n", start);
        auto name = trim(content.substr(start, end == std::string::npos ? std::string::npos
                                                                         : end - start));
        if (!name.empty())
            return name;
    }
    return {};
}

std::string extract_email(const std::string& content)
{
    std::istringstream words(content);
    std::string word;
    while (words >> word)
    {
        while (!word.empty() &&
               std::string(".,;:!?()<>\"'").find(word.back()) != std::string::npos)
            word.pop_back();
        while (!word.empty() && std::string("(<\"'").find(word.front()) != std::string::npos)
            word.erase(0, 1);
        if (looks_like_email(word))
            return word;
    }
    return {};
}

std::string extract_phone(const std::string& content)
{
    std::string best;
    std::string current;
    int digits = 0;
    auto flush = [&]() {
        while (!current.empty() && !std::isdigit(static_cast<unsigned char>(current.back())))
            current.pop_back();
        if (digits >= 8 && best.empty())
            best = current;
        current.clear();
        digits = 0;
    };
    for (char c : content)
    {
        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            current += c;
            ++digits;
        }
        else if (c == '+' && current.empty())
        {
            current += c;
        }
        else if ((c == ' ' || c == '-' || c == '.') && digits &&
                 std::isdigit(static_cast<unsigned char>(current.back())))
        {
            current += c;
        }
        else
        {
            flush();
        }
    }
    flush();
    return best;
}

std::string file_stem(const std::string& name)
{
    std::string stem;
    for (char c : fold(name))
    {
        if (std::isalnum(static_cast<unsigned char>(c)))
            stem += c;
        else if (!stem.empty() && stem.back() != '_')
            stem += '_';
    }
    while (!stem.empty() && stem.back() == '_')
        stem.pop_back();
    return stem;
}

void section(std::ostringstream& out, const std::string& title,
             const std::vector<std::string>& lines, const std::string& style)
{
    if (lines.empty())
        return;
    out << "\n## " << (style == "classique" ? ascii_lower(title) : title) << "\n\n";
    for (const auto& line : lines)
        out << "- " << line << "\n";
}

} // namespace

bool looks_like_email(const std::string& text)
{
    auto at = text.find('@');
    if (at == std::string::npos || at == 0 || text.find('@', at + 1) != std::string::npos)
        return false;
    if (text.find_first_of(" \t\r\n") != std::string::npos)
        return false;
    auto domain = text.substr(at + 1);
    auto dot = domain.rfind('.');
    return dot != std::string::npos && dot > 0 && dot + 1 < domain.size() &&
           domain.find("..") == std::string::npos;
}

CvProfile extract_profile(const Json& messages)
{
    CvProfile profile;
    if (!messages.is_array())
        return profile;

    for (const auto& m : messages)
    {
        if (!m.is_object() || !m.contains("content") || !m["content"].is_string())
            continue;
        if (!m.contains("role") || !m["role"].is_string() ||
            ascii_lower(m["role"].get<std::string>()) != "user")
            continue;

        std::string content = trim(m["content"].get<std::string>());
        if (content.empty())
            continue;
        std::string folded = fold(content);

        if (profile.name.empty())
            profile.name = extract_name(content);
        if (profile.email.empty())
            profile.email = extract_email(content);
        if (profile.phone.empty())
            profile.phone = extract_phone(content);

        if (mentions_any(folded, kExperienceWords))
            profile.experience.push_back(content);
        else if (mentions_any(folded, kEducationWords))
            profile.education.push_back(content);
        else if (mentions_any(folded, kSkillWords))
            profile.skills.push_back(content);
    }
    return profile;
}

std::string render_cv_markdown(const CvProfile& profile, const std::string& email,
                               const std::string& style, const std::string& color)
{
    std::ostringstream out;
    out << "<!-- style: " << style << ", couleur: " << color << " -->\n";
    out << "# " << (profile.name.empty() ? "Curriculum Vitae" : profile.name) << "\n\n";

    std::string contact_email = profile.email.empty() ? email : profile.email;
    if (style == "minimaliste")
    {
        out << contact_email;
        if (!profile.phone.empty())
            out << " | " << profile.phone;
        out << "\n";
    }
    else
    {
        out << "**Email :** " << contact_email << "  \n";
        if (!profile.phone.empty())
            out << "**Téléphone :** " << profile.phone << "  \n";
    }

    section(out, "Expériences professionnelles", profile.experience, style);
    section(out, "Formations", profile.education, style);
    section(out, "Compétences", profile.skills, style);
    return out.str();
}

Json create_cv(const Json& args, const ConversationSource& conversations)
{
    try
    {
        std::string call_id = trim(string_or(args, "call_id", ""));
        std::string email = trim(string_or(args, "email", ""));
        std::string style = fold(trim(string_or(args, "style", "moderne")));
        std::string color = fold(trim(string_or(args, "color", "bleu")));

        if (call_id.empty())
            return error_result("L'identifiant de l'appel (call_id) est requis");
        if (!looks_like_email(email))
            return error_result("Adresse email invalide: " + email);
        if (!one_of(kStyles, style))
            return error_result("Style inconnu. Valeurs acceptées: classique, moderne, "
                                "minimaliste");
        if (!one_of(kColors, color))
            return error_result("Couleur inconnue. Valeurs acceptées: bleu, vert, gris, rouge");

        auto messages = conversations.fetch(call_id);
        if (!messages)
            return error_result("Aucune conversation trouvée pour l'appel " + call_id);

        CvProfile profile = extract_profile(*messages);
        if (profile.empty())
            return error_result("La conversation ne contient pas encore d'informations pour le "
                                "CV (nom, expériences, formations, compétences)");

        std::string stem = file_stem(profile.name);
        std::string filename = "CV_" + (stem.empty() ? call_id : stem) + ".md";
        log::info("create_cv: generated " + filename + " for call " + call_id);

        return Json{{"status", "success"},
                    {"message", "CV généré pour " + email},
                    {"call_id", call_id},
                    {"email", email},
                    {"style", style},
                    {"color", color},
                    {"document",
                     {{"format", "markdown"},
                      {"filename", filename},
                      {"content", render_cv_markdown(profile, email, style, color)}}}};
    }
    catch (const ValidationError& e)
    {
        return error_result(e.what());
    }
}

tools::Tool cv_tool(std::shared_ptr<const ConversationSource> conversations)
{
    if (!conversations)
        throw ValidationError("create_cv requires a conversation source");
    return tools::Tool{
        "create_cv",
        "Génère un CV professionnel à partir de la conversation Voice Live.\n\n"
        "IMPORTANT: Cet outil nécessite que les informations aient été collectées pendant la "
        "conversation:\n"
        "- Nom complet, Email et téléphone\n"
        "- Expériences professionnelles\n"
        "- Formations et Compétences",
        tools::object_schema(
            Json{{"call_id", tools::schema_property(
                                 "string",
                                 "ID de l'appel Voice Live en cours (fourni automatiquement)")},
                 {"email", tools::schema_property("string", "Adresse email pour envoyer le CV")},
                 {"style", tools::schema_property(
                               "string", "Style visuel (classique, moderne, minimaliste)")},
                 {"color", tools::schema_property("string",
                                                  "Couleur principale (bleu, vert, gris, rouge)")}},
            {"call_id", "email"}),
        [conversations = std::move(conversations)](const Json& args) {
            return create_cv(args, *conversations);
        }};
}

} // namespace svcagent::services
