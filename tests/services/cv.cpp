#include "svcagent/exceptions.hpp"
#include "svcagent/services/conversation_source.hpp"
#include "svcagent/services/cv.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>

using namespace svcagent;

namespace
{

class MemoryConversations : public services::ConversationSource
{
  public:
    std::optional<Json> fetch(const std::string& call_id) const override
    {
        auto it = calls.find(call_id);
        if (it == calls.end())
            return std::nullopt;
        return it->second;
    }

    std::map<std::string, Json> calls;
};

Json transcript()
{
    return Json::array({
        Json{{"role", "assistant"}, {"content", "Bonjour, comment vous appelez-vous ?"}},
        Json{{"role", "user"}, {"content", "Je m'appelle Awa Ouédraogo."}},
        Json{{"role", "user"}, {"content", "Mon email est awa.ouedraogo@example.com et mon "
                                            "numéro est +226 70 12 34 56."}},
        Json{{"role", "user"},
             {"content", "J'ai travaillé 3 ans comme comptable chez SONABEL."}},
        Json{{"role", "user"},
             {"content", "J'ai une licence en gestion à l'Université Joseph Ki-Zerbo."}},
        Json{{"role", "user"}, {"content", "Je maîtrise Excel et Sage."}},
        Json{{"role", "assistant"}, {"content", "Merci, j'ai une expérience à noter."}},
    });
}

} // namespace

int main()
{
    // Email shape
    assert(services::looks_like_email("a.b@example.org"));
    assert(!services::looks_like_email("not-an-email"));
    assert(!services::looks_like_email("a@b"));
    assert(!services::looks_like_email("a@@b.com"));
    assert(!services::looks_like_email("@example.org"));
    assert(!services::looks_like_email("a b@example.org"));

    // Profile extraction reads only the user's messages
    auto profile = services::extract_profile(transcript());
    assert(profile.name == "Awa Ouédraogo");
    assert(profile.email == "awa.ouedraogo@example.com");
    assert(profile.phone == "+226 70 12 34 56");
    assert(profile.experience.size() == 1);
    assert(profile.education.size() == 1);
    assert(profile.skills.size() == 1);
    assert(services::extract_profile(Json::array()).empty());

    auto conversations = std::make_shared<MemoryConversations>();
    conversations->calls["call-1"] = transcript();
    conversations->calls["call-empty"] =
        Json::array({Json{{"role", "user"}, {"content", "Bonjour"}}});

    // Full generation
    auto r = services::create_cv(Json{{"call_id", "call-1"}, {"email", "awa@example.com"}},
                                 *conversations);
    assert(r["status"] == "success");
    assert(r["call_id"] == "call-1");
    assert(r["email"] == "awa@example.com");
    assert(r["style"] == "moderne");
    assert(r["color"] == "bleu");
    assert(r["document"]["format"] == "markdown");
    assert(r["document"]["filename"] == "CV_awa_ouedraogo.md");
    auto content = r["document"]["content"].get<std::string>();
    assert(content.find("# Awa Ouédraogo") != std::string::npos);
    assert(content.find("+226 70 12 34 56") != std::string::npos);
    assert(content.find("SONABEL") != std::string::npos);
    assert(content.find("Compétences") != std::string::npos);

    // Style and colour are normalised
    auto classic = services::create_cv(
        Json{{"call_id", "call-1"}, {"email", "awa@example.com"}, {"style", "Classique"},
             {"color", "VERT"}},
        *conversations);
    assert(classic["style"] == "classique");
    assert(classic["color"] == "vert");

    // Validation paths
    auto error_for = [&](const Json& args)
    { return services::create_cv(args, *conversations)["status"] == "error"; };
    assert(error_for(Json{{"email", "awa@example.com"}}));
    assert(error_for(Json{{"call_id", "call-1"}}));
    assert(error_for(Json{{"call_id", "call-1"}, {"email", "awa"}}));
    assert(error_for(
        Json{{"call_id", "call-1"}, {"email", "awa@example.com"}, {"style", "baroque"}}));
    assert(error_for(
        Json{{"call_id", "call-1"}, {"email", "awa@example.com"}, {"color", "violet"}}));
    assert(error_for(Json{{"call_id", "unknown"}, {"email", "awa@example.com"}}));
    assert(error_for(Json{{"call_id", "call-empty"}, {"email", "awa@example.com"}}));
    assert(error_for(Json{{"call_id", 5}, {"email", "awa@example.com"}}));

    // Directory-backed transcripts
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "svcagent_cv_test";
    fs::create_directories(dir);
    {
        std::ofstream(dir / "call-2.json") << Json{{"messages", transcript()}}.dump();
        std::ofstream(dir / "call-3.json") << transcript().dump();
        std::ofstream(dir / "call-4.json") << "{ broken";
    }
    services::JsonDirectoryConversationSource files(dir.string());
    assert(files.fetch("call-2")->size() == transcript().size());
    assert(files.fetch("call-3")->size() == transcript().size());
    assert(!files.fetch("call-404"));

    bool threw = false;
    try
    {
        files.fetch("../etc/passwd");
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    auto tool = services::cv_tool(std::make_shared<services::JsonDirectoryConversationSource>(
        dir.string()));
    assert(tool.name() == "create_cv");
    assert(tool.input_schema()["required"] == Json::array({"call_id", "email"}));
    assert(tool.invoke(Json{{"call_id", "call-2"}, {"email", "awa@example.com"}})["status"] ==
           "success");
    assert(tool.invoke(Json{{"call_id", "call-4"}, {"email", "awa@example.com"}})["status"] ==
           "error");
    assert(tool.invoke(Json{{"call_id", "a/b"}, {"email", "awa@example.com"}})["status"] ==
           "error");

    threw = false;
    try
    {
        services::cv_tool(nullptr);
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
    return 0;
}
