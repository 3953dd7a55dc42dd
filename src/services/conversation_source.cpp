#include "svcagent/services/conversation_source.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/util/json.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace svcagent::services
{

namespace
{
bool safe_call_id(const std::string& id)
{
    if (id.empty())
        return false;
    if (id.find('/') != std::string::npos || id.find('\\') != std::string::npos)
        return false;
    return id.find("..") == std::string::npos;
}
} // namespace

JsonDirectoryConversationSource::JsonDirectoryConversationSource(std::string dir)
    : dir_(std::move(dir))
{
}

std::optional<Json> JsonDirectoryConversationSource::fetch(const std::string& call_id) const
{
    if (!safe_call_id(call_id))
        throw ValidationError("Identifiant d'appel invalide: " + call_id);

    std::string path = dir_.empty() ? call_id + ".json" : dir_ + "/" + call_id + ".json";
    std::ifstream in(path);
    if (!in)
        return std::nullopt;

    std::stringstream ss;
    ss << in.rdbuf();
    auto doc = util::json::try_parse(ss.str());
    if (!doc)
        throw ValidationError("Conversation illisible pour l'appel " + call_id);

    if (doc->is_array())
        return *doc;
    if (doc->is_object() && doc->contains("messages") && (*doc)["messages"].is_array())
        return (*doc)["messages"];
    throw ValidationError("Format de conversation inattendu pour l'appel " + call_id);
}

} // namespace svcagent::services
