#pragma once
#include "svcagent/services/conversation_source.hpp"
#include "svcagent/tools/tool.hpp"
#include "svcagent/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace svcagent::services
{

/// Facts gathered from the caller's side of a conversation.
struct CvProfile
{
    std::string name;
    std::string email;
    std::string phone;
    std::vector<std::string> experience;
    std::vector<std::string> education;
    std::vector<std::string> skills;

    bool empty() const
    {
        return name.empty() && phone.empty() && experience.empty() && education.empty() &&
               skills.empty();
    }
};

/// Scan the user messages of a transcript ([{"role","content"}...]).
CvProfile extract_profile(const Json& messages);

/// Markdown rendering of a profile. `email` fills in when the transcript had none.
std::string render_cv_markdown(const CvProfile& profile, const std::string& email,
                               const std::string& style, const std::string& color);

bool looks_like_email(const std::string& text);

/// Arguments: call_id and email (required), style (default "moderne"), color (default "bleu").
Json create_cv(const Json& args, const ConversationSource& conversations);

/// Throws ValidationError when `conversations` is null.
tools::Tool cv_tool(std::shared_ptr<const ConversationSource> conversations);

} // namespace svcagent::services
