#pragma once
#include "svcagent/types.hpp"

#include <optional>
#include <string>

namespace svcagent::services
{

/// Read-only access to the transcript of a voice call.
class ConversationSource
{
  public:
    virtual ~ConversationSource() = default;

    /// Messages of the call as an array of {"role", "content"} objects, or nullopt when the
    /// call is unknown. Throws ValidationError for an unusable call id or a corrupt record.
    virtual std::optional<Json> fetch(const std::string& call_id) const = 0;
};

/// Transcripts stored as `<dir>/<call_id>.json`, either {"messages": [...]} or a bare array.
class JsonDirectoryConversationSource : public ConversationSource
{
  public:
    explicit JsonDirectoryConversationSource(std::string dir);

    std::optional<Json> fetch(const std::string& call_id) const override;

    const std::string& directory() const
    {
        return dir_;
    }

  private:
    std::string dir_;
};

} // namespace svcagent::services
