#pragma once
#include "svcagent/exceptions.hpp"
#include "svcagent/tools/tool.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace svcagent::tools {

// Name -> Tool registry. Enumeration follows registration order; re-registering a name
// replaces the descriptor in place and logs a warning. Reads take a shared lock and
// registration an exclusive one, so tools may also be added while serving.
class ToolManager {
 public:
  /// Throws ValidationError when the tool name is empty. Returns true if an existing
  /// registration was replaced.
  bool register_tool(const Tool& t);

  /// Throws ToolNotFoundError.
  Tool get(const std::string& name) const;
  std::optional<Tool> find(const std::string& name) const;
  bool contains(const std::string& name) const;

  std::vector<Tool> list() const;
  std::vector<std::string> list_names() const;
  std::size_t size() const;

  svcagent::Json invoke(const std::string& name, const svcagent::Json& arguments) const;

 private:
  mutable std::shared_mutex mutex_;
  std::vector<Tool> tools_;
  std::unordered_map<std::string, std::size_t> index_;  // name -> tools_ index
};

}  // namespace svcagent::tools
