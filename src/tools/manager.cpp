#include "svcagent/tools/manager.hpp"

#include "svcagent/util/log.hpp"

#include <mutex>

namespace svcagent::tools {

bool ToolManager::register_tool(const Tool& t) {
  if (t.name().empty()) throw svcagent::ValidationError("tool name must not be empty");
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = index_.find(t.name());
  if (it != index_.end()) {
    tools_[it->second] = t;
    lock.unlock();
    log::warning("tool '" + t.name() + "' registered twice; keeping the latest registration");
    return true;
  }
  index_.emplace(t.name(), tools_.size());
  tools_.push_back(t);
  return false;
}

Tool ToolManager::get(const std::string& name) const {
  auto found = find(name);
  if (!found) throw svcagent::ToolNotFoundError("Tool not found: " + name);
  return *found;
}

std::optional<Tool> ToolManager::find(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = index_.find(name);
  if (it == index_.end()) return std::nullopt;
  return tools_[it->second];
}

bool ToolManager::contains(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return index_.count(name) != 0;
}

std::vector<Tool> ToolManager::list() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return tools_;
}

std::vector<std::string> ToolManager::list_names() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(tools_.size());
  for (auto const& t : tools_) names.push_back(t.name());
  return names;
}

std::size_t ToolManager::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return tools_.size();
}

svcagent::Json ToolManager::invoke(const std::string& name,
                                   const svcagent::Json& arguments) const {
  // Handler runs outside the registry lock.
  Tool tool = get(name);
  return tool.invoke(arguments);
}

}  // namespace svcagent::tools
