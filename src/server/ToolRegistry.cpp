#include "autocode/server/ToolRegistry.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace autocode {
namespace server {

std::vector<std::string> Tool::required_arguments() const {
  std::vector<std::string> out;
  auto it = input_schema.find("required");
  if (it == input_schema.end() || !it->is_array())
    return out;
  for (const auto &r : *it) {
    if (r.is_string())
      out.push_back(r.get<std::string>());
  }
  return out;
}

json make_schema(
    const std::vector<std::pair<std::string, std::string>> &properties,
    const std::vector<std::string> &required) {
  json schema;
  schema["type"] = "object";
  schema["properties"] = json::object();
  for (const auto &[name, type] : properties)
    schema["properties"][name] = {{"type", type}};
  if (!required.empty())
    schema["required"] = required;
  return schema;
}

void ToolRegistry::add(Tool tool) {
  if (tool.name.empty())
    throw std::invalid_argument("tool name must not be empty");
  if (!tool.handler && !tool.stream_handler)
    throw std::invalid_argument("tool '" + tool.name + "' has no handler");
  if (tools_.count(tool.name))
    throw std::invalid_argument("duplicate tool '" + tool.name + "'");
  std::string name = tool.name;
  tools_.emplace(std::move(name), std::move(tool));
}

const Tool *ToolRegistry::find(const std::string &name) const {
  auto it = tools_.find(name);
  return it == tools_.end() ? nullptr : &it->second;
}

json ToolRegistry::list() const {
  json out = json::array();
  for (const auto &[name, tool] : tools_) {
    out.push_back({{"name", name},
                   {"description", tool.description},
                   {"inputSchema", tool.input_schema}});
  }
  return out;
}

std::vector<std::string> ToolRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto &[name, _] : tools_)
    out.push_back(name);
  return out;
}

} // namespace server
} // namespace autocode
