#pragma once
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace autocode {
namespace server {

class StreamContext;

using ToolHandler = std::function<nlohmann::json(const nlohmann::json &)>;
using StreamHandler =
    std::function<void(const nlohmann::json &, StreamContext &)>;

/// A named operation exposed through `tools/call`.
struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema = nlohmann::json::object();
  ToolHandler handler;
  StreamHandler stream_handler; // empty for non-streaming tools

  bool streaming() const { return static_cast<bool>(stream_handler); }

  /// Names listed under the schema's "required" array.
  std::vector<std::string> required_arguments() const;
};

/// Build an object schema from (name, type) pairs and a required list.
nlohmann::json make_schema(
    const std::vector<std::pair<std::string, std::string>> &properties,
    const std::vector<std::string> &required = {});

/// Table of tools, filled once at startup and read-only afterwards.
class ToolRegistry {
public:
  /// Throws std::invalid_argument on an empty or duplicate name, or when
  /// the tool has no handler at all.
  void add(Tool tool);

  /// nullptr when no tool has that name.
  const Tool *find(const std::string &name) const;

  /// `[{name, description, inputSchema}]` in name order.
  nlohmann::json list() const;

  std::vector<std::string> names() const;
  size_t size() const { return tools_.size(); }

private:
  std::map<std::string, Tool> tools_;
};

} // namespace server
} // namespace autocode
