#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace autocode {

/// Domain failure raised by a tool handler. The dispatcher turns it into a
/// structured error result instead of a JSON-RPC error.
class ToolError : public std::runtime_error {
public:
  ToolError(std::string kind, const std::string &message,
            std::string suggested_action = "",
            nlohmann::json details = nullptr)
      : std::runtime_error(message), kind_(std::move(kind)),
        suggested_action_(std::move(suggested_action)),
        details_(std::move(details)) {}

  const std::string &kind() const { return kind_; }
  const std::string &suggested_action() const { return suggested_action_; }
  const nlohmann::json &details() const { return details_; }

private:
  std::string kind_;
  std::string suggested_action_;
  nlohmann::json details_;
};

/// Raised by FunctionStore implementations.
class StoreError : public std::runtime_error {
public:
  enum class Kind { FunctionNotFound, TestNotFound, DependencyCycle,
                    InvalidArgument, Persistence };

  StoreError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

std::string to_string(StoreError::Kind kind);

/// {"ok": true, "result": result, ...meta}
nlohmann::json structured_success(const nlohmann::json &result,
                                  const nlohmann::json &meta = nullptr);

/// {"ok": false, "error": {"type", "message", "suggested_action"?,
/// "details"?}}
nlohmann::json structured_error(const std::string &kind,
                                const std::string &message,
                                const std::string &suggested_action = "",
                                const nlohmann::json &details = nullptr);

nlohmann::json structured_error(const ToolError &err);

} // namespace autocode
