#pragma once
#include "autocode/Config.hpp"
#include "autocode/generate/CodeGenerator.hpp"
#include "autocode/ipc/ScriptRunner.hpp"
#include "autocode/lint/Linter.hpp"
#include "autocode/server/ToolRegistry.hpp"
#include "autocode/store/FunctionStore.hpp"

namespace autocode {
namespace server {

/// Collaborators shared by the built-in tools. All must outlive the
/// registry and every streaming call started from it.
struct ToolContext {
  ipc::ScriptRunner &runner;
  store::FunctionStore &store;
  const lint::Linter &linter;
  generate::CodeGenerator *generator; // nullptr: generation tools omitted
  RuntimeConfig runtime;
};

/// Register the store, runner and linter tools. `generate_function` and
/// `generate_test` are registered only when a generator is supplied.
void register_builtin_tools(ToolRegistry &registry, const ToolContext &ctx);

} // namespace server
} // namespace autocode
