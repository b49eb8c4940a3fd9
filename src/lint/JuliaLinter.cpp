#include "autocode/lint/Linter.hpp"

#include <fmt/format.h>
#include <regex>
#include <sstream>
#include <vector>

namespace autocode {
namespace lint {

namespace {

enum class DefinitionForm { Long, Short, Anonymous };

struct Definition {
  DefinitionForm form;
  size_t line;         // zero-based
  size_t params_col;   // column of the parameter list
  std::string params;
};

struct ShadowedParam {
  std::string name;
  Definition def;
};

std::vector<std::string> split_lines(const std::string &code) {
  std::vector<std::string> lines;
  std::string line;
  std::istringstream in(code);
  while (std::getline(in, line))
    lines.push_back(line);
  if (!code.empty() && code.back() == '\n')
    lines.push_back("");
  return lines;
}

std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); i++) {
    if (i > 0)
      out += '\n';
    out += lines[i];
  }
  return out;
}

std::string trim(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos)
    return "";
  auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

size_t indent_of(const std::string &line) {
  auto pos = line.find_first_not_of(" \t");
  return pos == std::string::npos ? line.size() : pos;
}

std::string escape_regex(const std::string &text) {
  static const std::regex special(R"([.^$|()\[\]{}*+?\\!])");
  return std::regex_replace(text, special, R"(\$&)");
}

std::vector<std::string> parameter_names(const std::string &params) {
  std::vector<std::string> names;
  std::string list = params;
  // Keyword arguments after ';' are still parameters.
  for (auto &c : list) {
    if (c == ';')
      c = ',';
  }
  std::istringstream in(list);
  std::string param;
  while (std::getline(in, param, ',')) {
    param = trim(param);
    param = trim(param.substr(0, param.find('=')));
    param = trim(param.substr(0, param.find("::")));
    auto dots = param.find("...");
    if (dots != std::string::npos)
      param = trim(param.substr(0, dots));
    if (!param.empty())
      names.push_back(param);
  }
  return names;
}

std::vector<Definition> find_definitions(const std::vector<std::string> &lines) {
  static const std::regex long_form(R"(function\s+[\w!.]+\s*\(([^)]*)\))");
  static const std::regex short_form(R"(^\s*[\w!.]+\s*\(([^)]*)\)\s*=(?!=))");
  static const std::regex anonymous(R"(\(\s*([^)]*)\)\s*->)");

  std::vector<Definition> defs;
  for (size_t i = 0; i < lines.size(); i++) {
    const std::string &line = lines[i];
    std::smatch m;
    if (std::regex_search(line, m, long_form)) {
      defs.push_back({DefinitionForm::Long, i,
                      static_cast<size_t>(m.position(1)), m[1].str()});
    } else if (std::regex_search(line, m, short_form)) {
      defs.push_back({DefinitionForm::Short, i,
                      static_cast<size_t>(m.position(1)), m[1].str()});
    }
    for (auto it = std::sregex_iterator(line.begin(), line.end(), anonymous);
         it != std::sregex_iterator(); ++it) {
      defs.push_back({DefinitionForm::Anonymous, i,
                      static_cast<size_t>(it->position(1)), (*it)[1].str()});
    }
  }
  return defs;
}

// Last line of a long-form definition: the `end` at the same indentation.
size_t definition_end(const std::vector<std::string> &lines,
                      const Definition &def) {
  if (def.form != DefinitionForm::Long)
    return def.line;
  size_t indent = indent_of(lines[def.line]);
  for (size_t i = def.line + 1; i < lines.size(); i++) {
    if (trim(lines[i]) == "end" && indent_of(lines[i]) == indent)
      return i;
  }
  return lines.size() - 1;
}

// Rename whole-word occurrences outside of string literals.
std::string rename_identifier(const std::string &text, const std::string &from,
                              const std::string &to, size_t start = 0) {
  std::regex word("(^|[^\\w!])" + escape_regex(from) + "(?![\\w!])");
  std::string out = text.substr(0, start);
  std::string rest = text.substr(start);

  // Alternate between code and "..." segments.
  size_t pos = 0;
  while (pos < rest.size()) {
    size_t quote = rest.find('"', pos);
    std::string segment = rest.substr(pos, quote - pos);
    out += std::regex_replace(segment, word, "$1" + to);
    if (quote == std::string::npos)
      break;
    size_t close = rest.find('"', quote + 1);
    if (close == std::string::npos) {
      out += rest.substr(quote);
      break;
    }
    out += rest.substr(quote, close - quote + 1);
    pos = close + 1;
  }
  return out;
}

void check_regex_literals(const std::string &line, int line_no,
                          std::vector<LintIssue> &issues) {
  // A slash opens a regex literal only where an operand is expected, so
  // divisions such as `total / n / scale` are not reported.
  static const std::regex js_regex(
      R"((^|[=(,\[{:;!&|]|return)\s*(/(?:[^/\\\s]|\\.)(?:[^/\\]|\\.)*/([A-Za-z]*)))");

  for (auto it = std::sregex_iterator(line.begin(), line.end(), js_regex);
       it != std::sregex_iterator(); ++it) {
    const std::smatch &m = *it;
    std::string literal = m[2].str();
    std::string flags = m[3].str();
    if (flags.empty())
      continue;

    LintIssue issue;
    issue.line = line_no;
    issue.column = static_cast<int>(m.position(2));
    issue.can_fix = false;
    if (flags.find_first_of("uy") != std::string::npos) {
      issue.type = "unsupported_regex_flags";
      issue.severity = LintSeverity::Error;
      issue.message = fmt::format(
          "JS-style regex '{}' uses flags not supported in Julia. Use "
          "r\"pattern\"flags syntax instead.",
          literal);
    } else {
      issue.type = "js_regex_syntax";
      issue.severity = LintSeverity::Warning;
      issue.message = fmt::format(
          "JS-style regex '{}' should be converted to Julia "
          "r\"pattern\"flags syntax.",
          literal);
    }
    issues.push_back(std::move(issue));
  }
}

} // namespace

JuliaLinter::JuliaLinter(LinterOptions options)
    : options_(std::move(options)) {}

const std::set<std::string> &JuliaLinter::builtins() {
  static const std::set<std::string> names = {
      // types
      "Int", "Float64", "String", "Bool", "Char", "Array", "Vector", "Matrix",
      "Dict", "Set", "Tuple", "Union", "Any", "Nothing", "Missing",
      // functions
      "print", "println", "length", "size", "push!", "pop!", "append!", "sum",
      "prod", "min", "max", "sort", "filter", "map", "reduce", "findfirst",
      "findall", "replace", "split", "join", "strip", "parse", "string",
      "convert", "typeof", "isa", "eltype",
      // keywords
      "if", "else", "elseif", "for", "while", "break", "continue", "return",
      "try", "catch", "finally", "throw", "function", "end", "using", "import",
      "export", "module", "struct", "macro", "begin", "let", "global", "local",
      "const"};
  return names;
}

LintResult JuliaLinter::lint(const std::string &code, bool fix) const {
  LintResult result;
  std::vector<std::string> lines = split_lines(code);

  for (size_t i = 0; i < lines.size(); i++)
    check_regex_literals(lines[i], static_cast<int>(i + 1), result.issues);

  std::vector<ShadowedParam> shadowed;
  for (const auto &def : find_definitions(lines)) {
    for (const auto &name : parameter_names(def.params)) {
      if (!builtins().count(name))
        continue;
      LintIssue issue;
      issue.type = "parameter_shadowing";
      issue.message = fmt::format(
          "Parameter '{}' shadows Julia built-in. Consider renaming.", name);
      issue.line = static_cast<int>(def.line + 1);
      issue.column = static_cast<int>(def.params_col);
      issue.severity = LintSeverity::Warning;
      issue.can_fix = true;
      issue.fix_suggestion = fmt::format("Rename parameter to '{}{}'", name,
                                         options_.shadow_suffix);
      result.issues.push_back(std::move(issue));
      shadowed.push_back({name, def});
    }
  }

  if (fix && !shadowed.empty()) {
    std::vector<std::string> fixed = lines;
    for (const auto &param : shadowed) {
      std::string renamed = param.name + options_.shadow_suffix;
      size_t last = definition_end(fixed, param.def);
      fixed[param.def.line] = rename_identifier(
          fixed[param.def.line], param.name, renamed, param.def.params_col);
      for (size_t i = param.def.line + 1; i <= last && i < fixed.size(); i++)
        fixed[i] = rename_identifier(fixed[i], param.name, renamed);
    }
    std::string fixed_code = join_lines(fixed);
    if (fixed_code != code)
      result.fixed_code = fixed_code;
  }

  if (options_.block_unsafe && result.has_errors())
    result.success = false;
  else if (!options_.allow_warnings && result.has_warnings())
    result.success = false;
  else
    result.success = true;

  return result;
}

} // namespace lint
} // namespace autocode
