#include "autocode/ipc/RuntimeProfile.hpp"
#include "autocode/server/PropertyTest.hpp"

#include <gtest/gtest.h>

using namespace autocode;
using namespace autocode::server;

TEST(PropertySignature, JuliaLongForm) {
  auto sig = parse_signature(
      "function clamp_add(a::Int, b::Float64, c)\n    a + b + c\nend", "julia");
  ASSERT_TRUE(sig);
  EXPECT_EQ(sig->name, "clamp_add");
  ASSERT_EQ(sig->params.size(), 3u);
  EXPECT_EQ(sig->params[0].name, "a");
  EXPECT_EQ(sig->params[0].type, "Int");
  EXPECT_EQ(sig->params[1].type, "Float64");
  EXPECT_TRUE(sig->params[2].type.empty());
}

TEST(PropertySignature, JuliaShortFormAndKeywords) {
  auto sig = parse_signature("# helper\nscale(x; factor=2) = x * factor",
                             "julia");
  ASSERT_TRUE(sig);
  EXPECT_EQ(sig->name, "scale");
  ASSERT_EQ(sig->params.size(), 1u);
  EXPECT_EQ(sig->params[0].name, "x");
}

TEST(PropertySignature, PythonSkipsStarArgs) {
  auto sig = parse_signature("def mix(a: int, b: float = 1.0, *rest):\n"
                             "    return a * b\n",
                             "python");
  ASSERT_TRUE(sig);
  EXPECT_EQ(sig->name, "mix");
  ASSERT_EQ(sig->params.size(), 2u);
  EXPECT_EQ(sig->params[0].type, "int");
  EXPECT_EQ(sig->params[1].name, "b");
}

TEST(PropertySignature, NoDefinition) {
  EXPECT_FALSE(parse_signature("x = 1", "julia"));
  EXPECT_FALSE(parse_signature("x = 1", "python"));
}

TEST(PropertyScript, JuliaScriptSeedsAndCallsFunction) {
  FunctionRecord f;
  f.name = "double";
  f.code = "double(x::Int) = 2x";
  std::string script = render_property_script(ipc::julia_profile(), f, 25, 7);
  EXPECT_NE(script.find("Random.seed!(7)"), std::string::npos);
  EXPECT_NE(script.find("for i in 1:25"), std::string::npos);
  EXPECT_NE(script.find("double(arg1)"), std::string::npos);
  EXPECT_NE(script.find(f.code), std::string::npos);
  EXPECT_NE(script.find("PROPERTY_TEST_PASS"), std::string::npos);
}

TEST(PropertyScript, ZeroArgumentFunction) {
  FunctionRecord f;
  f.name = "answer";
  f.code = "def answer():\n    return 42\n";
  std::string script = render_property_script(ipc::python_profile(), f, 3, 1);
  EXPECT_NE(script.find("random.seed(1)"), std::string::npos);
  EXPECT_NE(script.find("args = []"), std::string::npos);
  EXPECT_NE(script.find("answer(*args)"), std::string::npos);
}

TEST(PropertyScript, UnparseableCodeFallsBackToOneArgument) {
  FunctionRecord f;
  f.name = "mystery";
  f.code = "mystery = x -> x + 1";
  std::string script = render_property_script(ipc::julia_profile(), f, 2, 42);
  EXPECT_NE(script.find("mystery(arg1)"), std::string::npos);
}

TEST(PropertyOutput, ParsesOnlyTrialLines) {
  auto trials = parse_property_output("warming up\n"
                                      "PROPERTY_TEST_PASS i=1, x=3\r\n"
                                      "PROPERTY_TEST_FAIL i=2, x=-1 error=boom\n"
                                      "done");
  ASSERT_EQ(trials.size(), 2u);
  EXPECT_TRUE(trials[0].passed);
  EXPECT_EQ(trials[0].info, "PROPERTY_TEST_PASS i=1, x=3");
  EXPECT_FALSE(trials[1].passed);
}

TEST(PropertyFailure, Classification) {
  EXPECT_EQ(classify_failure("AssertionError: x > 0").type,
            "assertion_failure");
  EXPECT_EQ(classify_failure("ParseError: unexpected )").type, "syntax_error");
  EXPECT_EQ(classify_failure("UndefVarError: `foo` not defined").type,
            "undefined_variable");
  EXPECT_EQ(classify_failure("LoadError: file missing").type, "load_error");
  auto other = classify_failure("DomainError with -1");
  EXPECT_EQ(other.type, "julia_error");
  EXPECT_FALSE(other.suggested_action.empty());
}
