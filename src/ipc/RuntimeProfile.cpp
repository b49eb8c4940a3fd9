#include "autocode/ipc/RuntimeProfile.hpp"

#include <stdexcept>

namespace autocode {
namespace ipc {

namespace {

// Requests are `<seq> <code>`; replies echo the seq. SIGINT only aborts
// the evaluation in flight and the loop keeps serving.
const char *JULIA_BOOTSTRAP = R"JL(using Base64
Base.exit_on_sigint(false)
while true
    try
        eof(stdin) && break
        line = strip(readline(stdin))
        sp = findfirst(isequal(' '), line)
        sp === nothing && continue
        seq = line[1:sp-1]
        body = line[sp+1:end]
        try
            result = Core.eval(Main, Meta.parse(body))
            println("{result_marker}" * seq * ":" * Base64.base64encode(string(result)))
        catch e
            println("{error_marker}" * seq * ":" * Base64.base64encode(sprint(showerror, e)))
        end
        flush(stdout)
    catch e
        e isa InterruptException && continue
        rethrow()
    end
end
)JL";

const char *JULIA_WRAPPER =
    R"JL(let _b = Base64.base64decode("{payload}"); include_string(Main, String(_b)); end)JL";

// SIGINT is ignored except while an evaluation runs, so a late interrupt
// cannot land in the read loop or in the next request.
const char *PYTHON_BOOTSTRAP = R"PY(import ast
import base64
import signal
import sys


def _emit(marker, seq, text):
    data = base64.b64encode(text.encode("utf-8", "replace")).decode("ascii")
    sys.stdout.write(marker + seq + ":" + data + "\n")
    sys.stdout.flush()


def _autocode_script(payload):
    source = base64.b64decode(payload).decode("utf-8")
    tree = ast.parse(source, "<script>", "exec")
    last = None
    if tree.body and isinstance(tree.body[-1], ast.Expr):
        last = ast.Expression(tree.body.pop().value)
    exec(compile(tree, "<script>", "exec"), _ns)
    if last is None:
        return None
    return eval(compile(last, "<script>", "eval"), _ns)


def _evaluate(body):
    try:
        code = compile(body, "<worker>", "eval")
    except SyntaxError:
        exec(compile(body, "<worker>", "exec"), _ns)
        return None
    return eval(code, _ns)


_ns = {"__name__": "__autocode__", "_autocode_script": _autocode_script}
signal.signal(signal.SIGINT, signal.SIG_IGN)
while True:
    try:
        line = sys.stdin.readline()
        if not line:
            break
        seq, _, body = line.strip().partition(" ")
        if not body:
            continue
        try:
            signal.signal(signal.SIGINT, signal.default_int_handler)
            try:
                result = str(_evaluate(body))
            finally:
                signal.signal(signal.SIGINT, signal.SIG_IGN)
        except BaseException as e:
            _emit("{error_marker}", seq, repr(e))
        else:
            _emit("{result_marker}", seq, result)
    except KeyboardInterrupt:
        continue
)PY";

// Runs a whole script; the value of a trailing expression is the result.
const char *PYTHON_WRAPPER = R"PY(_autocode_script("{payload}"))PY";

} // namespace

RuntimeProfile julia_profile() {
  RuntimeProfile p;
  p.name = "julia";
  p.executable = "julia";
  p.launch_args = {"--startup-file=no", "--quiet", "--color=no"};
  p.bootstrap_extension = ".jl";
  p.bootstrap_template = JULIA_BOOTSTRAP;
  p.wrapper_template = JULIA_WRAPPER;
  return p;
}

RuntimeProfile python_profile() {
  RuntimeProfile p;
  p.name = "python";
  p.executable = "python3";
  p.launch_args = {"-u", "-q"};
  p.bootstrap_extension = ".py";
  p.bootstrap_template = PYTHON_BOOTSTRAP;
  p.wrapper_template = PYTHON_WRAPPER;
  return p;
}

RuntimeProfile profile_by_name(const std::string &name) {
  if (name == "julia")
    return julia_profile();
  if (name == "python" || name == "python3")
    return python_profile();
  throw std::invalid_argument("unknown runtime profile: " + name);
}

} // namespace ipc
} // namespace autocode
