#include <fnexec/engine/framing.hpp>
#include <fnexec/engine/runtime.hpp>
#include <fnexec/engine/workspace.hpp>

#include <cctype>

namespace fnexec::engine::runtime {

  namespace {

    constexpr std::string_view RUNNER_TEMPLATE = R"py(# Generated by fnexec, do not edit.
import asyncio
import builtins
import importlib.util
import inspect
import json
import logging
import os
import sys
import traceback

RESULT_START = @RESULT_START@
RESULT_END = @RESULT_END@
HANDLER_NAME = @HANDLER@
SOURCE_FILE = @SOURCE@
EVENT_FILE = @EVENT@
JSON_HEADERS = {"content-type": "application/json"}
# Same text as JSON.stringify produces.
COMPACT = {"separators": (",", ":"), "ensure_ascii": False}

BASE = os.path.dirname(os.path.abspath(__file__))

_stdout = sys.stdout
_print = builtins.print


def _flushing_print(*args, **kwargs):
    kwargs.setdefault("flush", True)
    _print(*args, **kwargs)


builtins.print = _flushing_print
logging.basicConfig(
    stream=sys.stdout, level=logging.INFO, format="%(levelname)s %(name)s: %(message)s", force=True
)


def failure(message):
    return {"statusCode": 500, "headers": dict(JSON_HEADERS), "body": json.dumps({"error": message}, **COMPACT)}


def emit(response):
    try:
        text = json.dumps(response, allow_nan=False)
    except (TypeError, ValueError, RecursionError):
        text = json.dumps(failure("Non-serializable response"))
    # Leading newline: the user may have left an unterminated line on stdout.
    _stdout.write("\n" + RESULT_START + "\n" + text + "\n" + RESULT_END + "\n")
    _stdout.flush()
    sys.stderr.flush()
    # Lingering non-daemon threads must not keep the process alive.
    os._exit(0)


def normalize(result):
    raw = result if isinstance(result, dict) else {}
    status = raw.get("statusCode", 200)
    if isinstance(status, bool) or not isinstance(status, (int, float, str)):
        status = 200
    headers = raw.get("headers")
    if not isinstance(headers, dict):
        headers = {}
    body = raw.get("body")
    if not isinstance(body, str):
        try:
            body = json.dumps(body, allow_nan=False, **COMPACT)
        except (TypeError, ValueError, RecursionError):
            body = str(body)
    return {"statusCode": status, "headers": headers, "body": body}


def read_event():
    try:
        with open(os.path.join(BASE, EVENT_FILE), "r", encoding="utf-8") as f:
            return json.loads(f.read() or "{}")
    except (OSError, ValueError):
        return {}


def load_module():
    path = os.path.join(BASE, SOURCE_FILE)
    spec = importlib.util.spec_from_file_location("user_code", path)
    if spec is None or spec.loader is None:
        raise ImportError("Cannot load " + path)
    module = importlib.util.module_from_spec(spec)
    sys.modules["user_code"] = module
    spec.loader.exec_module(module)
    return module


def resolve_handler(module):
    fn = getattr(module, HANDLER_NAME, None)
    if callable(fn):
        return fn
    fn = getattr(getattr(module, "default", None), HANDLER_NAME, None)
    return fn if callable(fn) else None


async def _await(awaitable):
    return await awaitable


def message_of(e):
    return str(e) or type(e).__name__


def main():
    sys.path.insert(0, BASE)
    event = read_event()

    try:
        module = load_module()
    except BaseException as e:
        traceback.print_exc()
        emit(failure("Failed to load user module: " + message_of(e)))

    fn = resolve_handler(module)
    if fn is None:
        print("handler is missing or not callable", file=sys.stderr)
        emit(failure("Missing handler: " + HANDLER_NAME))

    try:
        result = fn(event)
        if inspect.isawaitable(result):
            result = asyncio.run(_await(result))
    except BaseException as e:
        traceback.print_exc()
        emit(failure(message_of(e)))

    emit(normalize(result))


if __name__ == "__main__":
    main()
)py";

  } // namespace

  Runtime PythonAdapter::runtime() const
  {
    return Runtime::PYTHON;
  }

  std::string_view PythonAdapter::source_file() const
  {
    return "index.py";
  }

  std::string_view PythonAdapter::runner_file() const
  {
    return "runner.py";
  }

  std::vector<InterpreterCandidate> PythonAdapter::candidates() const
  {
    return {{"python3", {}}, {"python", {}}};
  }

  bool PythonAdapter::valid_handler_name(std::string_view name) const
  {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
      return false;
    }
    for (char c : name) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
        return false;
      }
    }
    return true;
  }

  std::string PythonAdapter::render_runner(std::string_view handler_name) const
  {
    return detail::render_template(
        RUNNER_TEMPLATE, {{"RESULT_START", detail::quote(framing::RESULT_START)},
                          {"RESULT_END", detail::quote(framing::RESULT_END)},
                          {"HANDLER", detail::quote(handler_name)},
                          {"SOURCE", detail::quote(source_file())},
                          {"EVENT", detail::quote(Workspace::EVENT_FILE)}}
    );
  }

  std::vector<std::pair<std::string, std::string>>
  PythonAdapter::environment(std::string_view handler_name) const
  {
    auto env = RuntimeAdapter::environment(handler_name);
    env.emplace_back("PYTHONUNBUFFERED", "1");
    env.emplace_back("PYTHONDONTWRITEBYTECODE", "1");
    return env;
  }

} // namespace fnexec::engine::runtime
