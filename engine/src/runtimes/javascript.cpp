#include <fnexec/engine/framing.hpp>
#include <fnexec/engine/runtime.hpp>
#include <fnexec/engine/workspace.hpp>

#include <cctype>

namespace fnexec::engine::runtime {

  namespace {

    // ES module runner shared by Node.js and Bun. The user module is loaded with a
    // dynamic import, so both `export` syntax and a default export object work.
    // Code written against `exports` or `module.exports` fails to evaluate as an ES
    // module; it is copied to a .cjs file and loaded with require instead.
    constexpr std::string_view RUNNER_TEMPLATE = R"js(// Generated by fnexec, do not edit.
import { copyFileSync, readFileSync } from "node:fs";
import { createRequire } from "node:module";
import { dirname, join } from "node:path";
import { fileURLToPath, pathToFileURL } from "node:url";

const RESULT_START = @RESULT_START@;
const RESULT_END = @RESULT_END@;
const HANDLER_NAME = @HANDLER@;
const SOURCE_FILE = @SOURCE@;
const EVENT_FILE = @EVENT@;
const JSON_HEADERS = { "content-type": "application/json" };

const base = dirname(fileURLToPath(import.meta.url));

// A never-settling handler must run into the deadline instead of letting the
// event loop drain and exit with an unsettled top-level await.
const keepAlive = setInterval(() => {}, 1 << 30);

function formatArg(arg) {
  if (typeof arg === "string") return arg;
  if (arg instanceof Error) return arg.stack || String(arg);
  try {
    const text = JSON.stringify(arg);
    return text === undefined ? String(arg) : text;
  } catch {
    return String(arg);
  }
}

for (const level of ["log", "info", "warn", "error", "debug", "trace"]) {
  console[level] = (...args) => {
    process.stdout.write(args.map(formatArg).join(" ") + "\n");
  };
}

function stackOf(e) {
  return e && e.stack ? String(e.stack) : String(e);
}

function messageOf(e) {
  return e && e.message ? String(e.message) : String(e);
}

function failure(message) {
  return { statusCode: 500, headers: JSON_HEADERS, body: JSON.stringify({ error: message }) };
}

function normalize(result) {
  const raw = result && typeof result === "object" ? result : {};
  const statusCode = Number(raw.statusCode ?? 200);
  const headers =
    raw.headers && typeof raw.headers === "object" && !Array.isArray(raw.headers) ? raw.headers : {};
  let body = raw.body;
  if (typeof body !== "string") {
    try {
      body = JSON.stringify(body ?? null);
    } catch {
      body = String(body);
    }
  }
  return { statusCode, headers, body };
}

let emitted = false;

function emit(response) {
  if (emitted) return;
  emitted = true;
  clearInterval(keepAlive);

  let text;
  try {
    text = JSON.stringify(response);
  } catch {
    text = JSON.stringify(failure("Non-serializable response"));
  }
  // Leading newline: the user may have left an unterminated line on stdout.
  process.stdout.write("\n" + RESULT_START + "\n" + text + "\n" + RESULT_END + "\n", () =>
    process.exit(0)
  );
}

function fail(e) {
  process.stderr.write(stackOf(e) + "\n");
  emit(failure(messageOf(e)));
}

process.on("uncaughtException", fail);
process.on("unhandledRejection", fail);

function readEvent() {
  try {
    return JSON.parse(readFileSync(join(base, EVENT_FILE), "utf8") || "{}");
  } catch {
    return {};
  }
}

function resolveHandler(mod) {
  if (!mod) return null;
  if (typeof mod[HANDLER_NAME] === "function") return mod[HANDLER_NAME];
  const def = mod.default;
  if (def && typeof def[HANDLER_NAME] === "function") return def[HANDLER_NAME].bind(def);
  if (typeof def === "function" && def.name === HANDLER_NAME) return def;
  return null;
}

const event = readEvent();

const COMMONJS_GLOBALS = /\b(exports|module|require) is not defined/;

function isCommonJS(e) {
  return SOURCE_FILE.endsWith(".mjs") && e instanceof ReferenceError && COMMONJS_GLOBALS.test(e.message);
}

function loadCommonJS() {
  const path = join(base, SOURCE_FILE.slice(0, -".mjs".length) + ".cjs");
  copyFileSync(join(base, SOURCE_FILE), path);
  return { default: createRequire(import.meta.url)(path) };
}

let mod = null;
try {
  mod = await import(pathToFileURL(join(base, SOURCE_FILE)).href);
} catch (e) {
  let error = e;
  if (isCommonJS(e)) {
    try {
      mod = loadCommonJS();
      error = null;
    } catch (cjs) {
      // A module mixing `export` with require does not parse as CommonJS either.
      if (!(cjs instanceof SyntaxError)) error = cjs;
    }
  }
  if (error) {
    process.stderr.write(stackOf(error) + "\n");
    emit(failure("Failed to load user module: " + messageOf(error)));
  }
}

if (!emitted) {
  const fn = resolveHandler(mod);
  if (!fn) {
    process.stderr.write("handler is missing or not callable\n");
    emit(failure("Missing handler: " + HANDLER_NAME));
  } else {
    try {
      emit(normalize(await fn(event)));
    } catch (e) {
      fail(e);
    }
  }
}
)js";

    bool identifier_start(char c)
    {
      return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
    }

    bool identifier_char(char c)
    {
      return identifier_start(c) || std::isdigit(static_cast<unsigned char>(c));
    }

  } // namespace

  Runtime JavaScriptAdapter::runtime() const
  {
    return Runtime::JAVASCRIPT;
  }

  std::string_view JavaScriptAdapter::source_file() const
  {
    return "index.mjs";
  }

  std::string_view JavaScriptAdapter::runner_file() const
  {
    return "runner.mjs";
  }

  std::vector<InterpreterCandidate> JavaScriptAdapter::candidates() const
  {
    return {{"node", {}, {}}, {"bun", {}, {}}};
  }

  bool JavaScriptAdapter::valid_handler_name(std::string_view name) const
  {
    if (name.empty() || !identifier_start(name.front())) {
      return false;
    }
    for (char c : name) {
      if (!identifier_char(c)) {
        return false;
      }
    }
    return true;
  }

  std::string JavaScriptAdapter::render_runner(std::string_view handler_name) const
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
  JavaScriptAdapter::environment(std::string_view handler_name) const
  {
    auto env = RuntimeAdapter::environment(handler_name);
    env.emplace_back("NODE_NO_WARNINGS", "1");
    return env;
  }

  Runtime TypeScriptAdapter::runtime() const
  {
    return Runtime::TYPESCRIPT;
  }

  std::string_view TypeScriptAdapter::source_file() const
  {
    return "index.ts";
  }

  std::vector<InterpreterCandidate> TypeScriptAdapter::candidates() const
  {
    // Node.js runs TypeScript only from 22.6 on, and only with type stripping enabled;
    // older releases reject the flag.
    return {
        {"bun", {}, {}},
        {"node", {"--experimental-strip-types"}, {"--experimental-strip-types", "-e", ""}}};
  }

} // namespace fnexec::engine::runtime
