#include "harness.h"

#include <regex>
#include <utility>
#include <vector>

#include "utils.h"

namespace {

// {source} and {entry} are substituted with JSON string literals, which are
//   valid in both Python and JavaScript.
constexpr char kPythonRunner[] = R"(import inspect
import io
import json
import sys
import traceback

_SOURCE = {source}
_ENTRY = {entry}


def _find_callable(ns):
    if _ENTRY:
        fn = ns.get(_ENTRY)
        if not callable(fn):
            raise NameError("entry point %r is not defined" % _ENTRY)
        return fn
    for name in ("solve", "main", "solution"):
        if inspect.isfunction(ns.get(name)):
            return ns[name]
    for value in list(ns.values()):
        if inspect.isfunction(value) and value.__module__ == "__solution__":
            return value
    return None


def _call_forms(data):
    if data is None:
        return [((), {})]
    if isinstance(data, dict):
        return [((), data), ((data,), {}), ((), {})]
    if isinstance(data, list):
        return [((data,), {}), (tuple(data), {}), ((), {})]
    return [((data,), {}), ((), {})]


def _invoke(fn, data):
    forms = _call_forms(data)
    try:
        sig = inspect.signature(fn)
    except (TypeError, ValueError):
        sig = None
    if sig is not None:
        for args, kwargs in forms:
            try:
                sig.bind(*args, **kwargs)
            except TypeError:
                continue
            return fn(*args, **kwargs)
    last_error = None
    for args, kwargs in forms:
        try:
            return fn(*args, **kwargs)
        except TypeError as e:
            last_error = e
    raise last_error


def _main():
    raw = sys.stdin.read()
    sys.stdin = io.StringIO(raw)
    data = None
    if raw.strip():
        try:
            data = json.loads(raw)
        except ValueError:
            data = raw
    ns = {"__name__": "__solution__", "__builtins__": __builtins__}
    try:
        exec(compile(_SOURCE, "solution.py", "exec"), ns)
        fn = _find_callable(ns)
        if fn is None:
            return 0
        result = _invoke(fn, data)
    except SystemExit:
        raise
    except BaseException:
        traceback.print_exc()
        return 1
    if result is not None:
        if isinstance(result, str):
            print(result)
        else:
            try:
                text = json.dumps(result, ensure_ascii=False)
            except Exception:
                text = str(result)
            print(text)
    return 0


if __name__ == "__main__":
    sys.exit(_main())
)";

constexpr char kJavaScriptRunner[] = R"("use strict";
const vm = require("vm");
const fs = require("fs");

const SOURCE = {source};
const ENTRY = {entry};

function candidates(src) {
  const names = [];
  const re = /(?:^|[^\w$.])(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)\s*\(|(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s*)?(?:function\b|\([^)]*\)\s*=>|[A-Za-z_$][\w$]*\s*=>)/g;
  let m;
  while ((m = re.exec(src)) !== null) names.push(m[1] || m[2]);
  return names;
}

function lookup(name) {
  try {
    return vm.runInThisContext(`typeof ${name} === "function" ? ${name} : undefined`);
  } catch (e) {
    return undefined;
  }
}

function findCallable() {
  if (ENTRY) return lookup(ENTRY);
  const names = candidates(SOURCE);
  for (const name of ["solve", "main", "solution"]) {
    if (names.includes(name) && lookup(name)) return lookup(name);
  }
  for (const name of names) {
    const fn = lookup(name);
    if (fn) return fn;
  }
  if (typeof module.exports === "function") return module.exports;
  return undefined;
}

function invoke(fn, data) {
  if (data === null) return fn();
  if (Array.isArray(data) && fn.length > 1) {
    try {
      return fn(...data);
    } catch (e) {
      if (!(e instanceof TypeError)) throw e;
      return fn(data);
    }
  }
  try {
    return fn(data);
  } catch (e) {
    if (!(e instanceof TypeError) || !Array.isArray(data)) throw e;
    return fn(...data);
  }
}

function fail(e) {
  process.stderr.write(`${e && e.stack ? e.stack : e}\n`);
  process.exitCode = 1;
}

const raw = fs.readFileSync(0, "utf8");
let data = null;
if (raw.trim() !== "") {
  try {
    data = JSON.parse(raw);
  } catch (e) {
    data = raw;
  }
}
globalThis.require = require;
globalThis.module = { exports: {} };
globalThis.exports = globalThis.module.exports;

try {
  vm.runInThisContext(SOURCE, { filename: "solution.js" });
  const fn = findCallable();
  if (fn) {
    Promise.resolve(invoke(fn, data)).then((result) => {
      if (result === undefined || result === null) return;
      process.stdout.write(typeof result === "string" ? `${result}\n` : `${JSON.stringify(result)}\n`);
    }).catch(fail);
  }
} catch (e) {
  fail(e);
}
)";

constexpr char kCppHeaders[] =
    "#include <iostream>\n#include <vector>\n#include <string>\n#include <algorithm>\n"
    "using namespace std;\n\n";
constexpr char kCHeaders[] = "#include <stdio.h>\n#include <stdlib.h>\n#include <string.h>\n\n";

std::string JsonLiteral(const std::string& str) {
  return nlohmann::json(str).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string GenerateRunner(const char* runner, const std::string& source, const std::string& entry_point) {
  // entry goes first so that a "{entry}" inside the user source is left alone
  return FormatTemplate(runner, {{"entry", JsonLiteral(entry_point)}, {"source", JsonLiteral(source)}});
}

const std::regex kJavaPublicClass(R"(public\s+(?:final\s+|abstract\s+)*class\s+([A-Za-z_$][\w$]*))");

// The public class, else the innermost class whose braces enclose main
std::string JavaMainClass(const std::string& source) {
  static const std::regex kAnyClass(R"(\bclass\s+([A-Za-z_$][\w$]*))");
  static const std::regex kMainMethod(R"(\bstatic\s+void\s+main\s*\()");
  std::smatch match;
  if (std::regex_search(source, match, kJavaPublicClass)) return match[1];
  if (!std::regex_search(source, match, kMainMethod)) {
    if (std::regex_search(source, match, kAnyClass)) return match[1];
    return "Main";
  }
  const size_t main_pos = match.position(0);

  std::vector<std::pair<size_t, std::string>> decls; // name end, name
  for (std::sregex_iterator it(source.begin(), source.end(), kAnyClass), end; it != end; ++it) {
    if ((size_t)it->position(0) >= main_pos) break;
    decls.emplace_back(it->position(1) + it->length(1), (*it)[1]);
  }
  std::vector<std::string> scopes; // one per open brace; empty if not a class body
  std::string pending;
  size_t next = 0;
  for (size_t i = 0; i < main_pos; i++) {
    if (next < decls.size() && i == decls[next].first) pending = decls[next++].second;
    if (source[i] == '{') {
      scopes.push_back(pending);
      pending.clear();
    } else if (source[i] == '}' && !scopes.empty()) {
      scopes.pop_back();
    }
  }
  for (auto it = scopes.rbegin(); it != scopes.rend(); ++it) {
    if (!it->empty()) return *it;
  }
  return decls.empty() ? "Main" : decls.back().second;
}

} // namespace

PreparedProgram PrepareProgram(const LanguageSpec& spec, const std::string& source,
                               const std::string& entry_point) {
  PreparedProgram ret;
  ret.file_name = "main" + spec.extension;
  switch (spec.language) {
    case Language::PYTHON:
      ret.content = GenerateRunner(kPythonRunner, source, entry_point);
      break;
    case Language::JAVASCRIPT:
      ret.content = GenerateRunner(kJavaScriptRunner, source, entry_point);
      break;
    case Language::CPP:
      ret.content = source.find("#include") == std::string::npos ? kCppHeaders + source : source;
      break;
    case Language::C: {
      static const std::regex kMain(R"(\bmain\s*\()");
      ret.content = source;
      if (source.find("#include") == std::string::npos) ret.content = kCHeaders + ret.content;
      if (!std::regex_search(source, kMain)) ret.content += "\nint main(void) {\n  return 0;\n}\n";
      break;
    }
    case Language::JAVA:
      if (!std::regex_search(source, kJavaPublicClass) &&
          source.find("class Solution") == std::string::npos) {
        ret.content = "public class Main {\n" + source + "\n}\n";
      } else {
        ret.content = source;
      }
      ret.main_class = JavaMainClass(ret.content);
      ret.file_name = ret.main_class + spec.extension;
      break;
    default:
      ret.content = source;
  }
  return ret;
}

std::string StdinPayload(const LanguageSpec& spec, const nlohmann::json& input) {
  if (input.is_null()) return "";
  if (spec.harness == HarnessType::RAW_STDIN && input.is_string()) return input.get<std::string>();
  return input.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
