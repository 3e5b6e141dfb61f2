#include "labwright/script_guard.h"

#include <regex>
#include <set>
#include <sstream>

namespace labwright {

const std::vector<std::string>& denied_imports() {
    static const std::vector<std::string> mods = {
        "os", "subprocess", "socket", "shutil", "sys", "ctypes", "multiprocessing",
        "pty", "requests", "urllib", "http", "importlib", "pathlib", "signal",
    };
    return mods;
}

const std::vector<std::string>& denied_calls() {
    static const std::vector<std::string> calls = {
        "eval", "exec", "compile", "__import__", "open", "system", "popen", "breakpoint",
    };
    return calls;
}

static std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) e--;
    return s.substr(b, e - b);
}

// Top-level package of a dotted module path: "os.path" -> "os".
static std::string root_module(const std::string& dotted) {
    std::string t = trim_ws(dotted);
    size_t sp = t.find_first_of(" \t");
    if (sp != std::string::npos) t = t.substr(0, sp); // "x as y"
    while (!t.empty() && t.back() == ';') t.pop_back();
    size_t dot = t.find('.');
    return dot == std::string::npos ? t : t.substr(0, dot);
}

// Simple statements of one physical line: "a = 1; import os" has two.
static std::vector<std::string> statements_of(const std::string& line) {
    std::string code = line;
    size_t hash = code.find('#');
    if (hash != std::string::npos) code = code.substr(0, hash);
    std::vector<std::string> out;
    std::stringstream ss(code);
    std::string stmt;
    while (std::getline(ss, stmt, ';')) out.push_back(stmt);
    return out;
}

// Every module named by `import a, b.c as d` or `from a.b import c`,
// wherever the statement sits on its line.
static std::vector<std::string> imported_modules(const std::string& script) {
    static const std::regex import_re(R"(^\s*import\s+(.+)$)");
    static const std::regex from_re(R"(^\s*from\s+([A-Za-z_][\w.]*)\s+import\b)");
    std::vector<std::string> out;
    std::istringstream in(script);
    std::string line;
    while (std::getline(in, line)) {
        for (const auto& stmt : statements_of(line)) {
            std::smatch m;
            if (std::regex_search(stmt, m, from_re)) {
                out.push_back(root_module(m[1].str()));
            } else if (std::regex_search(stmt, m, import_re)) {
                std::stringstream ss(m[1].str());
                std::string item;
                while (std::getline(ss, item, ',')) {
                    std::string mod = root_module(item);
                    if (!mod.empty()) out.push_back(mod);
                }
            }
        }
    }
    return out;
}

ScriptVerdict check_script(const std::string& script) {
    ScriptVerdict v;

    const std::set<std::string> denied(denied_imports().begin(), denied_imports().end());
    for (const auto& mod : imported_modules(script)) {
        if (denied.count(mod)) {
            v.ok = false;
            v.reason = "forbidden import: " + mod;
            return v;
        }
    }

    for (const auto& name : denied_calls()) {
        // attribute calls such as re.compile( or df.eval( are not builtins
        std::regex call_re("(^|[^\\w.])" + name + "\\s*\\(");
        if (std::regex_search(script, call_re)) {
            v.ok = false;
            v.reason = "forbidden call: " + name + "()";
            return v;
        }
    }
    return v;
}

} // namespace labwright
