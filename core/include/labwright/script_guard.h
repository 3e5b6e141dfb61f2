#pragma once
#include <string>
#include <vector>

namespace labwright {

struct ScriptVerdict {
    bool ok{true};
    std::string reason; // empty when ok
};

// Static pre-execution scan of a Python script. Rejects imports of
// process, filesystem and network escape modules and calls to dangerous
// builtins. Imports are found in every `;`-separated statement. Calls are
// matched as bare names followed by `(`, so identifiers that merely contain
// a denylisted name and attribute calls (`re.compile(`) pass.
ScriptVerdict check_script(const std::string& script);

const std::vector<std::string>& denied_imports();
const std::vector<std::string>& denied_calls();

} // namespace labwright
