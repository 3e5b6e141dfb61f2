#pragma once
#include "blueprint.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace labwright {

// Printed by the reference script as its very last statement.
inline constexpr const char* kScriptSuccessSentinel = "===SELF_TEST_SOLUTION_OK===";

// Workspace file names, numbered so JupyterLab lists them in order.
inline constexpr const char* kInstructionsFile = "1_INSTRUCTIONS.md";
inline constexpr const char* kStarterNotebookFile = "2_getting_started.ipynb";
inline constexpr const char* kSolutionNotebookFile = "3_solution.ipynb";
inline constexpr const char* kIncorrectNotebookFile = "4_incorrect_solution.ipynb";

// Reference implementation per step: the blueprint's solution code, or code
// derived from tags and hints for steps that have none.
std::vector<std::string> reference_step_code(const Blueprint& bp);

// Executable reference solution fed to the interpreter on stdin.
std::string solution_script(const Blueprint& bp);

// Same layout with every step mutated at `level`. Equal to solution_script()
// when no mutation pattern applied.
std::string incorrect_script(const Blueprint& bp, int level);

std::string instructions_md(const Blueprint& bp);
std::string starter_notebook(const Blueprint& bp);
std::string solution_notebook(const Blueprint& bp);
std::string incorrect_notebook(const Blueprint& bp, int level);

// Replaces `{{ name }}` placeholders; unknown names are left untouched.
std::string render_template(const std::string& tpl, const std::map<std::string, std::string>& vars);

const char* default_compose_template();
const char* jupyter_dockerfile();

std::string jupyter_url(int port);

struct LabFilesOptions {
    std::string lab_id;
    int jupyter_port{0};
    std::string compose_template; // empty: built-in
    bool include_solutions{true};
};

// Materialize docker-compose.yml, both seed scripts, jupyter/Dockerfile and
// the workspace/ documents under lab_dir (created if missing).
bool write_lab_files(const Blueprint& bp,
                     const std::filesystem::path& lab_dir,
                     const LabFilesOptions& opt,
                     std::string* err);

// Writes through a sibling tmp file and rename.
bool write_text_file(const std::filesystem::path& p, const std::string& content, std::string* err);

} // namespace labwright
