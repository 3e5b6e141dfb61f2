#include "cmd_tools.h"
#include "runner_utils.h"

#include "labwright/compose.h"
#include "labwright/ids.h"
#include "labwright/orchestrator.h"
#include "labwright/renderer.h"
#include "labwright/script_guard.h"
#include "labwright/types.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace labwright;

int cmd_check_script(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: labwright_cli check_script <script.py>\n";
        return 2;
    }
    const std::string text = slurp_file(argv[2]);
    if (text.empty()) {
        std::cerr << "cannot read script: " << argv[2] << "\n";
        return 2;
    }
    ScriptVerdict v = check_script(text);
    if (v.ok) {
        std::cout << "OK\n";
        return 0;
    }
    std::cout << "REJECTED: " << v.reason << "\n";
    return 1;
}

int cmd_mutate(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: labwright_cli mutate <blueprint.json> <level>\n";
        return 2;
    }
    char* end = nullptr;
    long level = std::strtol(argv[3], &end, 10);
    if (!end || *end != '\0' || level < kMinMutationLevel || level > kMaxMutationLevel) {
        std::cerr << "level must be " << kMinMutationLevel << ".." << kMaxMutationLevel << "\n";
        return 2;
    }
    Blueprint bp;
    if (!load_blueprint_file(argv[2], &bp)) return 2;

    const std::string script = incorrect_script(bp, (int)level);
    std::cout << script;
    if (script == solution_script(bp)) {
        std::cerr << "[mutate] no pattern applied at level " << level << "\n";
        return 1;
    }
    return 0;
}

int cmd_render(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: labwright_cli render <blueprint.json> <out_dir>\n";
        return 2;
    }
    Blueprint bp;
    if (!load_blueprint_file(argv[2], &bp)) return 2;

    LabConfig cfg = load_lab_config();
    LabFilesOptions opt;
    opt.lab_id = gen_lab_id();
    opt.jupyter_port = cfg.port_range_start;
    opt.include_solutions = cfg.include_solutions;
    if (!cfg.compose_template_path.empty()) {
        opt.compose_template = slurp_file(cfg.compose_template_path);
        if (opt.compose_template.empty()) {
            std::cerr << "cannot read compose template: " << cfg.compose_template_path << "\n";
            return 2;
        }
    }

    std::string err;
    if (!write_lab_files(bp, argv[3], opt, &err)) {
        std::cerr << "render failed: " << err << "\n";
        return 1;
    }
    std::cout << argv[3] << "\n";
    return 0;
}

int cmd_recover(int argc, char** argv) {
    (void)argc;
    (void)argv;
    LabConfig cfg = load_lab_config();
    LabOrchestrator orch(cfg, std::make_shared<DockerComposeDriver>(cfg.docker_bin));
    int n = orch.recover_orphans();
    std::cout << n << "\n";
    return 0;
}
