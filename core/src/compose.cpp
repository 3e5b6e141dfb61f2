#include "labwright/compose.h"

#include <utility>

namespace labwright {

DockerComposeDriver::DockerComposeDriver(std::string docker_bin)
    : docker_bin_(std::move(docker_bin)) {}

std::vector<std::string> DockerComposeDriver::base_argv(const ComposeProject& p) const {
    return {docker_bin_, "compose", "-p", p.project_name, "-f", p.compose_file.string()};
}

ProcResult DockerComposeDriver::run(const std::vector<std::string>& argv,
                                    const ComposeProject& p,
                                    const std::string& stdin_data,
                                    int timeout_ms) const {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    // image builds may invoke setuid credential helpers
    lim.no_new_privs = false;

    ProcResult res;
    std::string cwd = p.lab_dir.empty() ? std::string() : p.lab_dir.string();
    if (!proc_run_capture_stdin(argv, cwd, stdin_data, lim, &res) && res.error.empty()) {
        res.error = "failed to start " + argv[0];
    }
    return res;
}

ProcResult DockerComposeDriver::up(const ComposeProject& p, int timeout_ms) {
    auto argv = base_argv(p);
    argv.insert(argv.end(), {"up", "-d", "--build"});
    return run(argv, p, std::string(), timeout_ms);
}

ProcResult DockerComposeDriver::down(const ComposeProject& p, int timeout_ms) {
    auto argv = base_argv(p);
    argv.insert(argv.end(), {"down", "-v", "--remove-orphans"});
    return run(argv, p, std::string(), timeout_ms);
}

ProcResult DockerComposeDriver::exec(const ComposeProject& p,
                                     const std::string& service,
                                     const std::vector<std::string>& argv,
                                     const std::string& stdin_data,
                                     int timeout_ms) {
    auto full = base_argv(p);
    full.insert(full.end(), {"exec", "-T", service});
    full.insert(full.end(), argv.begin(), argv.end());
    return run(full, p, stdin_data, timeout_ms);
}

} // namespace labwright
