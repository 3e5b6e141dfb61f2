#pragma once
#include "proc.h"

#include <filesystem>
#include <string>
#include <vector>

namespace labwright {

// Fixed service names of the sandbox topology.
inline constexpr const char* kSourceDbService = "source-db";
inline constexpr const char* kTargetDbService = "target-db";
inline constexpr const char* kJupyterService = "jupyter";

// Addresses one running topology. Reusable across many exec calls.
struct ComposeProject {
    std::string project_name;
    std::filesystem::path compose_file;
    std::filesystem::path lab_dir;
};

// Container bring-up/teardown/exec boundary. Implementations must be safe to
// call from several threads for different projects.
class IComposeDriver {
public:
    virtual ~IComposeDriver() = default;

    virtual ProcResult up(const ComposeProject& p, int timeout_ms) = 0;

    // Removes containers and anonymous volumes.
    virtual ProcResult down(const ComposeProject& p, int timeout_ms) = 0;

    // Runs argv inside a running service; stdin_data may be empty.
    virtual ProcResult exec(const ComposeProject& p,
                            const std::string& service,
                            const std::vector<std::string>& argv,
                            const std::string& stdin_data,
                            int timeout_ms) = 0;
};

// Drives the `docker compose` CLI as a child process.
class DockerComposeDriver : public IComposeDriver {
public:
    explicit DockerComposeDriver(std::string docker_bin = "docker");

    ProcResult up(const ComposeProject& p, int timeout_ms) override;
    ProcResult down(const ComposeProject& p, int timeout_ms) override;
    ProcResult exec(const ComposeProject& p,
                    const std::string& service,
                    const std::vector<std::string>& argv,
                    const std::string& stdin_data,
                    int timeout_ms) override;

private:
    std::vector<std::string> base_argv(const ComposeProject& p) const;
    ProcResult run(const std::vector<std::string>& argv, const ComposeProject& p,
                   const std::string& stdin_data, int timeout_ms) const;

    std::string docker_bin_;
};

} // namespace labwright
