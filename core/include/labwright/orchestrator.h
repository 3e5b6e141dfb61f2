#pragma once
#include "blueprint.h"
#include "compose.h"
#include "config.h"
#include "port_pool.h"
#include "session.h"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace labwright {

// Owns the sandbox lifecycle: port allocation, the per-session directory and
// the compose project. Safe to share between threads; every session is
// driven by one caller at a time.
class LabOrchestrator {
public:
    LabOrchestrator(LabConfig cfg, std::shared_ptr<IComposeDriver> driver);

    // Allocates a port, writes the lab directory and brings the topology up.
    // Never throws; failures come back as status ERROR with error_kind
    // RESOURCE_EXHAUSTED or PROVISIONING_FAILURE, the port already released
    // and the directory removed.
    LabSession provision(const Blueprint& bp, bool include_solutions);
    LabSession provision(const Blueprint& bp) { return provision(bp, cfg_.include_solutions); }

    // Takes the topology down (volumes included), removes the directory and
    // releases the port exactly once. No-op on a STOPPED session. Returns
    // false if `compose down` failed; the session is then ERROR but its port
    // is released all the same.
    bool teardown(LabSession& s);

    // Tears down every lab-* directory under base_dir that no live session of
    // this process owns. Never throws. Returns the number of directories
    // removed.
    int recover_orphans();

    // nullopt when the session has no live directory or compose file.
    std::optional<ComposeProject> execution_handle(const LabSession& s) const;

    // TRUNCATE every target table as the owning role. Returns how many
    // tables could not be truncated.
    int reset_target_store(const LabSession& s);

    // Rewrites the workspace incorrect-solution notebook at `level`.
    bool rewrite_incorrect_notebook(const LabSession& s, int level, std::string* err);

    const LabConfig& config() const { return cfg_; }
    std::shared_ptr<IComposeDriver> driver() const { return driver_; }
    PortPool& ports() { return ports_; }

private:
    void mark_live(const std::string& project);
    void mark_dead(const std::string& project);
    bool is_live(const std::string& project) const;
    void release_port(LabSession& s);
    bool load_template(std::string* out, std::string* err) const;

    LabConfig cfg_;
    std::shared_ptr<IComposeDriver> driver_;
    PortPool ports_;

    mutable std::mutex live_mu_;
    std::set<std::string> live_projects_;

    std::mutex orphan_mu_;
};

} // namespace labwright
