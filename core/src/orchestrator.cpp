#include "labwright/orchestrator.h"
#include "labwright/ids.h"
#include "labwright/renderer.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace labwright {

namespace fs = std::filesystem;

static std::string tail(const std::string& s, size_t n) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

LabOrchestrator::LabOrchestrator(LabConfig cfg, std::shared_ptr<IComposeDriver> driver)
    : cfg_(std::move(cfg)),
      driver_(std::move(driver)),
      ports_(cfg_.port_range_start, cfg_.port_range_end) {}

void LabOrchestrator::mark_live(const std::string& project) {
    std::lock_guard<std::mutex> lk(live_mu_);
    live_projects_.insert(project);
}

void LabOrchestrator::mark_dead(const std::string& project) {
    std::lock_guard<std::mutex> lk(live_mu_);
    live_projects_.erase(project);
}

bool LabOrchestrator::is_live(const std::string& project) const {
    std::lock_guard<std::mutex> lk(live_mu_);
    return live_projects_.count(project) > 0;
}

void LabOrchestrator::release_port(LabSession& s) {
    if (s.port_released || !s.jupyter_port) return;
    if (!ports_.release(*s.jupyter_port)) {
        std::cerr << "[orchestrator] port " << *s.jupyter_port << " was not held\n";
    }
    s.port_released = true;
}

bool LabOrchestrator::load_template(std::string* out, std::string* err) const {
    if (cfg_.compose_template_path.empty()) {
        *out = default_compose_template();
        return true;
    }
    std::ifstream f(cfg_.compose_template_path, std::ios::binary);
    if (!f) {
        *err = "cannot read compose template: " + cfg_.compose_template_path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    *out = ss.str();
    return true;
}

LabSession LabOrchestrator::provision(const Blueprint& bp, bool include_solutions) {
    LabSession s;
    s.blueprint = bp;

    auto port = ports_.acquire();
    if (!port) {
        s.status = LabStatus::ERROR;
        s.error_kind = ErrorKind::RESOURCE_EXHAUSTED;
        s.error_message = "No available ports in range " + std::to_string(ports_.first()) + "-" +
                          std::to_string(ports_.last());
        std::cerr << "[orchestrator] " << s.error_message << "\n";
        return s;
    }

    s.lab_id = gen_lab_id();
    s.jupyter_port = *port;
    s.project_name = kLabPrefix + s.lab_id;
    s.lab_dir = cfg_.base_dir / s.project_name;
    s.status = LabStatus::STARTING;
    mark_live(s.project_name);

    auto fail = [&](const std::string& msg, bool containers_may_exist) {
        std::cerr << "[orchestrator] lab " << s.lab_id << " provisioning failed: " << msg << "\n";
        if (containers_may_exist) {
            ComposeProject p{s.project_name, s.lab_dir / "docker-compose.yml", s.lab_dir};
            ProcResult down = driver_->down(p, cfg_.compose_down_timeout_ms);
            if (!down.ok()) {
                std::cerr << "[orchestrator] lab " << s.lab_id << " cleanup after failed up: exit="
                          << down.exit_code << "\n";
            }
        }
        std::error_code ec;
        fs::remove_all(s.lab_dir, ec);
        release_port(s);
        mark_dead(s.project_name);
        s.project_name.clear();
        s.lab_dir.clear();
        s.status = LabStatus::ERROR;
        s.error_kind = ErrorKind::PROVISIONING_FAILURE;
        s.error_message = msg;
        return s;
    };

    std::string tpl, err;
    if (!load_template(&tpl, &err)) return fail(err, false);

    LabFilesOptions opt;
    opt.lab_id = s.lab_id;
    opt.jupyter_port = *port;
    opt.compose_template = tpl;
    opt.include_solutions = include_solutions;
    if (!write_lab_files(bp, s.lab_dir, opt, &err)) return fail(err, false);

    ComposeProject p{s.project_name, s.lab_dir / "docker-compose.yml", s.lab_dir};
    std::cerr << "[orchestrator] lab " << s.lab_id << " starting on port " << *port << "\n";
    ProcResult up = driver_->up(p, cfg_.compose_up_timeout_ms);
    if (!up.ok()) {
        std::string msg = "compose up failed";
        if (up.timed_out) msg += " (timed out)";
        else if (!up.error.empty()) msg += ": " + up.error;
        else msg += " (exit " + std::to_string(up.exit_code) + ")";
        if (!up.output.empty()) msg += ": " + tail(up.output, 2000);
        return fail(msg, true);
    }

    s.status = LabStatus::RUNNING;
    s.jupyter_url = jupyter_url(*port);
    return s;
}

bool LabOrchestrator::teardown(LabSession& s) {
    if (s.status == LabStatus::STOPPED) return true;

    bool ok = true;
    if (!s.project_name.empty() && !s.lab_dir.empty()) {
        s.status = LabStatus::STOPPING;
        const fs::path compose_file = s.lab_dir / "docker-compose.yml";
        std::error_code ec;
        if (fs::exists(compose_file, ec)) {
            ProcResult down = driver_->down({s.project_name, compose_file, s.lab_dir},
                                            cfg_.compose_down_timeout_ms);
            if (!down.ok()) {
                ok = false;
                s.error_message = "compose down failed" +
                                  std::string(down.timed_out ? " (timed out)" : "") +
                                  (down.output.empty() ? "" : ": " + tail(down.output, 500));
                std::cerr << "[orchestrator] lab " << s.lab_id << " " << s.error_message << "\n";
            }
        }
        fs::remove_all(s.lab_dir, ec);
        if (ec) {
            std::cerr << "[orchestrator] lab " << s.lab_id << " could not remove " << s.lab_dir
                      << ": " << ec.message() << "\n";
        }
        mark_dead(s.project_name);
        s.status = ok ? LabStatus::STOPPED : LabStatus::ERROR;
    } else if (s.status != LabStatus::ERROR) {
        s.status = LabStatus::STOPPED;
    }

    release_port(s);
    return ok;
}

int LabOrchestrator::recover_orphans() {
    std::lock_guard<std::mutex> lk(orphan_mu_);

    std::error_code ec;
    if (!fs::is_directory(cfg_.base_dir, ec)) return 0;

    std::vector<fs::path> candidates;
    for (fs::directory_iterator it(cfg_.base_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind(kLabPrefix, 0) != 0) continue;
        std::error_code dec;
        if (!it->is_directory(dec)) continue;
        candidates.push_back(it->path());
    }
    if (ec) {
        std::cerr << "[orchestrator] orphan scan of " << cfg_.base_dir << " stopped early: " << ec.message() << "\n";
    }

    int cleaned = 0;
    for (const auto& dir : candidates) {
        const std::string project = dir.filename().string();
        if (is_live(project)) continue;

        std::error_code fec;
        const fs::path compose_file = dir / "docker-compose.yml";
        if (fs::exists(compose_file, fec)) {
            ProcResult down = driver_->down({project, compose_file, dir}, cfg_.compose_down_timeout_ms);
            if (!down.ok()) {
                std::cerr << "[orchestrator] orphan " << project << " down failed (exit "
                          << down.exit_code << "), removing directory anyway\n";
            }
        }
        fs::remove_all(dir, fec);
        if (fec) {
            std::cerr << "[orchestrator] orphan " << project << " not removed: " << fec.message() << "\n";
            continue;
        }
        cleaned++;
    }
    if (cleaned > 0) std::cerr << "[orchestrator] recovered " << cleaned << " orphaned lab(s)\n";
    return cleaned;
}

std::optional<ComposeProject> LabOrchestrator::execution_handle(const LabSession& s) const {
    if (s.project_name.empty() || s.lab_dir.empty()) return std::nullopt;
    const fs::path compose_file = s.lab_dir / "docker-compose.yml";
    std::error_code ec;
    if (!fs::exists(compose_file, ec)) return std::nullopt;
    return ComposeProject{s.project_name, compose_file, s.lab_dir};
}

int LabOrchestrator::reset_target_store(const LabSession& s) {
    auto h = execution_handle(s);
    if (!h) return (int)s.blueprint.target_tables.size();

    int failed = 0;
    for (const auto& t : s.blueprint.target_tables) {
        ProcResult r = driver_->exec(*h, kTargetDbService,
            {"psql", "-X", "-U", "labuser", "-d", "target_db", "-v", "ON_ERROR_STOP=1",
             "-c", "TRUNCATE TABLE \"" + t.name + "\" CASCADE;"},
            std::string(), cfg_.query_timeout_s * 1000 + 10000);
        if (!r.ok()) {
            failed++;
            std::cerr << "[orchestrator] lab " << s.lab_id << " truncate " << t.name << " failed: "
                      << tail(r.error.empty() ? r.output : r.error, 300) << "\n";
        }
    }
    return failed;
}

bool LabOrchestrator::rewrite_incorrect_notebook(const LabSession& s, int level, std::string* err) {
    if (s.lab_dir.empty()) {
        if (err) *err = "session has no lab directory";
        return false;
    }
    return write_text_file(s.lab_dir / "workspace" / kIncorrectNotebookFile,
                           incorrect_notebook(s.blueprint, level), err);
}

} // namespace labwright
