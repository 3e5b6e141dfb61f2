#include "runner_utils.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace labwright {

static std::atomic<bool> g_stop{false};

std::string slurp_file(const std::filesystem::path& p) {
    std::ifstream f(p.string(), std::ios::binary);
    if (!f) return "";
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

bool load_blueprint_file(const std::string& path, Blueprint* out) {
    const std::string text = slurp_file(path);
    if (text.empty()) {
        std::cerr << "cannot read blueprint: " << path << "\n";
        return false;
    }
    std::string err;
    if (!blueprint_from_json(text, out, &err)) {
        std::cerr << "invalid blueprint " << path << ": " << err << "\n";
        return false;
    }
    auto issues = check_blueprint(*out);
    for (const auto& i : issues) std::cerr << "blueprint issue " << i.code << ": " << i.message << "\n";
    return issues.empty();
}

std::unique_ptr<IRepairer> make_repairer(const LabConfig& cfg) {
    if (cfg.repair_cmd.empty()) return nullptr;
    return std::make_unique<ExternalProcessRepairer>(cfg.repair_cmd, cfg.repair_timeout_ms);
}

int recover_if_configured(const LabConfig& cfg, LabOrchestrator& orch) {
    if (!cfg.recover_on_start) return 0;
    int n = orch.recover_orphans();
    if (n > 0) std::cerr << "[cli] recovered " << n << " orphaned lab(s)\n";
    return n;
}

void install_stop_handlers() {
    g_stop.store(false);
    std::signal(SIGTERM, [](int) { g_stop.store(true); });
    std::signal(SIGINT,  [](int) { g_stop.store(true); });
}

bool stop_requested() { return g_stop.load(); }

void hold_until_signal() {
    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
}

} // namespace labwright
