#pragma once

#include "labwright/blueprint.h"
#include "labwright/config.h"
#include "labwright/orchestrator.h"
#include "labwright/repairer.h"

#include <filesystem>
#include <memory>
#include <string>

namespace labwright {

// Empty string when the file cannot be read.
std::string slurp_file(const std::filesystem::path& p);

// Parse and contract-check a blueprint file. Issues are printed to stderr;
// returns false on any of them.
bool load_blueprint_file(const std::string& path, Blueprint* out);

// Null when LABWRIGHT_REPAIR_CMD is unset.
std::unique_ptr<IRepairer> make_repairer(const LabConfig& cfg);

// Tears down lab directories left by a dead process when
// LABWRIGHT_RECOVER_ON_START is set. Returns the number removed.
int recover_if_configured(const LabConfig& cfg, LabOrchestrator& orch);

// SIGINT/SIGTERM set a flag instead of killing the process.
void install_stop_handlers();
bool stop_requested();

// Blocks until SIGINT/SIGTERM.
void hold_until_signal();

} // namespace labwright
