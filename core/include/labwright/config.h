#pragma once
#include <filesystem>
#include <string>

namespace labwright {

enum class Profile { DEV, PROD };

// Detect profile from LABWRIGHT_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Sets env vars that are not already set.
// DEV: solution notebooks shipped, event log on
// PROD: solution notebooks omitted, event log on
void apply_profile_defaults(Profile p);

// Runtime knobs, read once from the environment.
struct LabConfig {
    int port_range_start{8888};
    int port_range_end{8988};   // inclusive

    std::filesystem::path base_dir{"./lab_workspaces"};
    std::string compose_template_path; // empty: built-in template
    std::string docker_bin{"docker"};

    int compose_up_timeout_ms{600000};
    int compose_down_timeout_ms{120000};
    int script_timeout_ms{120000};
    int query_timeout_s{5};
    int db_ready_timeout_ms{120000};
    int db_poll_ms{2000};
    int settle_ms{5000};

    int max_retries{1};
    bool include_solutions{true};

    std::string repair_cmd;     // empty: no repair collaborator
    int repair_timeout_ms{600000};

    bool event_log{true};
    bool recover_on_start{false}; // selftest/launch sweep orphaned labs first

    std::filesystem::path failed_dir() const { return base_dir / "failed_labs"; }
    std::filesystem::path event_log_dir() const { return base_dir / "selftest_logs"; }
};

LabConfig load_lab_config();

// Integer env var with fallback on absence or garbage.
int env_int(const char* key, int fallback);
bool env_flag(const char* key, bool fallback);

} // namespace labwright
