#include "labwright/config.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace labwright {

Profile detect_profile() {
    const char* env = std::getenv("LABWRIGHT_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("LABWRIGHT_INCLUDE_SOLUTIONS", "1", NO_OVERWRITE);
            setenv("LABWRIGHT_EVENT_LOG",         "1", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("LABWRIGHT_INCLUDE_SOLUTIONS", "0", NO_OVERWRITE);
            setenv("LABWRIGHT_EVENT_LOG",         "1", NO_OVERWRITE);
            break;
    }
}

int env_int(const char* key, int fallback) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0') return fallback;
    if (n < INT_MIN || n > INT_MAX) return fallback;
    return (int)n;
}

bool env_flag(const char* key, bool fallback) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return fallback;
}

static std::string env_str(const char* key, const std::string& fallback) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    return v;
}

LabConfig load_lab_config() {
    LabConfig c;
    c.port_range_start = env_int("LABWRIGHT_PORT_RANGE_START", c.port_range_start);
    c.port_range_end = env_int("LABWRIGHT_PORT_RANGE_END", c.port_range_end);
    if (c.port_range_end < c.port_range_start) c.port_range_end = c.port_range_start;

    c.base_dir = env_str("LABWRIGHT_BASE_DIR", c.base_dir.string());
    c.compose_template_path = env_str("LABWRIGHT_COMPOSE_TEMPLATE", "");
    c.docker_bin = env_str("LABWRIGHT_DOCKER_BIN", c.docker_bin);

    c.compose_up_timeout_ms = env_int("LABWRIGHT_COMPOSE_UP_TIMEOUT_MS", c.compose_up_timeout_ms);
    c.compose_down_timeout_ms = env_int("LABWRIGHT_COMPOSE_DOWN_TIMEOUT_MS", c.compose_down_timeout_ms);
    c.script_timeout_ms = env_int("LABWRIGHT_SCRIPT_TIMEOUT_MS", c.script_timeout_ms);
    c.query_timeout_s = env_int("LABWRIGHT_QUERY_TIMEOUT_S", c.query_timeout_s);
    c.db_ready_timeout_ms = env_int("LABWRIGHT_DB_READY_TIMEOUT_MS", c.db_ready_timeout_ms);
    c.db_poll_ms = env_int("LABWRIGHT_DB_POLL_MS", c.db_poll_ms);
    c.settle_ms = env_int("LABWRIGHT_SETTLE_MS", c.settle_ms);

    c.max_retries = std::max(0, env_int("LABWRIGHT_MAX_RETRIES", c.max_retries));
    c.include_solutions = env_flag("LABWRIGHT_INCLUDE_SOLUTIONS", c.include_solutions);

    c.repair_cmd = env_str("LABWRIGHT_REPAIR_CMD", "");
    c.repair_timeout_ms = env_int("LABWRIGHT_REPAIR_TIMEOUT_MS", c.repair_timeout_ms);
    c.event_log = env_flag("LABWRIGHT_EVENT_LOG", c.event_log);
    c.recover_on_start = env_flag("LABWRIGHT_RECOVER_ON_START", c.recover_on_start);
    return c;
}

} // namespace labwright
