#pragma once
#include "blueprint.h"
#include "types.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace labwright {

// Directory and compose project prefix of every session.
inline constexpr const char* kLabPrefix = "lab-";

// One provisioned sandbox. Owned by exactly one layer at a time: the
// self-test coordinator while testing, then a SessionRegistry once published.
struct LabSession {
    std::string lab_id;
    LabStatus status{LabStatus::PENDING};
    std::optional<int> jupyter_port;
    std::string jupyter_url;

    // Set together, never one without the other.
    std::string project_name;
    std::filesystem::path lab_dir;

    Blueprint blueprint;
    std::vector<ValidationResult> validation_results;

    std::string error_message;
    ErrorKind error_kind{ErrorKind::NONE};

    // Guards the exactly-once port release.
    bool port_released{false};
};

// Read-only projection handed to whoever consumes a published lab.
struct PublishedLab {
    std::string lab_id;
    LabStatus status{LabStatus::PENDING};
    std::string jupyter_url;
    std::string error_message;
};

PublishedLab publish_view(const LabSession& s);

// Published sessions by lab id.
class SessionRegistry {
public:
    // Takes ownership; replaces any session with the same id.
    void put(LabSession s);

    std::optional<PublishedLab> view(const std::string& lab_id) const;
    std::vector<PublishedLab> list() const;

    // Removes and returns the session so the caller may tear it down.
    std::optional<LabSession> take(const std::string& lab_id);
    std::vector<LabSession> take_all();

    size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, LabSession> sessions_;
};

class LabOrchestrator;

// Shutdown hook: tears down every starting/running session in the registry.
// Failures are logged and skipped. Returns the number torn down cleanly.
int stop_all(SessionRegistry& registry, LabOrchestrator& orch);

} // namespace labwright
