#pragma once
#include <json-c/json.h>

#include <fstream>
#include <mutex>
#include <string>

namespace labwright {

// Append-only JSONL trail of one self-test run. Every line is a canonical
// (key-sorted) object: ts, run_id, event, attempt, payload.
// A logger that failed to open its file silently drops events.
class JsonlLogger {
public:
    JsonlLogger(std::string run_id, const std::string& path);

    // Takes ownership of payload (may be null).
    void event(int attempt, const std::string& name, json_object* payload);

    const std::string& path() const { return path_; }
    const std::string& run_id() const { return run_id_; }
    bool is_open() const { return out_.is_open(); }

private:
    std::string run_id_;
    std::string path_;
    std::ofstream out_;
    std::mutex mu_;
};

// Recursive serialization with sorted object keys.
std::string canonical_json(json_object* obj);

std::string iso_now();

} // namespace labwright
