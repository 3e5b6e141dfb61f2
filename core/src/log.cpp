#include "labwright/log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <utility>

namespace labwright {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Objects are written with their keys in byte order; scalars use json-c's
// plain form.
static void write_canonical(json_object* v, std::string& out) {
    if (!v) {
        out += "null";
        return;
    }
    if (json_object_is_type(v, json_type_array)) {
        out += '[';
        for (size_t i = 0, n = json_object_array_length(v); i < n; i++) {
            if (i) out += ',';
            write_canonical(json_object_array_get_idx(v, i), out);
        }
        out += ']';
        return;
    }
    if (!json_object_is_type(v, json_type_object)) {
        out += json_object_to_json_string_ext(v, JSON_C_TO_STRING_PLAIN);
        return;
    }
    std::map<std::string, json_object*> sorted;
    json_object_object_foreach(v, key, val) sorted[key] = val;
    out += '{';
    bool first = true;
    for (const auto& kv : sorted) {
        if (!first) out += ',';
        first = false;
        json_object* k = json_object_new_string_len(kv.first.c_str(), (int)kv.first.size());
        out += json_object_to_json_string_ext(k, JSON_C_TO_STRING_PLAIN);
        json_object_put(k);
        out += ':';
        write_canonical(kv.second, out);
    }
    out += '}';
}

std::string canonical_json(json_object* obj) {
    std::string out;
    write_canonical(obj, out);
    return out;
}

JsonlLogger::JsonlLogger(std::string run_id, const std::string& path)
    : run_id_(std::move(run_id)), path_(path), out_(path, std::ios::out | std::ios::app) {}

void JsonlLogger::event(int attempt, const std::string& name, json_object* payload) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "attempt", json_object_new_int(attempt));
    json_object_object_add(rec, "event", json_object_new_string_len(name.c_str(), (int)name.size()));
    json_object_object_add(rec, "payload", payload);
    json_object_object_add(rec, "run_id", json_object_new_string(run_id_.c_str()));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));
    std::string line = canonical_json(rec);
    json_object_put(rec);

    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.is_open()) return;
    out_ << line << "\n";
    out_.flush();
}

} // namespace labwright
