#pragma once

#include <string>
#include <vector>

namespace labwright {

// Limits applied to a child process. A zero rlimit leaves the host default;
// the docker CLI needs those.
struct ProcLimits {
    int timeout_ms{120000};
    size_t stdout_max_bytes{1024 * 1024};

    size_t rlimit_fsize_mb{0};
    int rlimit_nofile{0};

    bool no_new_privs{true};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr

    bool ok() const { return error.empty() && !timed_out && exit_code == 0; }
};

// Run a process (argv[0] is resolved through PATH), capture stdout+stderr
// merged, kill the whole process group on timeout. Returns true if the
// process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// Same, feeding stdin_data to the child. Stdin writes and output reads are
// interleaved so large payloads cannot deadlock. The caller must ignore
// SIGPIPE; a child may exit before consuming all of its input.
bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res);

// Tokenize a configured command line without a shell. Single quotes are
// literal, double quotes honour backslash escapes. Empty on an unterminated
// quote.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace labwright
