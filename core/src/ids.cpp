#include "labwright/ids.h"

#include <cstdio>
#include <ctime>
#include <random>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace labwright {

uint32_t secure_rand32() {
    uint32_t v = 0;
#if defined(__linux__)
    if (::getrandom(&v, sizeof(v), 0) == (ssize_t)sizeof(v)) return v;
#endif
    if (FILE* f = std::fopen("/dev/urandom", "rb")) {
        bool got = std::fread(&v, sizeof(v), 1, f) == 1;
        std::fclose(f);
        if (got) return v;
    }
    std::random_device rd;
    return (uint32_t)rd();
}

std::string gen_lab_id() {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", (unsigned)secure_rand32());
    return buf;
}

std::string gen_run_id() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char stamp[20];
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &tm);
    return std::string(stamp) + "-" + gen_lab_id();
}

} // namespace labwright
