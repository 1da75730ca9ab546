#include "glot/config.hpp"
#include <cstdlib>
#include <string>

namespace glot {

Env detect_env(){
    Env e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    e.debug = env_flag_enabled("GLOT_DEBUG");
    e.diag_json = env_flag_enabled("GLOT_DIAG_JSON");

    if (const char* v = get("GLOT_JOBS")) {
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if (end && *end == '\0') e.jobs = static_cast<unsigned>(n);
    }

    if (const char* v = get("GLOT_PRIMARY_LOCALE")) e.primary_locale = v;

    return e;
}

void apply_env(Config& cfg, const Env& env){
    if (env.jobs) cfg.jobs = env.jobs;
    if (!env.primary_locale.empty()) cfg.primary_locale = env.primary_locale;
}

} // namespace glot
