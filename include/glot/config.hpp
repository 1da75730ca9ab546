// Resolved checker configuration and environment overrides
#pragma once
#include <cstdlib>
#include <string>
#include <vector>

namespace glot {

// Fed by the configuration loader. Defaults match a fresh project.
struct Config {
    std::string primary_locale{"en"};
    std::vector<std::string> replica_locales;   // empty: every supplied non-primary table
    std::vector<std::string> includes;          // empty: every source file
    std::vector<std::string> ignores{"**/*.test.tsx", "**/*.test.ts", "**/*.spec.tsx", "**/*.spec.ts", "**/__tests__/**"};
    std::vector<std::string> checked_attributes{"placeholder", "title", "alt", "aria-label", "aria-description",
                                                "aria-placeholder", "aria-roledescription", "aria-valuetext"};
    std::vector<std::string> ignore_texts;
    std::vector<std::string> translation_hooks{"useTranslations", "getTranslations"};
    unsigned jobs = 0;                          // 0: hardware concurrency
};

struct Env {
    bool debug = false;
    bool diag_json = false;
    unsigned jobs = 0;
    std::string primary_locale;
};

inline bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

inline bool debug_enabled(){ return env_flag_enabled("GLOT_DEBUG"); }

// Reads GLOT_DEBUG, GLOT_DIAG_JSON, GLOT_JOBS and GLOT_PRIMARY_LOCALE.
Env detect_env();

// Overlays non-empty environment settings onto cfg.
void apply_env(Config& cfg, const Env& env);

} // namespace glot
