#include <cassert>
#include <iostream>
#include <string>
#include "glot/config.hpp"
#include "test_env.hpp"

using namespace glot;

static void test_defaults(){
    Config cfg;
    assert(cfg.primary_locale == "en");
    assert(cfg.replica_locales.empty() && cfg.includes.empty());
    assert(cfg.jobs == 0);
    assert(cfg.translation_hooks.size() == 2);
}

static void test_env_overrides(){
    scoped_env jobs("GLOT_JOBS", "3");
    scoped_env primary("GLOT_PRIMARY_LOCALE", "de");
    scoped_env debug("GLOT_DEBUG", "");
    scoped_env json("GLOT_DIAG_JSON", "true");
    auto env = detect_env();
    assert(env.jobs == 3 && env.primary_locale == "de");
    assert(!env.debug && env.diag_json);

    Config cfg;
    apply_env(cfg, env);
    assert(cfg.jobs == 3 && cfg.primary_locale == "de");
}

static void test_bad_values_are_ignored(){
    scoped_env jobs("GLOT_JOBS", "4x");
    scoped_env primary("GLOT_PRIMARY_LOCALE", "");
    scoped_env debug("GLOT_DEBUG", "0");
    auto env = detect_env();
    assert(env.jobs == 0 && env.primary_locale.empty() && !env.debug);

    Config cfg;
    cfg.jobs = 2;
    apply_env(cfg, env);
    assert(cfg.jobs == 2 && cfg.primary_locale == "en");
    assert(!debug_enabled());
}

void run_config_env_tests(){
    std::cout << "[glot] config env tests...\n";
    test_defaults();
    test_env_overrides();
    test_bad_values_are_ignored();
    std::cout << "[glot] config env tests passed\n";
}
