#include <gtest/gtest.h>
#include <iostream>

void run_text_tests();
void run_source_parser_tests();
void run_json_doc_tests();
void run_locale_tests();
void run_directives_tests();
void run_key_resolver_tests();
void run_checker_tests();
void run_editor_tests();
void run_diagnostics_json_tests();
void run_config_env_tests();

int main(int argc, char** argv){
    run_text_tests();
    run_source_parser_tests();
    run_json_doc_tests();
    run_locale_tests();
    run_directives_tests();
    run_key_resolver_tests();
    run_checker_tests();
    run_editor_tests();
    run_diagnostics_json_tests();
    run_config_env_tests();
    std::cout << "[glot] assert suites passed\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
