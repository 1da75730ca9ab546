#include <cassert>
#include <iostream>
#include <string>
#include "glot/locale.hpp"

using namespace glot;

static void test_locale_ids(){
    assert(locale_from_path("messages/de.json") == "de");
    assert(locale_from_path("de-AT.json") == "de-AT");
    assert(locale_from_path("C:\\app\\messages\\fr.json") == "fr");
}

static void test_flatten_shapes(){
    auto r = load_locale("messages/en.json",
        "{\n"
        "  \"a\": { \"b\": \"x\" },\n"
        "  \"list\": [\"one\", \"two\"],\n"
        "  \"mixed\": [{ \"q\": \"Q\" }, 3],\n"
        "  \"empty\": [],\n"
        "  \"n\": 5,\n"
        "  \"t\": true,\n"
        "  \"z\": null\n"
        "}\n");
    assert(r.table && !r.failure);
    const auto &t = *r.table;
    assert(t.locale == "en");
    assert(t.entries.size() == 7);
    assert(t.find("a.b")->type == value_type::string);
    assert(t.find("list")->type == value_type::string_array && t.find("list")->value == "one, two");
    assert(t.find("mixed.0.q")->value == "Q");
    assert(t.find("mixed.1")->type == value_type::number);
    assert(!t.contains("empty"));
    assert(t.find("n")->type == value_type::number && t.find("n")->value == "5");
    assert(t.find("t")->type == value_type::boolean);
    assert(t.find("z")->type == value_type::null);
    // Entries point at their key.
    assert(t.find("a.b")->where.line == 2 && t.find("a.b")->where.col == 10);
    assert(t.find("n")->where.line == 6 && t.find("n")->where.col == 3);
    assert(std::string(value_type_name(value_type::string_array)) == "array");
}

static void test_load_failures(){
    auto arr = load_locale("messages/en.json", "[\"x\"]");
    assert(!arr.table && arr.failure);
    assert(arr.failure->message == "message table root must be an object");

    auto bad = load_locale("messages/de.json", "{\n  \"a\": \"x\"\n  \"b\": 1\n}");
    assert(!bad.table && bad.failure);
    assert(bad.failure->where.begin.line == 3);
}

void run_locale_tests(){
    std::cout << "[glot] locale tests...\n";
    test_locale_ids();
    test_flatten_shapes();
    test_load_failures();
    std::cout << "[glot] locale tests passed\n";
}
