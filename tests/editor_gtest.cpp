#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "glot/editor.hpp"
#include "glot/locale.hpp"

using namespace glot;

TEST(EditSession, KeepsCarriageReturnLineEndings){
    SourceFile src{"src/a.tsx", "export const A = () => (\r\n  <p>Hello</p>\r\n);\r\n"};
    auto report = Checker(Config{}).run({src}, {{"messages/en.json", "{}"}});
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_FALSE(report.findings[0].jsx_comment);

    EditSession session;
    auto out = session.apply_suppressions(report.findings, {src});
    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].error.empty()) << out[0].error;
    EXPECT_EQ(out[0].text, "export const A = () => (\r\n  // glot-disable-next-line hardcoded\r\n  <p>Hello</p>\r\n);\r\n");
}

TEST(EditSession, RefusesSourcesThatNoLongerParse){
    SourceFile src{"src/b.tsx", "export const B = () => <p>Hello</p>;\n"};
    auto report = Checker(Config{}).run({src}, {{"messages/en.json", "{}"}});
    ASSERT_EQ(report.findings.size(), 1u);

    EditSession session;
    SourceFile broken{src.path, "export const B = () => <p>Hello</div>;\n"};
    auto out = session.apply_suppressions(report.findings, {broken});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].changed);
    EXPECT_NE(out[0].error.find("no longer parses"), std::string::npos) << out[0].error;
    EXPECT_EQ(out[0].text, broken.text);
}

TEST(EditSession, FilesWithoutTargetsPassThrough){
    SourceFile a{"src/a.tsx", "export const A = () => <p>Hello</p>;\n"};
    SourceFile b{"src/b.ts", "export const b = 1;\n"};
    auto report = Checker(Config{}).run({a, b}, {{"messages/en.json", "{}"}});
    EditSession session;
    auto out = session.apply_suppressions(report.findings, {a, b});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(out[0].changed);
    EXPECT_FALSE(out[1].changed);
    EXPECT_EQ(out[1].text, b.text);
}

TEST(EditSession, ParallelInsertsIntoSeparateTables){
    EditSession session;
    const int tables = 8;
    std::vector<InsertOutcome> results(tables);
    std::vector<std::thread> pool;
    for(int i = 0; i < tables; ++i){
        pool.emplace_back([&, i]{
            LocaleFile table{"messages/l" + std::to_string(i) + ".json", "{\n  \"base\": \"B\"\n}\n"};
            std::vector<KeyValue> values;
            for(int k = 0; k < 20; ++k)
                values.push_back(KeyValue{"group" + std::to_string(k % 4) + ".key" + std::to_string(k), "v" + std::to_string(i)});
            results[static_cast<std::size_t>(i)] = session.insert_keys(table, values);
        });
    }
    for(auto &t : pool) t.join();

    for(int i = 0; i < tables; ++i){
        const auto &r = results[static_cast<std::size_t>(i)];
        ASSERT_TRUE(r.outcome.error.empty()) << r.outcome.error;
        EXPECT_EQ(r.keys.size(), 20u);
        auto load = load_locale(r.outcome.path, r.outcome.text);
        ASSERT_TRUE(load.table.has_value());
        EXPECT_EQ(load.table->entries.size(), 21u);
        EXPECT_EQ(load.table->find("group1.key5")->value, "v" + std::to_string(i));
    }
}
