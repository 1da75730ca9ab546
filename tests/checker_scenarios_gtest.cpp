#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "glot/checker.hpp"

using namespace glot;

static std::vector<const Finding*> findings_of(const CheckReport& r, FindingKind k){
    std::vector<const Finding*> out;
    for(const auto &f : r.findings) if(f.kind == k) out.push_back(&f);
    return out;
}

static CheckReport check(std::vector<SourceFile> sources, std::vector<LocaleFile> locales, Config cfg = Config{}){
    return Checker(std::move(cfg)).run(sources, locales);
}

TEST(CheckerScenarios, HardcodedButtonText){
    auto r = check({{"src/app/page.tsx",
                     "export default function Page(){\n"
                     "  return <button>Submit</button>;\n"
                     "}\n"}},
                   {{"messages/en.json", "{}"}});
    ASSERT_EQ(r.findings.size(), 1u);
    const auto &f = r.findings[0];
    EXPECT_EQ(f.kind, FindingKind::hardcoded);
    EXPECT_EQ(f.path, "src/app/page.tsx");
    EXPECT_EQ(f.where.begin.line, 2);
    EXPECT_EQ(f.where.begin.col, 18);
    EXPECT_EQ(f.text, "Submit");
    EXPECT_FALSE(f.suppressed);
    EXPECT_TRUE(r.has_errors());
    EXPECT_EQ(r.source_files, 1u);
    EXPECT_EQ(r.locale_files, 1u);
}

TEST(CheckerScenarios, SuppressedHardcodedTextStaysInTheReport){
    auto r = check({{"src/app/page.tsx",
                     "export default function Page(){\n"
                     "  // glot-disable-next-line hardcoded\n"
                     "  return <button>Submit</button>;\n"
                     "}\n"}},
                   {{"messages/en.json", "{}"}});
    ASSERT_EQ(r.findings.size(), 1u);
    EXPECT_TRUE(r.findings[0].suppressed);
    EXPECT_FALSE(r.has_errors());
    EXPECT_EQ(count_by_kind(r.findings)[FindingKind::hardcoded], 0u);
    EXPECT_EQ(count_by_kind(r.findings, true)[FindingKind::hardcoded], 1u);
}

TEST(CheckerScenarios, UnusedPrimaryKey){
    auto r = check({{"src/home.tsx",
                     "export function Home(){\n"
                     "  const t = useTranslations(\"home\");\n"
                     "  return <h1>{t(\"title\")}</h1>;\n"
                     "}\n"}},
                   {{"messages/en.json",
                     "{\n"
                     "  \"home\": { \"title\": \"Home\" },\n"
                     "  \"legacy\": {\n"
                     "    \"unused_old_key\": \"Old\"\n"
                     "  }\n"
                     "}\n"}});
    ASSERT_EQ(r.findings.size(), 1u);
    const auto &f = r.findings[0];
    EXPECT_EQ(f.kind, FindingKind::unused_key);
    EXPECT_EQ(f.key, "legacy.unused_old_key");
    EXPECT_EQ(f.path, "messages/en.json");
    EXPECT_EQ(f.where.begin.line, 4);
    EXPECT_EQ(f.where.begin.col, 5);
    EXPECT_EQ(f.severity, Severity::warning);
    EXPECT_FALSE(r.has_errors());
}

static const char* kButtonTable =
    "{\n"
    "  \"common\": {\n"
    "    \"button\": \"Submit\"\n"
    "  }\n"
    "}\n";

TEST(CheckerScenarios, UntranslatedReplicaValue){
    auto r = check({{"src/save.tsx",
                     "export function Save(){\n"
                     "  const t = useTranslations();\n"
                     "  return <button>{t(\"common.button\")}</button>;\n"
                     "}\n"}},
                   {{"messages/en.json", kButtonTable}, {"messages/de.json", kButtonTable}});
    auto un = findings_of(r, FindingKind::untranslated);
    ASSERT_EQ(un.size(), 1u);
    EXPECT_EQ(un[0]->path, "messages/de.json");
    EXPECT_EQ(un[0]->locale, "de");
    EXPECT_EQ(un[0]->key, "common.button");
    EXPECT_EQ(un[0]->where.begin.line, 3);
    EXPECT_EQ(un[0]->where.begin.col, 5);
    EXPECT_EQ(un[0]->text, "Submit");
    ASSERT_EQ(un[0]->usages.size(), 1u);
    EXPECT_EQ(un[0]->usages[0].path, "src/save.tsx");
    EXPECT_EQ(un[0]->usages[0].where.begin.line, 3);
    EXPECT_FALSE(un[0]->usages[0].jsx_comment);   // the line starts with `return`
    EXPECT_FALSE(un[0]->suppressed);
    EXPECT_EQ(r.findings.size(), 1u);
}

TEST(CheckerScenarios, UntranslatedSuppressedAtEveryUsage){
    auto r = check({{"src/save.tsx",
                     "export function Save(){\n"
                     "  const t = useTranslations();\n"
                     "  // glot-disable-next-line untranslated\n"
                     "  const label = t(\"common.button\");\n"
                     "  return <button>{label}</button>;\n"
                     "}\n"}},
                   {{"messages/en.json", kButtonTable}, {"messages/de.json", kButtonTable}});
    auto un = findings_of(r, FindingKind::untranslated);
    ASSERT_EQ(un.size(), 1u);
    EXPECT_TRUE(un[0]->suppressed);
    EXPECT_FALSE(r.has_errors());

    // One usage left unsuppressed keeps the finding live.
    auto mixed = check({{"src/save.tsx",
                         "export function Save(){\n"
                         "  const t = useTranslations();\n"
                         "  // glot-disable-next-line untranslated\n"
                         "  const label = t(\"common.button\");\n"
                         "  const again = t(\"common.button\");\n"
                         "  return <button>{label}{again}</button>;\n"
                         "}\n"}},
                       {{"messages/en.json", kButtonTable}, {"messages/de.json", kButtonTable}});
    auto live = findings_of(mixed, FindingKind::untranslated);
    ASSERT_EQ(live.size(), 1u);
    EXPECT_FALSE(live[0]->suppressed);
    EXPECT_EQ(live[0]->usages.size(), 2u);
}

TEST(CheckerScenarios, ReplicaLagAndOrphans){
    auto r = check({{"src/use.ts", "const t = useTranslations();\nt(\"a\"); t(\"b\");\n"}},
                   {{"messages/en.json", "{\"a\": \"A\", \"b\": \"B\"}"},
                    {"messages/de.json", "{\"a\": \"A de\", \"c\": \"C\"}"},
                    {"messages/fr.json", "{\"a\": \"A fr\"}"}});
    ASSERT_EQ(r.findings.size(), 3u);
    EXPECT_EQ(r.findings[0].kind, FindingKind::orphan_key);
    EXPECT_EQ(r.findings[0].key, "c");
    EXPECT_EQ(r.findings[0].path, "messages/de.json");
    EXPECT_EQ(r.findings[0].severity, Severity::warning);
    for(int i : {1, 2}){
        EXPECT_EQ(r.findings[i].kind, FindingKind::replica_lag);
        EXPECT_EQ(r.findings[i].key, "b");
        EXPECT_EQ(r.findings[i].path, "messages/en.json");
    }
    EXPECT_EQ(r.findings[1].locale, "de");
    EXPECT_EQ(r.findings[2].locale, "fr");
    EXPECT_EQ(r.findings[2].message, "key 'b' is missing from locale 'fr'");
    EXPECT_TRUE(r.has_errors());
}

TEST(CheckerScenarios, TypeMismatchWinsOverUntranslated){
    auto r = check({{"src/use.ts", "const t = useTranslations();\nt(\"count\"); t.raw(\"items\");\n"}},
                   {{"messages/en.json", "{\"count\": \"Count\", \"items\": [\"One\", \"Two\"]}"},
                    {"messages/de.json", "{\"count\": 3, \"items\": [\"One\", \"Two\"]}"}});
    auto tm = findings_of(r, FindingKind::type_mismatch);
    ASSERT_EQ(tm.size(), 1u);
    EXPECT_EQ(tm[0]->key, "count");
    EXPECT_EQ(tm[0]->message, "key 'count' is string in 'en' but number in 'de'");
    auto un = findings_of(r, FindingKind::untranslated);
    ASSERT_EQ(un.size(), 1u);
    EXPECT_EQ(un[0]->key, "items");
    EXPECT_EQ(un[0]->text, "One, Two");
    EXPECT_EQ(r.findings.size(), 2u);
}

TEST(CheckerScenarios, MissingKeyListsEveryUsage){
    auto r = check({{"src/a.tsx", "const t = useTranslations();\nexport const A = () => <p>{t(\"nav.missing\")}</p>;\n"},
                    {"src/b.tsx", "const t = useTranslations(\"nav\");\n\nexport const B = () => <p>{t(\"missing\")}</p>;\n"}},
                   {{"messages/en.json", "{}"}});
    auto miss = findings_of(r, FindingKind::missing_key);
    ASSERT_EQ(miss.size(), 1u);
    EXPECT_EQ(miss[0]->key, "nav.missing");
    EXPECT_EQ(miss[0]->path, "src/a.tsx");
    EXPECT_EQ(miss[0]->where.begin.line, 2);
    EXPECT_EQ(miss[0]->message, "key 'nav.missing' is not defined in primary locale 'en'");
    ASSERT_EQ(miss[0]->notes.size(), 1u);
    EXPECT_EQ(miss[0]->notes[0].message, "also used here");
    EXPECT_EQ(miss[0]->notes[0].path, "src/b.tsx");
    EXPECT_EQ(miss[0]->notes[0].line, 3);
    EXPECT_EQ(miss[0]->usages.size(), 2u);
    EXPECT_TRUE(r.has_errors());
}

TEST(CheckerScenarios, OtherScriptDigitsAndPunctuationAreNotText){
    auto r = check({{"src/d.tsx",
                     "export const D = () => (\n"
                     "  <p>\n"
                     "    <span>০১২</span>\n"
                     "    <span>٣٤٥</span>\n"
                     "    <b>،</b>\n"
                     "    <i>Ναι</i>\n"
                     "  </p>\n"
                     ");\n"}},
                   {{"messages/en.json", "{}"}});
    ASSERT_EQ(r.findings.size(), 1u);
    EXPECT_EQ(r.findings[0].kind, FindingKind::hardcoded);
    EXPECT_EQ(r.findings[0].text, "Ναι");
    EXPECT_EQ(r.findings[0].where.begin.line, 6);
}

TEST(CheckerScenarios, ConstantKeysResolveAgainstTheTable){
    auto r = check({{"src/status.tsx",
                     "const LABELS = { open: \"status.open\", closed: \"status.closed\" } as const;\n"
                     "export function Status({ state }){\n"
                     "  const t = useTranslations();\n"
                     "  return <p>{t(LABELS[state])}</p>;\n"
                     "}\n"}},
                   {{"messages/en.json", "{\"status\": {\"open\": \"Open\"}}"}});
    auto miss = findings_of(r, FindingKind::missing_key);
    ASSERT_EQ(miss.size(), 1u);
    EXPECT_EQ(miss[0]->key, "status.closed");
    EXPECT_EQ(miss[0]->where.begin.line, 4);
    EXPECT_TRUE(findings_of(r, FindingKind::unresolved_key).empty());
    EXPECT_TRUE(findings_of(r, FindingKind::unused_key).empty());
}

TEST(CheckerScenarios, AnnotationGlobsExpandOverPrimaryKeys){
    auto r = check({{"src/roles.ts",
                     "const t = useTranslations();\n"
                     "// glot-message-keys \"roles.*.name\"\n"
                     "t(k);\n"
                     "// glot-message-keys \"menu.*.label\"\n"
                     "t(m);\n"}},
                   {{"messages/en.json",
                     "{\"roles\": {\"admin\": {\"name\": \"Admin\"}, \"user\": {\"name\": \"User\"}}}"}});
    ASSERT_EQ(r.findings.size(), 1u);
    EXPECT_EQ(r.findings[0].kind, FindingKind::missing_key);
    EXPECT_EQ(r.findings[0].key, "menu.*.label");
    EXPECT_EQ(r.findings[0].where.begin.line, 5);
}

TEST(CheckerScenarios, RawReadsWholeSubtree){
    auto r = check({{"src/faq.ts", "const t = useTranslations(\"faq\");\nconst all = t.raw(\"entries\");\n"}},
                   {{"messages/en.json",
                     "{\"faq\": {\"entries\": {\"q1\": \"Why?\", \"q2\": \"How?\"}, \"intro\": \"Hi\"}}"}});
    ASSERT_EQ(r.findings.size(), 1u);
    EXPECT_EQ(r.findings[0].kind, FindingKind::unused_key);
    EXPECT_EQ(r.findings[0].key, "faq.intro");
}

TEST(CheckerScenarios, UnknownNamespaceIsReportedOnce){
    auto r = check({{"src/n.tsx",
                     "export function N({ ns }){\n"
                     "  const t = useTranslations(ns);\n"
                     "  return <p>{t(\"x\")}</p>;\n"
                     "}\n"}},
                   {{"messages/en.json", "{}"}});
    ASSERT_EQ(r.findings.size(), 1u);
    EXPECT_EQ(r.findings[0].kind, FindingKind::unresolved_key);
    EXPECT_EQ(r.findings[0].severity, Severity::warning);
    EXPECT_NE(r.findings[0].message.find("unknown namespace"), std::string::npos);
    EXPECT_FALSE(r.has_errors());
}
