#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include "glot/key_resolver.hpp"

using namespace glot;

static FileKeys resolve(const std::string& path, const std::string& src, const Config& cfg = Config{}){
    auto unit = parse_source(path, src);
    assert(unit.ok());
    DirectiveState ds(unit);
    KeyResolver kr(cfg, unit, ds);
    return kr.run();
}

static std::vector<std::string> keys_of(const FileKeys& fk){
    std::vector<std::string> out;
    for(const auto &u : fk.used) out.push_back(u.key);
    std::sort(out.begin(), out.end());
    return out;
}

static std::vector<const Finding*> of_kind(const FileKeys& fk, FindingKind k){
    std::vector<const Finding*> out;
    for(const auto &f : fk.findings) if(f.kind == k) out.push_back(&f);
    return out;
}

static void test_hardcoded_candidates(){
    auto fk = resolve("src/Form.tsx",
        "export function Form({ ok, label, name }){\n"        // 1
        "  return (\n"                                          // 2
        "    <form>\n"                                          // 3
        "      <button>Submit</button>\n"                       // 4
        "      <input placeholder=\"Search...\" type=\"text\" />\n"  // 5
        "      <span>{\"Quoted\"}</span>\n"                     // 6
        "      <p>{ok ? \"Yes\" : label}</p>\n"                 // 7
        "      <p>{name || `Anonymous`}</p>\n"                  // 8
        "      <b>123</b>\n"                                    // 9
        "      <i>   </i>\n"                                    // 10
        "    </form>\n"                                         // 11
        "  );\n"                                                // 12
        "}\n");                                                 // 13
    auto hc = of_kind(fk, FindingKind::hardcoded);
    assert(hc.size() == 5);
    assert(hc[0]->text == "Submit" && hc[0]->where.begin.line == 4 && hc[0]->where.begin.col == 15);
    assert(hc[0]->severity == Severity::error);
    assert(hc[0]->jsx_comment);
    assert(hc[1]->text == "Search..." && hc[1]->where.begin.line == 5);
    assert(hc[2]->text == "Quoted" && hc[2]->where.begin.line == 6);
    assert(hc[3]->text == "Yes");
    assert(hc[4]->text == "Anonymous" && hc[4]->where.begin.line == 8);
    assert(fk.used.empty() && fk.calls.empty());
}

static void test_multiline_text_position(){
    auto fk = resolve("src/P.tsx",
        "const P = () => <p>\n"
        "  Welcome back,\n"
        "  friend\n"
        "</p>;\n");
    auto hc = of_kind(fk, FindingKind::hardcoded);
    assert(hc.size() == 1);
    assert(hc[0]->where.begin.line == 2 && hc[0]->where.begin.col == 3);
    assert(hc[0]->text == "Welcome back,\n  friend");
    assert(hc[0]->jsx_comment);
}

static void test_skipped_text(){
    Config cfg;
    cfg.ignore_texts = {"OK"};
    auto fk = resolve("src/S.tsx",
        "const S = () => <div>\n"
        "  <script>Some inline script</script>\n"
        "  <b>OK</b>\n"
        "  <i>{\"...\"} -- 42</i>\n"
        "  <img alt=\"\" title={`${n} / ${m}`} data-x=\"Not checked\" />\n"
        "  <em>Read more</em>\n"
        "</div>;\n", cfg);
    auto hc = of_kind(fk, FindingKind::hardcoded);
    assert(hc.size() == 1 && hc[0]->text == "Read more" && hc[0]->where.begin.line == 6);
}

static void test_translation_calls(){
    auto fk = resolve("src/Page.tsx",
        "import { useTranslations } from \"next-intl\";\n"                 // 1
        "export function Page({ role, flag }){\n"                         // 2
        "  const t = useTranslations(\"home\");\n"                        // 3
        "  const g = useTranslations();\n"                                // 4
        "  return <div title={t(\"title\")}>\n"                           // 5
        "    {g(\"common.save\")}\n"                                      // 6
        "    {t(role)}\n"                                                 // 7
        "    {t(`roles.${role}.name`)}\n"                                 // 8
        "    {t(flag ? \"on\" : \"off\")}\n"                              // 9
        "    {t.rich(\"intro\", { b: (c) => <b>{c}</b> })}\n"             // 10
        "    {t.raw(\"items\")}\n"                                        // 11
        "    {other.t(\"not.a.call\")}\n"                                 // 12
        "  </div>;\n"                                                     // 13
        "}\n");
    auto keys = keys_of(fk);
    std::vector<std::string> want = {"common.save", "home.intro", "home.items", "home.off", "home.on", "home.title"};
    assert(keys == want);
    for(const auto &u : fk.used) assert(u.raw == (u.key == "home.items"));

    auto un = of_kind(fk, FindingKind::unresolved_key);
    assert(un.size() == 2);
    assert(un[0]->where.begin.line == 7 && un[0]->message.find("variable key") != std::string::npos);
    assert(un[0]->text == "t" && un[0]->jsx_comment && un[0]->severity == Severity::warning);
    assert(un[0]->pattern.empty());
    assert(un[1]->where.begin.line == 8 && un[1]->message.find("template with expression") != std::string::npos);
    assert(un[1]->pattern == "home.roles.*.name");
    assert(un[1]->hint.find("{/* glot-message-keys \"home.roles.*.name\" */}") != std::string::npos);
    assert(un[1]->hint.find("// glot-message-keys \"home.roles.*.name\"") != std::string::npos);
    assert(of_kind(fk, FindingKind::hardcoded).empty());
    assert(fk.calls.size() == 7);
}

static void test_namespaces_and_shadowing(){
    auto fk = resolve("src/Scopes.tsx",
        "function A({ ns }){\n"                              // 1
        "  const t = useTranslations(ns);\n"                 // 2
        "  return <p>{t(\"x\")}</p>;\n"                      // 3
        "}\n"                                                // 4
        "function B(){\n"                                    // 5
        "  const t = useTranslations(\"b\");\n"              // 6
        "  {\n"                                              // 7
        "    const t = makeOther();\n"                       // 8
        "    t(\"ignored\");\n"                              // 9
        "  }\n"                                              // 10
        "  items.forEach((t) => { t(\"param\"); });\n"       // 11
        "  return t(\"kept\");\n"                            // 12
        "}\n"                                                // 13
        "async function C(){\n"                              // 14
        "  const t = await getTranslations({ locale, namespace: \"c\" });\n"  // 15
        "  return t(\"server\");\n"                          // 16
        "}\n");
    auto keys = keys_of(fk);
    std::vector<std::string> want = {"b.kept", "c.server"};
    assert(keys == want);
    auto un = of_kind(fk, FindingKind::unresolved_key);
    assert(un.size() == 1);
    assert(un[0]->where.begin.line == 3 && un[0]->message.find("unknown namespace") != std::string::npos);
}

static void test_annotations(){
    auto fk = resolve("src/R.tsx",
        "export function R({ role, k }){\n"                           // 1
        "  const t = useTranslations(\"roles\");\n"                   // 2
        "  return <ul>\n"                                             // 3
        "    {/* glot-message-keys \".list.*.name\" */}\n"            // 4
        "    <li>{t(`list.${role}.name`)}</li>\n"                          // 5
        "    {/* glot-message-keys \"admin.title\" */}\n"             // 6
        "    <li>{t(k)}</li>\n"                                       // 7
        "    <li>{t(\"static\")}</li>\n"                              // 8
        "  </ul>;\n"                                                  // 9
        "}\n");
    assert(fk.findings.empty());
    auto keys = keys_of(fk);
    std::vector<std::string> want = {"admin.title", "roles.list.*.name", "roles.static"};
    assert(keys == want);
    for(const auto &u : fk.used) assert(u.glob == (u.key == "roles.list.*.name"));
    assert(fk.calls[0].annotated && fk.calls[0].annotated->front() == ".list.*.name");

    // Static calls never take the annotation meant for the dynamic one after them.
    auto same_line = resolve("src/k.ts",
        "const t = useTranslations();\n"
        "// glot-message-keys \"x.a\" \"x.b\"\n"
        "t(\"s\"); t(k);\n");
    assert(same_line.findings.empty());
    std::vector<std::string> want2 = {"s", "x.a", "x.b"};
    assert(keys_of(same_line) == want2);

    // An annotation without keys still leaves the call unresolved.
    auto empty = resolve("src/e.ts",
        "const t = useTranslations();\n"
        "// glot-message-keys\n"
        "t(k);\n");
    assert(empty.findings.size() == 1 && empty.findings[0].kind == FindingKind::unresolved_key);
    assert(empty.findings[0].jsx_comment == false);
}

static void test_pattern_inference(){
    NamespaceRef none;
    NamespaceRef home{ NamespaceRef::state::known, "home" };
    NamespaceRef unknown{ NamespaceRef::state::unknown, "" };
    assert(infer_key_pattern(template_key{{"roles.", ".name"}}, none) == "roles.*.name");
    assert(infer_key_pattern(template_key{{"roles.", ".name"}}, home) == "home.roles.*.name");
    assert(infer_key_pattern(template_key{{"", ".name"}}, none).empty());
    assert(infer_key_pattern(template_key{{"a.", ".", ""}}, none) == "a.*.*");
    assert(infer_key_pattern(template_key{{"a.", ".", ".", ""}}, none).empty());
    assert(infer_key_pattern(template_key{{"btn_", ""}}, none) == "btn_*");
    assert(infer_key_pattern(template_key{{"a.", ".", ""}}, unknown).empty());
    assert(infer_key_pattern(template_key{{"a..", ""}}, none).empty());
    assert(qualify_key(home, "x") == "home.x" && qualify_key(none, "x") == "x");
}

static void test_logical_chains(){
    auto fk = resolve("src/L.tsx",
        "export const L = ({ a, b, c }) => <p>\n"   // 1
        "  {a || \"First\" || b}\n"                 // 2
        "  {\"Lead\" ?? c}\n"                       // 3
        "  {a && b || \"Last\"}\n"                  // 4
        "  {a && \"Shown\"}\n"                      // 5
        "</p>;\n");
    auto hc = of_kind(fk, FindingKind::hardcoded);
    assert(hc.size() == 4);
    assert(hc[0]->text == "First" && hc[0]->where.begin.line == 2);
    assert(hc[1]->text == "Lead" && hc[1]->where.begin.line == 3);
    assert(hc[2]->text == "Last" && hc[2]->where.begin.line == 4);
    assert(hc[3]->text == "Shown" && hc[3]->where.begin.line == 5);
}

static void test_constant_keys(){
    auto fk = resolve("src/Status.tsx",
        "const KEYS = [\"alpha\", \"beta\"] as const;\n"                           // 1
        "const LABELS = { open: \"status.open\", closed: \"status.closed\" };\n"  // 2
        "const ITEMS = [\n"                                                        // 3
        "  { titleKey: \"faq.one\", icon: One },\n"                               // 4
        "  { titleKey: \"faq.two\", icon: Two },\n"                               // 5
        "];\n"                                                                     // 6
        "export function Status({ state, flag }){\n"                               // 7
        "  const t = useTranslations(\"app\");\n"                                  // 8
        "  const k = \"single\";\n"                                                // 9
        "  const mode = flag ? \"on\" : \"off\";\n"                               // 10
        "  return <div>\n"                                                         // 11
        "    {t(k)}\n"                                                             // 12
        "    {t(`mode.${mode}`)}\n"                                                // 13
        "    {t(LABELS[state])}\n"                                                 // 14
        "    {t(LABELS.open)}\n"                                                   // 15
        "    {KEYS.map((key) => <b key={key}>{t(key)}</b>)}\n"                     // 16
        "    {ITEMS.map((item) => <i>{t(item.titleKey)}</i>)}\n"                   // 17
        "    {ITEMS.map(({ titleKey, icon }) => <u>{t(titleKey)}{t(icon)}</u>)}\n" // 18
        "    {t(state)}\n"                                                         // 19
        "  </div>;\n"                                                              // 20
        "}\n");
    std::vector<std::string> want = {"app.alpha", "app.beta", "app.faq.one", "app.faq.one", "app.faq.two", "app.faq.two",
                                     "app.mode.off", "app.mode.on", "app.single",
                                     "app.status.closed", "app.status.open", "app.status.open"};
    assert(keys_of(fk) == want);
    auto un = of_kind(fk, FindingKind::unresolved_key);
    assert(un.size() == 2);
    assert(un[0]->where.begin.line == 18 && un[0]->message.find("variable key") != std::string::npos);
    assert(un[1]->where.begin.line == 19);
    assert(of_kind(fk, FindingKind::hardcoded).empty());
    assert(std::holds_alternative<choice_key>(fk.calls[1].key));
    assert(std::get<static_key>(fk.calls[0].key).key == "single");
}

static void test_constants_respect_scope(){
    auto fk = resolve("src/Scope.tsx",
        "const k = \"outer\"\n"                               // 1
        "const t = useTranslations()\n"                       // 2
        "function A(k){ return t(k); }\n"                     // 3
        "function B(){ let k = pick(); return t(k); }\n"      // 4
        "function C(){ return t(k); }\n"                      // 5
        "function D(){ return t(early); }\n"                  // 6
        "const early = \"hoisted\"\n");                       // 7
    std::vector<std::string> want = {"hoisted", "outer"};
    assert(keys_of(fk) == want);
    auto un = of_kind(fk, FindingKind::unresolved_key);
    assert(un.size() == 2);
    assert(un[0]->where.begin.line == 3 && un[1]->where.begin.line == 4);
}

static void test_forwarded_translators(){
    auto fk = resolve("src/Page.tsx",
        "function Row({ t, id }){\n"                               // 1
        "  return <li>{t(\"row\")}</li>;\n"                        // 2
        "}\n"                                                      // 3
        "const labels = (tr) => ({ save: tr(\"save\") });\n"       // 4
        "export function Page(){\n"                                // 5
        "  const t = useTranslations(\"page\");\n"                 // 6
        "  const l = labels(t);\n"                                 // 7
        "  return <ul><Row t={t} id=\"x\" /></ul>;\n"              // 8
        "}\n"                                                      // 9
        "export function Admin(){\n"                               // 10
        "  const t = useTranslations(\"admin\");\n"                // 11
        "  return <Row t={t} />;\n"                                // 12
        "}\n");
    std::vector<std::string> want = {"admin.row", "page.row", "page.save"};
    assert(keys_of(fk) == want);
    assert(fk.findings.empty());
    assert(fk.calls.size() == 2);
    assert(fk.calls[0].namespaces.size() == 2);

    // A translator forwarded from a namespace nobody can name stays unresolved.
    auto unknown = resolve("src/U.tsx",
        "function Row({ t }){ return <li>{t(\"row\")}</li>; }\n"
        "export function U({ ns }){\n"
        "  const t = useTranslations(ns);\n"
        "  return <Row t={t} />;\n"
        "}\n");
    assert(unknown.used.empty());
    assert(unknown.findings.size() == 1 && unknown.findings[0].message.find("unknown namespace") != std::string::npos);
}

static void test_template_text_anchor(){
    auto fk = resolve("src/T.tsx",
        "export const T = ({ x }) => (\n"   // 1
        "  <p>\n"                            // 2
        "    {`\n"                           // 3
        "  Hello ${x}`}\n"                   // 4
        "  </p>\n"                           // 5
        ");\n");
    auto hc = of_kind(fk, FindingKind::hardcoded);
    assert(hc.size() == 1 && hc[0]->text == "Hello");
    assert(hc[0]->where.begin.line == 4 && hc[0]->anchor_line == 3 && hc[0]->directive_line() == 3);
    assert(hc[0]->jsx_comment);

    auto call = resolve("src/u.ts",
        "const t = useTranslations();\n"     // 1
        "const s = `a\n"                     // 2
        "${t(k)}`;\n");                      // 3
    assert(call.findings.size() == 1 && call.findings[0].kind == FindingKind::unresolved_key);
    assert(call.findings[0].where.begin.line == 3 && call.findings[0].directive_line() == 2);
    assert(!call.findings[0].jsx_comment);

    // Text that starts its own line outside any template keeps its line.
    auto plain = resolve("src/p.tsx", "const P = () => <p>\n  Plain\n</p>;\n");
    assert(plain.findings.size() == 1 && plain.findings[0].anchor_line == 0);
}

void run_key_resolver_tests(){
    std::cout << "[glot] key resolver tests...\n";
    test_hardcoded_candidates();
    test_multiline_text_position();
    test_skipped_text();
    test_translation_calls();
    test_namespaces_and_shadowing();
    test_annotations();
    test_pattern_inference();
    test_logical_chains();
    test_constant_keys();
    test_constants_respect_scope();
    test_forwarded_translators();
    test_template_text_anchor();
    std::cout << "[glot] key resolver tests passed\n";
}
