#include "glot/checker.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms; size_t findings; };

static RunResult bench_case(const char* name, glot::Config cfg, const std::vector<glot::SourceFile>& sources,
                            const std::vector<glot::LocaleFile>& locales){
    glot::Checker checker(std::move(cfg));
    auto t0 = Clock::now();
    glot::CheckReport report;
    try {
        report = checker.run(sources, locales);
    } catch (const glot::configuration_error& e) {
        std::cerr << "[bench] case '" << name << "' failed: " << e.what() << "\n";
        return {0.0, 0};
    }
    auto t1 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(), report.findings.size() };
}

// A component with static, dynamic and hardcoded content, repeated under distinct paths.
static std::string component(int i){
    std::string n = std::to_string(i);
    return
        "import { useTranslations } from 'next-intl';\n"
        "export function Card" + n + "({ role, items }) {\n"
        "  const t = useTranslations('card');\n"
        "  return (\n"
        "    <section title=\"Card " + n + "\">\n"
        "      <h2>{t('title')}</h2>\n"
        "      <p>{t('body', { count: items.length })}</p>\n"
        "      {/* glot-message-keys \"card.roles.*\" */}\n"
        "      <span>{t(`roles.${role}`)}</span>\n"
        "      <button aria-label={items.length ? t('open') : 'Closed'}>Go</button>\n"
        "    </section>\n"
        "  );\n"
        "}\n";
}

int main(){
    std::vector<glot::SourceFile> sources;
    for(int i = 0; i < 400; ++i) sources.push_back({ "src/components/Card" + std::to_string(i) + ".tsx", component(i) });
    std::vector<glot::LocaleFile> locales = {
        { "messages/en.json", "{\n  \"card\": {\n    \"title\": \"Title\",\n    \"body\": \"Body\",\n    \"open\": \"Open\",\n"
                              "    \"roles\": { \"admin\": \"Admin\", \"user\": \"User\" }\n  }\n}\n" },
        { "messages/de.json", "{\n  \"card\": {\n    \"title\": \"Titel\",\n    \"body\": \"Body\",\n    \"open\": \"Offen\"\n  }\n}\n" },
    };

    struct Case { const char* name; unsigned jobs; };
    std::vector<Case> cases = { { "serial", 1 }, { "parallel", 0 } };

    std::cout << "name,ms,findings\n";
    for(const auto &c : cases){
        glot::Config cfg;
        cfg.jobs = c.jobs;
        auto r = bench_case(c.name, cfg, sources, locales);
        std::cout << c.name << "," << r.ms << "," << r.findings << "\n";
    }
    return 0;
}
