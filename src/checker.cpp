#include "glot/checker.hpp"
#include "glot/directives.hpp"
#include "glot/source.hpp"
#include "glot/text.hpp"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <exception>
#include <map>
#include <thread>
#include <tuple>

namespace glot {

bool Checker::accepts(const std::string& path) const {
    if(!cfg_.includes.empty()){
        bool hit = false;
        for(const auto &p : cfg_.includes) if(path_glob_match(p, path)){ hit = true; break; }
        if(!hit) return false;
    }
    for(const auto &p : cfg_.ignores) if(path_glob_match(p, path)) return false;
    return true;
}

bool Checker::is_ignored_text(const std::string& text) const {
    return std::find(cfg_.ignore_texts.begin(), cfg_.ignore_texts.end(), text) != cfg_.ignore_texts.end();
}

FileResult Checker::check_file(const SourceFile& file) const {
    FileResult r;
    r.path = file.path;
    auto unit = parse_source(file.path, file.text);
    if(!unit.ok()){
        auto f = make_finding(FindingKind::parse_error, file.path, unit.failure->where, unit.failure->message);
        r.findings.push_back(std::move(f));
        return r;
    }
    DirectiveState directives(unit);
    KeyResolver resolver(cfg_, unit, directives);
    auto keys = resolver.run();
    for(auto &f : keys.findings){
        rule category = f.kind == FindingKind::hardcoded ? rule::hardcoded : rule::unresolved_key;
        f.suppressed = directives.is_suppressed(f.directive_line(), category);
    }
    for(auto &u : keys.used)
        u.usage.untranslated_suppressed = directives.is_suppressed(u.usage.directive_line(), rule::untranslated);
    r.findings = std::move(keys.findings);
    r.used = std::move(keys.used);
    return r;
}

std::vector<FileResult> Checker::check_files(const std::vector<const SourceFile*>& files) const {
    std::vector<FileResult> results(files.size());
    unsigned jobs = cfg_.jobs ? cfg_.jobs : std::thread::hardware_concurrency();
    if(jobs == 0) jobs = 1;
    if(jobs > files.size()) jobs = static_cast<unsigned>(std::max<std::size_t>(files.size(), 1));

    std::atomic<std::size_t> next{0};
    std::vector<std::exception_ptr> errors(jobs);
    auto work = [&](unsigned w){
        try {
            for(std::size_t i; (i = next.fetch_add(1)) < files.size(); )
                results[i] = check_file(*files[i]);
        } catch (...) {
            errors[w] = std::current_exception();
        }
    };
    if(jobs == 1){
        work(0);
    } else {
        std::vector<std::thread> pool;
        pool.reserve(jobs);
        for(unsigned w = 0; w < jobs; ++w) pool.emplace_back(work, w);
        for(auto &t : pool) t.join();
    }
    for(auto &e : errors) if(e) std::rethrow_exception(e);
    if(debug_enabled()) std::fprintf(stderr, "[glot:check] %zu source file(s) on %u worker(s)\n", files.size(), jobs);
    return results;
}

namespace {

Finding table_finding(FindingKind kind, const LocaleTable& table, const std::string& key,
                      const LocaleEntry& entry, std::string message){
    auto f = make_finding(kind, table.path, span{ entry.where, entry.where }, std::move(message));
    f.key = key;
    f.locale = table.locale;
    return f;
}

bool usage_less(const KeyUsage& a, const KeyUsage& b){
    return std::tie(a.path, a.where.begin.line, a.where.begin.col) < std::tie(b.path, b.where.begin.line, b.where.begin.col);
}

} // namespace

CheckReport Checker::run(const std::vector<SourceFile>& sources, const std::vector<LocaleFile>& locales) const {
    if(cfg_.primary_locale.empty()) throw configuration_error("no primary locale configured");

    std::map<std::string, const LocaleFile*> by_id;
    for(const auto &l : locales){
        auto id = locale_from_path(l.path);
        auto ins = by_id.emplace(id, &l);
        if(!ins.second)
            throw configuration_error("duplicate locale id '" + id + "': " + ins.first->second->path + " and " + l.path);
    }
    if(!by_id.count(cfg_.primary_locale))
        throw configuration_error("primary locale '" + cfg_.primary_locale + "' has no message table");

    std::vector<std::string> replica_ids;
    if(cfg_.replica_locales.empty()){
        for(const auto &kv : by_id) if(kv.first != cfg_.primary_locale) replica_ids.push_back(kv.first);
    } else {
        for(const auto &id : cfg_.replica_locales){
            if(!by_id.count(id)) throw configuration_error("replica locale '" + id + "' has no message table");
            if(id != cfg_.primary_locale && std::find(replica_ids.begin(), replica_ids.end(), id) == replica_ids.end())
                replica_ids.push_back(id);
        }
    }

    CheckReport report;
    auto load = [&](const std::string& id) -> std::optional<LocaleTable> {
        const auto *file = by_id.at(id);
        ++report.locale_files;
        auto r = load_locale(file->path, file->text);
        if(r.failure){
            auto f = make_finding(FindingKind::parse_error, file->path, r.failure->where, r.failure->message);
            f.locale = id;
            report.findings.push_back(std::move(f));
            return std::nullopt;
        }
        r.table->primary = id == cfg_.primary_locale;
        return std::move(r.table);
    };
    auto primary = load(cfg_.primary_locale);
    std::vector<LocaleTable> replicas;
    for(const auto &id : replica_ids) if(auto t = load(id)) replicas.push_back(std::move(*t));

    std::vector<const SourceFile*> accepted;
    for(const auto &s : sources){
        if(accepts(s.path)) accepted.push_back(&s);
        else if(debug_enabled()) std::fprintf(stderr, "[glot:check] skipped %s\n", s.path.c_str());
    }
    report.source_files = accepted.size();
    auto results = check_files(accepted);

    for(auto &r : results)
        for(auto &f : r.findings) report.findings.push_back(std::move(f));

    if(!primary){
        if(debug_enabled()) std::fprintf(stderr, "[glot:check] primary table unreadable, table checks skipped\n");
        std::sort(report.findings.begin(), report.findings.end(), finding_less);
        return report;
    }
    const auto &P = primary->entries;

    std::map<std::string, std::vector<KeyUsage>> uses;
    for(const auto &r : results){
        for(const auto &u : r.used){
            if(u.glob){
                bool matched = false;
                for(const auto &kv : P) if(key_glob_match(u.key, kv.first)){ uses[kv.first].push_back(u.usage); matched = true; }
                if(!matched) uses[u.key].push_back(u.usage);
                continue;
            }
            if(u.raw && !P.count(u.key)){
                // `t.raw("section")` reads the whole subtree
                std::string prefix = u.key + ".";
                bool matched = false;
                for(auto it = P.lower_bound(prefix); it != P.end() && starts_with(it->first, prefix); ++it){
                    uses[it->first].push_back(u.usage);
                    matched = true;
                }
                if(matched) continue;
            }
            uses[u.key].push_back(u.usage);
        }
    }
    for(auto &kv : uses) std::sort(kv.second.begin(), kv.second.end(), usage_less);

    for(const auto &kv : uses){
        if(P.count(kv.first)) continue;
        const auto &first = kv.second.front();
        auto f = make_finding(FindingKind::missing_key, first.path, first.where,
                              "key '" + kv.first + "' is not defined in primary locale '" + primary->locale + "'");
        f.key = kv.first;
        f.locale = primary->locale;
        f.usages = kv.second;
        for(std::size_t i = 1; i < kv.second.size(); ++i)
            f.notes.push_back(FindingNote{ "also used here", kv.second[i].path, kv.second[i].where.begin.line, kv.second[i].where.begin.col });
        report.findings.push_back(std::move(f));
    }

    for(const auto &kv : P){
        if(uses.count(kv.first)) continue;
        report.findings.push_back(table_finding(FindingKind::unused_key, *primary, kv.first, kv.second,
                                                "key '" + kv.first + "' is never used"));
    }

    for(const auto &replica : replicas){
        for(const auto &kv : P){
            const auto *entry = replica.find(kv.first);
            if(!entry){
                auto f = table_finding(FindingKind::replica_lag, *primary, kv.first, kv.second,
                                       "key '" + kv.first + "' is missing from locale '" + replica.locale + "'");
                f.locale = replica.locale;
                report.findings.push_back(std::move(f));
                continue;
            }
            if(entry->type != kv.second.type){
                report.findings.push_back(table_finding(FindingKind::type_mismatch, replica, kv.first, *entry,
                    "key '" + kv.first + "' is " + value_type_name(kv.second.type) + " in '" + primary->locale
                    + "' but " + value_type_name(entry->type) + " in '" + replica.locale + "'"));
                continue;
            }
            bool textual = entry->type == value_type::string || entry->type == value_type::string_array;
            if(!textual || entry->value != kv.second.value) continue;
            if(!has_alphabetic(entry->value) || is_ignored_text(entry->value)) continue;
            auto f = table_finding(FindingKind::untranslated, replica, kv.first, *entry,
                                   "key '" + kv.first + "' in '" + replica.locale + "' has the same value as '"
                                   + primary->locale + "'");
            f.text = entry->value;
            auto u = uses.find(kv.first);
            if(u != uses.end()){
                f.usages = u->second;
                f.suppressed = std::all_of(u->second.begin(), u->second.end(),
                                           [](const KeyUsage& k){ return k.untranslated_suppressed; });
            }
            report.findings.push_back(std::move(f));
        }
        for(const auto &kv : replica.entries){
            if(P.count(kv.first)) continue;
            report.findings.push_back(table_finding(FindingKind::orphan_key, replica, kv.first, kv.second,
                "key '" + kv.first + "' does not exist in primary locale '" + primary->locale + "'"));
        }
    }

    std::sort(report.findings.begin(), report.findings.end(), finding_less);
    if(debug_enabled()) std::fprintf(stderr, "[glot:check] %zu finding(s)\n", report.findings.size());
    return report;
}

} // namespace glot
