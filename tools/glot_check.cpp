#include <cstdlib>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "glot/checker.hpp"
#include "glot/config.hpp"
#include "glot/diagnostics_json.hpp"
#include "glot/editor.hpp"
#include "glot/text.hpp"

using namespace glot;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true;
}
static bool write_file(const std::string& path, const std::string& text){
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc); if(!ofs) return false;
    ofs<<text; return static_cast<bool>(ofs);
}

static void print_finding(const Finding& f){
    std::cerr << severity_name(f.severity) << "[" << kind_name(f.kind) << "]: " << f.message
              << " (" << f.path << ":" << f.where.begin.line << ":" << f.where.begin.col << ")\n";
    if(!f.hint.empty()) std::cerr << "  hint: " << f.hint << "\n";
    for(auto &n : f.notes){
        std::cerr << "  note: " << n.message;
        if(n.line>=0) std::cerr << " (" << n.path << ":" << n.line << ":" << n.col << ")";
        std::cerr << "\n";
    }
}

static int write_outcomes(const std::vector<EditOutcome>& outcomes){
    int failed = 0;
    for(auto &o : outcomes){
        if(!o.error.empty()){ std::cerr << "edit failed: " << o.error << "\n"; ++failed; continue; }
        if(o.changed && !write_file(o.path, o.text)){ std::cerr << "failed to write " << o.path << "\n"; ++failed; continue; }
        if(o.changed) std::cout << "updated " << o.path << "\n";
    }
    return failed;
}

int main(int argc, char** argv){
    if(argc<2){
        std::cerr << "usage: glot_check [--primary <locale>] [--replicas a,b] [--jobs N] [--ignore-text T]\n"
                     "                  [--suppress | --annotate | --delete-unused] <files...>\n"
                     "  .json files are message tables, every other file is a component source\n";
        return 2;
    }
    Config cfg;
    apply_env(cfg, detect_env());
    enum class mode { check, suppress, annotate, delete_unused } m = mode::check;
    std::vector<SourceFile> sources;
    std::vector<LocaleFile> locales;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        auto value = [&](){ if(i+1>=argc){ std::cerr << "missing value for " << a << "\n"; std::exit(2); } return std::string(argv[++i]); };
        if(a=="--primary"){ cfg.primary_locale = value(); continue; }
        if(a=="--replicas"){ cfg.replica_locales = split(value(), ','); continue; }
        if(a=="--jobs"){ cfg.jobs = static_cast<unsigned>(std::strtoul(value().c_str(), nullptr, 10)); continue; }
        if(a=="--ignore-text"){ cfg.ignore_texts.push_back(value()); continue; }
        if(a=="--suppress"){ m = mode::suppress; continue; }
        if(a=="--annotate"){ m = mode::annotate; continue; }
        if(a=="--delete-unused"){ m = mode::delete_unused; continue; }
        std::string text;
        if(!read_file(a, text)){ std::cerr << "failed to read " << a << "\n"; return 2; }
        if(a.size() > 5 && a.compare(a.size()-5, 5, ".json")==0) locales.push_back(LocaleFile{a, std::move(text)});
        else sources.push_back(SourceFile{a, std::move(text)});
    }

    Checker checker(cfg);
    CheckReport report;
    try {
        report = checker.run(sources, locales);
    } catch (const configuration_error& e) {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 2;
    }
    maybe_print_json(report);

    EditSession session;
    switch(m){
        case mode::suppress:
            return write_outcomes(session.apply_suppressions(report.findings, sources)) ? 1 : 0;
        case mode::annotate: {
            std::vector<AnnotationRequest> reqs;
            for(auto &f : report.findings)
                if(f.kind==FindingKind::unresolved_key && !f.suppressed) reqs.push_back(AnnotationRequest{f, {}});
            return write_outcomes(session.apply_annotations(reqs, sources)) ? 1 : 0;
        }
        case mode::delete_unused:
            return write_outcomes(session.apply_key_deletions(report.findings, locales)) ? 1 : 0;
        case mode::check:
            break;
    }

    for(auto &f : report.findings) if(!f.suppressed) print_finding(f);
    auto sev = count_by_severity(report.findings);
    std::cerr << sev[Severity::error] << " error(s), " << sev[Severity::warning] << " warning(s) in "
              << report.source_files << " source file(s) and " << report.locale_files << " message table(s)\n";
    return report.has_errors() ? 1 : 0;
}
