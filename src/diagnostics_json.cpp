#include "glot/diagnostics_json.hpp"
#include "glot/config.hpp"
#include "glot/json_doc.hpp"
#include <sstream>
#include <cstdio>

namespace glot {

static void append_notes_json(std::ostringstream& os, const std::vector<FindingNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"path\":"<<json_escape(notes[i].path)
          <<",\"line\":"<<notes[i].line
          <<",\"col\":"<<notes[i].col
          <<"}";
    }
    os<<"]";
}

static void append_finding_json(std::ostringstream& os, const Finding& f){
    os<<"{"
        "\"kind\":"<<json_escape(kind_name(f.kind))
        <<",\"severity\":"<<json_escape(severity_name(f.severity))
        <<",\"path\":"<<json_escape(f.path)
        <<",\"line\":"<<f.where.begin.line
        <<",\"col\":"<<f.where.begin.col
        <<",\"message\":"<<json_escape(f.message)
        <<",\"hint\":"<<json_escape(f.hint)
        <<",\"suppressed\":"<<(f.suppressed?"true":"false");
    if(!f.key.empty()) os<<",\"key\":"<<json_escape(f.key);
    if(!f.locale.empty()) os<<",\"locale\":"<<json_escape(f.locale);
    if(!f.pattern.empty()) os<<",\"pattern\":"<<json_escape(f.pattern);
    os<<",\"notes\":";
    append_notes_json(os, f.notes);
    os<<"}";
}

std::string findings_to_json(const CheckReport& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.has_errors()?"false":"true")
      <<",\"source_files\":"<<r.source_files
      <<",\"locale_files\":"<<r.locale_files
      <<",\"findings\":[";
    for(size_t i=0;i<r.findings.size(); ++i){
        if(i) os<<",";
        append_finding_json(os, r.findings[i]);
    }
    os<<"],\"counts\":{";
    bool first = true;
    for(const auto &kv : count_by_kind(r.findings)){
        if(!first) os<<",";
        first = false;
        os<<json_escape(kind_name(kv.first))<<":"<<kv.second;
    }
    os<<"}}";
    return os.str();
}

void maybe_print_json(const CheckReport& r){
    if(env_flag_enabled("GLOT_DIAG_JSON")){
        auto js=findings_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace glot
