// Comment insertion into sources and key edits on message tables
#pragma once
#include "glot/checker.hpp"
#include "glot/finding.hpp"
#include "glot/json_doc.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace glot {

// The text at an edit target no longer matches what the finding recorded.
struct edit_conflict : std::runtime_error {
    edit_conflict(const std::string& msg, std::string path, int line)
        : std::runtime_error(msg), path(std::move(path)), line(line) {}
    std::string path;
    int line;
};

// Result for one file. On error, text is the unchanged input.
struct EditOutcome {
    std::string path;
    std::string text;
    bool changed = false;
    std::string error;
};

struct AnnotationRequest {
    Finding finding;                  // an unresolved-key finding
    std::vector<std::string> keys;    // empty: use the inferred pattern, or a placeholder
};

struct KeyValue { std::string key; std::string value; };

struct InsertOutcome {
    EditOutcome outcome;
    std::vector<std::pair<std::string, insert_status>> keys;
};

// Edits are serialized per path; different paths can be edited from different threads.
class EditSession {
public:
    // `glot-disable-next-line` above each unsuppressed hardcoded / unresolved-key finding and above
    // each unsuppressed usage of an untranslated key. Lines already covered are left alone.
    std::vector<EditOutcome> apply_suppressions(const std::vector<Finding>& findings,
                                                const std::vector<SourceFile>& files);

    // `glot-message-keys` above each unresolved call that has no annotation yet.
    std::vector<EditOutcome> apply_annotations(const std::vector<AnnotationRequest>& requests,
                                               const std::vector<SourceFile>& files);

    // Unused keys leave every table that holds them; orphan keys leave their own table.
    std::vector<EditOutcome> apply_key_deletions(const std::vector<Finding>& findings,
                                                 const std::vector<LocaleFile>& tables);

    InsertOutcome insert_keys(const LocaleFile& table, const std::vector<KeyValue>& values);

private:
    std::mutex table_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;

    std::mutex& lock_for(const std::string& path);

    template<typename F>
    EditOutcome with_lock(const std::string& path, const std::string& text, F&& edit){
        std::lock_guard<std::mutex> lk(lock_for(path));
        EditOutcome out{ path, text, false, {} };
        try {
            out.text = edit();
            out.changed = out.text != text;
        } catch (const edit_conflict& e) {
            out.text = text;
            out.error = e.what();
        } catch (const json_error& e) {
            out.text = text;
            out.error = e.what();
        }
        return out;
    }
};

} // namespace glot
