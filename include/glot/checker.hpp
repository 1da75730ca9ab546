// Checker engine: per-file pass on a worker pool, then the cross-file table comparison
#pragma once
#include "glot/config.hpp"
#include "glot/finding.hpp"
#include "glot/key_resolver.hpp"
#include "glot/locale.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace glot {

// Raised before any finding is produced when the locale setup is unusable.
struct configuration_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SourceFile { std::string path; std::string text; };
struct LocaleFile { std::string path; std::string text; };

struct FileResult {
    std::string path;
    std::vector<Finding> findings;
    std::vector<ResolvedKey> used;
};

struct CheckReport {
    std::vector<Finding> findings;   // sorted with finding_less
    std::size_t source_files = 0;    // files that passed path filtering
    std::size_t locale_files = 0;

    bool has_errors() const {
        for(const auto &f : findings) if(!f.suppressed && f.severity == Severity::error) return true;
        return false;
    }
};

class Checker {
public:
    explicit Checker(Config cfg): cfg_(std::move(cfg)) {}

    const Config& config() const { return cfg_; }

    // Include / ignore filtering of source paths.
    bool accepts(const std::string& path) const;

    // Parse, track directives and resolve keys for one file. Suppressed flags are set.
    FileResult check_file(const SourceFile& file) const;

    // Throws configuration_error for an unusable locale setup.
    CheckReport run(const std::vector<SourceFile>& sources, const std::vector<LocaleFile>& locales) const;

private:
    Config cfg_;

    bool is_ignored_text(const std::string& text) const;
    std::vector<FileResult> check_files(const std::vector<const SourceFile*>& files) const;
};

} // namespace glot
