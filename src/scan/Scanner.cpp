#include "scan/Scanner.hpp"
#include "config/Config.hpp"
#include "crypto/util/hash.hpp"
#include "db/encoding/tags.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <iterator>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

using namespace fsnap::scan;
using namespace fsnap::snapshot::model;
namespace fs = std::filesystem;

namespace {

double toSeconds(const timespec& ts) {
    return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) / 1e9;
}

std::string joinRelative(const std::string& dir, const std::string& name) {
    return dir.empty() ? name : dir + '/' + name;
}

}

ScanOptions ScanOptions::fromSpec(const config::SnapshotSpec& spec) {
    ScanOptions opts;
    opts.root = spec.root_dir;
    opts.digest = spec.digest;
    opts.archived_by = spec.archived_by;
    opts.file_group_by = spec.file_group_by;
    opts.file_type_by = spec.file_type_by;

    for (const auto& [name, patterns] : spec.match_paths) {
        Category c{name, {}};
        c.templates.reserve(patterns.size());
        for (const auto& p : patterns) c.templates.push_back(pattern::compile(p));
        opts.categories.push_back(std::move(c));
    }

    return opts;
}

std::string Entry::relativePath() const { return joinRelative(dir_name, base_name); }

size_t Plan::fileCount() const {
    size_t n = 0;
    for (const auto& g : groups) n += g.entries.size();
    return n;
}

void ScanReport::merge(const ScanReport& other) {
    unreadable_dirs.insert(unreadable_dirs.end(), other.unreadable_dirs.begin(), other.unreadable_dirs.end());
    skipped_files += other.skipped_files;
    unencodable_files += other.unencodable_files;
    recorded_files += other.recorded_files;
}

Scanner::Scanner(ScanOptions options,
                 std::shared_ptr<spdlog::logger> log,
                 std::shared_ptr<spdlog::logger> digestLog)
    : options_(std::move(options)), log_(std::move(log)), digestLog_(std::move(digestLog)) {}

Entry Scanner::classify(const std::string& dirName, const std::string& baseName, ScanReport& report) const {
    Entry e{dirName, baseName, std::nullopt, {}};
    const auto rel = e.relativePath();
    bool rejected = false;

    for (size_t i = 0; i < options_.categories.size(); ++i) {
        for (const auto& tmpl : options_.categories[i].templates) {
            auto captures = tmpl.match(rel);
            if (!captures) continue;

            if (!db::encoding::isEncodable(*captures)) {
                rejected = true;
                continue;
            }

            e.category = i;
            e.metadata = std::move(*captures);
            return e;
        }
    }

    if (rejected) {
        log_->warn("[Scanner] {}: captured metadata contains '{}' or '{}', recording it as unmatched",
                   rel, db::encoding::TAG_DELIMITER, db::encoding::TAG_VALUE_DELIMITER);
        ++report.unencodable_files;
    }

    return e;
}

Plan Scanner::plan(ScanReport& report) const {
    Plan plan;
    for (const auto& c : options_.categories) plan.groups.push_back({c.name, {}});
    plan.groups.push_back({UNMATCHED_GROUP, {}});

    std::error_code ec;
    const auto rootStatus = fs::status(options_.root, ec);
    if (ec || !fs::is_directory(rootStatus))
        throw ScanIOError("Cannot enumerate scan root " + options_.root.string() +
                          (ec ? ": " + ec.message() : ": not a directory"));

    std::vector<std::string> pending{""};

    while (!pending.empty()) {
        const auto dir = std::move(pending.back());
        pending.pop_back();

        const auto absDir = dir.empty() ? options_.root : options_.root / dir;
        fs::directory_iterator it(absDir, ec);
        if (ec) {
            if (dir.empty())
                throw ScanIOError("Cannot enumerate scan root " + options_.root.string() + ": " + ec.message());
            log_->warn("[Scanner] Cannot read directory {}: {}", absDir.string(), ec.message());
            report.unreadable_dirs.push_back(dir);
            ec.clear();
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;

            const auto name = it->path().filename().string();
            const auto st = it->symlink_status(ec);
            if (ec) {
                log_->warn("[Scanner] Cannot stat {}: {}", it->path().string(), ec.message());
                ++report.skipped_files;
                ec.clear();
                continue;
            }

            if (fs::is_symlink(st)) {
                log_->debug("[Scanner] Skipping symlink {}", it->path().string());
                continue;
            }

            if (fs::is_directory(st)) {
                pending.push_back(joinRelative(dir, name));
                continue;
            }

            if (!fs::is_regular_file(st)) {
                log_->debug("[Scanner] Skipping special file {}", it->path().string());
                continue;
            }

            auto entry = classify(dir, name, report);
            auto& group = entry.category ? plan.groups[*entry.category] : plan.groups.back();
            group.entries.push_back(std::move(entry));
        }

        if (ec) {
            log_->warn("[Scanner] Error while reading directory {}: {}", absDir.string(), ec.message());
            report.unreadable_dirs.push_back(dir);
            ec.clear();
        }
    }

    for (auto& g : plan.groups)
        std::ranges::sort(g.entries, {}, [](const Entry& e) { return e.relativePath(); });

    log_->info("[Scanner] Planned {} files under {} in {} groups",
               plan.fileCount(), options_.root.string(), plan.groups.size());
    return plan;
}

std::optional<FileRecord> Scanner::record(const Entry& entry) const {
    const auto rel = entry.relativePath();
    const auto abs = options_.root / rel;

    struct stat st{};
    if (::lstat(abs.c_str(), &st) != 0) {
        log_->warn("[Scanner] Cannot stat {}: {}", abs.string(), std::strerror(errno));
        return std::nullopt;
    }

    if (!S_ISREG(st.st_mode)) {
        log_->warn("[Scanner] {} is no longer a regular file, skipping", abs.string());
        return std::nullopt;
    }

    FileRecord f;
    f.dir_name = entry.dir_name;
    f.base_name = entry.base_name;
    f.created = toSeconds(st.st_ctim);
    f.modified = toSeconds(st.st_mtim);
    f.size = static_cast<uintmax_t>(st.st_size);
    f.metadata = entry.metadata;

    if (options_.digest) {
        try {
            f.digest = crypto::hash::blake2b(abs);
            digestLog_->trace("[Digest] {} {}", f.hexDigest(), rel);
        } catch (const ScanIOError& e) {
            log_->warn("[Scanner] Skipping {}: {}", rel, e.what());
            return std::nullopt;
        }
    }

    if (entry.category) {
        f.archived = isArchived(options_.archived_by, f.metadata);
        f.file_group = calculate(options_.file_group_by, f.metadata);
        f.file_type = calculate(options_.file_type_by, f.metadata);
    }

    return f;
}

std::vector<FileRecord> Scanner::records(const std::vector<Entry>& entries, ScanReport& report) const {
    std::vector<FileRecord> out;
    out.reserve(entries.size());

    for (const auto& e : entries) {
        if (auto f = record(e)) {
            out.push_back(std::move(*f));
            ++report.recorded_files;
        } else ++report.skipped_files;
    }

    return out;
}

std::vector<FileRecord> Scanner::scan(ScanReport& report) const {
    const auto p = plan(report);

    std::vector<FileRecord> out;
    out.reserve(p.fileCount());
    for (const auto& g : p.groups) {
        auto recs = records(g.entries, report);
        std::ranges::move(recs, std::back_inserter(out));
    }
    return out;
}
