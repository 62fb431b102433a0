#pragma once

#include <string>
#include <optional>
#include <vector>
#include <utility>
#include <functional>
#include <cstdint>

// Failure categories surfaced to callers of the planning/build pipeline.
enum class ErrorKind {
    None,
    InvalidInput,   // bad metadata, duplicate keys, non-positive counts
    ConfigError,    // bad command template, walltime, merge fan-out
    IoError,        // filesystem / parse failures
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::IoError};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::IoError};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Forward an error from one Result type into another.
template <typename T, typename U>
Result<T> forward_err(const Result<U>& r) {
    return Result<T>::Err(r.kind, r.error);
}

// ── Work items and planning ─────────────────────────────────

struct WorkItem {
    std::string key;          // unique metadata key (e.g. run prefix)
    std::string input_path;   // <input_dir>/<key>
    std::string output_path;  // <output_dir>/<basename>.<ext>
};

struct JobPlan {
    int64_t total_items = 0;
    int64_t capacity = 0;
    int64_t items_per_slot = 0;
    int64_t slot_count = 0;
};

// One manifest line: input and derived output path.
struct ManifestEntry {
    std::string input_path;
    std::string output_path;
};

// ── Dispatch / merge configuration ──────────────────────────

enum class SchedulerKind { PBS, SLURM };

struct DispatchConfig {
    std::string resource_name;      // job name; also names manifest and script
    int parallelism = 0;            // cores per slot
    std::string memory_limit;
    std::string walltime_limit;     // HH:MM:SS
    int max_concurrent_slots = 0;
    std::string environment_setup;
    std::string command_template;   // must hold {infile} and {outfile}
    std::string output_extension;
    std::string output_dir;
    std::string contact;
};

struct MergeTask {
    std::string partition_key;
    std::string glob_pattern;
    bool rename_output = false;
};

using MergePlan = std::vector<MergeTask>;

struct MergeSettings {
    std::string resource_name;
    std::string output_dir;
    std::string metadata_path;
    std::string memory_limit;
    std::string walltime_limit;
    std::string environment_setup;
    std::string contact;
    std::string command_template;   // {prep} {base} {name} {glob}
    std::string archive_command;
    std::string notify_command;     // {url} {name} {output}
    std::string notify_url;
};

// ── Configuration structures ────────────────────────────────

struct ArrayDefaults {
    int capacity = 1024;
    int ppn = 8;
    std::string memory;
    std::string walltime;
    int max_running = 8;
    std::string output_extension;
    std::string command;                  // per-item template override
};

struct MergeDefaults {
    std::string memory;
    std::string walltime;
    std::vector<std::string> ranks;       // partition keys
    std::string primary;                  // rank bundled into the primary artifact
    std::string ungrouped;                // catch-all rank
    std::string table_extension;
    std::string command;                  // {prep} {base} {name} {glob}
    std::string archive;
    std::string notify;                   // {url} {name} {output}
};

struct ProjectConfig {
    std::string name;
    std::string input_dir;
    std::string output_dir;
    std::string metadata;                 // tab-separated upstream metadata
    std::string key_column;
    std::string database;                 // reference database prefix
    std::string scheduler;
    std::string environment;              // shell setup run before work
    std::string notify_url;
    std::string contact;
};

// ── Validation ──────────────────────────────────────────────

struct ArtifactFile {
    std::string path;
    std::string type;   // e.g. "biom", "log"
};

struct ArtifactInfo {
    std::string label;
    std::string kind;   // e.g. "BIOM"
    std::vector<ArtifactFile> files;
};

struct ValidationReport {
    std::vector<ArtifactInfo> artifacts;
    std::vector<std::string> errors;

    bool success() const { return errors.empty(); }
    std::string error_text() const;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
