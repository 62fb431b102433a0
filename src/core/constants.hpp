#pragma once

// ── Scheduler limits ────────────────────────────────────────
constexpr int MAX_ARRAY_SLOTS            = 1024;  // Max indexable job-array IDs
constexpr int MAX_MERGE_TASKS            = 32;    // Merge fan-out must stay below this

// ── Default array resources ─────────────────────────────────
constexpr int DEFAULT_PPN                = 8;
constexpr int DEFAULT_MAX_RUNNING        = 8;
constexpr const char* DEFAULT_MEMORY     = "64g";
constexpr const char* DEFAULT_WALLTIME   = "10:00:00";
constexpr const char* DEFAULT_OUTPUT_EXT = "sam";

// ── Default merge resources ─────────────────────────────────
constexpr const char* DEFAULT_MERGE_MEMORY   = "48g";
constexpr const char* DEFAULT_MERGE_WALLTIME = "4:00:00";

// ── Naming ──────────────────────────────────────────────────
constexpr const char* DEFAULT_KEY_COLUMN = "run_prefix";
constexpr const char* DEFAULT_CONTACT    = "qiita.help@gmail.com";
constexpr const char* PROJECT_CONFIG     = "arrayprep.yaml";
constexpr const char* INFILE_TOKEN       = "{infile}";
constexpr const char* OUTFILE_TOKEN      = "{outfile}";

// ── Output file templates ───────────────────────────────────
// Use fmt::format with these: fmt::format(MANIFEST_FILE, output_dir, name)
constexpr const char* MANIFEST_FILE      = "{}/{}.array-details";
constexpr const char* ARRAY_SCRIPT_FILE  = "{}/{}.qsub";
constexpr const char* MERGE_SCRIPT_FILE  = "{}/{}.merge.qsub";
constexpr const char* PLAN_FILE          = "{}/{}.array-plan.yaml";
constexpr const char* REPORT_FILE        = "{}/{}.report.yaml";

// ── External tool defaults ──────────────────────────────────
constexpr const char* DEFAULT_MERGE_COMMAND =
    "woltka_merge --prep {prep} --base {base} --name {name} --glob \"{glob}\"";
constexpr const char* DEFAULT_RANK_GLOB     = "*.woltka-taxa/{}.biom";
constexpr const char* DEFAULT_GENE_GLOB     = "*.woltka-per-gene";
constexpr const char* SECONDARY_KEY         = "per-gene";
constexpr const char* RENAME_FLAG           = "--rename";
constexpr const char* DEFAULT_ARCHIVE       = "tar -cvf alignment.tar *.sam.xz";
constexpr const char* DEFAULT_NOTIFY        = "finish_woltka {url} {name} {output}";
constexpr const char* ALIGNMENT_ARCHIVE     = "alignment.tar";
