#include "output_validator.hpp"
#include "run_log.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;

static const char* TABLE_KIND = "BIOM";

// Unreadable directories count as missing rather than throwing
static bool present(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

OutputValidator::OutputValidator(ValidationLayout layout, const TableNormalizer& normalizer)
    : layout_(std::move(layout)), normalizer_(normalizer) {}

std::string OutputValidator::table_path(const std::string& key) const {
    return fmt::format("{}/{}.{}", layout_.output_dir, key, layout_.table_extension);
}

std::string OutputValidator::contact_text() const {
    return fmt::format("please contact {} for more information", layout_.contact);
}

void OutputValidator::check_primary(ValidationReport& report) const {
    std::string table = table_path(layout_.primary_key);
    std::string archive = fmt::format("{}/{}", layout_.output_dir, ALIGNMENT_ARCHIVE);

    // Both files or nothing
    if (present(table) && present(archive)) {
        report.artifacts.push_back({"Alignment Profile", TABLE_KIND,
                                    {{table, "biom"}, {archive, "log"}}});
    } else {
        report.errors.push_back(fmt::format(
            "Missing files from the \"Alignment Profile\"; {}", contact_text()));
    }
}

void OutputValidator::check_partition(const std::string& key, ValidationReport& report) const {
    std::string table = table_path(key);
    if (!present(table)) {
        report.errors.push_back(fmt::format("Table {} was not created, {}", key, contact_text()));
        return;
    }

    // Tables only count once their rows carry the derived taxonomy
    auto normalized = normalizer_.normalize(table);
    if (normalized.is_err()) {
        arrayprep_log(fmt::format("validate: normalizing {} failed: {}", table, normalized.error));
        report.errors.push_back(fmt::format("Table {} could not be annotated ({}), {}",
                                            key, normalized.error, contact_text()));
        return;
    }

    report.artifacts.push_back({fmt::format("Taxonomic Predictions - {}", key), TABLE_KIND,
                                {{table, "biom"}}});
}

void OutputValidator::check_ungrouped(ValidationReport& report) const {
    std::string table = table_path(layout_.ungrouped_key);
    if (present(table)) {
        report.artifacts.push_back({"Per genome Predictions", TABLE_KIND, {{table, "biom"}}});
    } else {
        report.errors.push_back(fmt::format("Table {}/per-genome was not created, {}",
                                            layout_.ungrouped_key, contact_text()));
    }
}

void OutputValidator::check_secondary(const std::string& key, ValidationReport& report) const {
    std::string table = table_path(key);
    if (present(table)) {
        report.artifacts.push_back({"Per gene Predictions", TABLE_KIND, {{table, "biom"}}});
    } else {
        report.errors.push_back(fmt::format("Table {} was not created, {}", key, contact_text()));
    }
}

ValidationReport OutputValidator::validate() const {
    ValidationReport report;

    check_primary(report);

    for (const auto& key : layout_.partition_keys) {
        if (key == layout_.primary_key || key == layout_.ungrouped_key) continue;
        if (layout_.secondary_key && key == *layout_.secondary_key) continue;
        check_partition(key, report);
    }

    check_ungrouped(report);

    if (layout_.secondary_key) {
        check_secondary(*layout_.secondary_key, report);
    }

    arrayprep_log(fmt::format("validate: {} artifacts, {} errors in {}",
                              report.artifacts.size(), report.errors.size(), layout_.output_dir));
    return report;
}
