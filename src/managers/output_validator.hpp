#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include "table_normalizer.hpp"

// Where the merge stage leaves its results and which of them are expected.
struct ValidationLayout {
    std::string output_dir;
    std::vector<std::string> partition_keys;     // every merged key
    std::string primary_key;                     // merged with the archive into the primary artifact
    std::string ungrouped_key;                   // mandatory catch-all table
    std::optional<std::string> secondary_key;    // only checked when configured
    std::string table_extension = "biom";
    std::string contact;
};

// Reconciles expected merge outputs against what exists on disk. Every
// check runs; missing outputs become report errors and never abort.
class OutputValidator {
public:
    OutputValidator(ValidationLayout layout, const TableNormalizer& normalizer);

    ValidationReport validate() const;

    std::string table_path(const std::string& key) const;

private:
    ValidationLayout layout_;
    const TableNormalizer& normalizer_;

    void check_primary(ValidationReport& report) const;
    void check_partition(const std::string& key, ValidationReport& report) const;
    void check_ungrouped(ValidationReport& report) const;
    void check_secondary(const std::string& key, ValidationReport& report) const;

    std::string contact_text() const;
};
