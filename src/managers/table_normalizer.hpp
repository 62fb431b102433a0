#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Attaches derived per-row metadata to a merged result table in place.
class TableNormalizer {
public:
    virtual ~TableNormalizer() = default;
    virtual Result<void> normalize(const fs::path& table) const = 0;
};

// Lineage levels encoded in a row identifier ("k__Bacteria;p__Firmicutes").
std::vector<std::string> taxonomy_from_id(const std::string& row_id);

enum class TableFormat { Classic, Hdf5 };

// HDF5 files are recognised by their 8-byte signature; anything else is
// treated as a classic text table.
Result<TableFormat> detect_table_format(const fs::path& table);

// Classic tab-separated tables: optional '#' comment lines, a "#OTU ID"
// header, then one row per observation keyed by its first column. Adds (or
// replaces) a trailing "taxonomy" column and rewrites the file atomically.
class ClassicTableNormalizer : public TableNormalizer {
public:
    Result<void> normalize(const fs::path& table) const override;
};

// BIOM 2.x tables stored as HDF5. Reads observation/ids and writes
// observation/metadata/taxonomy as an (observations x levels) array of
// variable-length strings, padded with "". Works on a copy that is renamed
// over the original.
class Hdf5TableNormalizer : public TableNormalizer {
public:
    Result<void> normalize(const fs::path& table) const override;
};

// Picks the HDF5 or classic normalizer per file.
class FormatDetectingNormalizer : public TableNormalizer {
public:
    Result<void> normalize(const fs::path& table) const override;

private:
    ClassicTableNormalizer classic_;
    Hdf5TableNormalizer hdf5_;
};
