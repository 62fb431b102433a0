#include "table_normalizer.hpp"
#include <platform/platform.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <H5Cpp.h>
#include <algorithm>
#include <cstring>
#include <fstream>

static const char* HEADER_PREFIX = "#OTU ID";
static const char* TAXONOMY_COLUMN = "taxonomy";

std::vector<std::string> taxonomy_from_id(const std::string& row_id) {
    std::vector<std::string> levels;
    for (const auto& part : StringUtils::split(row_id, ';')) {
        levels.push_back(StringUtils::trim(part));
    }
    return levels;
}

Result<void> ClassicTableNormalizer::normalize(const fs::path& table) const {
    std::ifstream in(table);
    if (!in) {
        return Result<void>::Err("cannot open " + table.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    in.close();

    size_t header = lines.size();
    for (size_t i = 0; i < lines.size(); i++) {
        if (lines[i].rfind(HEADER_PREFIX, 0) == 0) {
            header = i;
            break;
        }
        if (lines[i].empty() || lines[i][0] != '#') break;
    }
    if (header == lines.size()) {
        return Result<void>::Err(ErrorKind::InvalidInput,
            fmt::format("{} has no '{}' header", table.string(), HEADER_PREFIX));
    }

    auto columns = StringUtils::split(lines[header], '\t');
    size_t tax_col = columns.size();
    for (size_t c = 0; c < columns.size(); c++) {
        if (columns[c] == TAXONOMY_COLUMN) tax_col = c;
    }
    if (tax_col == columns.size()) {
        columns.push_back(TAXONOMY_COLUMN);
        lines[header] = StringUtils::join(columns, "\t");
    }

    for (size_t i = header + 1; i < lines.size(); i++) {
        if (lines[i].empty()) continue;
        auto fields = StringUtils::split(lines[i], '\t');
        std::string taxonomy = StringUtils::join(taxonomy_from_id(fields[0]), "; ");
        if (fields.size() <= tax_col) fields.resize(tax_col + 1);
        fields[tax_col] = taxonomy;
        lines[i] = StringUtils::join(fields, "\t");
    }

    fs::path staging = platform::staging_path(table);
    {
        std::ofstream out(staging);
        if (!out) {
            return Result<void>::Err("cannot write " + staging.string());
        }
        for (const auto& l : lines) out << l << "\n";
        out.close();
        if (!out) {
            return Result<void>::Err("cannot write " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, table, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Result<void>::Err(fmt::format("cannot replace {}", table.string()));
    }
    return Result<void>::Ok();
}

// ── Format detection ───────────────────────────────────────

static const char HDF5_SIGNATURE[8] = {'\x89', 'H', 'D', 'F', '\r', '\n', '\x1a', '\n'};

Result<TableFormat> detect_table_format(const fs::path& table) {
    std::ifstream in(table, std::ios::binary);
    if (!in) {
        return Result<TableFormat>::Err("cannot open " + table.string());
    }

    char head[sizeof(HDF5_SIGNATURE)] = {};
    in.read(head, sizeof(head));
    if (in.gcount() == static_cast<std::streamsize>(sizeof(head)) &&
        std::memcmp(head, HDF5_SIGNATURE, sizeof(head)) == 0) {
        return Result<TableFormat>::Ok(TableFormat::Hdf5);
    }
    return Result<TableFormat>::Ok(TableFormat::Classic);
}

Result<void> FormatDetectingNormalizer::normalize(const fs::path& table) const {
    auto format = detect_table_format(table);
    if (format.is_err()) return forward_err<void>(format);

    if (format.value == TableFormat::Hdf5) {
        return hdf5_.normalize(table);
    }
    return classic_.normalize(table);
}

// ── HDF5 BIOM ───────────────────────────────────────────────

static const char* OBSERVATION_IDS = "/observation/ids";
static const char* OBSERVATION_METADATA = "/observation/metadata";

static std::vector<std::string> read_string_dataset(const H5::DataSet& ds) {
    H5::DataSpace space = ds.getSpace();
    auto n = static_cast<size_t>(space.getSimpleExtentNpoints());
    H5::DataType type = ds.getDataType();
    if (type.getClass() != H5T_STRING) {
        throw H5::DataSetIException("read_string_dataset", "observation ids are not strings");
    }

    std::vector<std::string> values;
    values.reserve(n);
    if (n == 0) return values;

    if (type.isVariableStr()) {
        H5::StrType mem(H5::PredType::C_S1, H5T_VARIABLE);
        std::vector<char*> buf(n, nullptr);
        ds.read(buf.data(), mem);
        for (char* p : buf) values.emplace_back(p ? p : "");
        H5::DataSet::vlenReclaim(buf.data(), mem, space);
    } else {
        size_t width = type.getSize();
        H5::StrType mem(H5::PredType::C_S1, width);
        std::vector<char> buf(n * width, '\0');
        ds.read(buf.data(), mem);
        for (size_t i = 0; i < n; i++) {
            const char* p = buf.data() + i * width;
            values.emplace_back(p, strnlen(p, width));
        }
    }
    return values;
}

static void write_taxonomy(H5::H5File& file, const std::vector<std::string>& ids) {
    std::vector<std::vector<std::string>> rows;
    size_t levels = 1;
    for (const auto& id : ids) {
        rows.push_back(taxonomy_from_id(id));
        levels = std::max(levels, rows.back().size());
    }

    std::vector<const char*> cells(rows.size() * levels, "");
    for (size_t r = 0; r < rows.size(); r++) {
        for (size_t c = 0; c < rows[r].size(); c++) {
            cells[r * levels + c] = rows[r][c].c_str();
        }
    }

    H5::Group meta = file.nameExists(OBSERVATION_METADATA)
        ? file.openGroup(OBSERVATION_METADATA)
        : file.createGroup(OBSERVATION_METADATA);
    if (meta.nameExists(TAXONOMY_COLUMN)) {
        meta.unlink(TAXONOMY_COLUMN);
    }

    H5::StrType vlen(H5::PredType::C_S1, H5T_VARIABLE);
    vlen.setCset(H5T_CSET_UTF8);
    hsize_t dims[2] = {static_cast<hsize_t>(rows.size()), static_cast<hsize_t>(levels)};
    H5::DataSpace space(2, dims);
    H5::DataSet ds = meta.createDataSet(TAXONOMY_COLUMN, vlen, space);
    if (!cells.empty()) {
        ds.write(cells.data(), vlen);
    }
}

Result<void> Hdf5TableNormalizer::normalize(const fs::path& table) const {
    fs::path staging = platform::staging_path(table);
    std::error_code ec;
    fs::copy_file(table, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("cannot copy {}: {}", table.string(), ec.message()));
    }

    H5::Exception::dontPrint();
    try {
        H5::H5File file(staging.string(), H5F_ACC_RDWR);
        if (!file.nameExists("/observation") || !file.nameExists(OBSERVATION_IDS)) {
            file.close();
            fs::remove(staging, ec);
            return Result<void>::Err(ErrorKind::InvalidInput,
                fmt::format("{} has no {} dataset", table.string(), OBSERVATION_IDS));
        }
        auto ids = read_string_dataset(file.openDataSet(OBSERVATION_IDS));
        write_taxonomy(file, ids);
        file.close();
    } catch (const H5::Exception& e) {
        fs::remove(staging, ec);
        return Result<void>::Err(ErrorKind::InvalidInput,
            fmt::format("{}: {}", table.string(), e.getDetailMsg()));
    }

    fs::rename(staging, table, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Result<void>::Err(fmt::format("cannot replace {}", table.string()));
    }
    return Result<void>::Ok();
}
