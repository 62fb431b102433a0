#include "work_items.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

Result<std::vector<WorkItem>> make_work_items(const std::vector<std::string>& keys,
                                              const std::string& input_dir,
                                              const std::string& output_dir,
                                              const std::string& extension) {
    std::vector<WorkItem> items;
    std::set<std::string> seen;

    for (const auto& key : keys) {
        if (key.empty()) {
            return Result<std::vector<WorkItem>>::Err(ErrorKind::InvalidInput,
                fmt::format("Row {} has an empty key", items.size() + 1));
        }
        if (!seen.insert(key).second) {
            return Result<std::vector<WorkItem>>::Err(ErrorKind::InvalidInput,
                fmt::format("The key values are not unique for each sample ('{}' repeats)", key));
        }

        WorkItem item;
        item.key = key;
        item.input_path = (fs::path(input_dir) / key).string();
        item.output_path = fmt::format("{}/{}.{}", output_dir,
                                       fs::path(item.input_path).filename().string(), extension);
        items.push_back(std::move(item));
    }
    return Result<std::vector<WorkItem>>::Ok(std::move(items));
}

Result<std::vector<WorkItem>> load_work_items(const std::string& metadata_path,
                                              const std::string& key_column,
                                              const std::string& input_dir,
                                              const std::string& output_dir,
                                              const std::string& extension) {
    std::ifstream in(metadata_path);
    if (!in) {
        return Result<std::vector<WorkItem>>::Err(ErrorKind::InvalidInput,
            "Cannot read metadata file " + metadata_path);
    }

    std::string line;
    if (!std::getline(in, line)) {
        return Result<std::vector<WorkItem>>::Err(ErrorKind::InvalidInput,
            "Metadata file is empty: " + metadata_path);
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    auto header = StringUtils::split(line, '\t');
    size_t col = header.size();
    for (size_t i = 0; i < header.size(); i++) {
        if (StringUtils::trim(header[i]) == key_column) {
            col = i;
            break;
        }
    }
    if (col == header.size()) {
        return Result<std::vector<WorkItem>>::Err(ErrorKind::InvalidInput,
            fmt::format("Metadata is missing the required {} column", key_column));
    }

    std::vector<std::string> keys;
    int row = 1;
    while (std::getline(in, line)) {
        row++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (StringUtils::trim(line).empty()) continue;

        auto fields = StringUtils::split(line, '\t');
        if (fields.size() <= col) {
            return Result<std::vector<WorkItem>>::Err(ErrorKind::InvalidInput,
                fmt::format("{}:{}: row has no {} value", metadata_path, row, key_column));
        }
        keys.push_back(StringUtils::trim(fields[col]));
    }

    return make_work_items(keys, input_dir, output_dir, extension);
}
