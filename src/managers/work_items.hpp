#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Build work items from unique keys, in the given order. The input is
// <input_dir>/<key> and the output <output_dir>/<basename(input)>.<extension>.
// Empty or repeated keys fail with InvalidInput.
Result<std::vector<WorkItem>> make_work_items(const std::vector<std::string>& keys,
                                              const std::string& input_dir,
                                              const std::string& output_dir,
                                              const std::string& extension);

// Read a tab-separated metadata file with a header row and build one work
// item per row from `key_column`. A missing column, a short row or duplicate
// values fail with InvalidInput before anything is written.
Result<std::vector<WorkItem>> load_work_items(const std::string& metadata_path,
                                              const std::string& key_column,
                                              const std::string& input_dir,
                                              const std::string& output_dir,
                                              const std::string& extension);
