#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global defaults from ~/.arrayprep/config.yaml (missing file = built-in defaults)
    static Result<Config> load_global();

    // Load project config from ./arrayprep.yaml on top of the given base
    static Result<Config> load_project(const fs::path& dir, const Config& base);

    // Load both and combine (prefer project overrides)
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse a project document held in memory (relative paths resolve against dir)
    static Result<Config> from_string(const std::string& yaml_text,
                                      const fs::path& dir = fs::current_path());

    // Accessors
    const ProjectConfig& project() const { return project_; }
    const ArrayDefaults& array() const { return array_; }
    const MergeDefaults& merge() const { return merge_; }
    const fs::path& project_dir() const { return project_dir_; }

public:
    Config();

private:
    ProjectConfig project_;
    ArrayDefaults array_;
    MergeDefaults merge_;
    fs::path project_dir_;

    friend class ConfigParser;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Write a commented starter arrayprep.yaml (never overwrites)
Result<void> create_default_project_config(const fs::path& dir = fs::current_path());
