#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".arrayprep";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG;
}

Result<void> create_default_project_config(const fs::path& dir) {
    fs::path config_path = get_project_config_path(dir);

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# arrayprep project configuration

name: "woltka-run"
input_dir: "/path/to/fastq"          # directory holding per-sample reads
output_dir: "/path/to/output"        # manifest, scripts, logs and results
metadata: "prep_information.tsv"     # tab-separated, one row per sample
key_column: "run_prefix"             # unique per row
database: "/path/to/db/WoLr1"        # prefix; *.tax and *.coords are discovered
scheduler: "pbs"                     # pbs | slurm
# environment: "source activate woltka"   # default: $ENVIRONMENT
notify_url: ""
contact: "qiita.help@gmail.com"

array:
  capacity: 1024                     # max array slots the scheduler accepts
  ppn: 8
  memory: "64g"
  walltime: "10:00:00"
  max_running: 8
  output_extension: "sam"

merge:
  memory: "48g"
  walltime: "4:00:00"
  ranks: [phylum, genus, species, free, none]
  primary: "free"
  ungrouped: "none"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Config::Config() {
    project_.key_column = DEFAULT_KEY_COLUMN;
    project_.scheduler = "pbs";
    project_.contact = DEFAULT_CONTACT;
    if (const char* env = std::getenv("ENVIRONMENT")) {
        project_.environment = env;
    }

    array_.capacity = MAX_ARRAY_SLOTS;
    array_.ppn = DEFAULT_PPN;
    array_.memory = DEFAULT_MEMORY;
    array_.walltime = DEFAULT_WALLTIME;
    array_.max_running = DEFAULT_MAX_RUNNING;
    array_.output_extension = DEFAULT_OUTPUT_EXT;

    merge_.memory = DEFAULT_MERGE_MEMORY;
    merge_.walltime = DEFAULT_MERGE_WALLTIME;
    merge_.ranks = {"phylum", "genus", "species", "free", "none"};
    merge_.primary = "free";
    merge_.ungrouped = "none";
    merge_.table_extension = "biom";
    merge_.command = DEFAULT_MERGE_COMMAND;
    merge_.archive = DEFAULT_ARCHIVE;
    merge_.notify = DEFAULT_NOTIFY;

    project_dir_ = fs::current_path();
}

// Overlays the keys present in a YAML document onto an existing Config.
class ConfigParser {
public:
    static void overlay(Config& config, const YAML::Node& root, const fs::path& dir) {
        overlay_project(config.project_, root, dir);
        if (root["array"] && root["array"].IsMap()) {
            overlay_array(config.array_, root["array"]);
        }
        if (root["merge"] && root["merge"].IsMap()) {
            overlay_merge(config.merge_, root["merge"]);
        }
        config.project_dir_ = dir;
    }

private:
    // Relative paths in the project file are relative to the file itself
    static std::string resolve_path(const std::string& value, const fs::path& dir) {
        if (value.empty()) return value;
        fs::path p(value);
        if (p.is_absolute()) return value;
        return (dir / p).lexically_normal().string();
    }

    static void overlay_project(ProjectConfig& p, const YAML::Node& node, const fs::path& dir) {
        p.name = node["name"].as<std::string>(p.name);
        if (node["input_dir"]) p.input_dir = resolve_path(node["input_dir"].as<std::string>(), dir);
        if (node["output_dir"]) p.output_dir = resolve_path(node["output_dir"].as<std::string>(), dir);
        if (node["metadata"]) p.metadata = resolve_path(node["metadata"].as<std::string>(), dir);
        p.key_column = node["key_column"].as<std::string>(p.key_column);
        if (node["database"]) p.database = resolve_path(node["database"].as<std::string>(), dir);
        p.scheduler = node["scheduler"].as<std::string>(p.scheduler);
        p.environment = node["environment"].as<std::string>(p.environment);
        p.notify_url = node["notify_url"].as<std::string>(p.notify_url);
        p.contact = node["contact"].as<std::string>(p.contact);
    }

    static void overlay_array(ArrayDefaults& a, const YAML::Node& node) {
        a.capacity = node["capacity"].as<int>(a.capacity);
        a.ppn = node["ppn"].as<int>(a.ppn);
        a.memory = node["memory"].as<std::string>(a.memory);
        a.walltime = node["walltime"].as<std::string>(a.walltime);
        a.max_running = node["max_running"].as<int>(a.max_running);
        a.output_extension = node["output_extension"].as<std::string>(a.output_extension);
        a.command = node["command"].as<std::string>(a.command);
    }

    static void overlay_merge(MergeDefaults& m, const YAML::Node& node) {
        m.memory = node["memory"].as<std::string>(m.memory);
        m.walltime = node["walltime"].as<std::string>(m.walltime);

        if (node["ranks"]) {
            if (node["ranks"].IsSequence()) {
                m.ranks = node["ranks"].as<std::vector<std::string>>();
            } else if (node["ranks"].IsScalar()) {
                m.ranks = {node["ranks"].as<std::string>()};
            }
        }

        m.primary = node["primary"].as<std::string>(m.primary);
        m.ungrouped = node["ungrouped"].as<std::string>(m.ungrouped);
        m.table_extension = node["table_extension"].as<std::string>(m.table_extension);
        m.command = node["command"].as<std::string>(m.command);
        m.archive = node["archive"].as<std::string>(m.archive);
        m.notify = node["notify"].as<std::string>(m.notify);
    }
};

Result<Config> Config::load_global() {
    Config config;
    if (!global_config_exists()) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(get_global_config_path().string());
        ConfigParser::overlay(config, root, fs::current_path());
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            std::string("Failed to parse global config: ") + e.what());
    }
}

Result<Config> Config::load_project(const fs::path& dir, const Config& base) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            "Project config not found at " + get_project_config_path(dir).string());
    }

    try {
        YAML::Node root = YAML::LoadFile(get_project_config_path(dir).string());

        Config config = base;
        ConfigParser::overlay(config, root, dir);

        // Auto-infer run name from directory name if not set
        if (config.project_.name.empty()) {
            config.project_.name = fs::absolute(dir).filename().string();
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            std::string("Failed to parse project config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& project_dir) {
    auto global_result = load_global();
    if (global_result.is_err()) {
        return global_result;
    }
    return load_project(project_dir, global_result.value);
}

Result<Config> Config::from_string(const std::string& yaml_text, const fs::path& dir) {
    try {
        Config config;
        ConfigParser::overlay(config, YAML::Load(yaml_text), dir);
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            std::string("Failed to parse config: ") + e.what());
    }
}
