#include "run_store.hpp"
#include <core/constants.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

RunStore::RunStore(const std::string& output_dir, const std::string& name)
    : plan_path_(fmt::format(PLAN_FILE, output_dir, name)),
      report_path_(fmt::format(REPORT_FILE, output_dir, name)) {}

Result<RunRecord> RunStore::load() const {
    if (!fs::exists(plan_path_)) {
        return Result<RunRecord>::Err(ErrorKind::InvalidInput,
            "No prepared run found at " + plan_path_.string() + " (run 'arrayprep prepare' first)");
    }

    try {
        YAML::Node root = YAML::LoadFile(plan_path_.string());

        RunRecord r;
        r.name = root["name"].as<std::string>("");
        r.scheduler = root["scheduler"].as<std::string>("pbs");
        r.created = root["created"].as<std::string>("");
        r.manifest_path = root["manifest"].as<std::string>("");
        r.array_script = root["array_script"].as<std::string>("");
        r.merge_script = root["merge_script"].as<std::string>("");
        r.has_secondary = root["has_secondary"].as<bool>(false);

        const auto& p = root["plan"];
        r.plan.total_items = p["total_items"].as<int64_t>(0);
        r.plan.capacity = p["capacity"].as<int64_t>(0);
        r.plan.items_per_slot = p["items_per_slot"].as<int64_t>(0);
        r.plan.slot_count = p["slot_count"].as<int64_t>(0);

        if (r.plan.total_items <= 0 || r.plan.items_per_slot <= 0 || r.plan.slot_count <= 0) {
            return Result<RunRecord>::Err(ErrorKind::InvalidInput,
                "Plan file is incomplete: " + plan_path_.string());
        }
        return Result<RunRecord>::Ok(r);
    } catch (const YAML::Exception& e) {
        return Result<RunRecord>::Err(ErrorKind::InvalidInput,
            fmt::format("Failed to parse {}: {}", plan_path_.string(), e.what()));
    }
}

Result<void> RunStore::save(const RunRecord& record) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << record.name;
    out << YAML::Key << "scheduler" << YAML::Value << record.scheduler;
    out << YAML::Key << "created" << YAML::Value << record.created;

    out << YAML::Key << "plan" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "total_items" << YAML::Value << record.plan.total_items;
    out << YAML::Key << "capacity" << YAML::Value << record.plan.capacity;
    out << YAML::Key << "items_per_slot" << YAML::Value << record.plan.items_per_slot;
    out << YAML::Key << "slot_count" << YAML::Value << record.plan.slot_count;
    out << YAML::EndMap;

    out << YAML::Key << "manifest" << YAML::Value << record.manifest_path;
    out << YAML::Key << "array_script" << YAML::Value << record.array_script;
    out << YAML::Key << "merge_script" << YAML::Value << record.merge_script;
    out << YAML::Key << "has_secondary" << YAML::Value << record.has_secondary;
    out << YAML::EndMap;

    std::ofstream fout(plan_path_);
    if (!fout) {
        return Result<void>::Err("Failed to write " + plan_path_.string());
    }
    fout << out.c_str() << "\n";
    return Result<void>::Ok();
}

Result<void> RunStore::save_report(const ValidationReport& report) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "success" << YAML::Value << report.success();

    out << YAML::Key << "artifacts" << YAML::Value << YAML::BeginSeq;
    for (const auto& a : report.artifacts) {
        out << YAML::BeginMap;
        out << YAML::Key << "label" << YAML::Value << a.label;
        out << YAML::Key << "kind" << YAML::Value << a.kind;
        out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
        for (const auto& f : a.files) {
            out << YAML::BeginMap;
            out << YAML::Key << "path" << YAML::Value << f.path;
            out << YAML::Key << "type" << YAML::Value << f.type;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "errors" << YAML::Value << YAML::BeginSeq;
    for (const auto& e : report.errors) {
        out << e;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream fout(report_path_);
    if (!fout) {
        return Result<void>::Err("Failed to write " + report_path_.string());
    }
    fout << out.c_str() << "\n";
    return Result<void>::Ok();
}
