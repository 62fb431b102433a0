#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

struct ReferenceDatabase {
    std::string prefix;                   // aligner index prefix
    std::string taxonomy;                 // *.tax lineage map
    std::optional<std::string> coords;    // *.coords gene coordinates, if shipped
};

// Find the files that share a database prefix. A lineage map is required;
// gene coordinates are optional and, when present, enable per-gene output.
Result<ReferenceDatabase> discover_database(const std::string& prefix);
