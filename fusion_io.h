#pragma once
#include "assembly.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct FiberSpec {
    Vec2 center;
    double radius = 0.0;
};

// Fiber layout plus optional fusion settings read from JSON.
struct LayoutFile {
    std::vector<FiberSpec> fibers;
    std::optional<double> fusionDegree;
    std::optional<double> toleranceFactor;
    std::optional<double> coreTolerance;
    std::optional<std::pair<double, double>> shiftBounds;
    std::optional<int> resolution;
};

// Accepts an array of {"x","y","radius"} or an object with a "fibers" array
// and optional settings. Bad fiber entries are skipped with a warning;
// anything else malformed throws std::runtime_error.
LayoutFile parseLayoutJson(const nlohmann::json& j, const std::string& source = "<json>");
LayoutFile loadLayoutJson(const std::string& filename);

// Throws std::logic_error if the assembly is not built.
nlohmann::json resultToJson(const Assembly& assembly);
void ExportResultJson(const std::string& filename, const Assembly& assembly);
void ExportFusionToSVG(const std::string& filename, const Assembly& assembly);
