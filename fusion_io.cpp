#include "fusion_io.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using nlohmann::json;

static std::optional<FiberSpec> parseFiber(const json& e, const std::string& source, size_t idx){
    if(!e.is_object()){
        spdlog::warn("[JSON] {}: fiber {} is not an object, skipped", source, idx);
        return std::nullopt;
    }
    for(const char* key : {"x", "y", "radius"}){
        if(!e.contains(key) || !e[key].is_number()){
            spdlog::warn("[JSON] {}: fiber {} has no numeric '{}', skipped", source, idx, key);
            return std::nullopt;
        }
    }
    FiberSpec f;
    f.center = {e["x"].get<double>(), e["y"].get<double>()};
    f.radius = e["radius"].get<double>();
    if(!std::isfinite(f.radius) || f.radius <= 0.0 ||
       !std::isfinite(f.center.x) || !std::isfinite(f.center.y)){
        spdlog::warn("[JSON] {}: fiber {} has invalid geometry, skipped", source, idx);
        return std::nullopt;
    }
    return f;
}

template<typename T>
static std::optional<T> optionalNumber(const json& j, const char* key, const std::string& source){
    if(!j.contains(key)) return std::nullopt;
    if(!j[key].is_number())
        throw std::runtime_error(source + ": '" + key + "' must be a number");
    return j[key].get<T>();
}

LayoutFile parseLayoutJson(const json& j, const std::string& source){
    LayoutFile out;
    const json* fibers = nullptr;
    if(j.is_array()){
        fibers = &j;
    } else if(j.is_object()){
        if(!j.contains("fibers") || !j["fibers"].is_array())
            throw std::runtime_error(source + ": missing 'fibers' array");
        fibers = &j["fibers"];
        out.fusionDegree = optionalNumber<double>(j, "fusion_degree", source);
        out.toleranceFactor = optionalNumber<double>(j, "tolerance_factor", source);
        out.coreTolerance = optionalNumber<double>(j, "core_tolerance", source);
        if(j.contains("resolution")){
            if(!j["resolution"].is_number_integer())
                throw std::runtime_error(source + ": 'resolution' must be an integer");
            out.resolution = j["resolution"].get<int>();
        }
        if(j.contains("shift_bounds")){
            const json& b = j["shift_bounds"];
            if(!b.is_array() || b.size() != 2 || !b[0].is_number() || !b[1].is_number())
                throw std::runtime_error(source + ": 'shift_bounds' must be [lower, upper]");
            out.shiftBounds = std::make_pair(b[0].get<double>(), b[1].get<double>());
        }
    } else {
        throw std::runtime_error(source + ": expected a JSON array or object");
    }

    for(size_t i=0;i<fibers->size();++i){
        if(auto f = parseFiber((*fibers)[i], source, i)) out.fibers.push_back(*f);
    }
    spdlog::info("[JSON] {}: {} fibers", source, out.fibers.size());
    return out;
}

LayoutFile loadLayoutJson(const std::string& filename){
    std::ifstream fin(filename);
    if(!fin) throw std::runtime_error("cannot open " + filename);
    std::stringstream buf; buf << fin.rdbuf();
    json j;
    try{
        j = json::parse(buf.str());
    }catch(const json::parse_error& e){
        spdlog::error("[JSON] parse {}: {}", filename, e.what());
        throw std::runtime_error("malformed JSON in " + filename);
    }
    return parseLayoutJson(j, filename);
}

static json pointJson(Vec2 p){
    return json::array({p.x, p.y});
}

json resultToJson(const Assembly& assembly){
    const ShiftSearchResult& shift = assembly.shiftResult();
    json out;
    out["shift"] = shift.shift;
    out["topology"] = toString(shift.topology);
    out["cost"] = shift.cost;
    out["removed_area"] = shift.removedArea;
    out["added_area"] = shift.addedArea;
    out["fused_area"] = assembly.fusedPolygon().area();
    out["converged"] = shift.success;

    json fibers = json::array();
    for(const auto& f : assembly.fibers()){
        fibers.push_back({{"center", pointJson(f.center())},
                          {"radius", f.radius()},
                          {"core", pointJson(f.core())}});
    }
    out["fibers"] = std::move(fibers);

    json connections = json::array();
    for(const auto& s : assembly.connectionSummaries()){
        connections.push_back({{"fibers", json::array({s.indexA, s.indexB})},
                               {"center_a", pointJson(s.centerA)},
                               {"center_b", pointJson(s.centerB)},
                               {"distance", s.distance},
                               {"topology", toString(s.topology)},
                               {"shift", s.shift},
                               {"added_area", s.addedArea},
                               {"removed_area", s.removedArea},
                               {"total_area", s.totalArea}});
    }
    out["connections"] = std::move(connections);

    json rings = json::array();
    for(const auto& path : assembly.fusedPolygon().paths()){
        json ring = json::array();
        for(const auto& pt : path) ring.push_back(pointJson(toVec2(pt)));
        rings.push_back(std::move(ring));
    }
    out["fused_polygon"] = std::move(rings);
    return out;
}

void ExportResultJson(const std::string& filename, const Assembly& assembly){
    std::ofstream f(filename);
    if(!f) throw std::runtime_error("cannot write " + filename);
    f << resultToJson(assembly).dump(2) << "\n";
}

void ExportFusionToSVG(const std::string& filename, const Assembly& assembly){
    const Shape& fused = assembly.fusedPolygon();
    std::ofstream f(filename);
    if(!f) throw std::runtime_error("cannot write " + filename);

    // SVG y grows downwards
    Rect64 b = fused.bounds();
    double x0 = Dbl(b.left), x1 = Dbl(b.right);
    double y0 = Dbl(std::min(b.top, b.bottom)), y1 = Dbl(std::max(b.top, b.bottom));
    double pad = 0.05 * std::max(x1 - x0, y1 - y0);
    double stroke = 0.002 * std::max(x1 - x0, y1 - y0);
    f << "<svg xmlns='http://www.w3.org/2000/svg' viewBox='" << x0 - pad << ' ' << -y1 - pad << ' '
      << (x1 - x0) + 2 * pad << ' ' << (y1 - y0) + 2 * pad << "'>\n";

    auto emit = [&](const Path64& ring, const char* fill, const char* color){
        f << "<polygon fill='" << fill << "' stroke='" << color << "' stroke-width='" << stroke << "' points='";
        for(const auto& p : ring) f << Dbl(p.x) << ',' << -Dbl(p.y) << ' ';
        f << "'/>\n";
    };
    for(const auto& ring : fused.paths()) emit(ring, "none", "red");
    for(const auto& ring : assembly.addedSection().paths()) emit(ring, "lightblue", "blue");
    for(const auto& fb : assembly.fibers()){
        f << "<circle cx='" << fb.center().x << "' cy='" << -fb.center().y << "' r='" << fb.radius()
          << "' fill='none' stroke='gray' stroke-width='" << stroke << "'/>\n";
        f << "<circle cx='" << fb.core().x << "' cy='" << -fb.core().y << "' r='" << 4 * stroke
          << "' fill='black'/>\n";
    }
    f << "</svg>\n";
}
