#include "structures.h"
#include <spdlog/spdlog.h>
#include <cmath>
#include <random>
#include <string>
#include <stdexcept>

double scalingFactor(double fusionDegree){
    if(!(fusionDegree >= 0.0 && fusionDegree <= 1.0))
        throw std::invalid_argument("fusion degree " + std::to_string(fusionDegree) + " outside [0, 1]");
    return 1.0 - fusionDegree * (2.0 - std::sqrt(2.0));
}

std::vector<Vec2> ringLayout(int n, double radius, double angleShift){
    if(n < 1) throw std::invalid_argument("ring needs at least one fiber");
    if(n == 1) return {Vec2{0.0, 0.0}};
    const double step = 360.0 / n;
    const double dtheta = 2.0 * 3.14159265358979323846 / n;
    const double d = std::sqrt(2.0 / (1.0 - std::cos(dtheta))) * radius;
    std::vector<Vec2> out;
    out.reserve(n);
    for(int k=0;k<n;++k){
        Transform2D rot = Transform2D::rotation(angleShift + k * step, {});
        out.push_back(rot.apply({0.0, d}));
    }
    return out;
}

std::vector<Vec2> lineLayout(int n, double radius, double rotationAngle){
    if(n < 1) throw std::invalid_argument("line needs at least one fiber");
    Transform2D rot = Transform2D::rotation(rotationAngle, {});
    std::vector<Vec2> out;
    out.reserve(n);
    const double mean = 0.5 * (n - 1);
    for(int k=0;k<n;++k) out.push_back(rot.apply({(k - mean) * 2.0 * radius, 0.0}));
    return out;
}

void applyFusionDegree(std::vector<Vec2>& centers, double fusionDegree, Vec2 origin){
    Transform2D t = Transform2D::scaling(scalingFactor(fusionDegree), origin);
    for(auto& c : centers) c = t.apply(c);
}

size_t Preset::fiberCount() const {
    size_t n = centerFiber ? 1 : 0;
    for(const auto& r : rings) n += r.count;
    return n;
}

const std::vector<Preset>& presets(){
    using Range = std::pair<double, double>;
    static const std::vector<Preset> table = {
        {"ring-1",  LayoutKind::Ring, {},                                     true,  std::nullopt},
        {"ring-2",  LayoutKind::Ring, {{2}},                                  false, Range{0.0, 1.0}},
        {"ring-3",  LayoutKind::Ring, {{3}},                                  false, Range{0.0, 0.4}},
        {"ring-4",  LayoutKind::Ring, {{4}},                                  false, Range{0.0, 0.4}},
        {"ring-5",  LayoutKind::Ring, {{5}},                                  false, Range{0.0, 0.45}},
        {"ring-6",  LayoutKind::Ring, {{6}},                                  false, Range{0.0, 0.45}},
        {"ring-7",  LayoutKind::Ring, {{6}},                                  true,  Range{0.0, 0.3}},
        {"ring-10", LayoutKind::Ring, {{7, 1.3, 25.0}, {3}},                  true,  Range{0.0, 0.3}},
        {"ring-12", LayoutKind::Ring, {{3}, {9, 1.05, 20.0}},                 false, std::nullopt},
        {"ring-19", LayoutKind::Ring, {{6}, {12, 1.0, 15.0}},                 true,  std::nullopt},
        {"line-1",  LayoutKind::Line, {{1}},                                  false, std::nullopt},
        {"line-2",  LayoutKind::Line, {{2}},                                  false, Range{0.0, 1.0}},
        {"line-3",  LayoutKind::Line, {{3}},                                  false, Range{0.1, 0.35}},
        {"line-4",  LayoutKind::Line, {{4}},                                  false, Range{0.0, 0.35}},
        {"line-5",  LayoutKind::Line, {{5}},                                  false, Range{0.0, 0.35}},
    };
    return table;
}

const Preset* findPreset(const std::string& name){
    for(const auto& p : presets())
        if(p.name == name) return &p;
    return nullptr;
}

std::optional<double> parametrizedFusionDegree(const Preset& preset, std::optional<double> degree){
    if(!preset.fusionRange){
        if(degree) throw std::invalid_argument("preset " + preset.name + " takes no fusion degree");
        return std::nullopt;
    }
    double fd = degree.value_or(0.8);
    if(!(fd >= 0.0 && fd <= 1.0))
        throw std::invalid_argument("fusion degree " + std::to_string(fd) + " outside [0, 1]");
    return preset.fusionRange->first * (1.0 - fd) + fd * preset.fusionRange->second;
}

std::vector<Vec2> presetCenters(const Preset& preset, double radius, std::optional<double> fusionDegree){
    std::optional<double> degree = parametrizedFusionDegree(preset, fusionDegree);
    std::vector<Vec2> centers;
    if(preset.centerFiber) centers.push_back({0.0, 0.0});
    for(const auto& ring : preset.rings){
        std::vector<Vec2> pts = preset.kind == LayoutKind::Ring
            ? ringLayout(ring.count, radius, ring.angleShift)
            : lineLayout(ring.count, radius, ring.angleShift);
        if(degree) applyFusionDegree(pts, *degree);
        Transform2D scale = Transform2D::scaling(ring.positionScale, {});
        for(auto& p : pts) centers.push_back(scale.apply(p));
    }
    return centers;
}

Assembly makePreset(const std::string& name, double radius, std::optional<double> fusionDegree, int resolution,
                    double scaleDown){
    const Preset* preset = findPreset(name);
    if(!preset) throw std::invalid_argument("unknown preset: " + name);
    Assembly assembly;
    for(auto c : presetCenters(*preset, radius, fusionDegree)) assembly.addFiber(c, radius, resolution);
    if(scaleDown != 1.0) assembly.scalePositions(scaleDown);
    spdlog::debug("preset {}: {} fibers", name, assembly.size());
    return assembly;
}

void scrambleCores(Assembly& assembly, double factor, unsigned seed){
    if(factor == 0.0) return;
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for(size_t i=0;i<assembly.size();++i){
        double dx = unit(gen) * factor;
        double dy = unit(gen) * factor;
        assembly.shiftCore(i, {dx, dy});
    }
}
