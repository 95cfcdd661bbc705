#pragma once
#include "assembly.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Center scale for a fusion degree in [0, 1]: 1 - degree * (2 - sqrt 2).
// Throws std::invalid_argument outside [0, 1].
double scalingFactor(double fusionDegree);

// n tangent fibers around the origin, the first at (0, d) before angleShift.
std::vector<Vec2> ringLayout(int n, double radius, double angleShift = 0.0);
// n tangent fibers on a line through the origin.
std::vector<Vec2> lineLayout(int n, double radius, double rotationAngle = 0.0);

void applyFusionDegree(std::vector<Vec2>& centers, double fusionDegree, Vec2 origin = {});

enum class LayoutKind { Ring, Line };

struct RingSpec {
    int count = 0;
    double positionScale = 1.0;
    double angleShift = 0.0;
};

struct Preset {
    std::string name;
    LayoutKind kind = LayoutKind::Ring;
    std::vector<RingSpec> rings;
    bool centerFiber = false;
    std::optional<std::pair<double, double>> fusionRange;

    size_t fiberCount() const;
};

const std::vector<Preset>& presets();
const Preset* findPreset(const std::string& name);

// Maps a user degree in [0, 1] into the preset fusion range; no degree means
// 0.8. Presets without a range accept no degree and yield nullopt.
std::optional<double> parametrizedFusionDegree(const Preset& preset, std::optional<double> degree);

std::vector<Vec2> presetCenters(const Preset& preset, double radius, std::optional<double> fusionDegree);
// Fibers of the named preset, not yet built, with every center scaled by
// scaleDown toward the origin. Throws std::invalid_argument for an unknown
// name or a non-positive scale.
Assembly makePreset(const std::string& name, double radius, std::optional<double> fusionDegree = std::nullopt,
                    int resolution = DEFAULT_RESOLUTION, double scaleDown = 1.0);

// Moves every core by factor * (U[0,1), U[0,1)).
void scrambleCores(Assembly& assembly, double factor, unsigned seed);
