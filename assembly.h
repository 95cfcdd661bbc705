#pragma once
#include "connection.h"
#include "core_optimizer.h"
#include "shift_optimizer.h"
#include <vector>

struct FusionOptions {
    ShiftSearchOptions shift;
    CoreSearchOptions core;
};

// Owns a fiber cluster and, after build(), its fused cross-section.
// Results are cached until the fibers change; reading them before build()
// throws std::logic_error.
//
// build() works on copies of the fibers scaled by 1 / lengthUnit() (the
// smallest radius), so the Clipper2 grid resolves every fiber the same way
// whatever the length unit of the input. Everything reported back is in input
// units except connections(), which live in that working frame.
class Assembly {
public:
    Assembly() = default;
    explicit Assembly(FusionOptions options) : options_(std::move(options)) {}
    Assembly(const Assembly&) = delete;
    Assembly& operator=(const Assembly&) = delete;
    Assembly(Assembly&&) = default;
    Assembly& operator=(Assembly&&) = default;

    FusionOptions& options() { return options_; }
    const FusionOptions& options() const { return options_; }

    void addFiber(const Circle& fiber);
    void addFiber(Vec2 center, double radius, int resolution = DEFAULT_RESOLUTION);
    const std::vector<Circle>& fibers() const { return fibers_; }
    size_t size() const { return fibers_.size(); }

    // graph, global shift, core positions, fused polygon
    void build();
    bool built() const { return built_; }
    void invalidate();

    // working frame: lengths divided by lengthUnit()
    const std::vector<PairConnection>& connections() const;
    double lengthUnit() const { return unit_; }
    const Shape& fusedPolygon() const;
    // plain union of the disks; available without build()
    Shape unfusedPolygon() const;
    Shape addedSection() const;
    double removedArea() const;
    const ShiftSearchResult& shiftResult() const;
    double shift() const { return shiftResult().shift; }
    Topology topology() const { return shiftResult().topology; }
    const std::vector<CoreSearchResult>& coreResults() const;
    std::vector<Vec2> cores() const;
    std::vector<ConnectionSummary> connectionSummaries() const;

    // moves centers toward `origin`; invalidates. Throws std::invalid_argument
    // unless factor is positive and finite.
    void scalePositions(double factor, Vec2 origin = {});
    // displaces one core without touching the fused geometry
    void shiftCore(size_t index, Vec2 shift);

    // rigid motions keep the build results valid; other maps throw
    // std::invalid_argument
    void transformInPlace(const Transform2D& t);
    void translateInPlace(Vec2 shift) { transformInPlace(Transform2D::translation(shift)); }
    void rotateInPlace(double angleDeg, Vec2 origin) { transformInPlace(Transform2D::rotation(angleDeg, origin)); }

private:
    void requireBuilt(const char* what) const;

    FusionOptions options_;
    std::vector<Circle> fibers_;
    // fibers_ in the working frame; connections_ point into it
    std::vector<Circle> work_;
    double unit_ = 1.0;
    std::vector<PairConnection> connections_;
    ShiftSearchResult shift_;
    std::vector<CoreSearchResult> cores_;
    Shape fused_;
    bool built_ = false;
};
