#pragma once
#include "geometry.h"
#include <optional>
#include <utility>

enum class Topology { Undefined, Convex, Concave };

const char* toString(Topology t);

// Overlap lost when two disks are replaced by their union. `area` is computed
// from the disk areas, not from `polygon`, and is what the optimizers balance.
struct RemovedSection {
    Shape polygon;
    double area = 0.0;
};

struct ConnectionSummary {
    int indexA = -1;
    int indexB = -1;
    Vec2 centerA;
    Vec2 centerB;
    double distance = 0.0;
    Topology topology = Topology::Undefined;
    double shift = 0.0;
    double addedArea = 0.0;
    double removedArea = 0.0;
    double totalArea = 0.0;
};

// One overlapping pair of fibers. The fibers are owned elsewhere and must
// outlive the connection.
class PairConnection {
public:
    // Throws std::invalid_argument if the centers coincide.
    PairConnection(Circle& a, Circle& b, int indexA = -1, int indexB = -1);

    Circle& fiberA() const { return *a_; }
    Circle& fiberB() const { return *b_; }
    int indexA() const { return indexA_; }
    int indexB() const { return indexB_; }

    Topology topology() const { return topology_; }
    double shift() const { return shift_; }
    const std::optional<std::pair<Circle, Circle>>& virtualCircles() const { return virtual_; }
    const std::optional<Shape>& mask() const { return mask_; }
    const Shape& addedSection() const { return added_; }
    // empty until configure()
    const RemovedSection& removedSection() const { return removed_; }
    // area(a) + area(b) - area(a u b), known from construction
    double removedArea() const { return removedArea_; }
    // hull(a u b) - a - b: the most a neck could ever add
    const Shape& limitAddedArea() const { return limit_; }

    Segment centerLine() const { return {a_->center(), b_->center()}; }
    // center line grown by both radii, scaled about its midpoint
    Segment extendedCenterLine() const;
    double distanceBetweenCenters() const { return centerLine().length(); }

    Topology determineTopology() const;
    // smallest shift giving the virtual circles a positive radius
    double minimumShift(Topology t) const;

    // Rebuilds virtual circles, mask and both sections for `shift`.
    // std::logic_error on Undefined, std::domain_error on a non-positive
    // virtual radius. Repeated calls with equal arguments give equal output.
    void configure(double shift, Topology topology);

    // both disks plus the added section, largest component only
    Shape totalArea() const;
    Shape splitGeometry(const Shape& geometry, Vec2 position, bool returnLargest) const;

    const std::optional<std::pair<Vec2, Vec2>>& coreShift() const { return coreShift_; }
    void setCoreShift(Vec2 shiftA, Vec2 shiftB) { coreShift_ = std::make_pair(shiftA, shiftB); }

    ConnectionSummary summary() const;

    // Moves the cached polygons; the fibers are moved by their owner.
    void transformInPlace(const Transform2D& t);

private:
    Circle* a_;
    Circle* b_;
    int indexA_;
    int indexB_;
    Topology topology_ = Topology::Undefined;
    double shift_ = 0.0;
    std::optional<std::pair<Circle, Circle>> virtual_;
    std::optional<Shape> mask_;
    Shape added_;
    RemovedSection removed_;
    double removedArea_ = 0.0;
    Shape limit_;
    std::optional<std::pair<Vec2, Vec2>> coreShift_;
};
