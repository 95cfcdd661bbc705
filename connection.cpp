#include "connection.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

const char* toString(Topology t){
    switch(t){
    case Topology::Convex: return "convex";
    case Topology::Concave: return "concave";
    default: return "undefined";
    }
}

PairConnection::PairConnection(Circle& a, Circle& b, int indexA, int indexB)
    : a_(&a), b_(&b), indexA_(indexA), indexB_(indexB){
    if(distance(a.center(), b.center()) == 0.0)
        throw std::invalid_argument("cannot connect fibers with coincident centers");
    Shape united = a.shape().unionWith(b.shape());
    removedArea_ = a.area() + b.area() - united.area();
    limit_ = united.convexHull().difference(a.shape()).difference(b.shape()).polygonsOnly();
    spdlog::debug("connection {}-{}: removed {:.6f}, limit {:.6f}",
                  indexA_, indexB_, removedArea_, limit_.area());
}

Segment PairConnection::extendedCenterLine() const {
    Segment line = centerLine();
    return line.withLength(line.length() + a_->radius() + b_->radius());
}

Topology PairConnection::determineTopology() const {
    return removedArea_ > limit_.area() ? Topology::Convex : Topology::Concave;
}

double PairConnection::minimumShift(Topology t) const {
    if(t != Topology::Concave) return 0.0;
    double half = 0.5 * distanceBetweenCenters();
    double r = a_->radius();
    return std::sqrt(std::max(0.0, r * r - half * half));
}

void PairConnection::configure(double shift, Topology topology){
    if(topology == Topology::Undefined)
        throw std::logic_error("configure called with undefined topology");

    Segment line = centerLine();
    Vec2 mid = line.midPoint();
    Vec2 perp = extendedCenterLine().perpendicular();
    double half = 0.5 * line.length();
    double base = std::sqrt(shift * shift + half * half);
    double radius = topology == Topology::Concave ? base - a_->radius() : base + a_->radius();
    if(!(radius > 0.0))
        throw std::domain_error("virtual circle radius is not positive for shift " + std::to_string(shift));

    // the secondary circle is the primary mirrored through the midpoint
    Circle primary(mid + perp * shift, radius, a_->resolution());
    Circle secondary(mid - perp * shift, radius, a_->resolution());

    Vec2 p0 = primary.nearestBoundaryPoint(*a_);
    Vec2 p1 = secondary.nearestBoundaryPoint(*a_);
    Vec2 p2 = primary.nearestBoundaryPoint(*b_);
    Vec2 p3 = secondary.nearestBoundaryPoint(*b_);

    Shape mask;
    Shape added;
    if(topology == Topology::Concave){
        mask = Shape::fromRing({p0, p1, p3, p2})
                   .difference(primary.shape())
                   .difference(secondary.shape());
        added = mask.difference(a_->shape()).difference(b_->shape())
                    .difference(primary.shape().unionWith(secondary.shape()));
    } else {
        Shape wedges = Shape::fromRing({mid, p0, p2}).scaled(1e3, mid)
                           .unionWith(Shape::fromRing({mid, p1, p3}).scaled(1e3, mid));
        mask = wedges.intersection(primary.shape().unionWith(secondary.shape()));
        added = mask.difference(a_->shape()).difference(b_->shape())
                    .intersection(primary.shape().intersection(secondary.shape()));
    }

    topology_ = topology;
    shift_ = shift;
    virtual_.emplace(std::move(primary), std::move(secondary));
    mask_ = std::move(mask);
    added_ = added.polygonsOnly();
    removed_.polygon = a_->shape().intersection(b_->shape()).polygonsOnly();
    removed_.area = removedArea_;
}

Shape PairConnection::totalArea() const {
    return unionAll({a_->shape(), b_->shape(), added_}).polygonsOnly().largestComponent();
}

Shape PairConnection::splitGeometry(const Shape& geometry, Vec2 position, bool returnLargest) const {
    Segment cut = centerLine().centeredAt(position).transformed(Transform2D::rotation(90.0, position));
    return geometry.splitByLine(cut, returnLargest);
}

ConnectionSummary PairConnection::summary() const {
    ConnectionSummary s;
    s.indexA = indexA_;
    s.indexB = indexB_;
    s.centerA = a_->center();
    s.centerB = b_->center();
    s.distance = distanceBetweenCenters();
    s.topology = topology_;
    s.shift = shift_;
    s.addedArea = added_.area();
    s.removedArea = removedArea_;
    s.totalArea = totalArea().area();
    return s;
}

void PairConnection::transformInPlace(const Transform2D& t){
    if(!t.isRigid()) throw std::invalid_argument("connection transform must be rigid");
    if(virtual_){
        virtual_->first.transformInPlace(t);
        virtual_->second.transformInPlace(t);
    }
    if(mask_) mask_->transformInPlace(t);
    added_.transformInPlace(t);
    removed_.polygon.transformInPlace(t);
    limit_.transformInPlace(t);
    if(coreShift_){
        coreShift_->first = t.applyLinear(coreShift_->first);
        coreShift_->second = t.applyLinear(coreShift_->second);
    }
}
