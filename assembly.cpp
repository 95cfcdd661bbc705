#include "assembly.h"
#include "connection_graph.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

static double smallestRadius(const std::vector<Circle>& fibers){
    double r = 1.0;
    if(!fibers.empty()){
        r = fibers.front().radius();
        for(const auto& f : fibers) r = std::min(r, f.radius());
    }
    return r;
}

static std::vector<Circle> toWorkingFrame(const std::vector<Circle>& fibers, double unit){
    std::vector<Circle> out;
    out.reserve(fibers.size());
    for(const auto& f : fibers) out.emplace_back(f.center() / unit, f.radius() / unit, f.resolution());
    return out;
}

static ConnectionSummary toInputUnits(ConnectionSummary s, double unit){
    s.centerA = s.centerA * unit;
    s.centerB = s.centerB * unit;
    s.distance *= unit;
    s.shift *= unit;
    s.addedArea *= unit * unit;
    s.removedArea *= unit * unit;
    s.totalArea *= unit * unit;
    return s;
}

void Assembly::addFiber(const Circle& fiber){
    invalidate();
    fibers_.push_back(fiber);
}

void Assembly::addFiber(Vec2 center, double radius, int resolution){
    addFiber(Circle(center, radius, resolution));
}

void Assembly::invalidate(){
    connections_.clear();
    work_.clear();
    unit_ = 1.0;
    cores_.clear();
    shift_ = ShiftSearchResult{};
    fused_ = Shape();
    built_ = false;
}

void Assembly::requireBuilt(const char* what) const {
    if(!built_) throw std::logic_error(std::string(what) + " requested before build()");
}

void Assembly::build(){
    invalidate();
    spdlog::info("fusing {} fibers", fibers_.size());
    for(auto& f : fibers_) f.setCore(f.center());
    try {
        unit_ = smallestRadius(fibers_);
        work_ = toWorkingFrame(fibers_, unit_);
        const double u = unit_;
        if(u != 1.0) spdlog::debug("working length unit {:.6g}", u);

        FusionOptions opts = options_;
        if(opts.shift.bounds)
            opts.shift.bounds = std::make_pair(opts.shift.bounds->first / u, opts.shift.bounds->second / u);
        if(options_.shift.observer){
            ShiftObserver observer = options_.shift.observer;
            opts.shift.observer = [observer, u](double shift, double added, double removed, double cost){
                observer(shift * u, added * u * u, removed * u * u, cost * u * u);
            };
        }

        connections_ = ConnectionGraph::build(work_);
        spdlog::info("{} overlapping pairs", connections_.size());
        // leaves every connection configured at the accepted shift
        shift_ = GlobalShiftOptimizer::findShift(connections_, work_, opts.shift);
        cores_ = CorePositionOptimizer::optimizeAll(connections_, opts.core);

        std::vector<Shape> parts;
        parts.reserve(work_.size() + connections_.size());
        for(const auto& f : work_) parts.push_back(f.shape());
        for(const auto& c : connections_) parts.push_back(c.addedSection());
        fused_ = unionAll(parts).polygonsOnly();

        if(u != 1.0){
            shift_.shift *= u;
            shift_.lower *= u;
            shift_.upper *= u;
            shift_.cost *= u * u;
            shift_.addedArea *= u * u;
            shift_.removedArea *= u * u;
            for(auto& r : cores_){
                r.shiftA = r.shiftA * u;
                r.shiftB = r.shiftB * u;
                r.cost *= u * u;
            }
            fused_ = fused_.scaled(u, {}).polygonsOnly();
        }
        for(size_t i=0;i<fibers_.size();++i)
            fibers_[i].setCore(fibers_[i].center() + (work_[i].core() - work_[i].center()) * u);
    } catch(...) {
        invalidate();
        throw;
    }
    built_ = true;
    spdlog::info("fused area {:.6g}", fused_.area());
}

const std::vector<PairConnection>& Assembly::connections() const {
    requireBuilt("connections");
    return connections_;
}

const Shape& Assembly::fusedPolygon() const {
    requireBuilt("fused polygon");
    return fused_;
}

Shape Assembly::unfusedPolygon() const {
    std::vector<Shape> disks;
    disks.reserve(fibers_.size());
    for(const auto& f : fibers_) disks.push_back(f.shape());
    return unionAll(disks);
}

Shape Assembly::addedSection() const {
    requireBuilt("added section");
    std::vector<Shape> sections, disks;
    for(const auto& c : connections_) sections.push_back(c.addedSection());
    for(const auto& f : work_) disks.push_back(f.shape());
    Shape added = unionAll(sections).difference(unionAll(disks));
    return unit_ == 1.0 ? added : added.scaled(unit_, {}).polygonsOnly();
}

double Assembly::removedArea() const {
    if(built_) return shift_.removedArea;
    double u = smallestRadius(fibers_);
    return GlobalShiftOptimizer::totalRemovedArea(toWorkingFrame(fibers_, u)) * u * u;
}

const ShiftSearchResult& Assembly::shiftResult() const {
    requireBuilt("shift");
    return shift_;
}

const std::vector<CoreSearchResult>& Assembly::coreResults() const {
    requireBuilt("core results");
    return cores_;
}

std::vector<Vec2> Assembly::cores() const {
    std::vector<Vec2> out;
    out.reserve(fibers_.size());
    for(const auto& f : fibers_) out.push_back(f.core());
    return out;
}

std::vector<ConnectionSummary> Assembly::connectionSummaries() const {
    requireBuilt("connection summaries");
    std::vector<ConnectionSummary> out;
    out.reserve(connections_.size());
    for(const auto& c : connections_) out.push_back(toInputUnits(c.summary(), unit_));
    return out;
}

void Assembly::scalePositions(double factor, Vec2 origin){
    if(!std::isfinite(factor) || factor <= 0.0)
        throw std::invalid_argument("position scale must be positive, got " + std::to_string(factor));
    invalidate();
    for(auto& f : fibers_) f.scalePositionInPlace(factor, origin);
}

void Assembly::shiftCore(size_t index, Vec2 shift){
    if(index >= fibers_.size())
        throw std::out_of_range("fiber index " + std::to_string(index) + " out of range");
    fibers_[index].shiftCore(shift);
    if(built_) work_[index].shiftCore(shift / unit_);
}

void Assembly::transformInPlace(const Transform2D& t){
    if(!t.isRigid()) throw std::invalid_argument("assembly transform must be rigid, use scalePositions");
    for(auto& f : fibers_) f.transformInPlace(t);
    if(!built_) return;
    Transform2D w = t;
    w.tx /= unit_;
    w.ty /= unit_;
    for(auto& f : work_) f.transformInPlace(w);
    for(auto& c : connections_) c.transformInPlace(w);
    fused_.transformInPlace(t);
}
