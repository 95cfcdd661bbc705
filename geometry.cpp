#include "geometry.h"
#include <algorithm>
#include <stdexcept>

using namespace Clipper2Lib;

namespace {
constexpr double MATH_PI = 3.14159265358979323846;
// rings below this many squared integer units are boolean debris
constexpr double MIN_RING_AREA = 1.0;
}

// ---- transforms ----
Transform2D Transform2D::translation(Vec2 shift){
    Transform2D t;
    t.tx = shift.x;
    t.ty = shift.y;
    return t;
}

Transform2D Transform2D::rotation(double angleDeg, Vec2 origin){
    double rad = angleDeg * MATH_PI / 180.0;
    double cs = std::cos(rad), sn = std::sin(rad);
    Transform2D t;
    t.a = cs; t.b = -sn;
    t.c = sn; t.d = cs;
    t.tx = origin.x - (cs * origin.x - sn * origin.y);
    t.ty = origin.y - (sn * origin.x + cs * origin.y);
    return t;
}

Transform2D Transform2D::scaling(double factor, Vec2 origin){
    Transform2D t;
    t.a = factor; t.d = factor;
    t.tx = origin.x * (1.0 - factor);
    t.ty = origin.y * (1.0 - factor);
    return t;
}

// ---- Segment ----
Vec2 Segment::perpendicular() const {
    double len = length();
    if(len == 0.0) throw std::invalid_argument("perpendicular of a zero-length segment");
    Vec2 d = p1 - p0;
    return Vec2{d.y, -d.x} / len;
}

Segment Segment::extended(double factor) const {
    Vec2 m = midPoint();
    return {m + (p0 - m) * factor, m + (p1 - m) * factor};
}

Segment Segment::withLength(double newLength) const {
    double len = length();
    if(len == 0.0) throw std::invalid_argument("cannot resize a zero-length segment");
    return extended(newLength / len);
}

Segment Segment::centeredAt(Vec2 center) const {
    Vec2 shift = center - midPoint();
    return {p0 + shift, p1 + shift};
}

// ---- Utilities ----
static long long cross64(const Point64& a, const Point64& b, const Point64& c){
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

Path64 convexHull(const std::vector<Point64>& pts){
    if(pts.size() < 3) return Path64(pts.begin(), pts.end());
    std::vector<Point64> p = pts;
    std::sort(p.begin(), p.end(), [](const Point64& a, const Point64& b){
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });
    std::vector<Point64> lower, upper;
    for(const auto& pt : p){
        while(lower.size() >= 2 && cross64(lower[lower.size()-2], lower.back(), pt) <= 0)
            lower.pop_back();
        lower.push_back(pt);
    }
    for(auto it=p.rbegin(); it!=p.rend(); ++it){
        while(upper.size() >= 2 && cross64(upper[upper.size()-2], upper.back(), *it) <= 0)
            upper.pop_back();
        upper.push_back(*it);
    }
    lower.pop_back();
    upper.pop_back();
    lower.insert(lower.end(), upper.begin(), upper.end());
    return Path64(lower.begin(), lower.end());
}

// ---- Shape ----
Shape Shape::fromRing(const std::vector<Vec2>& ring){
    Path64 p; p.reserve(ring.size());
    for(auto v : ring) p.push_back(toPoint64(v));
    return Shape(Union(Paths64{p}, FillRule::NonZero));
}

double Shape::area() const {
    return std::abs(Area(paths_)) / (SCALE * SCALE);
}

Vec2 Shape::centroid() const {
    double a2 = 0.0, cx = 0.0, cy = 0.0;
    for(const auto& path : paths_){
        size_t n = path.size();
        for(size_t i=0;i<n;++i){
            Vec2 p = toVec2(path[i]);
            Vec2 q = toVec2(path[(i+1)%n]);
            double cr = p.x * q.y - q.x * p.y;
            a2 += cr;
            cx += (p.x + q.x) * cr;
            cy += (p.y + q.y) * cr;
        }
    }
    if(a2 == 0.0) return {};
    return {cx / (3.0 * a2), cy / (3.0 * a2)};
}

Rect64 Shape::bounds() const {
    return GetBounds(paths_);
}

Shape Shape::unionWith(const Shape& other) const {
    return Shape(Union(paths_, other.paths_, FillRule::NonZero));
}

Shape Shape::difference(const Shape& other) const {
    return Shape(Difference(paths_, other.paths_, FillRule::NonZero));
}

Shape Shape::intersection(const Shape& other) const {
    return Shape(Intersect(paths_, other.paths_, FillRule::NonZero));
}

Shape Shape::convexHull() const {
    std::vector<Point64> pts;
    for(const auto& path : paths_) pts.insert(pts.end(), path.begin(), path.end());
    Path64 hull = ::convexHull(pts);
    if(hull.size() < 3) return Shape();
    return Shape(Paths64{hull});
}

Shape Shape::polygonsOnly() const {
    Paths64 kept;
    for(const auto& path : paths_){
        if(path.size() < 3) continue;
        if(std::abs(Area(path)) < MIN_RING_AREA) continue;
        kept.push_back(path);
    }
    return Shape(std::move(kept));
}

static void collectComponents(const PolyPath64& node, std::vector<Shape>& out){
    for(size_t i=0;i<node.Count();++i){
        const PolyPath64* outer = node.Child(i);
        Paths64 comp{outer->Polygon()};
        for(size_t j=0;j<outer->Count();++j){
            const PolyPath64* hole = outer->Child(j);
            comp.push_back(hole->Polygon());
            collectComponents(*hole, out);
        }
        out.emplace_back(std::move(comp));
    }
}

std::vector<Shape> Shape::components() const {
    std::vector<Shape> out;
    if(paths_.empty()) return out;
    Clipper64 c;
    c.AddSubject(paths_);
    PolyTree64 tree;
    c.Execute(ClipType::Union, FillRule::NonZero, tree);
    collectComponents(tree, out);
    return out;
}

Shape Shape::largestComponent() const {
    auto comps = components();
    if(comps.empty()) return Shape();
    auto it = std::max_element(comps.begin(), comps.end(), [](const Shape& a, const Shape& b){
        return a.area() < b.area();
    });
    return *it;
}

Shape Shape::splitByLine(const Segment& line, bool returnLargest) const {
    if(paths_.empty()) return Shape();
    Vec2 dir = line.p1 - line.p0;
    double len = norm(dir);
    if(len == 0.0) throw std::invalid_argument("split line has zero length");
    dir = dir / len;
    Vec2 nrm{-dir.y, dir.x};

    Rect64 b = bounds();
    Vec2 lo = toVec2(Point64(b.left, std::min(b.top, b.bottom)));
    Vec2 hi = toVec2(Point64(b.right, std::max(b.top, b.bottom)));
    Vec2 mid = (lo + hi) * 0.5;
    double reach = 2.0 * (distance(lo, hi) + distance(mid, line.p0)) + 1.0;

    Vec2 s0 = line.p0 - dir * reach;
    Vec2 s1 = line.p0 + dir * reach;
    Shape left = Shape::fromRing({s0, s1, s1 + nrm * reach, s0 + nrm * reach});
    Shape right = Shape::fromRing({s0, s0 - nrm * reach, s1 - nrm * reach, s1});

    std::vector<Shape> pieces;
    for(const Shape* side : {&left, &right}){
        Shape cut = intersection(*side).polygonsOnly();
        for(auto& comp : cut.components()) pieces.push_back(std::move(comp));
    }
    if(pieces.size() < 2) return *this;

    auto byArea = [](const Shape& a, const Shape& b){ return a.area() < b.area(); };
    if(returnLargest) return *std::max_element(pieces.begin(), pieces.end(), byArea);
    return *std::min_element(pieces.begin(), pieces.end(), byArea);
}

Shape Shape::transformed(const Transform2D& t) const {
    Shape out(*this);
    out.transformInPlace(t);
    return out;
}

void Shape::transformInPlace(const Transform2D& t){
    for(auto& path : paths_)
        for(auto& pt : path) pt = toPoint64(t.apply(toVec2(pt)));
    // reflections flip orientation, so renormalise
    if(t.a * t.d - t.b * t.c < 0.0) paths_ = Union(paths_, FillRule::NonZero);
}

Shape unionAll(const std::vector<Shape>& shapes){
    Paths64 all;
    for(const auto& s : shapes) all.insert(all.end(), s.paths().begin(), s.paths().end());
    if(all.empty()) return Shape();
    return Shape(Union(all, FillRule::NonZero));
}

// ---- Circle ----
Circle::Circle(Vec2 center, double radius, int resolution)
    : center_(center), radius_(radius), resolution_(resolution), core_(center){
    if(!std::isfinite(radius) || radius <= 0.0)
        throw std::invalid_argument("circle radius must be positive and finite");
    if(!std::isfinite(center.x) || !std::isfinite(center.y))
        throw std::invalid_argument("circle center must be finite");
    if(resolution < 1)
        throw std::invalid_argument("circle resolution must be at least 1");
    rebuildShape();
}

void Circle::rebuildShape(){
    int n = 4 * resolution_;
    Path64 ring; ring.reserve(n);
    for(int i=0;i<n;++i){
        double ang = 2.0 * MATH_PI * i / n;
        ring.push_back(toPoint64({center_.x + radius_ * std::cos(ang),
                                  center_.y + radius_ * std::sin(ang)}));
    }
    shape_ = Shape(Paths64{ring});
}

bool Circle::overlaps(const Circle& other) const {
    if(distance(center_, other.center_) >= radius_ + other.radius_) return false;
    return shape_.intersection(other.shape_).area() > 0.0;
}

Vec2 Circle::nearestBoundaryPoint(const Circle& other) const {
    double d = distance(center_, other.center_);
    if(d == 0.0) return center_ + Vec2{radius_, 0.0};
    Vec2 u = (other.center_ - center_) / d;
    double ro = other.radius_;
    if(d >= radius_ + ro) return center_ + u * radius_;
    if(d <= std::abs(radius_ - ro)){
        return radius_ >= ro ? center_ + u * radius_ : center_ - u * radius_;
    }
    // boundaries cross: one of the two intersection points
    double a = (d * d + radius_ * radius_ - ro * ro) / (2.0 * d);
    double h = std::sqrt(std::max(0.0, radius_ * radius_ - a * a));
    Vec2 perp{-u.y, u.x};
    return center_ + u * a + perp * h;
}

Circle Circle::transformed(const Transform2D& t) const {
    Circle out(*this);
    out.transformInPlace(t);
    return out;
}

void Circle::transformInPlace(const Transform2D& t){
    if(!t.isRigid())
        throw std::invalid_argument("circle transform must be rigid, use scalePositionInPlace to move centers");
    center_ = t.apply(center_);
    core_ = t.apply(core_);
    shape_.transformInPlace(t);
}

Circle Circle::positionScaled(double factor, Vec2 origin) const {
    Circle out(*this);
    out.scalePositionInPlace(factor, origin);
    return out;
}

void Circle::scalePositionInPlace(double factor, Vec2 origin){
    Transform2D t = Transform2D::scaling(factor, origin);
    center_ = t.apply(center_);
    core_ = t.apply(core_);
    rebuildShape();
}
