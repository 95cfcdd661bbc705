#pragma once
#include <clipper2/clipper.h>
#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>
using namespace Clipper2Lib;

// Fixed-point scale: Clipper2 integer units per length unit
constexpr double SCALE = 1e6;
// Quarter-circle segment count of a discretised disk (4 * 128 vertices)
constexpr int DEFAULT_RESOLUTION = 128;

inline int64_t I64(double v) { return static_cast<int64_t>(std::llround(v * SCALE)); }
inline double Dbl(int64_t v) { return double(v) / SCALE; }

// ---- 2D point / vector ----
struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator-(Vec2 a) { return {-a.x, -a.y}; }
inline Vec2 operator*(Vec2 a, double s) { return {a.x * s, a.y * s}; }
inline Vec2 operator/(Vec2 a, double s) { return {a.x / s, a.y / s}; }
inline Vec2& operator+=(Vec2& a, Vec2 b) { a.x += b.x; a.y += b.y; return a; }
inline bool operator==(Vec2 a, Vec2 b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Vec2 a, Vec2 b) { return !(a == b); }
inline double norm(Vec2 a) { return std::hypot(a.x, a.y); }
inline double distance(Vec2 a, Vec2 b) { return norm(b - a); }
inline Point64 toPoint64(Vec2 p) { return Point64(I64(p.x), I64(p.y)); }
inline Vec2 toVec2(const Point64& p) { return {Dbl(p.x), Dbl(p.y)}; }

// Affine map x' = [a b; c d] x + t
struct Transform2D {
    double a = 1.0, b = 0.0, c = 0.0, d = 1.0;
    double tx = 0.0, ty = 0.0;

    Vec2 apply(Vec2 p) const { return {a * p.x + b * p.y + tx, c * p.x + d * p.y + ty}; }
    Vec2 applyLinear(Vec2 v) const { return {a * v.x + b * v.y, c * v.x + d * v.y}; }
    // orthonormal linear part: rotation or reflection plus translation
    bool isRigid(double tol = 1e-9) const {
        return std::abs(a * a + c * c - 1.0) <= tol && std::abs(b * b + d * d - 1.0) <= tol &&
               std::abs(a * b + c * d) <= tol;
    }

    static Transform2D translation(Vec2 shift);
    static Transform2D rotation(double angleDeg, Vec2 origin);
    static Transform2D scaling(double factor, Vec2 origin);
};

// ---- two-point line ----
struct Segment {
    Vec2 p0;
    Vec2 p1;

    Vec2 midPoint() const { return (p0 + p1) * 0.5; }
    double length() const { return distance(p0, p1); }
    // unit vector perpendicular to p0->p1, (dy, -dx) / length
    Vec2 perpendicular() const;
    // p0 at t = 0, p1 at t = 1
    Vec2 at(double t) const { return p0 * (1.0 - t) + p1 * t; }
    Segment extended(double factor) const;
    Segment withLength(double newLength) const;
    Segment centeredAt(Vec2 center) const;
    Segment transformed(const Transform2D& t) const { return {t.apply(p0), t.apply(p1)}; }
};

// ---- polygon set over Clipper2 paths ----
// Outer rings are counter-clockwise, holes clockwise (Clipper2 output orientation).
class Shape {
public:
    Shape() = default;
    explicit Shape(Paths64 paths) : paths_(std::move(paths)) {}

    static Shape fromRing(const std::vector<Vec2>& ring);

    const Paths64& paths() const { return paths_; }
    bool empty() const { return paths_.empty(); }
    double area() const;
    Vec2 centroid() const;
    Rect64 bounds() const;

    Shape unionWith(const Shape& other) const;
    Shape difference(const Shape& other) const;
    Shape intersection(const Shape& other) const;
    Shape convexHull() const;

    // drops rings that are points/lines left over by a boolean chain
    Shape polygonsOnly() const;
    std::vector<Shape> components() const;
    Shape largestComponent() const;
    // cuts along the (infinite) line through `line` and keeps one fragment
    Shape splitByLine(const Segment& line, bool returnLargest) const;

    Shape transformed(const Transform2D& t) const;
    void transformInPlace(const Transform2D& t);
    Shape translated(Vec2 shift) const { return transformed(Transform2D::translation(shift)); }
    Shape rotated(double angleDeg, Vec2 origin) const { return transformed(Transform2D::rotation(angleDeg, origin)); }
    Shape scaled(double factor, Vec2 origin) const { return transformed(Transform2D::scaling(factor, origin)); }

private:
    Paths64 paths_;
};

Shape unionAll(const std::vector<Shape>& shapes);
Path64 convexHull(const std::vector<Point64>& pts);

// ---- fiber disk ----
// The disk moves only through explicit transforms. `core` is tracked separately
// and is the only field the fusion optimizers move.
class Circle {
public:
    Circle(Vec2 center, double radius, int resolution = DEFAULT_RESOLUTION);

    Vec2 center() const { return center_; }
    double radius() const { return radius_; }
    int resolution() const { return resolution_; }
    const Shape& shape() const { return shape_; }
    double area() const { return shape_.area(); }

    Vec2 core() const { return core_; }
    void setCore(Vec2 core) { core_ = core; }
    void shiftCore(Vec2 shift) { core_ += shift; }

    // strictly positive overlap; boundary contact does not count
    bool overlaps(const Circle& other) const;
    // point of this boundary closest to the other boundary
    Vec2 nearestBoundaryPoint(const Circle& other) const;

    // rigid motions: center and core follow, radius is kept. Throws
    // std::invalid_argument for any other affine map.
    Circle transformed(const Transform2D& t) const;
    void transformInPlace(const Transform2D& t);
    Circle translated(Vec2 shift) const { return transformed(Transform2D::translation(shift)); }
    void translateInPlace(Vec2 shift) { transformInPlace(Transform2D::translation(shift)); }
    Circle rotated(double angleDeg, Vec2 origin) const { return transformed(Transform2D::rotation(angleDeg, origin)); }
    void rotateInPlace(double angleDeg, Vec2 origin) { transformInPlace(Transform2D::rotation(angleDeg, origin)); }

    // moves the center (and core) toward `origin` by `factor`; the radius is unchanged
    Circle positionScaled(double factor, Vec2 origin = {}) const;
    void scalePositionInPlace(double factor, Vec2 origin = {});

private:
    void rebuildShape();

    Vec2 center_;
    double radius_;
    int resolution_;
    Vec2 core_;
    Shape shape_;
};
