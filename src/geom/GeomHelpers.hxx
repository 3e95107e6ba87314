#ifndef BZSECT_GEOM_HELPERS_HXX
#define BZSECT_GEOM_HELPERS_HXX

#include "Bezier.hxx"
#include <vector>

namespace GeomHelpers {

// Relative tolerance for vectorClose() (2^-40).
constexpr double VECTOR_CLOSE_EPS = 9.094947017729282e-13;
// Snapping radius used by wiggleInterval() (2^-44).
constexpr double WIGGLE = 5.684341886080802e-14;

struct BBox {
    double left;
    double right;
    double bottom;
    double top;
};

// z-component of the 3D cross product of (a, 0) and (b, 0).
double crossProduct(const Bezier::Point& a, const Bezier::Point& b);

// Axis-aligned box of a non-empty node set.
BBox bbox(const std::vector<Bezier::Point>& nodes);

// start <= value <= end
bool inInterval(double value, double start, double end);

// Snap a value that is within WIGGLE of [0, 1] into the interval.
// Returns false (and leaves result untouched) when it is further out.
bool wiggleInterval(double value, double& result);

// |a - b| <= eps * min(|a|, |b|), or |other| <= eps when one side is zero.
bool vectorClose(const Bezier::Point& a, const Bezier::Point& b, double eps = VECTOR_CLOSE_EPS);

} // namespace GeomHelpers

#endif // BZSECT_GEOM_HELPERS_HXX
