#include "GeomHelpers.hxx"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
static inline double norm2(double x, double y) { return std::sqrt(x * x + y * y); }
}

namespace GeomHelpers {

double crossProduct(const Bezier::Point& a, const Bezier::Point& b) {
    return a[0] * b[1] - a[1] * b[0];
}

BBox bbox(const std::vector<Bezier::Point>& nodes) {
    if (nodes.empty()) throw std::runtime_error("Bounding box of an empty node set");
    BBox b{nodes[0][0], nodes[0][0], nodes[0][1], nodes[0][1]};
    for (const auto& p : nodes) {
        b.left = std::min(b.left, p[0]);
        b.right = std::max(b.right, p[0]);
        b.bottom = std::min(b.bottom, p[1]);
        b.top = std::max(b.top, p[1]);
    }
    return b;
}

bool inInterval(double value, double start, double end) {
    return start <= value && value <= end;
}

bool wiggleInterval(double value, double& result) {
    if (-WIGGLE < value && value < WIGGLE) {
        result = 0.0;
    } else if (WIGGLE <= value && value <= 1.0 - WIGGLE) {
        result = value;
    } else if (1.0 - WIGGLE < value && value < 1.0 + WIGGLE) {
        result = 1.0;
    } else {
        return false;
    }
    return true;
}

bool vectorClose(const Bezier::Point& a, const Bezier::Point& b, double eps) {
    const double sizeA = norm2(a[0], a[1]);
    const double sizeB = norm2(b[0], b[1]);
    if (sizeA == 0.0) return sizeB <= eps;
    if (sizeB == 0.0) return sizeA <= eps;
    const double upper = eps * std::min(sizeA, sizeB);
    return norm2(a[0] - b[0], a[1] - b[1]) <= upper;
}

} // namespace GeomHelpers
