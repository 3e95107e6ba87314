#ifndef BZSECT_CURVE_ARENA_HXX
#define BZSECT_CURVE_ARENA_HXX

#include "Bezier.hxx"
#include <cstddef>
#include <utility>
#include <vector>

// Root curves live once in a CurveArena and are referred to by index.
// Segments produced by subdivision carry the handle of the curve they came
// from plus their own sub-interval [start, end] of that curve's domain, so
// parameters found on a segment can always be reported on the root curve.
using CurveHandle = std::size_t;

struct CurveSegment {
    std::vector<Bezier::Point> nodes; // control points of this piece
    double start = 0.0;               // sub-interval of the root domain
    double end = 1.0;
    CurveHandle root = 0;

    const Bezier::Point& firstNode() const { return nodes.front(); }
    const Bezier::Point& lastNode() const { return nodes.back(); }

    // Affine map from the segment's local [0, 1] into the root domain.
    double mapParameter(double local) const { return (1.0 - local) * start + local * end; }
};

// Halves a segment with de Casteljau; both children keep the root handle.
std::pair<CurveSegment, CurveSegment> subdivide(const CurveSegment& segment);

class CurveArena {
public:
    CurveArena() = default;

    // Stores a copy of the curve. Throws std::runtime_error if invalid.
    CurveHandle add(const Bezier& curve);

    // Throws std::out_of_range for a handle not issued by this arena.
    const Bezier& curve(CurveHandle handle) const;

    // The whole curve as a segment over [0, 1].
    CurveSegment rootSegment(CurveHandle handle) const;

    std::size_t size() const { return curves_.size(); }
    bool empty() const { return curves_.empty(); }

private:
    std::vector<Bezier> curves_;
};

#endif // BZSECT_CURVE_ARENA_HXX
