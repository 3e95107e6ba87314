#include "CurveArena.hxx"

#include <stdexcept>
#include <string>

std::pair<CurveSegment, CurveSegment> subdivide(const CurveSegment& segment) {
    CurveSegment left, right;
    Bezier::splitNodes(segment.nodes, left.nodes, right.nodes);
    const double middle = 0.5 * (segment.start + segment.end);
    left.start = segment.start;
    left.end = middle;
    right.start = middle;
    right.end = segment.end;
    left.root = segment.root;
    right.root = segment.root;
    return std::make_pair(std::move(left), std::move(right));
}

CurveHandle CurveArena::add(const Bezier& curve) {
    std::string why;
    if (!curve.isValid(&why)) {
        throw std::runtime_error(std::string("Invalid Bezier curve: ") + why);
    }
    curves_.push_back(curve);
    return curves_.size() - 1;
}

const Bezier& CurveArena::curve(CurveHandle handle) const {
    if (handle >= curves_.size()) {
        throw std::out_of_range("Curve handle not found in arena");
    }
    return curves_[handle];
}

CurveSegment CurveArena::rootSegment(CurveHandle handle) const {
    CurveSegment seg;
    seg.nodes = curve(handle).controlPoints();
    seg.start = 0.0;
    seg.end = 1.0;
    seg.root = handle;
    return seg;
}
