// Subdivision based intersection of planar Bezier curves.
#include "CurveIntersection.hxx"
#include "GeomHelpers.hxx"

#include <algorithm>
#include <cmath>

using GeomHelpers::crossProduct;
using GeomHelpers::inInterval;

namespace {
static inline Bezier::Point sub(const Bezier::Point& a, const Bezier::Point& b) {
    return Bezier::Point{a[0] - b[0], a[1] - b[1]};
}

static inline double dot(const Bezier::Point& a, const Bezier::Point& b) {
    return a[0] * b[0] + a[1] * b[1];
}

// Does the box edge edgeStart->edgeEnd cross the line (both parameters in [0, 1])?
static bool edgeCrossesLine(const Bezier::Point& edgeStart, const Bezier::Point& edgeEnd,
                            const Bezier::Point& lineStart, const Bezier::Point& lineEnd) {
    double s = 0.0, t = 0.0;
    if (!CurveIntersection::segmentIntersection(edgeStart, edgeEnd, lineStart, lineEnd, s, t)) {
        return false;
    }
    return inInterval(s, 0.0, 1.0) && inInterval(t, 0.0, 1.0);
}

// Snap both root parameters into [0, 1]; false if either is too far out.
static bool wiggleParams(double s, double t, LinearizedResult::ParamPair& out) {
    return GeomHelpers::wiggleInterval(s, out.s) && GeomHelpers::wiggleInterval(t, out.t);
}

// Two exact lines on the same infinite line that share a span. The chord
// parameters are exact curve parameters here, so no Newton step is taken.
static LinearizedResult collinearOverlap(const CurveSegment& first, const CurveSegment& second) {
    const Bezier::Point delta0 = sub(first.lastNode(), first.firstNode());
    const double norm0Sq = dot(delta0, delta0);
    if (norm0Sq == 0.0) return LinearizedResult::miss();

    // Parameters on `first` of second's start (t = 0) and end (t = 1).
    const double a = dot(sub(second.firstNode(), first.firstNode()), delta0) / norm0Sq;
    const double b = dot(sub(second.lastNode(), first.firstNode()), delta0) / norm0Sq;
    const double lo = std::max(0.0, std::min(a, b));
    const double hi = std::min(1.0, std::max(a, b));
    if (lo > hi || a == b) return LinearizedResult::miss();

    LinearizedResult result;
    const double ends[2] = {lo, hi};
    const int count = (lo == hi) ? 1 : 2;
    for (int k = 0; k < count; ++k) {
        const double s = ends[k];
        const double t = (s - a) / (b - a);
        LinearizedResult::ParamPair snapped{};
        if (!wiggleParams(first.mapParameter(s), second.mapParameter(t), snapped)) {
            return LinearizedResult::failure(IntersectStatus::WiggleFail);
        }
        result.params.push_back(snapped);
    }
    return result;
}
} // anonymous namespace

const char* statusName(IntersectStatus status) {
    switch (status) {
    case IntersectStatus::Success: return "SUCCESS";
    case IntersectStatus::Parallel: return "PARALLEL";
    case IntersectStatus::WiggleFail: return "WIGGLE_FAILURE";
    case IntersectStatus::SingularJacobian: return "SINGULAR_JACOBIAN";
    case IntersectStatus::TooManyCandidates: return "TOO_MANY_CANDIDATES";
    case IntersectStatus::NoConvergence: return "NO_CONVERGENCE";
    }
    return "UNKNOWN";
}

void IntersectionStore::add(CurveHandle first, double s, CurveHandle second, double t) {
    Intersection rec;
    rec.s = s;
    rec.t = t;
    rec.first = first;
    rec.second = second;
    records_.push_back(rec);
}

namespace CurveIntersection {

double linearizationError(const std::vector<Bezier::Point>& nodes) {
    const std::size_t n = nodes.size();
    // A line has no linearization error.
    if (n <= 2) return 0.0;

    double worstX = 0.0, worstY = 0.0;
    for (std::size_t i = 0; i + 2 < n; ++i) {
        const double dx = nodes[i][0] - 2.0 * nodes[i + 1][0] + nodes[i + 2][0];
        const double dy = nodes[i][1] - 2.0 * nodes[i + 1][1] + nodes[i + 2][1];
        worstX = std::max(worstX, std::fabs(dx));
        worstY = std::max(worstY, std::fabs(dy));
    }
    const double scale = 0.125 * static_cast<double>(n - 1) * static_cast<double>(n - 2);
    return scale * std::sqrt(worstX * worstX + worstY * worstY);
}

bool segmentIntersection(const Bezier::Point& start0, const Bezier::Point& end0,
                         const Bezier::Point& start1, const Bezier::Point& end1,
                         double& s, double& t) {
    const Bezier::Point delta0 = sub(end0, start0);
    const Bezier::Point delta1 = sub(end1, start1);
    const double crossD0D1 = crossProduct(delta0, delta1);
    if (crossD0D1 == 0.0) return false;

    const Bezier::Point startDelta = sub(start1, start0);
    s = crossProduct(startDelta, delta1) / crossD0D1;
    t = crossProduct(startDelta, delta0) / crossD0D1;
    return true;
}

bool newtonRefineIntersect(double s, const std::vector<Bezier::Point>& nodes1,
                           double t, const std::vector<Bezier::Point>& nodes2,
                           double& newS, double& newT) {
    const Bezier::Point funcVal = sub(Bezier::deCasteljau(nodes2, t), Bezier::deCasteljau(nodes1, s));
    if (funcVal[0] == 0.0 && funcVal[1] == 0.0) {
        newS = s;
        newT = t;
        return true;
    }

    // Rows B1'(s) and B2'(t). The system is [ds, dt] J = f with the second
    // row negated; the sign is folded into the explicit inverse below.
    const Bezier::Point jac1 = Bezier::hodograph(nodes1, s);
    const Bezier::Point jac2 = Bezier::hodograph(nodes2, t);
    const double determinant = jac1[0] * jac2[1] - jac1[1] * jac2[0];
    if (determinant == 0.0) return false;

    const double deltaS = (jac2[1] * funcVal[0] - jac2[0] * funcVal[1]) / determinant;
    const double deltaT = (jac1[1] * funcVal[0] - jac1[0] * funcVal[1]) / determinant;
    if (!std::isfinite(s + deltaS) || !std::isfinite(t + deltaT)) return false;
    newS = s + deltaS;
    newT = t + deltaT;
    return true;
}

BoxIntersectionType bboxIntersect(const std::vector<Bezier::Point>& nodes1,
                                  const std::vector<Bezier::Point>& nodes2) {
    const GeomHelpers::BBox b1 = GeomHelpers::bbox(nodes1);
    const GeomHelpers::BBox b2 = GeomHelpers::bbox(nodes2);

    if (b2.right < b1.left || b1.right < b2.left ||
        b2.top < b1.bottom || b1.top < b2.bottom) {
        return BoxIntersectionType::Disjoint;
    }
    if (b2.right == b1.left || b1.right == b2.left ||
        b2.top == b1.bottom || b1.top == b2.bottom) {
        return BoxIntersectionType::Tangent;
    }
    return BoxIntersectionType::Intersection;
}

BoxIntersectionType bboxLineIntersect(const std::vector<Bezier::Point>& nodes,
                                      const Bezier::Point& lineStart,
                                      const Bezier::Point& lineEnd) {
    const GeomHelpers::BBox b = GeomHelpers::bbox(nodes);

    if (inInterval(lineStart[0], b.left, b.right) && inInterval(lineStart[1], b.bottom, b.top)) {
        return BoxIntersectionType::Intersection;
    }
    if (inInterval(lineEnd[0], b.left, b.right) && inInterval(lineEnd[1], b.bottom, b.top)) {
        return BoxIntersectionType::Intersection;
    }

    // segmentIntersection() fails for an edge parallel to the line. Nothing
    // is lost: a parallel line that overlaps the box either has an endpoint
    // in it (handled above) or spans a whole side, and then crosses the two
    // edges that meet that side.
    const Bezier::Point bottomLeft{b.left, b.bottom};
    const Bezier::Point bottomRight{b.right, b.bottom};
    const Bezier::Point topRight{b.right, b.top};
    const Bezier::Point topLeft{b.left, b.top};
    if (edgeCrossesLine(bottomLeft, bottomRight, lineStart, lineEnd)) {
        return BoxIntersectionType::Intersection;
    }
    if (edgeCrossesLine(bottomRight, topRight, lineStart, lineEnd)) {
        return BoxIntersectionType::Intersection;
    }
    if (edgeCrossesLine(topRight, topLeft, lineStart, lineEnd)) {
        return BoxIntersectionType::Intersection;
    }
    // The left edge is skipped: with both endpoints outside the box the line
    // must cross at least two edges.
    return BoxIntersectionType::Disjoint;
}

bool parallelDifferent(const Bezier::Point& start0, const Bezier::Point& end0,
                       const Bezier::Point& start1, const Bezier::Point& end1) {
    const Bezier::Point delta0 = sub(end0, start0);
    const double line0Const = crossProduct(start0, delta0);
    const double start1Against = crossProduct(start1, delta0);
    if (line0Const != start1Against) return true;

    //      0 <= numer / norm0Sq <= 1
    // <==> 0 <= numer <= norm0Sq
    const double norm0Sq = dot(delta0, delta0);
    const double startNumer = dot(sub(start1, start0), delta0);
    if (0.0 <= startNumer && startNumer <= norm0Sq) return false;
    const double endNumer = dot(sub(end1, start0), delta0);
    if (0.0 <= endNumer && endNumer <= norm0Sq) return false;

    // Neither end is inside [0, 1]; they may still contain it between them.
    return 0.0 < std::min(startNumer, endNumer) || std::max(startNumer, endNumer) < 0.0;
}

LinearizedResult fromLinearized(double error1, const CurveSegment& first, const Bezier& root1,
                                double error2, const CurveSegment& second, const Bezier& root2) {
    double s = 0.0, t = 0.0;
    if (segmentIntersection(first.firstNode(), first.lastNode(),
                            second.firstNode(), second.lastNode(), s, t)) {
        // Exact lines get no leeway on almost-intersections.
        if (error1 == 0.0 && (s < 0.0 || 1.0 < s)) return LinearizedResult::miss();
        if (error2 == 0.0 && (t < 0.0 || 1.0 < t)) return LinearizedResult::miss();
        if (s < -CHORD_PARAM_SLACK || 1.0 + CHORD_PARAM_SLACK < s) return LinearizedResult::miss();
        if (t < -CHORD_PARAM_SLACK || 1.0 + CHORD_PARAM_SLACK < t) return LinearizedResult::miss();
    } else if (error1 == 0.0 && error2 == 0.0) {
        if (parallelDifferent(first.firstNode(), first.lastNode(),
                              second.firstNode(), second.lastNode())) {
            return LinearizedResult::miss();
        }
        return collinearOverlap(first, second);
    } else {
        if (bboxIntersect(root1.controlPoints(), root2.controlPoints()) == BoxIntersectionType::Disjoint) {
            return LinearizedResult::miss();
        }
        return LinearizedResult::failure(IntersectStatus::Parallel);
    }

    // Promote the chord parameters onto the root curves and polish them.
    const double origS = first.mapParameter(s);
    const double origT = second.mapParameter(t);
    double refinedS = origS, refinedT = origT;
    if (!newtonRefineIntersect(origS, root1.controlPoints(), origT, root2.controlPoints(),
                               refinedS, refinedT)) {
        return LinearizedResult::failure(IntersectStatus::SingularJacobian);
    }

    LinearizedResult::ParamPair snapped{};
    if (!wiggleParams(refinedS, refinedT, snapped)) {
        return LinearizedResult::failure(IntersectStatus::WiggleFail);
    }
    return LinearizedResult::hit(snapped.s, snapped.t);
}

IntersectStatus addFromLinearized(const CurveArena& arena,
                                  const CurveSegment& first, const CurveSegment& second,
                                  IntersectionStore& intersections) {
    const Bezier& root1 = arena.curve(first.root);
    const Bezier& root2 = arena.curve(second.root);
    const double error1 = linearizationError(first.nodes);
    const double error2 = linearizationError(second.nodes);

    const LinearizedResult result = fromLinearized(error1, first, root1, error2, second, root2);
    if (result.failed()) return result.status;
    for (const auto& p : result.params) {
        intersections.add(first.root, p.s, second.root, p.t);
    }
    return IntersectStatus::Success;
}

void endpointCheck(const CurveSegment& first, const Bezier::Point& nodeFirst, double s,
                   const CurveSegment& second, const Bezier::Point& nodeSecond, double t,
                   IntersectionStore& intersections) {
    if (!GeomHelpers::vectorClose(nodeFirst, nodeSecond)) return;
    intersections.add(first.root, first.mapParameter(s), second.root, second.mapParameter(t));
}

void tangentBBoxIntersection(const CurveSegment& first, const CurveSegment& second,
                             IntersectionStore& intersections) {
    const Bezier::Point& start1 = first.firstNode();
    const Bezier::Point& end1 = first.lastNode();
    const Bezier::Point& start2 = second.firstNode();
    const Bezier::Point& end2 = second.lastNode();

    endpointCheck(first, start1, 0.0, second, start2, 0.0, intersections);
    endpointCheck(first, start1, 0.0, second, end2, 1.0, intersections);
    endpointCheck(first, end1, 1.0, second, start2, 0.0, intersections);
    endpointCheck(first, end1, 1.0, second, end2, 1.0, intersections);
}

void addCandidates(CandidateList& candidates,
                   const CurveSegment& first, const CurveSegment& second,
                   Subdivide which) {
    switch (which) {
    case Subdivide::First: {
        auto halves = subdivide(first);
        candidates.push_back(CandidatePair{std::move(halves.first), second});
        candidates.push_back(CandidatePair{std::move(halves.second), second});
        break;
    }
    case Subdivide::Second: {
        auto halves = subdivide(second);
        candidates.push_back(CandidatePair{first, std::move(halves.first)});
        candidates.push_back(CandidatePair{first, std::move(halves.second)});
        break;
    }
    case Subdivide::Both: {
        const auto halves1 = subdivide(first);
        const auto halves2 = subdivide(second);
        candidates.push_back(CandidatePair{halves1.first, halves2.first});
        candidates.push_back(CandidatePair{halves1.first, halves2.second});
        candidates.push_back(CandidatePair{halves1.second, halves2.first});
        candidates.push_back(CandidatePair{halves1.second, halves2.second});
        break;
    }
    case Subdivide::Neither:
        break;
    }
}

IntersectStatus intersectOneRound(const CurveArena& arena,
                                  const CandidateList& candidates,
                                  IntersectionStore& intersections,
                                  CandidateList& nextCandidates) {
    nextCandidates.clear();
    for (const auto& pair : candidates) {
        const CurveSegment& first = pair.first;
        const CurveSegment& second = pair.second;
        const double error1 = linearizationError(first.nodes);
        const double error2 = linearizationError(second.nodes);

        BoxIntersectionType boxType = BoxIntersectionType::Disjoint;
        Subdivide which = Subdivide::Neither;
        if (error1 < LINEARIZATION_THRESHOLD) {
            if (error2 < LINEARIZATION_THRESHOLD) {
                // Both sides are (nearly) lines: intersect them right away.
                const IntersectStatus status = addFromLinearized(arena, first, second, intersections);
                if (status != IntersectStatus::Success) return status;
                continue;
            }
            which = Subdivide::Second;
            boxType = bboxLineIntersect(second.nodes, first.firstNode(), first.lastNode());
        } else if (error2 < LINEARIZATION_THRESHOLD) {
            which = Subdivide::First;
            boxType = bboxLineIntersect(first.nodes, second.firstNode(), second.lastNode());
        } else {
            which = Subdivide::Both;
            boxType = bboxIntersect(first.nodes, second.nodes);
        }

        if (boxType == BoxIntersectionType::Disjoint) continue;
        if (boxType == BoxIntersectionType::Tangent) {
            tangentBBoxIntersection(first, second, intersections);
            continue;
        }
        addCandidates(nextCandidates, first, second, which);
    }
    return IntersectStatus::Success;
}

} // namespace CurveIntersection
