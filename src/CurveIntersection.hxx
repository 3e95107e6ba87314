#ifndef BZSECT_CURVE_INTERSECTION_HXX
#define BZSECT_CURVE_INTERSECTION_HXX

#include "Bezier.hxx"
#include "CurveArena.hxx"
#include <cstddef>
#include <vector>

// Geometric (subdivision based) intersection of two planar Bezier curves.
//
// The search runs in rounds. A round looks at every candidate pair of curve
// segments and either drops it (disjoint boxes), resolves it (both pieces are
// close to lines, or the boxes only touch), or replaces it with finer pairs
// for the next round. Callers own the loop so they can bound the number of
// rounds; see CurveIntersector for the stock driver.

// Outcome codes that callers branch on. The first three come out of the
// linearized decision procedure; the last two are only produced by drivers
// that enforce a budget.
enum class IntersectStatus {
    Success,
    Parallel,          // chords parallel, pair not resolvable by this method
    WiggleFail,        // refined parameter outside [0, 1] beyond tolerance
    SingularJacobian,  // Newton step had a zero determinant or overflowed
    TooManyCandidates,
    NoConvergence
};

const char* statusName(IntersectStatus status);

enum class BoxIntersectionType { Intersection, Tangent, Disjoint };

// Which side(s) of a candidate pair to split for the next round.
enum class Subdivide { First, Second, Both, Neither };

// Half the bits of a double: below this a segment is treated as its chord.
constexpr double LINEARIZATION_THRESHOLD = 1.4901161193847656e-08; // 2^-26
// Slack on chord parameters for segments that are only nearly linear.
constexpr double CHORD_PARAM_SLACK = 1.52587890625e-05; // 2^-16

// An intersection on the root curves, s on `first` and t on `second`.
struct Intersection {
    double s = -1.0;
    double t = -1.0;
    CurveHandle first = 0;
    CurveHandle second = 0;
};

// Append-only record of intersections found by one query.
// Repeated points reached through different candidate paths are all kept.
class IntersectionStore {
public:
    void add(CurveHandle first, double s, CurveHandle second, double t);

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const Intersection& operator[](std::size_t i) const { return records_[i]; }
    const std::vector<Intersection>& records() const { return records_; }

    std::vector<Intersection>::const_iterator begin() const { return records_.begin(); }
    std::vector<Intersection>::const_iterator end() const { return records_.end(); }

private:
    std::vector<Intersection> records_;
};

struct CandidatePair {
    CurveSegment first;
    CurveSegment second;
};

using CandidateList = std::vector<CandidatePair>;

// Result of intersecting two nearly linear segments.
struct LinearizedResult {
    struct ParamPair { double s; double t; };

    IntersectStatus status = IntersectStatus::Success;
    // Root-domain parameters; empty when the chords miss each other.
    // Two entries only for overlapping collinear lines (ends of the overlap).
    std::vector<ParamPair> params;

    bool failed() const { return status != IntersectStatus::Success; }
    bool intersects() const { return status == IntersectStatus::Success && !params.empty(); }

    static LinearizedResult miss() { return LinearizedResult{}; }
    static LinearizedResult hit(double s, double t) {
        LinearizedResult r;
        r.params.push_back(ParamPair{s, t});
        return r;
    }
    static LinearizedResult failure(IntersectStatus status) {
        LinearizedResult r;
        r.status = status;
        return r;
    }
};

namespace CurveIntersection {

// Upper bound on the distance between a segment and its chord.
double linearizationError(const std::vector<Bezier::Point>& nodes);

// Intersect start0->end0 with start1->end1. Returns false iff the directions
// are exactly parallel; s and t are not clamped to [0, 1].
bool segmentIntersection(const Bezier::Point& start0, const Bezier::Point& end0,
                         const Bezier::Point& start1, const Bezier::Point& end1,
                         double& s, double& t);

// One Newton step on B1(s) = B2(t). Returns false (outputs untouched) if the
// Jacobian is singular or the update is not finite.
bool newtonRefineIntersect(double s, const std::vector<Bezier::Point>& nodes1,
                           double t, const std::vector<Bezier::Point>& nodes2,
                           double& newS, double& newT);

BoxIntersectionType bboxIntersect(const std::vector<Bezier::Point>& nodes1,
                                  const std::vector<Bezier::Point>& nodes2);

// Box of `nodes` against the segment lineStart->lineEnd. Never Tangent.
BoxIntersectionType bboxLineIntersect(const std::vector<Bezier::Point>& nodes,
                                      const Bezier::Point& lineStart,
                                      const Bezier::Point& lineEnd);

// For two parallel segments: true if they do not share any point.
bool parallelDifferent(const Bezier::Point& start0, const Bezier::Point& end0,
                       const Bezier::Point& start1, const Bezier::Point& end1);

// Decision procedure for two segments whose linearization errors are below
// LINEARIZATION_THRESHOLD. `root1`/`root2` are the full curves the segments
// were cut from.
LinearizedResult fromLinearized(double error1, const CurveSegment& first, const Bezier& root1,
                                double error2, const CurveSegment& second, const Bezier& root2);

IntersectStatus addFromLinearized(const CurveArena& arena,
                                  const CurveSegment& first, const CurveSegment& second,
                                  IntersectionStore& intersections);

// Record an intersection if the two nodes coincide; s and t are the local
// parameters (0 or 1) of the nodes on their segments.
void endpointCheck(const CurveSegment& first, const Bezier::Point& nodeFirst, double s,
                   const CurveSegment& second, const Bezier::Point& nodeSecond, double t,
                   IntersectionStore& intersections);

void tangentBBoxIntersection(const CurveSegment& first, const CurveSegment& second,
                             IntersectionStore& intersections);

void addCandidates(CandidateList& candidates,
                   const CurveSegment& first, const CurveSegment& second,
                   Subdivide which);

// Process every pair in `candidates`. Pairs that need more work are
// appended to `nextCandidates` (cleared first). Stops at the first pair
// whose linearized intersection fails and returns that status.
IntersectStatus intersectOneRound(const CurveArena& arena,
                                  const CandidateList& candidates,
                                  IntersectionStore& intersections,
                                  CandidateList& nextCandidates);

} // namespace CurveIntersection

#endif // BZSECT_CURVE_INTERSECTION_HXX
