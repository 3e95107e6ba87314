#include "CurveIntersector.hxx"

#include <sstream>

namespace {
static void setError(std::string* errorMessage, const std::string& text) {
    if (errorMessage) *errorMessage = text;
}
} // anonymous namespace

IntersectStatus CurveIntersector::allIntersections(const CurveArena& arena,
                                                   CurveHandle first, CurveHandle second,
                                                   IntersectionStore& intersections,
                                                   std::string* errorMessage) const {
    CandidateList candidates;
    candidates.push_back(CandidatePair{arena.rootSegment(first), arena.rootSegment(second)});
    CandidateList next;

    for (int round = 0; round < maxRounds_; ++round) {
        const IntersectStatus status =
            CurveIntersection::intersectOneRound(arena, candidates, intersections, next);
        if (status != IntersectStatus::Success) {
            std::ostringstream oss;
            oss << "Round " << round << " failed with " << statusName(status)
                << " (curves " << first << " and " << second << ")";
            setError(errorMessage, oss.str());
            return status;
        }
        if (next.size() > maxCandidates_) {
            std::ostringstream oss;
            oss << "Too many candidate pairs after round " << round << ": "
                << next.size() << " > " << maxCandidates_;
            setError(errorMessage, oss.str());
            return IntersectStatus::TooManyCandidates;
        }
        if (next.empty()) return IntersectStatus::Success;
        candidates.swap(next);
    }

    std::ostringstream oss;
    oss << "Curve intersection did not converge after " << maxRounds_ << " rounds ("
        << candidates.size() << " candidate pairs left)";
    setError(errorMessage, oss.str());
    return IntersectStatus::NoConvergence;
}
