#ifndef BZSECT_CURVE_INTERSECTOR_HXX
#define BZSECT_CURVE_INTERSECTOR_HXX

#include "CurveArena.hxx"
#include "CurveIntersection.hxx"
#include <cstddef>
#include <string>

// CurveIntersector: runs CurveIntersection::intersectOneRound until the
// candidate list is empty, with a hard limit on the number of rounds and on
// the number of candidate pairs alive at once.
//
// Each round halves the surviving segments, so the linearization error of a
// curved segment drops by a factor of 4 per round; 20 rounds are enough for
// any reasonably scaled input to reach LINEARIZATION_THRESHOLD.
class CurveIntersector {
public:
    explicit CurveIntersector(int maxRounds = 20, std::size_t maxCandidates = 64)
        : maxRounds_(maxRounds), maxCandidates_(maxCandidates) {}

    int maxRounds() const { return maxRounds_; }
    std::size_t maxCandidates() const { return maxCandidates_; }

    // Intersect curves `first` and `second` of the arena, appending to
    // `intersections`. Records found before a failure are kept.
    IntersectStatus allIntersections(const CurveArena& arena,
                                     CurveHandle first, CurveHandle second,
                                     IntersectionStore& intersections,
                                     std::string* errorMessage = nullptr) const;

private:
    int maxRounds_;
    std::size_t maxCandidates_;
};

#endif // BZSECT_CURVE_INTERSECTOR_HXX
