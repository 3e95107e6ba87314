#include <gtest/gtest.h>
#include "CurveIntersector.hxx"
#include <algorithm>
#include <cmath>
#include <vector>

static CurveHandle addCurve(CurveArena& arena, const std::vector<Bezier::Point>& nodes) {
    return arena.add(Bezier(nodes));
}

// Records sorted by s, so tests do not depend on candidate order.
static std::vector<Intersection> sortedRecords(const IntersectionStore& store) {
    std::vector<Intersection> out(store.begin(), store.end());
    std::sort(out.begin(), out.end(),
              [](const Intersection& a, const Intersection& b) { return a.s < b.s; });
    return out;
}

static double distance(const Bezier::Point& a, const Bezier::Point& b) {
    return std::hypot(a[0] - b[0], a[1] - b[1]);
}

TEST(CurveIntersector, DefaultLimits) {
    CurveIntersector intersector;
    EXPECT_EQ(intersector.maxRounds(), 20);
    EXPECT_EQ(intersector.maxCandidates(), 64u);
}

TEST(CurveIntersector, CrossingLines) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {2.0, 2.0} });
    CurveHandle b = addCurve(arena, { {0.0, 2.0}, {2.0, 0.0} });
    IntersectionStore found;
    ASSERT_EQ(CurveIntersector().allIntersections(arena, a, b, found), IntersectStatus::Success);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].s, 0.5);
    EXPECT_EQ(found[0].t, 0.5);
    EXPECT_EQ(found[0].first, a);
    EXPECT_EQ(found[0].second, b);
}

TEST(CurveIntersector, ParabolaAndLine) {
    // 4s(1 - s) = 1/2  =>  s = 1/2 -+ sqrt(2)/4
    CurveArena arena;
    CurveHandle curve = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    CurveHandle line = addCurve(arena, { {0.0, 0.5}, {2.0, 0.5} });
    IntersectionStore found;
    std::string err;
    ASSERT_EQ(CurveIntersector().allIntersections(arena, curve, line, found, &err),
              IntersectStatus::Success) << err;
    auto recs = sortedRecords(found);
    ASSERT_EQ(recs.size(), 2u);
    const double r = std::sqrt(2.0) / 4.0;
    EXPECT_NEAR(recs[0].s, 0.5 - r, 1e-15);
    EXPECT_NEAR(recs[0].t, 0.5 - r, 1e-15);
    EXPECT_NEAR(recs[1].s, 0.5 + r, 1e-15);
    EXPECT_NEAR(recs[1].t, 0.5 + r, 1e-15);
}

TEST(CurveIntersector, TwoParabolas) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {0.0, 1.0}, {1.0, -1.0}, {2.0, 1.0} });
    IntersectionStore found;
    ASSERT_EQ(CurveIntersector().allIntersections(arena, a, b, found), IntersectStatus::Success);
    auto recs = sortedRecords(found);
    ASSERT_EQ(recs.size(), 2u);
    for (const auto& rec : recs) {
        EXPECT_LT(distance(arena.curve(a).evaluate(rec.s), arena.curve(b).evaluate(rec.t)), 1e-14);
        EXPECT_NEAR(rec.s, rec.t, 1e-15);
    }
    EXPECT_NEAR(recs[0].s, 0.5 - std::sqrt(2.0) / 4.0, 1e-15);
}

TEST(CurveIntersector, CubicAndLineKeepsDuplicates) {
    // y(s) vanishes at s = 1/2 and s = 1/2 -+ sqrt(15)/10. The middle root
    // sits on a subdivision point, so it is reached from both halves.
    CurveArena arena;
    CurveHandle cubic = addCurve(arena, { {0.0, -1.0}, {1.0, 3.0}, {2.0, -3.0}, {3.0, 1.0} });
    CurveHandle line = addCurve(arena, { {-0.5, 0.0}, {3.5, 0.0} });
    IntersectionStore found;
    ASSERT_EQ(CurveIntersector().allIntersections(arena, cubic, line, found), IntersectStatus::Success);
    auto recs = sortedRecords(found);
    ASSERT_EQ(recs.size(), 4u);
    const double r = std::sqrt(15.0) / 10.0;
    EXPECT_NEAR(recs[0].s, 0.5 - r, 1e-14);
    EXPECT_EQ(recs[1].s, 0.5);
    EXPECT_EQ(recs[1].t, 0.5);
    EXPECT_EQ(recs[2].s, 0.5);
    EXPECT_EQ(recs[2].t, 0.5);
    EXPECT_NEAR(recs[3].s, 0.5 + r, 1e-14);
    for (const auto& rec : recs) {
        EXPECT_LT(distance(arena.curve(cubic).evaluate(rec.s), arena.curve(line).evaluate(rec.t)), 1e-14);
    }
}

TEST(CurveIntersector, SharedEndpoint) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {1.0, 1.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {2.0, 0.0}, {3.0, 1.0}, {4.0, 0.0} });
    IntersectionStore found;
    ASSERT_EQ(CurveIntersector().allIntersections(arena, a, b, found), IntersectStatus::Success);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].s, 1.0);
    EXPECT_EQ(found[0].t, 0.0);
}

TEST(CurveIntersector, FarApartCurves) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {100.0, 100.0}, {101.0, 102.0}, {102.0, 100.0} });
    IntersectionStore found;
    EXPECT_EQ(CurveIntersector().allIntersections(arena, a, b, found), IntersectStatus::Success);
    EXPECT_TRUE(found.empty());
}

TEST(CurveIntersector, ParallelDegreeElevatedLines) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {1.0, 0.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {0.0, 1.0}, {1.0, 1.0}, {2.0, 1.0} });
    IntersectionStore found;
    EXPECT_EQ(CurveIntersector().allIntersections(arena, a, b, found), IntersectStatus::Success);
    EXPECT_TRUE(found.empty());
}

TEST(CurveIntersector, CollinearOverlapReportsSpanEnds) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {1.0, 0.0}, {3.0, 0.0} });
    IntersectionStore found;
    ASSERT_EQ(CurveIntersector().allIntersections(arena, a, b, found), IntersectStatus::Success);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].s, 0.5);
    EXPECT_EQ(found[0].t, 0.0);
    EXPECT_EQ(found[1].s, 1.0);
    EXPECT_EQ(found[1].t, 0.5);
}

TEST(CurveIntersector, RoundBudgetExhausted) {
    CurveArena arena;
    CurveHandle curve = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    CurveHandle line = addCurve(arena, { {0.0, 0.5}, {2.0, 0.5} });
    IntersectionStore found;
    std::string err;
    EXPECT_EQ(CurveIntersector(5).allIntersections(arena, curve, line, found, &err),
              IntersectStatus::NoConvergence);
    EXPECT_NE(err.find("did not converge after 5 rounds"), std::string::npos) << err;
    EXPECT_TRUE(found.empty());
}

TEST(CurveIntersector, CandidateLimitExceeded) {
    // Round 0 splits both parabolas into four pairs.
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {0.0, 1.0}, {1.0, -1.0}, {2.0, 1.0} });
    IntersectionStore found;
    std::string err;
    EXPECT_EQ(CurveIntersector(20, 3).allIntersections(arena, a, b, found, &err),
              IntersectStatus::TooManyCandidates);
    EXPECT_NE(err.find("Too many candidate pairs"), std::string::npos) << err;
}

TEST(CurveIntersector, ErrorMessageIsOptional) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {0.0, 0.5}, {2.0, 0.5} });
    IntersectionStore found;
    EXPECT_EQ(CurveIntersector(1).allIntersections(arena, a, b, found), IntersectStatus::NoConvergence);
}

TEST(CurveIntersector, AppendsToExistingStore) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {2.0, 2.0} });
    CurveHandle b = addCurve(arena, { {0.0, 2.0}, {2.0, 0.0} });
    CurveHandle c = addCurve(arena, { {1.0, -1.0}, {1.0, 3.0} });
    CurveIntersector intersector;
    IntersectionStore found;
    ASSERT_EQ(intersector.allIntersections(arena, a, b, found), IntersectStatus::Success);
    ASSERT_EQ(intersector.allIntersections(arena, a, c, found), IntersectStatus::Success);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[1].first, a);
    EXPECT_EQ(found[1].second, c);
    EXPECT_EQ(found[1].s, 0.5);
    EXPECT_EQ(found[1].t, 0.5);
}

TEST(CurveIntersector, StatusNames) {
    EXPECT_STREQ(statusName(IntersectStatus::Success), "SUCCESS");
    EXPECT_STREQ(statusName(IntersectStatus::Parallel), "PARALLEL");
    EXPECT_STREQ(statusName(IntersectStatus::WiggleFail), "WIGGLE_FAILURE");
    EXPECT_STREQ(statusName(IntersectStatus::SingularJacobian), "SINGULAR_JACOBIAN");
    EXPECT_STREQ(statusName(IntersectStatus::TooManyCandidates), "TOO_MANY_CANDIDATES");
    EXPECT_STREQ(statusName(IntersectStatus::NoConvergence), "NO_CONVERGENCE");
}

TEST(CurveIntersector, TangentAtSharedEndpointNeedsFallback) {
    // Both curves end at (2, 0) with parallel tangents. Pairs near the touch
    // point never separate, so the candidate limit trips before anything is
    // recorded.
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {2.0, 0.0}, {1.5, 1.0}, {3.0, 1.0} });
    IntersectionStore found;
    EXPECT_EQ(CurveIntersector().allIntersections(arena, a, b, found), IntersectStatus::TooManyCandidates);
    EXPECT_TRUE(found.empty());
}

TEST(CurveIntersector, IdenticalCurvesNeedFallback) {
    CurveArena arena;
    CurveHandle a = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    CurveHandle b = addCurve(arena, { {0.0, 0.0}, {1.0, 2.0}, {2.0, 0.0} });
    IntersectionStore found;
    std::string err;
    EXPECT_EQ(CurveIntersector().allIntersections(arena, a, b, found, &err),
              IntersectStatus::TooManyCandidates);
    EXPECT_NE(err.find("after round 5"), std::string::npos) << err;
    // Endpoint matches from touching boxes are kept, all on the diagonal s == t.
    ASSERT_FALSE(found.empty());
    for (const auto& rec : found) EXPECT_EQ(rec.s, rec.t);
}
