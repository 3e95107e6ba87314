#include "Bezier.hxx"
#include "BezIO.hxx"
#include "CurveArena.hxx"
#include "CurveIntersection.hxx"
#include "CurveIntersector.hxx"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

// Usage: intersect_curves <file.bez> [maxRounds]
// Prints one line "i j s t x y" per intersection of curves i < j.
int main(int argc, char** argv) {
	if (argc < 2) {
		std::fprintf(stderr, "usage: %s <file.bez> [maxRounds]\n", argv[0]);
		return 2;
	}
	int maxRounds = 20;
	if (argc >= 3) {
		maxRounds = std::atoi(argv[2]);
		if (maxRounds <= 0) { std::fprintf(stderr, "maxRounds must be positive\n"); return 2; }
	}

	std::vector<Bezier> curves;
	std::string err;
	if (!BezIO::readFile(argv[1], curves, &err)) {
		std::fprintf(stderr, "BEZ read failed: %s\n", err.c_str());
		return 1;
	}

	CurveArena arena;
	std::vector<CurveHandle> handles;
	try {
		for (const auto& c : curves) handles.push_back(arena.add(c));
	} catch (const std::exception& e) {
		std::fprintf(stderr, "%s\n", e.what());
		return 1;
	}

	CurveIntersector intersector(maxRounds);
	int failures = 0;
	for (std::size_t i = 0; i < handles.size(); ++i) {
		for (std::size_t j = i + 1; j < handles.size(); ++j) {
			IntersectionStore found;
			IntersectStatus status = intersector.allIntersections(arena, handles[i], handles[j], found, &err);
			if (status != IntersectStatus::Success) {
				std::fprintf(stderr, "curves %zu/%zu: %s\n", i, j, err.c_str());
				++failures;
			}
			for (const auto& rec : found) {
				const Bezier::Point p = arena.curve(rec.first).evaluate(rec.s);
				std::printf("%zu %zu %.17g %.17g %.17g %.17g\n", i, j, rec.s, rec.t, p[0], p[1]);
			}
		}
	}
	return failures == 0 ? 0 : 1;
}
