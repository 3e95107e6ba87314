#include "Bezier.hxx"
#include "BezIO.hxx"

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

static Bezier makeLine(const Bezier::Point& a, const Bezier::Point& b) {
	return Bezier(std::vector<Bezier::Point>{a, b});
}

// Polynomial quarter-circle approximation of radius r (standard cubic with
// handle length k = 4/3 (sqrt(2) - 1)). qStart picks the quadrant as in
// 0 => 0->pi/2, 1 => pi/2->pi, 2 => pi->3pi/2, 3 => 3pi/2->2pi.
static Bezier makeQuarterArc(double r, int qStart) {
	const double k = 4.0 / 3.0 * (std::sqrt(2.0) - 1.0) * r;
	const Bezier::Point P[4] = { { r, 0 }, { 0, r }, { -r, 0 }, { 0, -r } };
	// Tangent directions (counter-clockwise) at the cardinal points
	const Bezier::Point D[4] = { { 0, 1 }, { -1, 0 }, { 0, -1 }, { 1, 0 } };
	const int a = ((qStart % 4) + 4) % 4;
	const int b = (a + 1) % 4;
	std::vector<Bezier::Point> cps = {
		P[a],
		{ P[a][0] + k * D[a][0], P[a][1] + k * D[a][1] },
		{ P[b][0] - k * D[b][0], P[b][1] - k * D[b][1] },
		P[b]
	};
	return Bezier(cps);
}

// Single high degree curve whose control points are samples of
// y = amp * sin(x) on [x0, x1] (a smooth wiggly test input).
static Bezier makeWave(double x0, double x1, double amp, int degree) {
	std::vector<Bezier::Point> pts;
	pts.reserve(static_cast<std::size_t>(degree + 1));
	for (int k = 0; k <= degree; ++k) {
		double x = x0 + (x1 - x0) * (static_cast<double>(k) / degree);
		pts.push_back(Bezier::Point{ x, amp * std::sin(x) });
	}
	return Bezier(pts);
}

int main() {
	// Set 1: unit circle from four cubic arcs crossed by two diagonals
	{
		std::vector<Bezier> curves;
		for (int q = 0; q < 4; ++q) curves.push_back(makeQuarterArc(1.0, q));
		curves.push_back(makeLine({-1.5, -1.25}, {1.5, 1.25}));
		curves.push_back(makeLine({-1.5, 1.0}, {1.5, -1.0}));

		const std::string path = "circle_and_lines.bez";
		std::string err;
		if (!BezIO::writeFile(path, curves, &err)) { std::fprintf(stderr, "BEZ write failed: %s\n", err.c_str()); return 1; }
	}

	// Set 2: a wave, a parabola and a horizontal line
	{
		std::vector<Bezier> curves;
		const double pi = 3.14159265358979323846;
		curves.push_back(makeWave(0.0, 2.0 * pi, 1.0, 7));
		curves.push_back(Bezier(std::vector<Bezier::Point>{ {0.0, -1.0}, {pi, 3.0}, {2.0 * pi, -1.0} }));
		curves.push_back(makeLine({-0.5, 0.3}, {2.0 * pi + 0.5, 0.3}));

		const std::string path = "wave_parabola_line.bez";
		std::string err;
		if (!BezIO::writeFile(path, curves, &err)) { std::fprintf(stderr, "BEZ write failed: %s\n", err.c_str()); return 1; }
	}

	std::printf("Wrote example curves: circle_and_lines.bez, wave_parabola_line.bez\n");
	return 0;
}
