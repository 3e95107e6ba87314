#ifndef BZSECT_BEZIER_HXX
#define BZSECT_BEZIER_HXX


#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <array>

// A planar Bezier curve B(s) over the unit parameter interval.
// Notes:
// - Control points ("nodes") are 2D; degree is numControlPoints() - 1.
// - Evaluation uses de Casteljau and accepts any real s, so Newton iterates
//   that leave [0, 1] still evaluate (by polynomial extrapolation).
// - The curve is immutable once constructed; subdivision returns new curves.
class Bezier {
public:
	using Point = std::array<double, 2>; // 2D point (x, y)

	// Constructors
	Bezier();
	explicit Bezier(const std::vector<Point>& controlPoints);

	// Basic metadata
	int degree() const;
	std::size_t numControlPoints() const;

	const std::vector<Point>& controlPoints() const;

	// At least two control points, all finite.
	bool isValid(std::string* reason = nullptr) const;

	// Evaluate B(s) with de Casteljau.
	Point evaluate(double s) const;
	std::vector<Point> evaluateMulti(const std::vector<double>& params) const;

	// First derivative B'(s): degree * (hodograph control net evaluated at s).
	Point evaluateHodograph(double s) const;

	// Split at s = 1/2 into the curves over [0, 1/2] and [1/2, 1].
	std::pair<Bezier, Bezier> subdivide() const;

	// Node-level helpers shared with curve segments.
	static Point deCasteljau(const std::vector<Point>& nodes, double s);
	static Point hodograph(const std::vector<Point>& nodes, double s);
	static void splitNodes(const std::vector<Point>& nodes,
	                       std::vector<Point>& left,
	                       std::vector<Point>& right);

private:
	std::vector<Point> ctrlPts_;
};



#endif // BZSECT_BEZIER_HXX
