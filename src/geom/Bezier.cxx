// Implementation for Bezier class
#include "Bezier.hxx"

#include <cmath>
#include <stdexcept>

Bezier::Bezier() = default;

Bezier::Bezier(const std::vector<Point>& controlPoints)
	: ctrlPts_(controlPoints) {}

int Bezier::degree() const { return static_cast<int>(ctrlPts_.size()) - 1; }

std::size_t Bezier::numControlPoints() const { return ctrlPts_.size(); }

const std::vector<Bezier::Point>& Bezier::controlPoints() const { return ctrlPts_; }

bool Bezier::isValid(std::string* reason) const {
	if (ctrlPts_.size() < 2) {
		if (reason) *reason = "A curve needs at least two control points";
		return false;
	}
	for (const auto& p : ctrlPts_) {
		if (!std::isfinite(p[0]) || !std::isfinite(p[1])) {
			if (reason) *reason = "Control points must be finite";
			return false;
		}
	}
	return true;
}

Bezier::Point Bezier::deCasteljau(const std::vector<Point>& nodes, double s) {
	if (nodes.empty()) {
		throw std::runtime_error("Cannot evaluate an empty control net");
	}
	std::vector<Point> work(nodes);
	const double r = 1.0 - s;
	for (std::size_t level = work.size() - 1; level > 0; --level) {
		for (std::size_t i = 0; i < level; ++i) {
			work[i][0] = r * work[i][0] + s * work[i + 1][0];
			work[i][1] = r * work[i][1] + s * work[i + 1][1];
		}
	}
	return work[0];
}

Bezier::Point Bezier::hodograph(const std::vector<Point>& nodes, double s) {
	if (nodes.size() < 2) {
		throw std::runtime_error("Hodograph requires at least two control points");
	}
	const std::size_t n = nodes.size() - 1;
	std::vector<Point> firstDeriv(n);
	for (std::size_t i = 0; i < n; ++i) {
		firstDeriv[i][0] = nodes[i + 1][0] - nodes[i][0];
		firstDeriv[i][1] = nodes[i + 1][1] - nodes[i][1];
	}
	Point d = deCasteljau(firstDeriv, s);
	const double deg = static_cast<double>(n);
	d[0] *= deg; d[1] *= deg;
	return d;
}

void Bezier::splitNodes(const std::vector<Point>& nodes,
                        std::vector<Point>& left,
                        std::vector<Point>& right) {
	const std::size_t n = nodes.size();
	left.assign(n, Point{});
	right.assign(n, Point{});
	if (n == 0) return;
	// Each de Casteljau level at 1/2 contributes one node to each side.
	std::vector<Point> work(nodes);
	for (std::size_t level = 0; level < n; ++level) {
		const std::size_t width = n - level;
		left[level] = work[0];
		right[n - 1 - level] = work[width - 1];
		for (std::size_t i = 0; i + 1 < width; ++i) {
			work[i][0] = 0.5 * (work[i][0] + work[i + 1][0]);
			work[i][1] = 0.5 * (work[i][1] + work[i + 1][1]);
		}
	}
}

Bezier::Point Bezier::evaluate(double s) const {
	return deCasteljau(ctrlPts_, s);
}

std::vector<Bezier::Point> Bezier::evaluateMulti(const std::vector<double>& params) const {
	std::vector<Point> out;
	out.reserve(params.size());
	for (double s : params) out.push_back(deCasteljau(ctrlPts_, s));
	return out;
}

Bezier::Point Bezier::evaluateHodograph(double s) const {
	return hodograph(ctrlPts_, s);
}

std::pair<Bezier, Bezier> Bezier::subdivide() const {
	std::vector<Point> left, right;
	splitNodes(ctrlPts_, left, right);
	return std::make_pair(Bezier(left), Bezier(right));
}
