#include "BezIO.hxx"

#include <fstream>
#include <sstream>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace {
static inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static void splitTokens(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
}
}

namespace BezIO {

//
// BEZ text format (2D)
// Lines starting with '*' are comments. Inline comments after '#' are ignored.
// Whitespace separated tokens.
//    curve [degree <p>]
//    ctrl <x0> <y0>  <x1> <y1> ... <xn> <yn>
//    endcurve
// 'ctrl' may repeat inside a block; points accumulate in order.
// A declared degree must equal the number of points minus one.
//

static void finishCurveOrThrow(int degree, const std::vector<Bezier::Point>& ctrl, std::vector<Bezier>& out) {
    if (ctrl.empty()) throw std::runtime_error("BEZ: curve without control points");
    if (degree >= 0 && static_cast<std::size_t>(degree) + 1 != ctrl.size()) {
        throw std::runtime_error("BEZ: degree does not match number of control points");
    }
    Bezier c(ctrl);
    std::string why; if (!c.isValid(&why)) throw std::runtime_error(std::string("BEZ: invalid curve: ")+why);
    out.push_back(std::move(c));
}

bool readFile(const std::string& path, std::vector<Bezier>& out) {
    std::ifstream ifs(path);
    if (!ifs) return false;
    std::string line;
    std::vector<std::string> toks;
    bool inCurve = false;
    int degree = -1;
    std::vector<Bezier::Point> ctrl;

    while (std::getline(ifs, line)) {
        // Strip inline comments after '#'
        auto hashPos = line.find('#');
        if (hashPos != std::string::npos) line = line.substr(0, hashPos);
        std::string t = trim(line);
        if (t.empty()) continue;
        if (t[0] == '*') continue; // full-line comment

        splitTokens(t, toks);
        if (toks.empty()) continue;
        if (!inCurve) {
            if (toks[0] != "curve") throw std::runtime_error("BEZ: expected 'curve'");
            inCurve = true; degree = -1; ctrl.clear();
            if (toks.size() >= 3 && toks[1] == "degree") degree = std::stoi(toks[2]);
        } else if (toks[0] == "degree" && toks.size() >= 2) {
            degree = std::stoi(toks[1]);
        } else if (toks[0] == "ctrl") {
            if ((toks.size()-1) % 2 != 0) throw std::runtime_error("BEZ: ctrl requires pairs of x y");
            for (std::size_t i = 1; i+1 < toks.size(); i += 2) ctrl.push_back(Bezier::Point{std::stod(toks[i]), std::stod(toks[i+1])});
        } else if (toks[0] == "endcurve") {
            finishCurveOrThrow(degree, ctrl, out); inCurve = false;
        } else {
            throw std::runtime_error("BEZ: unknown token in curve block");
        }
    }
    if (inCurve) throw std::runtime_error("BEZ: unterminated curve block");
    return true;
}

bool readFile(const std::string& path, std::vector<Bezier>& out, std::string* errorMessage) {
    try {
        if (readFile(path, out)) return true;
        if (errorMessage) *errorMessage = "Could not open bez file for reading";
        return false;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

bool writeFile(const std::string& path, const std::vector<Bezier>& curves) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs.precision(std::numeric_limits<double>::max_digits10);
    ofs << "* bzsect BEZ 2D format\n";
    for (const auto& c : curves) {
        ofs << "curve degree " << c.degree() << "\n";
        ofs << "ctrl";
        for (const auto& p : c.controlPoints()) ofs << ' ' << p[0] << ' ' << p[1];
        ofs << "\nendcurve\n\n";
    }
    return static_cast<bool>(ofs);
}

bool writeFile(const std::string& path, const std::vector<Bezier>& curves, std::string* errorMessage) {
    try {
        if (writeFile(path, curves)) return true;
        if (errorMessage) *errorMessage = "Could not write bez file";
        return false;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

} // namespace BezIO
