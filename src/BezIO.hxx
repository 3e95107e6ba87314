#ifndef BZSECT_BEZ_IO_HXX
#define BZSECT_BEZ_IO_HXX

#include "Bezier.hxx"
#include <string>
#include <vector>

namespace BezIO {

// Read a .bez file and append curves to 'out'. Returns true on success.
// The overload without errorMessage throws std::runtime_error on parse errors.
bool readFile(const std::string& path, std::vector<Bezier>& out);
bool readFile(const std::string& path, std::vector<Bezier>& out, std::string* errorMessage);

// Write curves to a .bez file with round-trip precision. Returns true on success.
bool writeFile(const std::string& path, const std::vector<Bezier>& curves);
bool writeFile(const std::string& path, const std::vector<Bezier>& curves, std::string* errorMessage);

} // namespace BezIO

#endif // BZSECT_BEZ_IO_HXX
