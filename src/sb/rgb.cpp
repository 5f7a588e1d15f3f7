#include "sb/rgb.h"

#include <sstream>

namespace sb {

std::string Rgb::toString() const {
    std::ostringstream out;
    out << "(" << int(r) << "," << int(g) << "," << int(b) << ")";
    return out.str();
}

} // namespace sb
