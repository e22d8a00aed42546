#include "status.hh"

namespace suitegen {

std::string Failure::to_string() const {
    std::string out(error_code_string(code));
    if (!names.empty()) {
        out += " [";
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += names[i];
        }
        out += "]";
    }
    if (!detail.empty()) {
        out += ": ";
        out += detail;
    }
    return out;
}

}  // namespace suitegen
