#include "placement_parser.hpp"
#include <sstream>
#include <stdexcept>
#include <vector>

namespace quadrillion {
namespace cli {

std::pair<std::string, Placement> parse_placement(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::runtime_error("Expected NAME=F,R,Y,X: " + text);
    }

    std::string name = text.substr(0, eq);
    std::vector<int> fields;
    std::istringstream stream(text.substr(eq + 1));
    std::string field;
    while (std::getline(stream, field, ',')) {
        size_t pos = 0;
        int value = 0;
        try {
            value = std::stoi(field, &pos);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid number in placement: " + text);
        }
        if (pos != field.size()) {
            throw std::runtime_error("Invalid number in placement: " + text);
        }
        fields.push_back(value);
    }
    if (fields.size() != 4) {
        throw std::runtime_error("Placement requires 4 fields (flips, rotations, row, column): " + text);
    }

    return {name, Placement{fields[0], fields[1], {fields[2], fields[3]}}};
}

} // namespace cli
} // namespace quadrillion
