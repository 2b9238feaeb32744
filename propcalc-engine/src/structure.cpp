#include "structure.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace propcalc {

int legal_useful_life(StructureType structure) {
    switch (structure) {
        case StructureType::RC: return 47;
        case StructureType::SRC: return 47;
        case StructureType::HeavySteel: return 34;
        case StructureType::LightSteel: return 19;
        case StructureType::Wood: return 22;
    }
    return 47;
}

int remaining_useful_life(StructureType structure, int building_age) {
    const int legal_life = legal_useful_life(structure);
    const int minimum_life = std::max(2, static_cast<int>(std::floor(legal_life * 0.2)));
    const int age = std::max(0, building_age);
    return std::max(minimum_life, legal_life - age);
}

std::string structure_to_string(StructureType structure) {
    switch (structure) {
        case StructureType::RC: return "RC";
        case StructureType::SRC: return "SRC";
        case StructureType::HeavySteel: return "S_HEAVY";
        case StructureType::LightSteel: return "S_LIGHT";
        case StructureType::Wood: return "WOOD";
    }
    return "RC";
}

StructureType parse_structure(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "RC") return StructureType::RC;
    if (upper == "SRC") return StructureType::SRC;
    if (upper == "S_HEAVY" || upper == "HEAVY_STEEL") return StructureType::HeavySteel;
    if (upper == "S_LIGHT" || upper == "LIGHT_STEEL") return StructureType::LightSteel;
    if (upper == "WOOD") return StructureType::Wood;

    throw std::invalid_argument("Unknown structure type: " + name);
}

} // namespace propcalc
