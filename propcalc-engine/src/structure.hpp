#ifndef PROPCALC_STRUCTURE_HPP
#define PROPCALC_STRUCTURE_HPP

#include <cstdint>
#include <string>

namespace propcalc {

// Building structure, each with a statutory useful life for depreciation
enum class StructureType : uint8_t {
    RC = 0,          // Reinforced concrete
    SRC = 1,         // Steel-reinforced concrete
    HeavySteel = 2,  // Steel frame, members thicker than 4mm
    LightSteel = 3,  // Steel frame, members 3mm or thinner
    Wood = 4
};

// Legal useful life in years
int legal_useful_life(StructureType structure);

// Remaining depreciation life for a building bought at the given age.
// Remaining life = legal life - age, never shorter than
// max(2, floor(legal life * 0.2)).
int remaining_useful_life(StructureType structure, int building_age);

std::string structure_to_string(StructureType structure);

// Accepts "RC", "SRC", "S_HEAVY", "S_LIGHT", "WOOD" (case-insensitive)
// Throws std::invalid_argument on unknown names
StructureType parse_structure(const std::string& name);

} // namespace propcalc

#endif // PROPCALC_STRUCTURE_HPP
