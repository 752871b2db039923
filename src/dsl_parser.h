#ifndef BRICKED_DSL_PARSER_H_
#define BRICKED_DSL_PARSER_H_

#include <string>
#include <vector>

#include "part.h"

namespace bricked {

// Removes /* ... */ blocks first, then // comments up to end of line.
std::string StripDescriptionComments(const std::string &src);

// Parses a build description:
//
//   place("2x4", xStud=0, yStud=0, zLevel=0, rotY=90, color=[0.85,0.1,0.1]);
//   place("1x1", xMm=10.2, yMm=9.6, zMm=6.7, rot=[0,15,0]);
//
// Never fails. Statements with an unknown kind are skipped; missing fields
// fall back to origin, zero rotation and the default red. Explicit xMm/yMm/zMm
// win over xStud/yStud/zLevel; either triple must be complete to apply.
// Grid mapping: xStud -> X, yStud -> Z, zLevel -> Y (vertical).
std::vector<Part> ParseBuildDescription(const std::string &text);

}  // namespace bricked

#endif  // BRICKED_DSL_PARSER_H_
