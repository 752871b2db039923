#ifndef BRICKED_SOLID_SOURCE_H_
#define BRICKED_SOLID_SOURCE_H_

#include <string>

#include "geometry_params.h"
#include "part_catalog.h"

namespace bricked {

// Builds solid-modeling source text for one part kind. The output is plain
// OpenSCAD (Z up, origin at the footprint corner) restricted to $fn,
// union, translate, cube, cylinder and polyhedron, so both the built-in
// compiler and an external openscad binary accept it.
//
// Footprint is studsX*pitch - wallGap by studsY*pitch - wallGap. Bricks and
// plates are boxes; slopes are a wedge falling from full height at y=0 to a
// sharp edge at y=depth. Studs sit at pitch/2 + i*pitch on the top face and
// are omitted for tiles. Slopes carry only the row of studs along the high
// edge, extended down into the ramp so the union stays a single solid.
std::string BuildPartSolidSource(const PartKind &kind, const GeometryParameters &params);

}  // namespace bricked

#endif  // BRICKED_SOLID_SOURCE_H_
