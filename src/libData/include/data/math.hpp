#pragma once

#include <glm/glm.hpp>

namespace shroom {

using Vector3 = glm::vec3; //!< World space vector.
using Basis   = glm::mat3; //!< Orientation basis. Column major: [0] x, [1] y, [2] z (back) axis.

//! Identity orientation.
inline Basis identityBasis() {
	return Basis{1.0f};
}

//! Direction the basis looks at. Cameras look along their negative z axis.
inline Vector3 forward(const Basis& basis) {
	return -basis[2];
}

} // namespace shroom
