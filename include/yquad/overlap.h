#pragma once

#include <glm/glm.hpp>
#include <array>

namespace yquad {

//-----------------------------------------------------------------------------
// Quad overlap test
//
// A quad is four clip-space points in the unit-quad corner order
// (0,0) (0,1) (1,1) (1,0) after transformation. Mirrors the helpers in
// quad-cull.wgsl; both must use the same strict `> 0` boundary rule.
//-----------------------------------------------------------------------------
using QuadCorners = std::array<glm::vec2, 4>;

// Unit quad corners in culling order
QuadCorners unitQuadCorners();

// Corners of the unit quad transformed by `m` (xy only)
QuadCorners transformQuad(const glm::mat4& m);

// The fixed clip-space viewport [-1,1]^2 in culling order
QuadCorners clipViewportQuad();

// Signed area of the parallelogram (a, b)
inline float cross2(const glm::vec2& a, const glm::vec2& b) {
    return a.x * b.y - a.y * b.x;
}

// True iff the sign of cross(b - a, p - a) > 0 agrees across all four edges.
// Points exactly on an edge count as `false` for that edge. A degenerate
// (zero-area) polygon reports every point inside.
bool pointInPolygon(const glm::vec2& p, const QuadCorners& polygon);

// True iff any vertex of `a` is inside `b` or any vertex of `b` is inside `a`.
// Misses two quads that cross without containing each other's vertices.
bool overlaps(const QuadCorners& a, const QuadCorners& b);

} // namespace yquad
