#pragma once

#include <yquad/atlas-region.h>
#include <glm/glm.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace yquad {

//-----------------------------------------------------------------------------
// RenderNode - one node of the render tree handed to the frame builder
//
// Coordinates are destination pixels, origin top-left, Y down. Each placement
// matrix maps the unit quad into the node's local space; child transforms are
// composed onto the parent's accumulated transform. A node's stencil clips
// its own texture and every descendant until a descendant declares its own.
//-----------------------------------------------------------------------------
class RenderNode {
public:
    struct Placement {
        AtlasRegion region;
        glm::mat4 transform{1.0f};
    };

    struct Child;

    RenderNode() = default;

    RenderNode& withTexture(const AtlasRegion& region, const glm::mat4& placement);
    RenderNode& withStencil(const AtlasRegion& region, const glm::mat4& placement);
    RenderNode& addChild(RenderNode child, const glm::mat4& transform);

    const std::optional<Placement>& texture() const { return _texture; }
    const std::optional<Placement>& stencil() const { return _stencil; }
    const std::vector<Child>& children() const { return _children; }

    // Total number of nodes in this subtree, including this one
    size_t count() const;

private:
    std::optional<Placement> _texture;
    std::optional<Placement> _stencil;
    std::vector<Child> _children;
};

struct RenderNode::Child {
    RenderNode node;
    glm::mat4 transform{1.0f};
};

} // namespace yquad
