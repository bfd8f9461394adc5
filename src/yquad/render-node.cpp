#include <yquad/render-node.h>

namespace yquad {

RenderNode& RenderNode::withTexture(const AtlasRegion& region, const glm::mat4& placement) {
    _texture = Placement{region, placement};
    return *this;
}

RenderNode& RenderNode::withStencil(const AtlasRegion& region, const glm::mat4& placement) {
    _stencil = Placement{region, placement};
    return *this;
}

RenderNode& RenderNode::addChild(RenderNode child, const glm::mat4& transform) {
    _children.push_back(Child{std::move(child), transform});
    return *this;
}

size_t RenderNode::count() const {
    size_t n = 1;
    for (const auto& c : _children) {
        n += c.node.count();
    }
    return n;
}

} // namespace yquad
