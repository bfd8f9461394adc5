#include <yquad/overlap.h>

namespace yquad {

QuadCorners unitQuadCorners() {
    return {glm::vec2(0.0f, 0.0f), glm::vec2(0.0f, 1.0f),
            glm::vec2(1.0f, 1.0f), glm::vec2(1.0f, 0.0f)};
}

QuadCorners transformQuad(const glm::mat4& m) {
    QuadCorners out = unitQuadCorners();
    for (auto& c : out) {
        glm::vec4 p = m * glm::vec4(c, 0.0f, 1.0f);
        c = glm::vec2(p.x, p.y);
    }
    return out;
}

QuadCorners clipViewportQuad() {
    return {glm::vec2(-1.0f, -1.0f), glm::vec2(-1.0f, 1.0f),
            glm::vec2(1.0f, 1.0f), glm::vec2(1.0f, -1.0f)};
}

bool pointInPolygon(const glm::vec2& p, const QuadCorners& polygon) {
    bool first = false;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const glm::vec2& a = polygon[i];
        const glm::vec2& b = polygon[(i + 1) % polygon.size()];
        bool sign = cross2(b - a, p - a) > 0.0f;
        if (i == 0) {
            first = sign;
        } else if (sign != first) {
            return false;
        }
    }
    return true;
}

bool overlaps(const QuadCorners& a, const QuadCorners& b) {
    for (const auto& p : a) {
        if (pointInPolygon(p, b)) return true;
    }
    for (const auto& p : b) {
        if (pointInPolygon(p, a)) return true;
    }
    return false;
}

} // namespace yquad
