/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/PhysicsUtils.hpp"
#include "core/PhysicsConfig.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace PongEngine {
namespace PhysicsUtils {

OverlapResult checkCircleAABBOverlap(const Vector2D& center, float radius, const BoundingBox& box) {
    OverlapResult result;
    if (box.isDegenerate() || radius <= 0.0f) {
        return result;
    }

    const Vector2D closest = box.closestPoint(center);
    const Vector2D delta = center - closest;
    const float distanceSq = delta.lengthSquared();

    if (distanceSq >= radius * radius) {
        return result;
    }

    if (distanceSq > 1e-9f) {
        const float distance = std::sqrt(distanceSq);
        result.normal = delta / distance;
        result.penetration = result.normal * (radius - distance);
        result.collided = true;
        return result;
    }

    // Centre on or inside the box: leave through the closest face
    const float toLeft = center.getX() - box.left;
    const float toRight = box.right - center.getX();
    const float toTop = center.getY() - box.top;
    const float toBottom = box.bottom - center.getY();
    const float nearest = std::min({toLeft, toRight, toTop, toBottom});

    if (nearest == toLeft) {
        result.normal = Vector2D(-1.0f, 0.0f);
    } else if (nearest == toRight) {
        result.normal = Vector2D(1.0f, 0.0f);
    } else if (nearest == toTop) {
        result.normal = Vector2D(0.0f, -1.0f);
    } else {
        result.normal = Vector2D(0.0f, 1.0f);
    }
    result.penetration = result.normal * (nearest + radius);
    result.collided = true;
    return result;
}

SweepResult sweepCircleVsMovingRect(const Vector2D& p0, const Vector2D& circleMove, float radius,
                                    const BoundingBox& rect, const Vector2D& rectMove) {
    SweepResult result;

    const Vector2D rel = circleMove - rectMove;
    if (std::abs(rel.getX()) < MOTION_EPSILON && std::abs(rel.getY()) < MOTION_EPSILON) {
        return result;
    }

    const BoundingBox expanded = rect.expanded(radius);
    constexpr float NEG_INF = -std::numeric_limits<float>::infinity();

    float tmin = 0.0f;
    float tmax = 1.0f;
    float txEntry = NEG_INF;
    float tyEntry = NEG_INF;

    // X slab
    if (std::abs(rel.getX()) > MOTION_EPSILON) {
        const float inv = 1.0f / rel.getX();
        const float t1 = (expanded.left - p0.getX()) * inv;
        const float t2 = (expanded.right - p0.getX()) * inv;
        txEntry = std::min(t1, t2);
        tmin = std::max(tmin, txEntry);
        tmax = std::min(tmax, std::max(t1, t2));
        if (tmin > tmax) return result;
    } else if (p0.getX() < expanded.left || p0.getX() > expanded.right) {
        return result;
    }

    // Y slab
    if (std::abs(rel.getY()) > MOTION_EPSILON) {
        const float inv = 1.0f / rel.getY();
        const float t1 = (expanded.top - p0.getY()) * inv;
        const float t2 = (expanded.bottom - p0.getY()) * inv;
        tyEntry = std::min(t1, t2);
        tmin = std::max(tmin, tyEntry);
        tmax = std::min(tmax, std::max(t1, t2));
        if (tmin > tmax) return result;
    } else if (p0.getY() < expanded.top || p0.getY() > expanded.bottom) {
        return result;
    }

    if (tmin < 0.0f || tmin > 1.0f) return result;

    // The axis entered last is the face that was hit
    if (txEntry > tyEntry) {
        result.normal = Vector2D(rel.getX() < 0.0f ? 1.0f : -1.0f, 0.0f);
    } else {
        result.normal = Vector2D(0.0f, rel.getY() < 0.0f ? 1.0f : -1.0f);
    }
    result.t = tmin;
    result.collided = true;
    return result;
}

Vector2D reflectVelocity(const Vector2D& velocity, const Vector2D& normal) {
    return velocity - normal * (2.0f * velocity.dot(normal));
}

float computeEdgeDeflection(float relativeHit, float zoneSize, float maxDeflection) {
    if (zoneSize <= 0.0f || maxDeflection == 0.0f) {
        return 0.0f;
    }
    const float rel = std::clamp(relativeHit, 0.0f, 1.0f);

    if (rel < zoneSize) {
        return -maxDeflection * (1.0f - rel / zoneSize);
    }
    if (rel > 1.0f - zoneSize) {
        return maxDeflection * ((rel - (1.0f - zoneSize)) / zoneSize);
    }
    return 0.0f;
}

Vector2D applyPaddleDeflection(const Vector2D& impactPoint, const Vector2D& reflectedVelocity,
                               float paddleTop, float paddleBottom, const PhysicsConfig& config) {
    const float paddleHeight = paddleBottom - paddleTop;
    if (paddleHeight <= 0.0f) {
        return reflectedVelocity;
    }

    const float relativeHit = (impactPoint.getY() - paddleTop) / paddleHeight;
    const float deflection = computeEdgeDeflection(relativeHit, config.edgeZoneSize, config.maxDeflection);
    if (deflection == 0.0f) {
        return reflectedVelocity;
    }
    return reflectedVelocity.rotated(deflection * std::numbers::pi_v<float>);
}

Vector2D correctPosition(const Vector2D& contactPoint, const Vector2D& normal, float epsilon) {
    return contactPoint + normal * epsilon;
}

} // namespace PhysicsUtils
} // namespace PongEngine
