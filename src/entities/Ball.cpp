/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Ball.hpp"
#include "core/Canvas.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>
#include <stdexcept>

namespace PongEngine {

namespace {
constexpr float DEG_TO_RAD = std::numbers::pi_v<float> / 180.0f;
}

Ball::Ball(float x, float y, std::shared_ptr<const Canvas> canvas, const PhysicsConfig& config)
    : m_canvas(std::move(canvas))
    , m_config(config)
    , m_position(x, y)
    , m_previousPosition(x, y)
    , m_rng(std::random_device{}())
{
    if (!m_canvas) {
        throw std::invalid_argument("Ball requires a canvas");
    }
    const int width = m_canvas->getWidth();
    const int height = m_canvas->getHeight();
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument(std::format("Ball canvas has no area ({}x{})", width, height));
    }

    const GameSizes sizes = calculateGameSizes(width, height, m_config);
    m_radius = sizes.ballRadius;
    m_baseSpeed = static_cast<float>(width) / m_config.timeToCross;
    m_speedMultiplier = m_config.initialMultiplier;
    m_currentSpeed = m_baseSpeed * m_speedMultiplier;
    m_lastWidth = width;
    m_lastHeight = height;
}

void Ball::launch() {
    launch(m_rng);
}

void Ball::launch(std::mt19937& rng) {
    m_speedMultiplier = m_config.initialMultiplier;
    m_currentSpeed = m_baseSpeed * m_speedMultiplier;

    std::uniform_real_distribution<float> variation(-m_config.launchAngleVariation,
                                                    m_config.launchAngleVariation);
    std::bernoulli_distribution coinFlip(0.5);

    float angle = (m_config.launchAngleBase + variation(rng)) * DEG_TO_RAD;
    if (coinFlip(rng)) {
        angle = -angle;
    }
    setVelocityFromAngle(angle, m_currentSpeed);

    if (coinFlip(rng)) {
        m_velocity.setX(-m_velocity.getX());
    }

    BALL_DEBUG(std::format("Launched at ({:.1f}, {:.1f}) px/s", m_velocity.getX(), m_velocity.getY()));
}

void Ball::update(float deltaTime, GameState state) {
    if (state != GameState::PLAYING) {
        return;
    }

    m_previousPosition = m_position;
    // Stays where it left the field until restart() or a paddle contact
    if (m_destroyed) {
        return;
    }

    const float speedCap = m_baseSpeed * m_config.maxMultiplier;
    if (m_currentSpeed > speedCap) {
        m_currentSpeed = speedCap;
        m_velocity = m_velocity.normalized() * m_currentSpeed;
    }

    m_position += m_velocity * deltaTime;
    checkBoundaries();
}

void Ball::hit(HitFace hitFace, float deflectionModifier) {
    const float speed = m_velocity.length();
    if (speed > 0.0f) {
        const float angle = std::atan2(m_velocity.getY(), m_velocity.getX());
        const float deflection = deflectionModifier * std::numbers::pi_v<float>;

        switch (hitFace) {
        case HitFace::FRONT:
            setVelocityFromAngle(std::numbers::pi_v<float> - angle + deflection, speed);
            break;
        case HitFace::TOP:
            setVelocityFromAngle(-angle + deflection, speed);
            m_velocity.setY(-std::abs(m_velocity.getY()));
            break;
        case HitFace::BOTTOM:
            setVelocityFromAngle(-angle + deflection, speed);
            m_velocity.setY(std::abs(m_velocity.getY()));
            break;
        }
    }

    accelerate();
}

void Ball::accelerate() {
    m_speedMultiplier = std::min(m_speedMultiplier + m_config.accelerationRate, m_config.maxMultiplier);
    m_currentSpeed = m_baseSpeed * m_speedMultiplier;
    m_velocity = m_velocity.normalized() * m_currentSpeed;
}

void Ball::updateSizes() {
    const int width = m_canvas->getWidth();
    const int height = m_canvas->getHeight();
    if (width <= 0 || height <= 0) {
        BALL_WARN(std::format("Ignoring size update for {}x{} canvas", width, height));
        return;
    }

    const GameSizes sizes = calculateGameSizes(width, height, m_config);
    m_radius = sizes.ballRadius;
    m_baseSpeed = static_cast<float>(width) / m_config.timeToCross;

    // Aspect changes skew the direction; magnitude is re-derived below
    Vector2D direction = m_velocity;
    if (m_lastWidth > 0 && m_lastHeight > 0) {
        direction = Vector2D(m_velocity.getX() * static_cast<float>(width) / static_cast<float>(m_lastWidth),
                             m_velocity.getY() * static_cast<float>(height) / static_cast<float>(m_lastHeight));
    }
    m_currentSpeed = m_baseSpeed * m_speedMultiplier;
    m_velocity = direction.normalized() * m_currentSpeed;

    m_lastWidth = width;
    m_lastHeight = height;
}

BallState Ball::saveState() const {
    return saveState(m_canvas->getWidth(), m_canvas->getHeight());
}

BallState Ball::saveState(int width, int height) const {
    BallState state;
    state.velocity = m_velocity.normalized();
    state.speedMultiplier = m_speedMultiplier;

    if (width <= 0 || height <= 0) {
        BALL_WARN(std::format("Saving against a {}x{} canvas, centring", width, height));
        state.position = Vector2D(0.5f, 0.5f);
        return state;
    }

    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);
    state.position = Vector2D(std::clamp(m_position.getX(), 0.0f, w) / w,
                              std::clamp(m_position.getY(), 0.0f, h) / h);
    return state;
}

void Ball::restoreState(const BallState& state) {
    restoreState(state, m_canvas->getWidth(), m_canvas->getHeight());
}

void Ball::restoreState(const BallState& state, int width, int height) {
    if (width <= 0 || height <= 0) {
        BALL_WARN(std::format("Rejecting restore into a {}x{} canvas", width, height));
        return;
    }

    m_position = Vector2D(static_cast<float>(width) * state.position.getX(),
                          static_cast<float>(height) * state.position.getY());
    m_previousPosition = m_position;

    m_speedMultiplier = std::clamp(state.speedMultiplier, m_config.initialMultiplier, m_config.maxMultiplier);
    m_currentSpeed = m_baseSpeed * m_speedMultiplier;
    m_velocity = state.velocity.normalized() * m_currentSpeed;
}

void Ball::restart() {
    m_position = Vector2D(static_cast<float>(m_canvas->getWidth()) * 0.5f,
                          static_cast<float>(m_canvas->getHeight()) * 0.5f);
    m_previousPosition = m_position;
    m_velocity = Vector2D(0.0f, 0.0f);
    m_destroyed = false;
    m_hitLeftBorder = false;
}

void Ball::setPosition(const Vector2D& position) {
    m_position = position;
}

void Ball::setVelocity(const Vector2D& velocity) {
    m_velocity = velocity;
}

void Ball::applyContact(const Vector2D& position, const Vector2D& velocity) {
    m_position = position;
    m_velocity = velocity;
    m_destroyed = false;
    m_hitLeftBorder = false;
}

void Ball::clampToField() {
    const float height = static_cast<float>(m_canvas->getHeight());
    if (height < 2.0f * m_radius) {
        return;
    }

    if (m_position.getY() < m_radius) {
        m_position.setY(m_radius);
        m_velocity.setY(std::abs(m_velocity.getY()));
    } else if (m_position.getY() > height - m_radius) {
        m_position.setY(height - m_radius);
        m_velocity.setY(-std::abs(m_velocity.getY()));
    }
}

Vector2D Ball::getInterpolatedPosition(float alpha) const {
    return m_previousPosition + (m_position - m_previousPosition) * alpha;
}

void Ball::checkBoundaries() {
    const float width = static_cast<float>(m_canvas->getWidth());
    const float height = static_cast<float>(m_canvas->getHeight());

    if (m_position.getY() - m_radius <= 0.0f) {
        m_position.setY(m_radius);
        m_velocity.setY(std::abs(m_velocity.getY()));
        accelerate();
    } else if (m_position.getY() + m_radius >= height) {
        m_position.setY(height - m_radius);
        m_velocity.setY(-std::abs(m_velocity.getY()));
        accelerate();
    }

    if (m_position.getX() - m_radius <= 0.0f) {
        m_destroyed = true;
        m_hitLeftBorder = true;
    } else if (m_position.getX() + m_radius >= width) {
        m_destroyed = true;
        m_hitLeftBorder = false;
    }

    // Float decay can leave a crawling ball; lift it to the floor speed
    const float speed = m_velocity.length();
    if (speed > 0.0f && speed < m_config.minVelocity) {
        m_velocity *= m_config.minVelocity / speed;
    }
}

void Ball::setVelocityFromAngle(float angle, float speed) {
    m_velocity = Vector2D(std::cos(angle) * speed, std::sin(angle) * speed);
}

} // namespace PongEngine
