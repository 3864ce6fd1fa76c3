/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Canvas.hpp"
#include "core/Logger.hpp"
#include "core/PhysicsConfig.hpp"
#include "entities/Ball.hpp"
#include "entities/Paddle.hpp"
#include "managers/PauseManager.hpp"
#include "managers/PhysicsManager.hpp"
#include "managers/ResizeManager.hpp"
#include "managers/SettingsManager.hpp"
#include <SDL3/SDL.h>
#include <exception>
#include <format>
#include <initializer_list>
#include <memory>
#include <string>

using namespace PongEngine;

namespace {

const int WINDOW_WIDTH{800};
const int WINDOW_HEIGHT{600};
const std::string GAME_NAME{"Pong"};
const std::string DEFAULT_SETTINGS_PATH{"res/pong_settings.json"};

// Canvas backed by the window's drawable size
class SDLWindowCanvas : public Canvas {
public:
    explicit SDLWindowCanvas(SDL_Window* window) : m_window(window) {}

    int getWidth() const override {
        int w = 0;
        int h = 0;
        SDL_GetWindowSizeInPixels(m_window, &w, &h);
        return w;
    }

    int getHeight() const override {
        int w = 0;
        int h = 0;
        SDL_GetWindowSizeInPixels(m_window, &w, &h);
        return h;
    }

private:
    SDL_Window* m_window;
};

struct Score {
    int left{0};
    int right{0};
};

Direction directionFromKeys(const bool* keys, SDL_Scancode up, SDL_Scancode down) {
    if (keys[up] && !keys[down]) {
        return Direction::UP;
    }
    if (keys[down] && !keys[up]) {
        return Direction::DOWN;
    }
    return Direction::NONE;
}

void fillRect(SDL_Renderer* renderer, float x, float y, float w, float h) {
    const SDL_FRect rect{x, y, w, h};
    SDL_RenderFillRect(renderer, &rect);
}

int runGame(SDL_Window* window, SDL_Renderer* renderer, const PhysicsConfig& config, bool softwareLimiting) {
    auto canvas = std::make_shared<SDLWindowCanvas>(window);
    const int width = canvas->getWidth();
    const int height = canvas->getHeight();
    const GameSizes sizes = calculateGameSizes(width, height, config);

    Ball ball(width * 0.5f, height * 0.5f, canvas, config);
    const float paddleY = (height - sizes.paddleHeight) * 0.5f;
    Paddle leftPaddle(sizes.playerPadding, paddleY, sizes.paddleWidth, sizes.paddleHeight, canvas, config);
    Paddle rightPaddle(width - (sizes.playerPadding + sizes.paddleWidth), paddleY,
                       sizes.paddleWidth, sizes.paddleHeight, canvas, config);

    PauseManager pauseManager(ball, leftPaddle, rightPaddle, config);
    ResizeManager resizeManager(canvas, ball, leftPaddle, rightPaddle, pauseManager, config);
    PhysicsManager physics(ball, config);
    physics.addPaddle(leftPaddle);
    physics.addPaddle(rightPaddle);
    physics.getTimestepManager().setSoftwareFrameLimiting(softwareLimiting);

    Score score;
    physics.setScoreCallback([&](bool hitLeftBorder) {
        // Leaving through the left border is a point for the right player
        if (hitLeftBorder) {
            ++score.right;
        } else {
            ++score.left;
        }
        GAMELOOP_INFO(std::format("Score {} - {}", score.left, score.right));
        pauseManager.handlePointScored();
    });
    pauseManager.setCountdownCallback([](int secondsRemaining) {
        if (secondsRemaining > 0) {
            GAMELOOP_DEBUG(std::format("Countdown {}", secondsRemaining));
        }
    });

    GAMELOOP_INFO("Press Space or Enter to start, Escape to pause");

    bool running = true;
    Uint64 lastTicks = SDL_GetTicksNS();

    while (running) {
        const Uint64 nowTicks = SDL_GetTicksNS();
        const float frameSeconds = static_cast<float>(static_cast<double>(nowTicks - lastTicks) / 1e9);
        lastTicks = nowTicks;

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
            case SDL_EVENT_QUIT:
                running = false;
                break;
            case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                resizeManager.onCanvasResizedByEngine();
                break;
            case SDL_EVENT_KEY_DOWN:
                if (event.key.repeat) {
                    break;
                }
                if (event.key.scancode == SDL_SCANCODE_SPACE || event.key.scancode == SDL_SCANCODE_RETURN) {
                    if (!resizeManager.isCurrentlyResizing()) {
                        pauseManager.resume();
                    }
                } else if (event.key.scancode == SDL_SCANCODE_ESCAPE) {
                    pauseManager.pause();
                }
                break;
            default:
                break;
            }
        }

        if (pauseManager.hasState(GameState::PLAYING)) {
            const bool* keys = SDL_GetKeyboardState(nullptr);
            leftPaddle.setDirection(directionFromKeys(keys, SDL_SCANCODE_W, SDL_SCANCODE_S));
            rightPaddle.setDirection(directionFromKeys(keys, SDL_SCANCODE_UP, SDL_SCANCODE_DOWN));
        }

        resizeManager.update(frameSeconds);
        pauseManager.update(frameSeconds);
        physics.advanceFrame(frameSeconds, pauseManager.getState());

        const float alpha = static_cast<float>(physics.getInterpolationAlpha());
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);

        for (const Paddle* paddle : {&leftPaddle, &rightPaddle}) {
            const Vector2D p = paddle->getInterpolatedPosition(alpha);
            fillRect(renderer, p.getX(), p.getY(), paddle->getWidth(), paddle->getHeight());
        }
        const Vector2D b = ball.getInterpolatedPosition(alpha);
        const float r = ball.getRadius();
        fillRect(renderer, b.getX() - r, b.getY() - r, r * 2.0f, r * 2.0f);

        SDL_RenderPresent(renderer);
        physics.getTimestepManager().endFrame();
    }

    resizeManager.cleanup();
    pauseManager.cleanup();
    GAMELOOP_INFO(std::format("Final score {} - {}", score.left, score.right));
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    GAMELOOP_INFO(std::format("Initializing {}", GAME_NAME));

    const std::string settingsPath = argc > 1 ? argv[1] : DEFAULT_SETTINGS_PATH;
    auto& settingsManager = SettingsManager::Instance();
    if (!settingsManager.loadFromFile(settingsPath)) {
        GAMELOOP_WARN(std::format("Failed to load {} - using defaults", settingsPath));
    }
    const PhysicsConfig config = PhysicsConfig::fromSettings(settingsManager);

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        GAMELOOP_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
        return -1;
    }

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    if (!SDL_CreateWindowAndRenderer(GAME_NAME.c_str(), WINDOW_WIDTH, WINDOW_HEIGHT,
                                     SDL_WINDOW_RESIZABLE, &window, &renderer)) {
        GAMELOOP_CRITICAL(std::format("Window creation failed: {}", SDL_GetError()));
        SDL_Quit();
        return -1;
    }

    const bool vsync = SDL_SetRenderVSync(renderer, 1);
    if (!vsync) {
        GAMELOOP_WARN(std::format("VSync unavailable, limiting frames in software: {}", SDL_GetError()));
    }

    int result = 0;
    try {
        result = runGame(window, renderer, config, !vsync);
    } catch (const std::exception& e) {
        GAMELOOP_CRITICAL(std::format("Fatal error: {}", e.what()));
        result = -1;
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return result;
}
