/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ResizeManagerTests
#include <boost/test/unit_test.hpp>

#include "core/Canvas.hpp"
#include "core/GameState.hpp"
#include "entities/Ball.hpp"
#include "entities/Paddle.hpp"
#include "managers/PauseManager.hpp"
#include "managers/ResizeManager.hpp"
#include <memory>
#include <stdexcept>

using namespace PongEngine;

struct ResizeFixture {
    std::shared_ptr<FixedCanvas> canvas = std::make_shared<FixedCanvas>(800, 600);
    Ball ball{400.0f, 300.0f, canvas};
    Paddle leftPaddle{24.0f, 255.0f, 8.0f, 90.0f, canvas};
    Paddle rightPaddle{768.0f, 255.0f, 8.0f, 90.0f, canvas};
    PauseManager pauseManager{ball, leftPaddle, rightPaddle};
    ResizeManager resizeManager{canvas, ball, leftPaddle, rightPaddle, pauseManager};

    void startPlaying() {
        pauseManager.resume();
        pauseManager.update(3.0f);
    }
};

BOOST_AUTO_TEST_SUITE(ResizeConstructionTests)

BOOST_AUTO_TEST_CASE(TestNullCanvasThrows)
{
    auto canvas = std::make_shared<FixedCanvas>(800, 600);
    Ball ball(400.0f, 300.0f, canvas);
    Paddle left(24.0f, 255.0f, 8.0f, 90.0f, canvas);
    Paddle right(768.0f, 255.0f, 8.0f, 90.0f, canvas);
    PauseManager pauseManager(ball, left, right);

    BOOST_CHECK_THROW(ResizeManager(nullptr, ball, left, right, pauseManager), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ResizeDebounceTests, ResizeFixture)

BOOST_AUTO_TEST_CASE(TestInitialLayoutSize)
{
    BOOST_CHECK_EQUAL(resizeManager.getPreviousWidth(), 800);
    BOOST_CHECK_EQUAL(resizeManager.getPreviousHeight(), 600);
    BOOST_CHECK(!resizeManager.isCurrentlyResizing());
    BOOST_CHECK(!resizeManager.hasPendingResize());
}

BOOST_AUTO_TEST_CASE(TestBurstIsDebounced)
{
    canvas->resize(1000, 700);
    resizeManager.onCanvasResizedByEngine();
    BOOST_CHECK(resizeManager.hasPendingResize());
    BOOST_CHECK(resizeManager.isCurrentlyResizing());
    BOOST_CHECK_CLOSE(resizeManager.getDebounceRemaining(), 0.05f, 0.001f);

    resizeManager.update(0.03f);
    BOOST_CHECK(resizeManager.hasPendingResize());

    // A second event re-arms the full debounce
    canvas->resize(1600, 1200);
    resizeManager.onCanvasResizedByEngine();
    resizeManager.update(0.03f);
    BOOST_CHECK(resizeManager.hasPendingResize());
    BOOST_CHECK_EQUAL(resizeManager.getPreviousWidth(), 800);

    resizeManager.update(0.03f);
    BOOST_CHECK(!resizeManager.hasPendingResize());
    BOOST_CHECK(!resizeManager.isCurrentlyResizing());
    BOOST_CHECK_EQUAL(resizeManager.getPreviousWidth(), 1600);
    BOOST_CHECK_EQUAL(resizeManager.getPreviousHeight(), 1200);
}

BOOST_AUTO_TEST_CASE(TestCleanupDropsPendingResize)
{
    canvas->resize(1600, 1200);
    resizeManager.onCanvasResizedByEngine();
    resizeManager.cleanup();
    resizeManager.update(1.0f);

    BOOST_CHECK(!resizeManager.hasPendingResize());
    BOOST_CHECK_EQUAL(resizeManager.getPreviousWidth(), 800);
    BOOST_CHECK_CLOSE(leftPaddle.getHeight(), 90.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestResizeWhilePlayingPauses)
{
    startPlaying();
    ball.setPosition(Vector2D(200.0f, 150.0f));
    ball.setVelocity(Vector2D(300.0f, 0.0f));

    canvas->resize(1600, 1200);
    resizeManager.onCanvasResizedByEngine();

    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_REQUIRE(pauseManager.getSnapshot());
    // Normalised against the size the ball was laid out for
    BOOST_CHECK_CLOSE(pauseManager.getSnapshot()->ballState.position.getX(), 0.25f, 0.001f);
    BOOST_CHECK_CLOSE(pauseManager.getSnapshot()->ballState.position.getY(), 0.25f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestResizeDuringCountdownPauses)
{
    pauseManager.startGame();
    resizeManager.onCanvasResizedByEngine();

    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_CHECK(!pauseManager.isCountingDown());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ResizeLayoutTests, ResizeFixture)

BOOST_AUTO_TEST_CASE(TestProportionalScaling)
{
    ball.setPosition(Vector2D(200.0f, 450.0f));
    leftPaddle.setPosition(24.0f, 100.0f);

    canvas->resize(1600, 1200);
    resizeManager.resizeGameObjects();

    BOOST_CHECK_CLOSE(ball.getPosition().getX(), 400.0f, 0.001f);
    BOOST_CHECK_CLOSE(ball.getPosition().getY(), 900.0f, 0.001f);
    BOOST_CHECK_CLOSE(ball.getRadius(), 9.0f, 0.001f);

    // Centre 145/600 of the old height, paddle now 180 tall
    BOOST_CHECK_CLOSE(leftPaddle.getPosition().getY(), 200.0f, 0.01f);
    BOOST_CHECK_CLOSE(rightPaddle.getPosition().getY(), 510.0f, 0.01f);
    BOOST_CHECK_CLOSE(leftPaddle.getHeight(), 180.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestPaddlesReanchoredToPadding)
{
    canvas->resize(1600, 1200);
    resizeManager.resizeGameObjects();

    BOOST_CHECK_CLOSE(leftPaddle.getPosition().getX(), 48.0f, 0.001f);
    BOOST_CHECK_CLOSE(rightPaddle.getPosition().getX(), 1536.0f, 0.001f);
    BOOST_CHECK_CLOSE(leftPaddle.getPreviousPosition().getX(), 48.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestVelocityFollowsNewBaseSpeed)
{
    ball.setVelocity(Vector2D(ball.getBaseSpeed(), 0.0f));

    canvas->resize(1600, 1200);
    resizeManager.resizeGameObjects();

    BOOST_CHECK_CLOSE(ball.getBaseSpeed(), 1600.0f / 2.75f, 0.01f);
    BOOST_CHECK_CLOSE(ball.getVelocity().getX(), ball.getBaseSpeed(), 0.01f);
    BOOST_CHECK_SMALL(ball.getVelocity().getY(), 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSnapshotReplayedAtNewSize)
{
    startPlaying();
    ball.setPosition(Vector2D(200.0f, 150.0f));
    ball.setVelocity(Vector2D(300.0f, 0.0f));

    canvas->resize(1600, 1200);
    resizeManager.onCanvasResizedByEngine();
    resizeManager.update(0.05f);

    BOOST_CHECK(!resizeManager.isCurrentlyResizing());
    BOOST_CHECK_CLOSE(ball.getPosition().getX(), 400.0f, 0.001f);
    BOOST_CHECK_CLOSE(ball.getPosition().getY(), 300.0f, 0.001f);
    BOOST_CHECK_CLOSE(leftPaddle.getPosition().getY(), 510.0f, 0.01f);

    BOOST_REQUIRE(pauseManager.getSnapshot());
    BOOST_CHECK_CLOSE(pauseManager.getSnapshot()->leftPaddleRelativeY, 0.5f, 0.001f);

    // Resuming plays on from the rescaled snapshot
    pauseManager.resume();
    pauseManager.update(3.0f);
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PLAYING);
    BOOST_CHECK_CLOSE(ball.getPosition().getX(), 400.0f, 0.001f);
    BOOST_CHECK_CLOSE(ball.getVelocity().getX(), 1600.0f / 2.75f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestEmptyCanvasSkipsRescale)
{
    ball.setPosition(Vector2D(200.0f, 150.0f));

    canvas->resize(0, 0);
    resizeManager.resizeGameObjects();

    BOOST_CHECK_CLOSE(ball.getPosition().getX(), 200.0f, 0.001f);
    BOOST_CHECK_CLOSE(leftPaddle.getHeight(), 90.0f, 0.001f);
    BOOST_CHECK_EQUAL(resizeManager.getPreviousWidth(), 800);
    BOOST_CHECK_EQUAL(resizeManager.getPreviousHeight(), 600);
}

BOOST_AUTO_TEST_CASE(TestCountdownRecentresBall)
{
    pauseManager.startGame();
    ball.setPosition(Vector2D(100.0f, 100.0f));

    canvas->resize(1000, 500);
    resizeManager.resizeGameObjects();

    BOOST_CHECK_CLOSE(ball.getPosition().getX(), 500.0f, 0.001f);
    BOOST_CHECK_CLOSE(ball.getPosition().getY(), 250.0f, 0.001f);
    BOOST_CHECK(ball.getVelocity().isZero());
}

BOOST_AUTO_TEST_SUITE_END()
