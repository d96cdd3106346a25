#include "game_loop.h"
#include "board.h"
#include <spdlog/spdlog.h>

namespace
{
    const char *causeName(EndCause c)
    {
        switch (c)
        {
        case EndCause::None:
            return "none";
        case EndCause::Exit:
            return "exit";
        case EndCause::SelfCollision:
            return "self-collision";
        }
        return "?";
    }

    bool isPauseOrExit(std::optional<ControlToken> t)
    {
        return t == ControlToken::Pause || t == ControlToken::Exit;
    }
}

GameLoop::GameLoop(InputChannel &input, RenderSink &sink, const LoopOptions &options)
    : input(input), sink(sink), options(options),
      interval(tickInterval(state.snake().size())),
      sleep([](std::chrono::milliseconds d)
            { std::this_thread::sleep_for(d); })
{
    unsigned seed = options.seed ? *options.seed
                                 : static_cast<unsigned>(
                                       std::chrono::high_resolution_clock::now().time_since_epoch().count());
    rng.seed(seed);
}

GameLoop::~GameLoop()
{
    if (worker.joinable())
    {
        stop();
        worker.join();
    }
}

void GameLoop::start()
{
    if (worker.joinable())
    {
        stop();
        join();
    }
    worker = std::thread([this]
                         { run(); });
}

void GameLoop::stop()
{
    input.send(ControlToken::Exit);
}

void GameLoop::join()
{
    if (worker.joinable())
        worker.join();
}

void GameLoop::reset()
{
    auto held = input.lock();
    state.reset();
    cause = EndCause::None;
    interval = tickInterval(state.snake().size());
    input.set(tokenOf(state.direction()));
}

void GameLoop::run()
{
    bool ended = false;
    {
        auto held = input.lock();
        ended = state.phase() == Phase::Ended;
    }
    if (ended)
        reset();

    drawOpening();
    spdlog::info("[GameLoop] Game started");

    while (true)
    {
        TickOutcome outcome = tick();
        if (outcome == TickOutcome::Ended)
            break;
        if (outcome == TickOutcome::Paused)
        {
            // A pause/resume cycle does not use up a tick
            if (!waitWhilePaused())
                break;
            continue;
        }
        sleep(lastInterval());
    }
}

void GameLoop::drawOpening()
{
    Snapshot s = snapshot();
    sink.resetSurface(std::vector<std::string>(BOARD_ROWS, std::string(BOARD_COLS, EMPTY_CHAR)));

    CellUpdates updates;
    updates.emplace_back(s.food, std::string(1, FOOD_CHAR));
    for (const Point &p : s.snake)
        updates.emplace_back(p, std::string(1, SNAKE_CHAR));
    appendStatus(updates, s.score);
    pushUpdates(updates);
    sink.notify(RenderEvent::UpdateScreen);
}

TickOutcome GameLoop::tick()
{
    CellUpdates updates;
    EndCause ending = EndCause::None;
    int finalScore = 0;
    {
        auto held = input.lock();
        if (state.phase() == Phase::Ended)
            return TickOutcome::Ended;
        if (state.phase() == Phase::Paused)
            return TickOutcome::Paused;

        std::optional<ControlToken> token = input.current();
        if (token == ControlToken::Exit)
        {
            state.requestExit();
            ending = cause = EndCause::Exit;
            finalScore = state.score();
        }
        else if (token == ControlToken::Pause)
        {
            state.requestPause();
            input.clear();
            spdlog::info("[GameLoop] Paused at score {}", state.score());
            return TickOutcome::Paused;
        }
        else
        {
            if (token)
                state.requestDirection(*directionOf(*token));

            const Snake &body = state.snake();
            Point head = nextHead(body, state.direction());
            if (isSelfCollision(head, body))
            {
                state.requestExit();
                ending = cause = EndCause::SelfCollision;
                finalScore = state.score();
            }
            else
            {
                bool ate = ateFood(head, state.food());
                Snake next = body;
                next.push_front(head);
                // Measured with the new head in and the old tail not yet gone
                interval = tickInterval(next.size());
                int score = state.score();
                Point food = state.food();
                if (ate)
                {
                    ++score;
                    food = nextFood(PointSet(next.begin(), next.end()), rng);
                }
                else
                {
                    next.pop_back();
                }

                TickDelta delta = state.commit(std::move(next), food, score, ate);
                state.rememberDirection();

                if (delta.food)
                {
                    spdlog::debug("[GameLoop] Food eaten, score {} length {}", score, state.snake().size());
                    updates.emplace_back(*delta.food, std::string(1, FOOD_CHAR));
                }
                if (delta.vacated)
                    updates.emplace_back(*delta.vacated, std::string(1, EMPTY_CHAR));
                updates.emplace_back(delta.head, std::string(1, SNAKE_CHAR));
                appendStatus(updates, score);
            }
        }
    }

    if (ending != EndCause::None)
    {
        finish(ending, finalScore);
        return TickOutcome::Ended;
    }

    pushUpdates(updates);
    sink.notify(RenderEvent::UpdateScreen);
    return TickOutcome::Advanced;
}

bool GameLoop::waitWhilePaused()
{
    int finalScore = 0;
    {
        auto held = input.lock();
        if (state.phase() != Phase::Paused)
            return state.phase() != Phase::Ended;

        // Woken by every send(); the timeout only bounds how long a missed
        // wake-up could go unnoticed
        while (!input.waitFor(held, options.pausePoll, isPauseOrExit))
        {
        }

        if (input.current() == ControlToken::Pause)
        {
            // Anything steered during the pause is dropped
            state.resume();
            input.set(tokenOf(state.direction()));
            spdlog::info("[GameLoop] Resumed");
            return true;
        }

        state.requestExit();
        cause = EndCause::Exit;
        finalScore = state.score();
    }
    finish(EndCause::Exit, finalScore);
    return false;
}

Snapshot GameLoop::snapshot()
{
    auto held = input.lock();
    return state.snapshot();
}

EndCause GameLoop::endCause()
{
    auto held = input.lock();
    return cause;
}

std::chrono::milliseconds GameLoop::lastInterval()
{
    auto held = input.lock();
    return interval;
}

void GameLoop::finish(EndCause why, int finalScore)
{
    spdlog::info("[GameLoop] Game over ({}), score {}", causeName(why), finalScore);
    sink.resetSurface({"Score - " + std::to_string(finalScore), CLOSING_TEXT});
    sink.notify(RenderEvent::EndGame);
}

void GameLoop::pushUpdates(const CellUpdates &updates)
{
    for (const auto &u : updates)
        sink.applyCellUpdate(u.first, u.second);
}

void GameLoop::appendStatus(CellUpdates &updates, int score)
{
    updates.emplace_back(Point{0, SCORE_COL}, "Score : " + std::to_string(score) + " ");
    updates.emplace_back(Point{0, HELP_COL}, HELP_TEXT);
}
