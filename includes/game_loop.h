#pragma once
#include "game_state.h"
#include "input_channel.h"
#include "render_sink.h"
#include <chrono>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

enum class TickOutcome
{
    Advanced,
    Paused,
    Ended
};

enum class EndCause
{
    None,
    Exit,
    SelfCollision
};

struct LoopOptions
{
    // How often the pause wait re-checks the slot even without a wake-up
    std::chrono::milliseconds pausePoll{50};
    // Fixed seed for food placement; clock-seeded when empty
    std::optional<unsigned> seed;
};

// Drives the game: reads the input slot, moves the snake, commits the result
// and tells the render sink what changed. All state reads and writes happen
// under the input channel's lock; sleeping and rendering happen outside it.
class GameLoop
{
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    GameLoop(InputChannel &input, RenderSink &sink, const LoopOptions &options = {});
    ~GameLoop();

    GameLoop(const GameLoop &) = delete;
    GameLoop &operator=(const GameLoop &) = delete;

    // Run a fresh game on a worker thread. Stops any game still running.
    void start();
    // Ask the running game to end, as if Exit had been pressed
    void stop();
    void join();

    // Blocking loop; returns once the game has ended
    void run();

    // Starting state again, with Right queued as the current token
    void reset();

    // One locked step. A Pause token parks the loop in PausedWaiting; an
    // Exit token or a self-collision ends it and draws the end screen.
    TickOutcome tick();

    // Blocks while paused. True on resume, false when Exit arrived instead.
    bool waitWhilePaused();

    // Draw the initial board: blank surface, food, snake and status line
    void drawOpening();

    Snapshot snapshot();
    EndCause endCause();
    std::chrono::milliseconds lastInterval();

    void setSleepFunction(SleepFn fn) { sleep = std::move(fn); }

private:
    using CellUpdates = std::vector<std::pair<Point, std::string>>;

    // Log and draw the end screen. The cause is already recorded.
    void finish(EndCause why, int finalScore);
    void pushUpdates(const CellUpdates &updates);
    static void appendStatus(CellUpdates &updates, int score);

    InputChannel &input;
    RenderSink &sink;
    LoopOptions options;
    GameState state;
    EndCause cause{EndCause::None};
    std::chrono::milliseconds interval;
    std::mt19937 rng;
    SleepFn sleep;
    std::thread worker;
};
