// Game host using Notcurses for rendering and non-blocking key input
#include "terminal.h"
#include "board.h"
#include "event_queue.h"
#include "game_loop.h"
#include "grid_sink.h"
#include "input_channel.h"
#include <chrono>
#include <clocale>
#include <cstdint>

#include <notcurses/notcurses.h>
#include <spdlog/spdlog.h>

namespace
{
    constexpr auto EVENT_WAIT = std::chrono::milliseconds(5);

    inline void set_fg(ncplane *n, uint8_t r, uint8_t g, uint8_t b) { ncplane_set_fg_rgb8(n, r, g, b); }

    // Key name as understood by KeyMap; empty for keys we don't name
    std::string symbolFor(uint32_t key)
    {
        switch (key)
        {
        case NCKEY_UP:
            return "up";
        case NCKEY_DOWN:
            return "down";
        case NCKEY_LEFT:
            return "left";
        case NCKEY_RIGHT:
            return "right";
        case NCKEY_ESC:
            return "esc";
        case ' ':
            return "space";
        default:
            break;
        }
        if (key > ' ' && key < 0x7f)
            return std::string(1, static_cast<char>(key));
        return {};
    }
}

Terminal::Terminal(const GameConfig &cfg)
    : cfg(cfg)
{
}

int Terminal::run()
{
    setlocale(LC_ALL, "");
    notcurses_options opts{};
    nc = notcurses_init(&opts, nullptr);
    if (!nc)
    {
        spdlog::error("[Terminal] notcurses_init failed");
        return 1;
    }
    stdp = notcurses_stdplane(nc);

    // The board has to fit, status line included
    unsigned termh = 0, termw = 0;
    ncplane_dim_yx(stdp, &termh, &termw);
    if (termh < static_cast<unsigned>(BOARD_ROWS) || termw < static_cast<unsigned>(SCREEN_COLS))
    {
        ncplane_putstr_yx(stdp, 0, 0, "Terminal too small for the game board.");
        ncplane_putstr_yx(stdp, 1, 0, "Resize terminal and try again.");
        notcurses_render(nc);
        notcurses_stop(nc);
        spdlog::error("[Terminal] Terminal is {}x{}, need {}x{}", termw, termh, SCREEN_COLS, BOARD_ROWS);
        return 1;
    }

    EventQueue events;
    GridSink sink(BOARD_ROWS, BOARD_COLS, events);
    InputChannel input;
    GameLoop loop(input, sink, cfg.loop);
    loop.start();

    bool ended = false;
    bool quit = false;
    while (!quit)
    {
        ncinput ni{};
        while (true)
        {
            uint32_t key = notcurses_get_nblock(nc, &ni);
            if (key == 0u)
                break; // no input available
            if (key == (uint32_t)-1)
                break; // error

            const std::string symbol = symbolFor(key);
            if (!ended)
            {
                onKey(input, cfg.keys, symbol);
                continue;
            }
            // End screen: r plays again, q or the exit key leaves
            if (symbol == "r" || symbol == "R")
            {
                ended = false;
                loop.start();
            }
            else if (symbol == "q" || symbol == "Q" || cfg.keys.lookup(symbol) == ControlToken::Exit)
            {
                quit = true;
            }
        }

        bool dirty = false;
        while (auto ev = events.pop(EVENT_WAIT))
        {
            dirty = true;
            if (*ev == RenderEvent::EndGame)
                ended = true;
        }
        if (dirty)
        {
            draw(sink.lines(), ended);
            notcurses_render(nc);
        }
    }

    loop.stop();
    loop.join();
    notcurses_stop(nc);
    nc = nullptr;
    stdp = nullptr;
    return 0;
}

void Terminal::draw(const std::vector<std::string> &lines, bool ended)
{
    ncplane_erase(stdp);
    unsigned ph = 0, pw = 0;
    ncplane_dim_yx(stdp, &ph, &pw);
    int oy = (int)ph / 2 - BOARD_ROWS / 2;
    if (oy < 0)
        oy = 0;
    int ox = (int)pw / 2 - SCREEN_COLS / 2;
    if (ox < 0)
        ox = 0;

    for (std::size_t row = 0; row < lines.size(); ++row)
    {
        const std::string &line = lines[row];
        if (row == 0 || ended)
        {
            // status line and end screen are plain text
            set_fg(stdp, 200, 230, 255);
            ncplane_putstr_yx(stdp, oy + (int)row, ox, line.c_str());
            continue;
        }
        for (std::size_t col = 0; col < line.size(); ++col)
        {
            char c = line[col];
            if (c == SNAKE_CHAR)
                set_fg(stdp, 80, 255, 120);
            else if (c == FOOD_CHAR)
                set_fg(stdp, 255, 80, 80);
            else
                continue;
            ncplane_putchar_yx(stdp, oy + (int)row, ox + (int)col, c);
        }
    }
    if (ended)
    {
        set_fg(stdp, 170, 170, 170);
        ncplane_putstr_yx(stdp, oy + (int)lines.size() + 1, ox, "r: play again  q: quit");
    }
}
