#pragma once

// Board geometry. Playable rows are FIRST_ROW..LAST_ROW, playable cols
// FIRST_COL..LAST_COL; row 0 is the status line.
constexpr int BOARD_ROWS = 19;
constexpr int BOARD_COLS = 59;
constexpr int FIRST_ROW = 1;
constexpr int LAST_ROW = BOARD_ROWS - 1;
constexpr int FIRST_COL = 1;
constexpr int LAST_COL = BOARD_COLS - 1;

constexpr char SNAKE_CHAR = '#';
constexpr char FOOD_CHAR = '*';
constexpr char EMPTY_CHAR = ' ';

// Status line layout
constexpr int SCORE_COL = 2;
constexpr int HELP_COL = 27;
constexpr char HELP_TEXT[] = " SNAKE / MOVEMENTs(hjkl) EXIT(i) PAUSE(space) ";
constexpr char CLOSING_TEXT[] = "http://bitemelater.in";

// The help text runs past the board's right edge
constexpr int STATUS_WIDTH = HELP_COL + static_cast<int>(sizeof(HELP_TEXT)) - 1;
constexpr int SCREEN_COLS = STATUS_WIDTH > BOARD_COLS ? STATUS_WIDTH : BOARD_COLS;
