#pragma once
#include <string>
#include <string_view>
#include <vector>

// A rows x cols block of characters, one string per line, edited in place
// the way a text buffer is.
class TextGrid
{
public:
    TextGrid(int rows, int cols);

    // Overwrite line `row` from column `col`. Lines grow when written past
    // their end; rows past the last line are ignored.
    void addstr(int row, int col, std::string_view text);

    void blank();
    void replace(const std::vector<std::string> &newLines);

    const std::vector<std::string> &lines() const { return content; }

private:
    int height;
    int width;
    std::vector<std::string> content;
};
