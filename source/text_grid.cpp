#include "text_grid.h"
#include <algorithm>

TextGrid::TextGrid(int rows, int cols)
    : height(rows), width(cols)
{
    blank();
}

void TextGrid::addstr(int row, int col, std::string_view text)
{
    if (row < 0 || col < 0 || row >= static_cast<int>(content.size()))
        return;
    std::string &line = content[row];
    const std::size_t start = static_cast<std::size_t>(col);
    if (line.size() < start)
        line.resize(start, ' ');
    line.replace(start, std::min(text.size(), line.size() - start), text);
}

void TextGrid::blank()
{
    content.assign(height, std::string(width, ' '));
}

void TextGrid::replace(const std::vector<std::string> &newLines)
{
    content = newLines;
}
