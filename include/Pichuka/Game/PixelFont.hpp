#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace Pichuka::Game {

constexpr int GLYPH_COLUMNS = 3;
constexpr int GLYPH_ROWS = 5;

// One 3x5 character cell. Bit 2 of each row is the left column.
struct Glyph {
    uint8_t rows[GLYPH_ROWS];

    bool Lit(int column, int row) const {
        return (rows[row] >> (GLYPH_COLUMNS - 1 - column)) & 1u;
    }
};

// Letters are case-insensitive. Digits, space, ':', '-' and '|' are also
// covered; anything else has no glyph and is laid out as a blank cell.
std::optional<Glyph> FindGlyph(char c);

// Horizontal advance of one line in pixels, one blank column between cells
float MeasureLine(std::string_view line, float pixel);

// Split on '\n'; an empty text still yields one empty line
std::vector<std::string_view> SplitLines(std::string_view text);

} // namespace Pichuka::Game
