#include "Pichuka/Game/PixelFont.hpp"
#include <cctype>

namespace Pichuka::Game {

namespace {

constexpr Glyph DIGITS[10] = {
    {{0b111, 0b101, 0b101, 0b101, 0b111}},
    {{0b010, 0b110, 0b010, 0b010, 0b111}},
    {{0b111, 0b001, 0b111, 0b100, 0b111}},
    {{0b111, 0b001, 0b111, 0b001, 0b111}},
    {{0b101, 0b101, 0b111, 0b001, 0b001}},
    {{0b111, 0b100, 0b111, 0b001, 0b111}},
    {{0b111, 0b100, 0b111, 0b101, 0b111}},
    {{0b111, 0b001, 0b001, 0b001, 0b001}},
    {{0b111, 0b101, 0b111, 0b101, 0b111}},
    {{0b111, 0b101, 0b111, 0b001, 0b111}},
};

constexpr Glyph LETTERS[26] = {
    {{0b010, 0b101, 0b111, 0b101, 0b101}},  // A
    {{0b110, 0b101, 0b110, 0b101, 0b110}},
    {{0b011, 0b100, 0b100, 0b100, 0b011}},
    {{0b110, 0b101, 0b101, 0b101, 0b110}},
    {{0b111, 0b100, 0b110, 0b100, 0b111}},
    {{0b111, 0b100, 0b110, 0b100, 0b100}},
    {{0b011, 0b100, 0b101, 0b101, 0b011}},
    {{0b101, 0b101, 0b111, 0b101, 0b101}},
    {{0b111, 0b010, 0b010, 0b010, 0b111}},
    {{0b001, 0b001, 0b001, 0b101, 0b010}},
    {{0b101, 0b101, 0b110, 0b101, 0b101}},
    {{0b100, 0b100, 0b100, 0b100, 0b111}},
    {{0b101, 0b111, 0b111, 0b101, 0b101}},  // M
    {{0b110, 0b101, 0b101, 0b101, 0b101}},
    {{0b010, 0b101, 0b101, 0b101, 0b010}},
    {{0b110, 0b101, 0b110, 0b100, 0b100}},
    {{0b010, 0b101, 0b101, 0b110, 0b011}},
    {{0b110, 0b101, 0b110, 0b101, 0b101}},
    {{0b011, 0b100, 0b010, 0b001, 0b110}},
    {{0b111, 0b010, 0b010, 0b010, 0b010}},
    {{0b101, 0b101, 0b101, 0b101, 0b111}},
    {{0b101, 0b101, 0b101, 0b101, 0b010}},
    {{0b101, 0b101, 0b111, 0b111, 0b101}},
    {{0b101, 0b101, 0b010, 0b101, 0b101}},
    {{0b101, 0b101, 0b010, 0b010, 0b010}},
    {{0b111, 0b001, 0b010, 0b100, 0b111}},  // Z
};

} // namespace

std::optional<Glyph> FindGlyph(char c) {
    const unsigned char u = static_cast<unsigned char>(c);
    if (std::isdigit(u)) {
        return DIGITS[c - '0'];
    }
    if (std::isalpha(u)) {
        return LETTERS[std::toupper(u) - 'A'];
    }

    switch (c) {
        case ' ': return Glyph{{0, 0, 0, 0, 0}};
        case ':': return Glyph{{0b000, 0b010, 0b000, 0b010, 0b000}};
        case '-': return Glyph{{0b000, 0b000, 0b111, 0b000, 0b000}};
        case '|': return Glyph{{0b010, 0b010, 0b010, 0b010, 0b010}};
        default:  return std::nullopt;
    }
}

float MeasureLine(std::string_view line, float pixel) {
    if (line.empty()) {
        return 0.0f;
    }
    const float cells = static_cast<float>(line.size());
    return (cells * (GLYPH_COLUMNS + 1) - 1.0f) * pixel;
}

std::vector<std::string_view> SplitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    for (;;) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            return lines;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
}

} // namespace Pichuka::Game
