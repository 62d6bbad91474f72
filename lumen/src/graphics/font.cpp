// SPDX-License-Identifier: GPL-3.0-only
//
// Copyright (C) 2026 Alexandre Boissiere
// This file is part of the Lumen loader.
//
// This program is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, version 3.
// This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
// without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
// See the GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License along with this program.
// If not, see <https://www.gnu.org/licenses/>.

#include <cstddef>
#include <cstdint>

#include <shared/Debug.hpp>
#include <shared/Response.hpp>

#include <lumen/bitmap.hpp>
#include <lumen/config.hpp>
#include <lumen/draw.hpp>
#include <lumen/font.hpp>

#include <ldstdio.hpp>

namespace {
    static constinit Lumen::Graphics::Font builtinFont{Lumen::Resources::FONT_SOURCE};

    struct Line {
        const char* start;
        size_t length;
        const char* next;       // first character of the following line, or the terminator
    };

    static Line readLine(const char* p) {
        const char* end = p;
        while (*end != '\0' && *end != '\n') {
            ++end;
        }

        Line line{ .start = p, .length = static_cast<size_t>(end - p), .next = *end == '\n' ? end + 1 : end };

        if (line.length > 0 && line.start[line.length - 1] == '\r') {
            --line.length;
        }

        return line;
    }

    static int hexDigit(char c) {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        else if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        else if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }

        return -1;
    }

    // "0x41" -> 0x41; exactly two hex digits
    static Optional<uint8_t> parseHeader(const Line& line) {
        if (line.length != 4 || line.start[0] != '0' || line.start[1] != 'x') {
            return Optional<uint8_t>();
        }

        uint32_t value = 0;

        for (size_t i = 2; i < line.length; ++i) {
            int digit = hexDigit(line.start[i]);
            if (digit < 0) {
                return Optional<uint8_t>();
            }

            value = value * 16 + static_cast<uint32_t>(digit);
        }

        return Optional<uint8_t>(static_cast<uint8_t>(value));
    }

    static Lumen::Graphics::Glyph parseRows(const char* p) {
        using namespace Lumen;

        Graphics::Glyph glyph{};

        for (int64_t y = 0; y < Config::GLYPH_HEIGHT && *p != '\0'; ++y) {
            Line row = readLine(p);

            for (size_t x = 0; x < row.length && x < static_cast<size_t>(Config::GLYPH_WIDTH); ++x) {
                if (row.start[x] == Config::GLYPH_INK) {
                    glyph.rows[y] |= static_cast<uint8_t>(0x80 >> x);
                }
            }

            p = row.next;
        }

        return glyph;
    }
}

namespace Lumen::Graphics {
    void Font::parse() const {
        parsed = true;

        if (source == nullptr) {
            return;
        }

        const char* p = source;

        while (*p != '\0') {
            Line line = readLine(p);
            auto codepoint = parseHeader(line);

            // the first entry for a codepoint wins
            if (codepoint.HasValue()) {
                const uint8_t c = codepoint.GetValue();

                if ((present[c / 8] & (1 << (c % 8))) == 0) {
                    glyphs[c] = parseRows(line.next);
                    present[c / 8] |= static_cast<uint8_t>(1 << (c % 8));
                }
            }

            p = line.next;
        }
    }

    Optional<Glyph> Font::Lookup(uint32_t codepoint) const {
        if (codepoint >= GLYPH_COUNT) {
            return Optional<Glyph>();
        }

        if (!parsed) {
            parse();
        }

        if ((present[codepoint / 8] & (1 << (codepoint % 8))) == 0) {
            return Optional<Glyph>();
        }

        return Optional<Glyph>(glyphs[codepoint]);
    }

    const Font& Font::Builtin() {
        return builtinFont;
    }

    void DrawGlyph(Bitmap& buf, const Font& font, int64_t x, int64_t y, Color color, uint32_t codepoint) {
        auto glyph = font.Lookup(codepoint);
        if (!glyph.HasValue()) {
            return;
        }

        const Glyph g = glyph.GetValue();
        size_t clipped = 0;

        for (int64_t dy = 0; dy < Config::GLYPH_HEIGHT; ++dy) {
            for (int64_t dx = 0; dx < Config::GLYPH_WIDTH; ++dx) {
                if (!g.IsInk(dx, dy)) {
                    continue;
                }

                // partially visible glyphs are clipped cell by cell
                if (DrawPoint(buf, x + dx, y + dy, color).CheckError()) {
                    ++clipped;
                }
            }
        }

        if constexpr (Debug::DEBUG_GRAPHICS_INFO) {
            if (clipped != 0) {
                Lumen::printf("glyph 0x%.2x at (%lld, %lld): %zu cells clipped\n",
                    codepoint, static_cast<long long>(x), static_cast<long long>(y), clipped);
            }
        }
    }

    void DrawGlyph(Bitmap& buf, int64_t x, int64_t y, Color color, char c) {
        DrawGlyph(buf, Font::Builtin(), x, y, color, static_cast<unsigned char>(c));
    }

    void DrawGlyphBg(Bitmap& buf, const Font& font, int64_t x, int64_t y, Color fg, Color bg, uint32_t codepoint) {
        auto glyph = font.Lookup(codepoint);
        const Glyph g = glyph.HasValue() ? glyph.GetValue() : Glyph{};

        // cells off the canvas are skipped, like DrawGlyph does
        for (int64_t dy = 0; dy < Config::GLYPH_HEIGHT; ++dy) {
            for (int64_t dx = 0; dx < Config::GLYPH_WIDTH; ++dx) {
                auto pixel = buf.PixelAt(x + dx, y + dy);
                if (pixel.HasValue()) {
                    *pixel.GetValue() = g.IsInk(dx, dy) ? fg : bg;
                }
            }
        }
    }

    void DrawString(Bitmap& buf, const Font& font, int64_t x, int64_t y, Color color, const char* text) {
        for (int64_t i = 0; text[i] != '\0'; ++i) {
            DrawGlyph(buf, font, x + i * Config::GLYPH_WIDTH, y, color, static_cast<unsigned char>(text[i]));
        }
    }

    void DrawString(Bitmap& buf, int64_t x, int64_t y, Color color, const char* text) {
        DrawString(buf, Font::Builtin(), x, y, color, text);
    }
}
