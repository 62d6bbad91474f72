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

#include <cstdarg>
#include <cstdint>

#include <lumen/bitmap.hpp>
#include <lumen/config.hpp>
#include <lumen/console.hpp>
#include <lumen/font.hpp>

#include <ldstdio.hpp>
#include <ldstdlib.hpp>

namespace Lumen::Graphics {
    Console::Console(Bitmap& target, Color fg, Color bg)
        : Console(target, Font::Builtin(), fg, bg) {}

    Console::Console(Bitmap& target, const Font& font, Color fg, Color bg)
        : target{target}, font{font}, fg{fg}, bg{bg}, cursorX{0}, cursorY{0} {}

    int64_t Console::columnsLimit() const {
        return target.Width() < target.PixelsPerLine() ? target.Width() : target.PixelsPerLine();
    }

    void Console::Clear() {
        const int64_t width = columnsLimit();

        for (int64_t y = 0; y < target.Height(); ++y) {
            uint32_t* row = target.UncheckedPixelAt(0, y);
            for (int64_t x = 0; x < width; ++x) {
                row[x] = bg;
            }
        }

        cursorX = 0;
        cursorY = 0;
    }

    void Console::scroll() {
        const int64_t width = columnsLimit();
        const int64_t height = target.Height();

        for (int64_t y = 0; y + Config::GLYPH_HEIGHT < height; ++y) {
            Lumen::memmove(
                target.UncheckedPixelAt(0, y),
                target.UncheckedPixelAt(0, y + Config::GLYPH_HEIGHT),
                static_cast<size_t>(width) * sizeof(uint32_t)
            );
        }

        const int64_t freed = height < Config::GLYPH_HEIGHT ? 0 : height - Config::GLYPH_HEIGHT;

        for (int64_t y = freed; y < height; ++y) {
            uint32_t* row = target.UncheckedPixelAt(0, y);
            for (int64_t x = 0; x < width; ++x) {
                row[x] = bg;
            }
        }
    }

    void Console::newLine() {
        cursorX = 0;
        cursorY += Config::GLYPH_HEIGHT;

        if (cursorY + Config::GLYPH_HEIGHT > target.Height()) {
            scroll();
            cursorY -= Config::GLYPH_HEIGHT;

            if (cursorY < 0) {
                cursorY = 0;
            }
        }
    }

    void Console::putc(char c) {
        if (c == '\n') {
            newLine();
            return;
        }
        else if (c == '\r') {
            cursorX = 0;
            return;
        }

        if (cursorX != 0 && cursorX + Config::GLYPH_WIDTH > columnsLimit()) {
            newLine();
        }

        DrawGlyphBg(target, font, cursorX, cursorY, fg, bg, static_cast<unsigned char>(c));
        cursorX += Config::GLYPH_WIDTH;
    }

    void Console::puts(const char* s) {
        while (*s != '\0') {
            putc(*s++);
        }
    }

    void Console::vprintf(const char* format, va_list args) {
        char buffer[Config::PRINTF_BUFFER_SIZE];
        Lumen::vsnprintf(buffer, sizeof(buffer), format, args);
        puts(buffer);
    }

    void Console::printf(const char* format, ...) {
        va_list args;
        va_start(args, format);
        vprintf(format, args);
        va_end(args);
    }
}
