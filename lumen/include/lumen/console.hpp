#pragma once

#include <cstdarg>
#include <cstdint>

#include <lumen/bitmap.hpp>
#include <lumen/config.hpp>
#include <lumen/font.hpp>

namespace Lumen::Graphics {
    // Text cursor over a bitmap: places glyphs on an 8x16 cell grid, breaks lines
    // on '\n' and at the right edge, and scrolls when the bottom is reached.
    class Console {
    public:
        Console(Bitmap& target, Color fg = Config::CONSOLE_FOREGROUND, Color bg = Config::CONSOLE_BACKGROUND);
        Console(Bitmap& target, const Font& font, Color fg, Color bg);

        void putc(char c);
        void puts(const char* s);
        void vprintf(const char* format, va_list args);
        void printf(const char* format, ...);

        void Clear();

        inline int64_t CursorX() const { return cursorX; }
        inline int64_t CursorY() const { return cursorY; }

    private:
        int64_t columnsLimit() const;
        void newLine();
        void scroll();

        Bitmap& target;
        const Font& font;
        Color fg;
        Color bg;
        int64_t cursorX;
        int64_t cursorY;
    };
}
