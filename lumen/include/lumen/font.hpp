#pragma once

#include <cstddef>
#include <cstdint>

#include <shared/Response.hpp>

#include <lumen/bitmap.hpp>
#include <lumen/config.hpp>

namespace Lumen::Resources {
    // contents of resources/font.txt, embedded at build time
    extern const char FONT_SOURCE[];
}

namespace Lumen::Graphics {
    struct Glyph {
        uint8_t rows[Config::GLYPH_HEIGHT];     // bit 7 is the leftmost column

        inline bool IsInk(int64_t x, int64_t y) const {
            return (rows[y] & (0x80 >> x)) != 0;
        }
    };

    // Glyph table in the text format of resources/font.txt: a "0x" line holding the
    // codepoint in hex, then 16 lines of 8 cells where '*' is ink and anything else
    // is blank. The source is parsed once, on the first lookup.
    class Font {
    public:
        static constexpr size_t GLYPH_COUNT = 256;

        explicit constexpr Font(const char* source)
            : source{source}, parsed{false}, present{}, glyphs{} {}

        Optional<Glyph> Lookup(uint32_t codepoint) const;

        static const Font& Builtin();

    private:
        void parse() const;

        const char* source;
        mutable bool parsed;
        mutable uint8_t present[GLYPH_COUNT / 8];
        mutable Glyph glyphs[GLYPH_COUNT];
    };

    // transparent blit: only ink cells are written, cells off the canvas are skipped
    void DrawGlyph(Bitmap& buf, const Font& font, int64_t x, int64_t y, Color color, uint32_t codepoint);
    void DrawGlyph(Bitmap& buf, int64_t x, int64_t y, Color color, char c);

    // opaque blit: blank cells are painted with bg, missing glyphs become a bg cell
    void DrawGlyphBg(Bitmap& buf, const Font& font, int64_t x, int64_t y, Color fg, Color bg, uint32_t codepoint);

    // one glyph every GLYPH_WIDTH pixels, no line breaking
    void DrawString(Bitmap& buf, const Font& font, int64_t x, int64_t y, Color color, const char* text);
    void DrawString(Bitmap& buf, int64_t x, int64_t y, Color color, const char* text);
}
