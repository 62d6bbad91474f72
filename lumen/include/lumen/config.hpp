#pragma once

#include <cstddef>
#include <cstdint>

namespace Lumen {
    namespace Config {
        inline constexpr size_t MEMORY_MAP_BUFFER_SIZE  = 0x8000;  // 32 KiB

        inline constexpr int64_t GLYPH_WIDTH            = 8;
        inline constexpr int64_t GLYPH_HEIGHT           = 16;
        inline constexpr char GLYPH_INK                 = '*';

        inline constexpr uint32_t CONSOLE_FOREGROUND    = 0x00FFFFFF;
        inline constexpr uint32_t CONSOLE_BACKGROUND    = 0x00000000;

        // longest line printf can produce, terminator included
        inline constexpr size_t PRINTF_BUFFER_SIZE      = 512;
    }
}
