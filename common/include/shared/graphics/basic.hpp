#pragma once

#include <cstdint>

#include <shared/efi/efi_abi.hpp>

namespace Shared::Graphics {
    inline constexpr uint64_t BYTES_PER_PIXEL = 4;

    struct BasicGraphics {
        uint32_t ResX;                      // horizontal resolution
        uint32_t ResY;                      // vertical resolution
        uint32_t PPSL;                      // pixels per scan line
        EFI_GRAPHICS_PIXEL_FORMAT PXFMT;    // pixel format
        uint32_t* FBADDR;                   // frame buffer address
        uint64_t FBSIZE;                    // frame buffer size in bytes, as reported by firmware

        // bytes covered by ResY scan lines of PPSL pixels
        inline constexpr uint64_t RequiredSize() const {
            return static_cast<uint64_t>(ResY) * PPSL * BYTES_PER_PIXEL;
        }

        inline constexpr bool HasLinearFramebuffer() const {
            return FBADDR != nullptr
                && PXFMT != PixelBltOnly
                && PXFMT < PixelFormatMax
                && PPSL >= ResX
                && FBSIZE >= RequiredSize();
        }
    };
}
