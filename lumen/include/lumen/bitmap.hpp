#pragma once

#include <cstdint>

#include <shared/Response.hpp>
#include <shared/graphics/basic.hpp>

namespace Lumen::Graphics {
    // 0x00RRGGBB, top byte unused
    typedef uint32_t Color;

    inline constexpr Color MakeColor(uint8_t r, uint8_t g, uint8_t b) {
        return (static_cast<Color>(r) << 16) | (static_cast<Color>(g) << 8) | static_cast<Color>(b);
    }

    // A 32-bit-per-pixel surface of Width x Height visible pixels, with rows
    // PixelsPerLine pixels apart. Backends provide the geometry and the base
    // address; pixel addressing is implemented once here.
    class Bitmap {
    public:
        virtual int64_t Width() const = 0;
        virtual int64_t Height() const = 0;
        virtual int64_t PixelsPerLine() const = 0;
        virtual uint32_t* Buffer() = 0;
        virtual const uint32_t* Buffer() const = 0;

        bool IsInXRange(int64_t x) const;
        bool IsInYRange(int64_t y) const;

        Optional<uint32_t*> PixelAt(int64_t x, int64_t y);
        Optional<Color> ReadPixel(int64_t x, int64_t y) const;

        // Precondition: IsInXRange(x) && IsInYRange(y). Callers establish this
        // once for a whole region before entering their pixel loop.
        inline uint32_t* UncheckedPixelAt(int64_t x, int64_t y) {
            return Buffer() + y * PixelsPerLine() + x;
        }

    protected:
        ~Bitmap() = default;
    };

    // The firmware frame buffer. The memory belongs to the firmware and stays
    // mapped for the loader's entire run.
    class VramBuffer final : public Bitmap {
    public:
        explicit VramBuffer(const Shared::Graphics::BasicGraphics& gfx);

        int64_t Width() const override { return width; }
        int64_t Height() const override { return height; }
        int64_t PixelsPerLine() const override { return ppsl; }
        uint32_t* Buffer() override { return base; }
        const uint32_t* Buffer() const override { return base; }

    private:
        uint32_t* base;
        int64_t width;
        int64_t height;
        int64_t ppsl;
    };

    // Off-screen surface over caller-provided storage of at least
    // height * pixelsPerLine pixels.
    class MemoryBitmap final : public Bitmap {
    public:
        MemoryBitmap(uint32_t* storage, int64_t width, int64_t height);
        MemoryBitmap(uint32_t* storage, int64_t width, int64_t height, int64_t pixelsPerLine);

        int64_t Width() const override { return width; }
        int64_t Height() const override { return height; }
        int64_t PixelsPerLine() const override { return ppl; }
        uint32_t* Buffer() override { return storage; }
        const uint32_t* Buffer() const override { return storage; }

    private:
        uint32_t* storage;
        int64_t width;
        int64_t height;
        int64_t ppl;
    };
}
