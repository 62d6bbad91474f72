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

#include <cstdint>

#include <shared/Response.hpp>
#include <shared/graphics/basic.hpp>

#include <lumen/bitmap.hpp>

namespace Lumen::Graphics {
    bool Bitmap::IsInXRange(int64_t x) const {
        const int64_t limit = Width() < PixelsPerLine() ? Width() : PixelsPerLine();
        return 0 <= x && x < limit;
    }

    bool Bitmap::IsInYRange(int64_t y) const {
        return 0 <= y && y < Height();
    }

    Optional<uint32_t*> Bitmap::PixelAt(int64_t x, int64_t y) {
        if (!IsInXRange(x) || !IsInYRange(y)) {
            return Optional<uint32_t*>();
        }

        return Optional<uint32_t*>(UncheckedPixelAt(x, y));
    }

    Optional<Color> Bitmap::ReadPixel(int64_t x, int64_t y) const {
        if (!IsInXRange(x) || !IsInYRange(y)) {
            return Optional<Color>();
        }

        return Optional<Color>(Buffer()[y * PixelsPerLine() + x]);
    }

    VramBuffer::VramBuffer(const Shared::Graphics::BasicGraphics& gfx)
        : base{gfx.FBADDR},
          width{static_cast<int64_t>(gfx.ResX)},
          height{static_cast<int64_t>(gfx.ResY)},
          ppsl{static_cast<int64_t>(gfx.PPSL)} {}

    MemoryBitmap::MemoryBitmap(uint32_t* storage, int64_t width, int64_t height)
        : MemoryBitmap(storage, width, height, width) {}

    MemoryBitmap::MemoryBitmap(uint32_t* storage, int64_t width, int64_t height, int64_t pixelsPerLine)
        : storage{storage}, width{width}, height{height}, ppl{pixelsPerLine} {}
}
