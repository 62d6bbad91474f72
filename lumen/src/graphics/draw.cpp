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

#include <lumen/bitmap.hpp>
#include <lumen/draw.hpp>

namespace {
    static inline int64_t abs64(int64_t v) {
        return v < 0 ? -v : v;
    }

    static inline int64_t signum(int64_t v) {
        return (v > 0) - (v < 0);
    }

    static inline Lumen::Graphics::DrawResult outOfRange() {
        return Lumen::Graphics::DrawResult(Lumen::Graphics::GraphicsError::OutOfRange);
    }
}

namespace Lumen::Graphics {
    const char* ErrorName(GraphicsError error) {
        switch (error) {
            case GraphicsError::OutOfRange:
                return "OutOfRange";
        }

        return "Unknown";
    }

    Optional<int64_t> CalcSlopePoint(int64_t da, int64_t db, int64_t ia) {
        if (da < db || db < 0) {
            return Optional<int64_t>();
        }
        else if (da == 0) {
            return Optional<int64_t>(0);
        }
        else if (ia < 0 || ia > da) {
            return Optional<int64_t>();
        }

        // floor((2 * db * ia + da) / (2 * da)), everything is non-negative here;
        // the product needs up to 127 bits, the quotient is at most db
        typedef unsigned __int128 uint128_t;

        const uint128_t numerator = 2 * static_cast<uint128_t>(db) * static_cast<uint128_t>(ia) + static_cast<uint128_t>(da);
        const uint128_t denominator = 2 * static_cast<uint128_t>(da);

        return Optional<int64_t>(static_cast<int64_t>(numerator / denominator));
    }

    DrawResult DrawPoint(Bitmap& buf, int64_t x, int64_t y, Color color) {
        auto pixel = buf.PixelAt(x, y);
        if (!pixel.HasValue()) {
            return outOfRange();
        }

        *pixel.GetValue() = color;
        return DrawResult::MakeSuccess();
    }

    DrawResult FillRect(Bitmap& buf, int64_t px, int64_t py, int64_t w, int64_t h, Color color) {
        if (w <= 0 || h <= 0 || !buf.IsInXRange(px) || !buf.IsInYRange(py)) {
            return outOfRange();
        }

        // the far corner is checked against the room left after the near one,
        // px + w may not be representable
        const int64_t columns = buf.Width() < buf.PixelsPerLine() ? buf.Width() : buf.PixelsPerLine();

        if (w - 1 > columns - 1 - px || h - 1 > buf.Height() - 1 - py) {
            return outOfRange();
        }

        for (int64_t y = py; y < py + h; ++y) {
            uint32_t* row = buf.UncheckedPixelAt(px, y);
            for (int64_t x = 0; x < w; ++x) {
                row[x] = color;
            }
        }

        return DrawResult::MakeSuccess();
    }

    DrawResult DrawLine(Bitmap& buf, int64_t x0, int64_t y0, int64_t x1, int64_t y1, Color color) {
        if (!buf.IsInXRange(x0)
            || !buf.IsInYRange(y0)
            || !buf.IsInXRange(x1)
            || !buf.IsInYRange(y1)
        ) {
            return outOfRange();
        }

        const bool xMajor = abs64(x1 - x0) >= abs64(y1 - y0);

        // walk from the end with the smaller major coordinate so that both
        // directions of the same segment round identically
        if ((xMajor && x1 < x0) || (!xMajor && y1 < y0)) {
            int64_t tx = x0, ty = y0;
            x0 = x1; y0 = y1;
            x1 = tx; y1 = ty;
        }

        const int64_t dx = abs64(x1 - x0);
        const int64_t sx = signum(x1 - x0);
        const int64_t dy = abs64(y1 - y0);
        const int64_t sy = signum(y1 - y0);

        const int64_t da = xMajor ? dx : dy;
        const int64_t db = xMajor ? dy : dx;

        // every point lies on the segment between two in-range endpoints,
        // hence inside the canvas
        for (int64_t ia = 0; ia <= da; ++ia) {
            auto ib = CalcSlopePoint(da, db, ia);
            if (!ib.HasValue()) {
                continue;
            }

            if (xMajor) {
                *buf.UncheckedPixelAt(x0 + ia * sx, y0 + ib.GetValue() * sy) = color;
            }
            else {
                *buf.UncheckedPixelAt(x0 + ib.GetValue() * sx, y0 + ia * sy) = color;
            }
        }

        return DrawResult::MakeSuccess();
    }
}
