#pragma once

#include <cstdint>

#include <shared/Response.hpp>

#include <lumen/bitmap.hpp>

namespace Lumen::Graphics {
    enum class GraphicsError : uint8_t {
        OutOfRange
    };

    typedef Response<GraphicsError, void> DrawResult;

    const char* ErrorName(GraphicsError error);

    // Offset along the minor axis at position ia of the major axis, for a line
    // whose major side is da long and minor side db long.
    //  da: length of the major side
    //  db: length of the minor side
    //  ia: position along the major side, in [0, da]
    Optional<int64_t> CalcSlopePoint(int64_t da, int64_t db, int64_t ia);

    DrawResult DrawPoint(Bitmap& buf, int64_t x, int64_t y, Color color);

    // all-or-nothing: nothing is written unless the whole rectangle is on the canvas
    DrawResult FillRect(Bitmap& buf, int64_t px, int64_t py, int64_t w, int64_t h, Color color);

    DrawResult DrawLine(Bitmap& buf, int64_t x0, int64_t y0, int64_t x1, int64_t y1, Color color);
}
