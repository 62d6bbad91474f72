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

#include <ldstdlib.hpp>

// basic and non-optimized code (no need for the loader to use more optimized versions)

size_t Lumen::strlen(const char* s) {
    const char* p = s;
    while (*p != '\0') {
        ++p;
    }

    return static_cast<size_t>(p - s);
}

void* Lumen::memcpy(void* dest, const void* src, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        *(static_cast<uint8_t*>(dest) + i) = *(static_cast<const uint8_t*>(src) + i);
    }

    return dest;
}

void* Lumen::memmove(void* dest, const void* src, size_t count) {
    uint8_t* d = static_cast<uint8_t*>(dest);
    const uint8_t* s = static_cast<const uint8_t*>(src);

    if (d < s) {
        for (size_t i = 0; i < count; ++i) {
            d[i] = s[i];
        }
    }
    else if (d > s) {
        for (size_t i = count; i > 0; --i) {
            d[i - 1] = s[i - 1];
        }
    }

    return dest;
}

void* Lumen::memset(void* dest, int ch, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        *(static_cast<uint8_t*>(dest) + i) = static_cast<uint8_t>(ch);
    }

    return dest;
}
