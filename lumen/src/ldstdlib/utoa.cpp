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

#include <shared/efi/efi_abi.hpp>

#include <ldstdlib.hpp>

namespace {
    // enough for a 64-bit value in base 2
    static constexpr size_t DIGITS_BUFFER_SIZE = 64;
}

INTN Lumen::utoa(UINTN x, char* buffer, INT32 radix) {
    char tmp[DIGITS_BUFFER_SIZE];
    char* tp = tmp;

    UINTN i;
    UINTN v = x;

    while (v || tp == tmp) {
        i = v % radix;
        v /= radix;

        if (i < 10) {
            *tp++ = static_cast<char>(i + '0');
        } else {
            *tp++ = static_cast<char>(i + 'a' - 10);
        }
    }

    INTN len = tp - tmp;

    while (tp > tmp) {
        *buffer++ = *--tp;
    }
    *buffer++ = '\0';

    return len;
}
