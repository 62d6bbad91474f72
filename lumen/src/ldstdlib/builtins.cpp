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

// Symbols the compiler may reference on its own in a freestanding image.
// Only linked into the firmware image; hosted builds get them from the C runtime.

#include <cstddef>

#include <efi/efi_misc.hpp>

#include <ldstdlib.hpp>

extern "C" {
    void* memcpy(void* dest, const void* src, size_t count) {
        return Lumen::memcpy(dest, src, count);
    }

    void* memmove(void* dest, const void* src, size_t count) {
        return Lumen::memmove(dest, src, count);
    }

    void* memset(void* dest, int ch, size_t count) {
        return Lumen::memset(dest, ch, count);
    }

    [[noreturn]] void __cxa_pure_virtual() {
        EFI::Halt();
    }
}
