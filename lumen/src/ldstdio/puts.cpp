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

#include <efi/efi_misc.hpp>
#include <lumen/console.hpp>

#include <ldstdio.hpp>

namespace {
    static Lumen::Graphics::Console* screen = nullptr;

    // ConOut takes UCS-2; chunks are flushed when full
    static constexpr size_t CHUNK_SIZE = 128;
}

void Lumen::AttachScreen(Graphics::Console* console) {
    screen = console;
}

EFI_STATUS Lumen::puts(const char* s) {
    if (screen != nullptr) {
        screen->puts(s);
    }

    if (EFI::sys == nullptr || EFI::sys->ConOut == nullptr || EFI::sys->ConOut->OutputString == nullptr) {
        return EFI_NOT_READY;
    }

    EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL* conOut = EFI::sys->ConOut;

    CHAR16 chunk[CHUNK_SIZE + 1];
    size_t n = 0;
    EFI_STATUS status = EFI_SUCCESS;

    auto flush = [&]() {
        chunk[n] = u'\0';
        EFI_STATUS result = conOut->OutputString(conOut, chunk);
        if (result != EFI_SUCCESS && status == EFI_SUCCESS) {
            status = result;
        }
        n = 0;
    };

    while (*s != '\0') {
        // the firmware console wants "\n\r" to return to column 0
        if (*s == '\n') {
            if (n + 2 > CHUNK_SIZE) {
                flush();
            }
            chunk[n++] = u'\n';
            chunk[n++] = u'\r';
        }
        else {
            if (n + 1 > CHUNK_SIZE) {
                flush();
            }
            chunk[n++] = static_cast<CHAR16>(static_cast<unsigned char>(*s));
        }

        ++s;
    }

    if (n != 0) {
        flush();
    }

    return status;
}
