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

#include <efi/efi_misc.hpp>
#include <lumen/panic.hpp>

#include <ldstdio.hpp>

// the firmware console is the only diagnostic channel left, its status is not checked

namespace Panic {
    [[noreturn]] void Panic(const char* msg) {
        Lumen::printf("\n------ LOADER PANIC ------\n");

        if (msg != nullptr) {
            Lumen::printf("\t\t %s\n", msg);
        }

        EFI::Halt();
    }

    [[noreturn]] void Panic(const char* msg, EFI::FirmwareError error) {
        Lumen::printf("\n------ LOADER PANIC ------\n");

        if (msg != nullptr) {
            Lumen::printf("\t\t %s\n", msg);
        }

        Lumen::printf("\t\t %s: %s (0x%.16llx)\n",
            EFI::ErrorName(error.code),
            EFI::StatusName(error.status),
            static_cast<unsigned long long>(error.status));

        EFI::Halt();
    }
}
