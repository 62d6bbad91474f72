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

#include <shared/Debug.hpp>
#include <shared/efi/efi_abi.hpp>
#include <shared/graphics/basic.hpp>
#include <shared/memory/defs.hpp>

#include <efi/efi_graphics.hpp>
#include <efi/efi_memory_map.hpp>
#include <efi/efi_misc.hpp>

#include <lumen/bitmap.hpp>
#include <lumen/console.hpp>
#include <lumen/draw.hpp>
#include <lumen/font.hpp>
#include <lumen/panic.hpp>

#include <ldstdio.hpp>

namespace LG = Lumen::Graphics;
namespace ShdMem = Shared::Memory;

#define LEGACY_EXPORT extern "C"

static EFI::MemoryMapHolder memoryMap;

namespace {
    // a failed primitive only loses that primitive, the frame goes on
    static void check(LG::DrawResult result, const char* what) {
        if (result.CheckError()) {
            if constexpr (Debug::DEBUG_GRAPHICS_ERRORS) {
                Lumen::printf("%s: %s\n", what, LG::ErrorName(result.GetError()));
            }
        }
    }

    static void drawTestPattern(LG::Bitmap& vram) {
        check(LG::FillRect(vram, 0, 0, vram.Width(), vram.Height(), 0x000000), "background");
        check(LG::FillRect(vram, 32, 32, 32, 32, 0x0000FF), "blue square");
        check(LG::FillRect(vram, 64, 64, 64, 64, 0x00FF00), "green square");
        check(LG::FillRect(vram, 128, 128, 128, 128, 0xFF0000), "red square");

        for (int64_t i = 0; i < 256; ++i) {
            check(LG::DrawPoint(vram, i, i, 0x010101), "diagonal");
        }

        constexpr int64_t gridSize = 32;
        constexpr int64_t rectSize = gridSize * 8;

        for (int64_t i = 0; i <= rectSize; i += gridSize) {
            check(LG::DrawLine(vram, 0, i, rectSize, i, 0xFF0000), "grid row");
            check(LG::DrawLine(vram, i, 0, i, rectSize, 0xFF0000), "grid column");
        }

        constexpr int64_t cx = rectSize / 2;
        constexpr int64_t cy = rectSize / 2;

        for (int64_t i = 0; i <= rectSize; i += gridSize) {
            check(LG::DrawLine(vram, cx, cy, 0, i, 0xFFFF00), "fan");
            check(LG::DrawLine(vram, cx, cy, i, 0, 0x00FFFF), "fan");
            check(LG::DrawLine(vram, cx, cy, rectSize, i, 0xFF00FF), "fan");
            check(LG::DrawLine(vram, cx, cy, i, rectSize, 0xFFFFFF), "fan");
        }

        const char* letters = "ABCDEF";
        for (int64_t i = 0; letters[i] != '\0'; ++i) {
            LG::DrawGlyph(vram, i * 16 + 256, i * 16, 0xFFFF00, letters[i]);
        }
        LG::DrawGlyph(vram, 0, 0, 0xFFFFFF, 'A');

        LG::DrawString(vram, 256, 256, 0xFFFFFF, "Hello, world!");
    }

    static void printMemoryMap(LG::Console& console, const EFI_BOOT_SERVICES* bootServices) {
        EFI::FirmwareResult result = EFI::GetMemoryMap(bootServices, memoryMap);
        if (result.CheckError()) {
            console.printf("GetMemoryMap: %s\n", EFI::StatusName(result.GetError().status));
            return;
        }

        console.printf("Memory map: %zu descriptors of %zu bytes\n",
            memoryMap.DescriptorCount(), static_cast<size_t>(memoryMap.DescriptorSize()));

        for (const EFI_MEMORY_DESCRIPTOR& desc : memoryMap) {
            if (desc.Type != EfiConventionalMemory) {
                continue;
            }

            if constexpr (Debug::DEBUG_MEMORY_MAP) {
                console.printf("%s phys 0x%.16llx virt 0x%.16llx pages %llu attr 0x%llx\n",
                    EFI::MemoryTypeName(desc.Type),
                    static_cast<unsigned long long>(desc.PhysicalStart),
                    static_cast<unsigned long long>(desc.VirtualStart),
                    static_cast<unsigned long long>(desc.NumberOfPages),
                    static_cast<unsigned long long>(desc.Attribute));
            }
        }

        console.printf("Total Memory Size: %llu MiB\n",
            static_cast<unsigned long long>(ShdMem::PagesToMiB(memoryMap.ConventionalPages())));
    }
}

LEGACY_EXPORT EFIAPI EFI_STATUS EfiMain([[maybe_unused]] EFI_HANDLE handle, EFI_SYSTEM_TABLE* _sys) {
    EFI::sys = _sys;

    if (EFI::sys->ConOut != nullptr && EFI::sys->ConOut->ClearScreen != nullptr) {
        EFI_STATUS status = EFI::sys->ConOut->ClearScreen(EFI::sys->ConOut);
        if (status != EFI_SUCCESS && Debug::DEBUG_FIRMWARE_ERRORS) {
            Lumen::printf("ClearScreen failed: %s\n", EFI::StatusName(status));
        }
    }

    Lumen::printf("=== Lumen loader ===\n");

    EFI::FirmwareResult watchdog = EFI::DisableWatchdog(EFI::sys);
    if (watchdog.CheckError()) {
        Lumen::printf("Watchdog still armed: %s\n", EFI::StatusName(watchdog.GetError().status));
    }

    auto graphics = Lumen::LoadGraphics(EFI::sys);
    if (graphics.CheckError()) {
        Panic::Panic("Could not find a suitable graphics output protocol", graphics.GetError());
    }

    LG::VramBuffer vram(graphics.GetValue());
    drawTestPattern(vram);

    LG::Console console(vram);

    // from here on, diagnostics also go to the screen
    Lumen::AttachScreen(&console);

    for (int i = 0; i < 4; ++i) {
        console.printf("i = %d\n", i);
    }

    printMemoryMap(console, EFI::sys->BootServices);

    EFI::Halt();
}
