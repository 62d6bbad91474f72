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

#include <efi/efi_graphics.hpp>
#include <efi/efi_misc.hpp>

#include <ldstdio.hpp>

namespace {
    typedef Response<EFI::FirmwareError, EFI_GRAPHICS_OUTPUT_PROTOCOL*> GopResponse;
    typedef Response<EFI::FirmwareError, Shared::Graphics::BasicGraphics> GraphicsResponse;

    static inline EFI::FirmwareError protocolNotFound(EFI_STATUS status) {
        return EFI::FirmwareError{ .code = EFI::FirmwareErrorCode::ProtocolNotFound, .status = status };
    }

    static inline bool hasUsableMode(const EFI_GRAPHICS_OUTPUT_PROTOCOL* gop) {
        return gop->Mode != nullptr && gop->Mode->Info != nullptr;
    }
}

GopResponse EFI::LocateGraphicsProtocol(const EFI_SYSTEM_TABLE* table) {
    if (table == nullptr || table->BootServices == nullptr || table->BootServices->LocateProtocol == nullptr) {
        return GopResponse(CallFailed(EFI_INVALID_PARAMETER));
    }

    EFI_GUID guid = EFI_GRAPHICS_OUTPUT_PROTOCOL_GUID;
    EFI_GRAPHICS_OUTPUT_PROTOCOL* gop = nullptr;

    EFI_STATUS status = table->BootServices->LocateProtocol(
        &guid,
        nullptr,
        reinterpret_cast<VOID**>(&gop)
    );

    if (status == EFI_NOT_FOUND) {
        return GopResponse(protocolNotFound(status));
    }
    else if (status != EFI_SUCCESS) {
        return GopResponse(CallFailed(status));
    }
    else if (gop == nullptr) {
        return GopResponse(protocolNotFound(status));
    }

    return GopResponse(gop);
}

GraphicsResponse Lumen::LoadGraphics(const EFI_SYSTEM_TABLE* table) {
    auto located = EFI::LocateGraphicsProtocol(table);
    if (located.CheckError()) {
        return GraphicsResponse(located.GetError());
    }

    EFI_GRAPHICS_OUTPUT_PROTOCOL* gop = located.GetValue();

    // no current mode: fall back to the firmware's default mode
    if (!hasUsableMode(gop)) {
        if (gop->SetMode == nullptr) {
            return GraphicsResponse(EFI::CallFailed(EFI_UNSUPPORTED));
        }

        EFI_STATUS status = gop->SetMode(gop, 0);
        if (status != EFI_SUCCESS) {
            if constexpr (Debug::DEBUG_FIRMWARE_ERRORS) {
                Lumen::printf("Error configuring default video mode: %s\n", EFI::StatusName(status));
            }

            return GraphicsResponse(EFI::CallFailed(status));
        }

        if (!hasUsableMode(gop)) {
            return GraphicsResponse(EFI::CallFailed(EFI_DEVICE_ERROR));
        }
    }

    const EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE* mode = gop->Mode;

    Shared::Graphics::BasicGraphics gfx {
        .ResX = mode->Info->HorizontalResolution,
        .ResY = mode->Info->VerticalResolution,
        .PPSL = mode->Info->PixelsPerScanLine,
        .PXFMT = mode->Info->PixelFormat,
        .FBADDR = reinterpret_cast<uint32_t*>(mode->FrameBufferBase),
        .FBSIZE = mode->FrameBufferSize
    };

    if (!gfx.HasLinearFramebuffer()) {
        if constexpr (Debug::DEBUG_FIRMWARE_ERRORS) {
            Lumen::printf("Graphics mode %u has no usable linear frame buffer\n", mode->Mode);
        }

        return GraphicsResponse(EFI::CallFailed(EFI_UNSUPPORTED));
    }

    if constexpr (Debug::DEBUG_FIRMWARE_INFO) {
        Lumen::printf("GOP mode %u: %ux%u, %u pixels per scan line, frame buffer at %p\n",
            mode->Mode, gfx.ResX, gfx.ResY, gfx.PPSL, gfx.FBADDR);
    }

    return GraphicsResponse(gfx);
}
