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

#include <shared/Debug.hpp>
#include <shared/efi/efi_abi.hpp>

#include <efi/efi_misc.hpp>

#include <ldstdio.hpp>

EFI_SYSTEM_TABLE* EFI::sys = nullptr;

namespace {
    static const char* const MEMORY_TYPE_NAMES[] = {
        "RESERVED",
        "LOADER_CODE",
        "LOADER_DATA",
        "BOOT_SERVICES_CODE",
        "BOOT_SERVICES_DATA",
        "RUNTIME_SERVICES_CODE",
        "RUNTIME_SERVICES_DATA",
        "CONVENTIONAL_MEMORY",
        "UNUSABLE_MEMORY",
        "ACPI_RECLAIM_MEMORY",
        "ACPI_MEMORY_NVS",
        "MEMORY_MAPPED_IO",
        "MEMORY_MAPPED_IO_PORT_SPACE",
        "PAL_CODE",
        "PERSISTENT_MEMORY"
    };

    static_assert(sizeof(MEMORY_TYPE_NAMES) / sizeof(MEMORY_TYPE_NAMES[0]) == EfiMaxMemoryType);
}

const char* EFI::ErrorName(FirmwareErrorCode code) {
    switch (code) {
        case FirmwareErrorCode::ProtocolNotFound:
            return "ProtocolNotFound";
        case FirmwareErrorCode::FirmwareCallFailed:
            return "FirmwareCallFailed";
    }

    return "Unknown";
}

const char* EFI::StatusName(EFI_STATUS status) {
    switch (status) {
        case EFI_SUCCESS:               return "EFI_SUCCESS";
        case EFI_LOAD_ERROR:            return "EFI_LOAD_ERROR";
        case EFI_INVALID_PARAMETER:     return "EFI_INVALID_PARAMETER";
        case EFI_UNSUPPORTED:           return "EFI_UNSUPPORTED";
        case EFI_BAD_BUFFER_SIZE:       return "EFI_BAD_BUFFER_SIZE";
        case EFI_BUFFER_TOO_SMALL:      return "EFI_BUFFER_TOO_SMALL";
        case EFI_NOT_READY:             return "EFI_NOT_READY";
        case EFI_DEVICE_ERROR:          return "EFI_DEVICE_ERROR";
        case EFI_WRITE_PROTECTED:       return "EFI_WRITE_PROTECTED";
        case EFI_OUT_OF_RESOURCES:      return "EFI_OUT_OF_RESOURCES";
        case EFI_NOT_FOUND:             return "EFI_NOT_FOUND";
        case EFI_ACCESS_DENIED:         return "EFI_ACCESS_DENIED";
        case EFI_TIMEOUT:               return "EFI_TIMEOUT";
        case EFI_ABORTED:               return "EFI_ABORTED";
        default:
            return IsError(status) ? "EFI_ERROR" : "EFI_WARNING";
    }
}

const char* EFI::MemoryTypeName(uint32_t type) {
    if (type >= EfiMaxMemoryType) {
        return "UNKNOWN";
    }

    return MEMORY_TYPE_NAMES[type];
}

EFI::FirmwareResult EFI::DisableWatchdog(const EFI_SYSTEM_TABLE* table) {
    if (table == nullptr || table->BootServices == nullptr || table->BootServices->SetWatchdogTimer == nullptr) {
        return FirmwareResult(CallFailed(EFI_INVALID_PARAMETER));
    }

    EFI_STATUS status = table->BootServices->SetWatchdogTimer(0, 0, 0, nullptr);
    if (status != EFI_SUCCESS) {
        if constexpr (Debug::DEBUG_FIRMWARE_ERRORS) {
            Lumen::printf("SetWatchdogTimer failed: %s\n", StatusName(status));
        }

        return FirmwareResult(CallFailed(status));
    }

    return FirmwareResult::MakeSuccess();
}

[[noreturn]] void EFI::Halt(void) {
    while (1) {
#if defined(__x86_64__) || defined(__i386__)
        __asm__ volatile("pause");
#elif defined(__aarch64__)
        __asm__ volatile("yield");
#endif
    }
}
