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

#pragma once

// Fixed-layout records for the subset of the UEFI 2.x boot-time ABI used by the loader.
// Only the members the loader calls are typed; everything else is reserved padding that
// keeps the typed members at the offsets the firmware expects. Offsets are for x86_64.

#include <cstddef>
#include <cstdint>

#if defined(__x86_64__)
#define EFIAPI __attribute__((ms_abi))
#else
#define EFIAPI
#endif

typedef uint8_t     BOOLEAN;
typedef int64_t     INTN;
typedef uint64_t    UINTN;
typedef int8_t      INT8;
typedef uint8_t     UINT8;
typedef int16_t     INT16;
typedef uint16_t    UINT16;
typedef int32_t     INT32;
typedef uint32_t    UINT32;
typedef int64_t     INT64;
typedef uint64_t    UINT64;
typedef char16_t    CHAR16;
typedef void        VOID;

typedef UINTN       EFI_STATUS;
typedef VOID*       EFI_HANDLE;
typedef UINT64      EFI_PHYSICAL_ADDRESS;
typedef UINT64      EFI_VIRTUAL_ADDRESS;

static_assert(sizeof(UINTN) == sizeof(VOID*), "UINTN must be pointer sized");

inline constexpr EFI_STATUS EFI_ERROR_BIT = static_cast<EFI_STATUS>(1) << 63;

inline constexpr EFI_STATUS EFI_SUCCESS                 = 0;
inline constexpr EFI_STATUS EFI_LOAD_ERROR              = EFI_ERROR_BIT | 1;
inline constexpr EFI_STATUS EFI_INVALID_PARAMETER       = EFI_ERROR_BIT | 2;
inline constexpr EFI_STATUS EFI_UNSUPPORTED             = EFI_ERROR_BIT | 3;
inline constexpr EFI_STATUS EFI_BAD_BUFFER_SIZE         = EFI_ERROR_BIT | 4;
inline constexpr EFI_STATUS EFI_BUFFER_TOO_SMALL        = EFI_ERROR_BIT | 5;
inline constexpr EFI_STATUS EFI_NOT_READY               = EFI_ERROR_BIT | 6;
inline constexpr EFI_STATUS EFI_DEVICE_ERROR            = EFI_ERROR_BIT | 7;
inline constexpr EFI_STATUS EFI_WRITE_PROTECTED         = EFI_ERROR_BIT | 8;
inline constexpr EFI_STATUS EFI_OUT_OF_RESOURCES        = EFI_ERROR_BIT | 9;
inline constexpr EFI_STATUS EFI_NOT_FOUND               = EFI_ERROR_BIT | 14;
inline constexpr EFI_STATUS EFI_ACCESS_DENIED           = EFI_ERROR_BIT | 15;
inline constexpr EFI_STATUS EFI_TIMEOUT                 = EFI_ERROR_BIT | 18;
inline constexpr EFI_STATUS EFI_ABORTED                 = EFI_ERROR_BIT | 21;

struct EFI_GUID {
    UINT32 Data1;
    UINT16 Data2;
    UINT16 Data3;
    UINT8  Data4[8];
};

static_assert(offsetof(EFI_GUID, Data1) == 0);
static_assert(offsetof(EFI_GUID, Data2) == 4);
static_assert(offsetof(EFI_GUID, Data3) == 6);
static_assert(offsetof(EFI_GUID, Data4) == 8);
static_assert(sizeof(EFI_GUID) == 16);

inline constexpr EFI_GUID EFI_GRAPHICS_OUTPUT_PROTOCOL_GUID = {
    .Data1 = 0x9042A9DE,
    .Data2 = 0x23DC,
    .Data3 = 0x4A38,
    .Data4 = { 0x96, 0xFB, 0x7A, 0xDE, 0xD0, 0x80, 0x51, 0x6A }
};

struct EFI_TABLE_HEADER {
    UINT64 Signature;
    UINT32 Revision;
    UINT32 HeaderSize;
    UINT32 CRC32;
    UINT32 Reserved;
};

static_assert(offsetof(EFI_TABLE_HEADER, Signature) == 0);
static_assert(offsetof(EFI_TABLE_HEADER, Revision) == 8);
static_assert(offsetof(EFI_TABLE_HEADER, HeaderSize) == 12);
static_assert(offsetof(EFI_TABLE_HEADER, CRC32) == 16);
static_assert(sizeof(EFI_TABLE_HEADER) == 24);

//
// memory map
//

enum EFI_MEMORY_TYPE : UINT32 {
    EfiReservedMemoryType,
    EfiLoaderCode,
    EfiLoaderData,
    EfiBootServicesCode,
    EfiBootServicesData,
    EfiRuntimeServicesCode,
    EfiRuntimeServicesData,
    EfiConventionalMemory,
    EfiUnusableMemory,
    EfiACPIReclaimMemory,
    EfiACPIMemoryNVS,
    EfiMemoryMappedIO,
    EfiMemoryMappedIOPortSpace,
    EfiPalCode,
    EfiPersistentMemory,
    EfiMaxMemoryType
};

struct EFI_MEMORY_DESCRIPTOR {
    EFI_MEMORY_TYPE         Type;
    UINT32                  Pad;
    EFI_PHYSICAL_ADDRESS    PhysicalStart;
    EFI_VIRTUAL_ADDRESS     VirtualStart;
    UINT64                  NumberOfPages;
    UINT64                  Attribute;
};

static_assert(sizeof(EFI_MEMORY_TYPE) == 4);
static_assert(offsetof(EFI_MEMORY_DESCRIPTOR, Type) == 0);
static_assert(offsetof(EFI_MEMORY_DESCRIPTOR, PhysicalStart) == 8);
static_assert(offsetof(EFI_MEMORY_DESCRIPTOR, VirtualStart) == 16);
static_assert(offsetof(EFI_MEMORY_DESCRIPTOR, NumberOfPages) == 24);
static_assert(offsetof(EFI_MEMORY_DESCRIPTOR, Attribute) == 32);
static_assert(sizeof(EFI_MEMORY_DESCRIPTOR) == 40);

typedef EFI_STATUS (EFIAPI *EFI_GET_MEMORY_MAP)(
    UINTN* MemoryMapSize,
    EFI_MEMORY_DESCRIPTOR* MemoryMap,
    UINTN* MapKey,
    UINTN* DescriptorSize,
    UINT32* DescriptorVersion
);

//
// boot services
//

typedef EFI_STATUS (EFIAPI *EFI_STALL)(UINTN Microseconds);

typedef EFI_STATUS (EFIAPI *EFI_SET_WATCHDOG_TIMER)(
    UINTN Timeout,
    UINT64 WatchdogCode,
    UINTN DataSize,
    CHAR16* WatchdogData
);

typedef EFI_STATUS (EFIAPI *EFI_LOCATE_PROTOCOL)(
    EFI_GUID* Protocol,
    VOID* Registration,
    VOID** Interface
);

struct EFI_BOOT_SERVICES {
    EFI_TABLE_HEADER        Hdr;
    VOID*                   Reserved0[4];       // RaiseTPL .. FreePages
    EFI_GET_MEMORY_MAP      GetMemoryMap;
    VOID*                   Reserved1[23];      // AllocatePool .. GetNextMonotonicCount
    EFI_STALL               Stall;
    EFI_SET_WATCHDOG_TIMER  SetWatchdogTimer;
    VOID*                   Reserved2[7];       // ConnectController .. LocateHandleBuffer
    EFI_LOCATE_PROTOCOL     LocateProtocol;
    VOID*                   Reserved3[6];       // InstallMultipleProtocolInterfaces .. CreateEventEx
};

static_assert(offsetof(EFI_BOOT_SERVICES, Hdr) == 0);
static_assert(offsetof(EFI_BOOT_SERVICES, GetMemoryMap) == 56);
static_assert(offsetof(EFI_BOOT_SERVICES, Stall) == 248);
static_assert(offsetof(EFI_BOOT_SERVICES, SetWatchdogTimer) == 256);
static_assert(offsetof(EFI_BOOT_SERVICES, LocateProtocol) == 320);
static_assert(sizeof(EFI_BOOT_SERVICES) == 376);

//
// simple text output
//

struct EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL;

typedef EFI_STATUS (EFIAPI *EFI_TEXT_STRING)(
    EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL* This,
    const CHAR16* String
);

typedef EFI_STATUS (EFIAPI *EFI_TEXT_CLEAR_SCREEN)(EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL* This);

struct EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL {
    VOID*                   Reset;
    EFI_TEXT_STRING         OutputString;
    VOID*                   Reserved0[4];       // TestString .. SetAttribute
    EFI_TEXT_CLEAR_SCREEN   ClearScreen;
    VOID*                   Reserved1[2];       // SetCursorPosition, EnableCursor
    VOID*                   Mode;
};

static_assert(offsetof(EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL, OutputString) == 8);
static_assert(offsetof(EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL, ClearScreen) == 48);
static_assert(offsetof(EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL, Mode) == 72);
static_assert(sizeof(EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL) == 80);

//
// graphics output
//

enum EFI_GRAPHICS_PIXEL_FORMAT : UINT32 {
    PixelRedGreenBlueReserved8BitPerColor,
    PixelBlueGreenRedReserved8BitPerColor,
    PixelBitMask,
    PixelBltOnly,
    PixelFormatMax
};

struct EFI_PIXEL_BITMASK {
    UINT32 RedMask;
    UINT32 GreenMask;
    UINT32 BlueMask;
    UINT32 ReservedMask;
};

struct EFI_GRAPHICS_OUTPUT_MODE_INFORMATION {
    UINT32                      Version;
    UINT32                      HorizontalResolution;
    UINT32                      VerticalResolution;
    EFI_GRAPHICS_PIXEL_FORMAT   PixelFormat;
    EFI_PIXEL_BITMASK           PixelInformation;
    UINT32                      PixelsPerScanLine;
};

static_assert(sizeof(EFI_GRAPHICS_PIXEL_FORMAT) == 4);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_MODE_INFORMATION, Version) == 0);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_MODE_INFORMATION, HorizontalResolution) == 4);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_MODE_INFORMATION, VerticalResolution) == 8);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_MODE_INFORMATION, PixelFormat) == 12);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_MODE_INFORMATION, PixelInformation) == 16);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_MODE_INFORMATION, PixelsPerScanLine) == 32);
static_assert(sizeof(EFI_GRAPHICS_OUTPUT_MODE_INFORMATION) == 36);

struct EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE {
    UINT32                                  MaxMode;
    UINT32                                  Mode;
    EFI_GRAPHICS_OUTPUT_MODE_INFORMATION*   Info;
    UINTN                                   SizeOfInfo;
    EFI_PHYSICAL_ADDRESS                    FrameBufferBase;
    UINTN                                   FrameBufferSize;
};

static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE, MaxMode) == 0);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE, Mode) == 4);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE, Info) == 8);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE, SizeOfInfo) == 16);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE, FrameBufferBase) == 24);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE, FrameBufferSize) == 32);
static_assert(sizeof(EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE) == 40);

struct EFI_GRAPHICS_OUTPUT_PROTOCOL;

typedef EFI_STATUS (EFIAPI *EFI_GRAPHICS_OUTPUT_PROTOCOL_QUERY_MODE)(
    EFI_GRAPHICS_OUTPUT_PROTOCOL* This,
    UINT32 ModeNumber,
    UINTN* SizeOfInfo,
    EFI_GRAPHICS_OUTPUT_MODE_INFORMATION** Info
);

typedef EFI_STATUS (EFIAPI *EFI_GRAPHICS_OUTPUT_PROTOCOL_SET_MODE)(
    EFI_GRAPHICS_OUTPUT_PROTOCOL* This,
    UINT32 ModeNumber
);

struct EFI_GRAPHICS_OUTPUT_PROTOCOL {
    EFI_GRAPHICS_OUTPUT_PROTOCOL_QUERY_MODE QueryMode;
    EFI_GRAPHICS_OUTPUT_PROTOCOL_SET_MODE   SetMode;
    VOID*                                   Blt;
    EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE*      Mode;
};

static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL, QueryMode) == 0);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL, SetMode) == 8);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL, Blt) == 16);
static_assert(offsetof(EFI_GRAPHICS_OUTPUT_PROTOCOL, Mode) == 24);
static_assert(sizeof(EFI_GRAPHICS_OUTPUT_PROTOCOL) == 32);

//
// system table
//

struct EFI_SYSTEM_TABLE {
    EFI_TABLE_HEADER                    Hdr;
    CHAR16*                             FirmwareVendor;
    UINT32                              FirmwareRevision;
    EFI_HANDLE                          ConsoleInHandle;
    VOID*                               ConIn;
    EFI_HANDLE                          ConsoleOutHandle;
    EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL*    ConOut;
    EFI_HANDLE                          StandardErrorHandle;
    EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL*    StdErr;
    VOID*                               RuntimeServices;
    EFI_BOOT_SERVICES*                  BootServices;
    UINTN                               NumberOfTableEntries;
    VOID*                               ConfigurationTable;
};

static_assert(offsetof(EFI_SYSTEM_TABLE, Hdr) == 0);
static_assert(offsetof(EFI_SYSTEM_TABLE, FirmwareVendor) == 24);
static_assert(offsetof(EFI_SYSTEM_TABLE, FirmwareRevision) == 32);
static_assert(offsetof(EFI_SYSTEM_TABLE, ConsoleInHandle) == 40);
static_assert(offsetof(EFI_SYSTEM_TABLE, ConIn) == 48);
static_assert(offsetof(EFI_SYSTEM_TABLE, ConsoleOutHandle) == 56);
static_assert(offsetof(EFI_SYSTEM_TABLE, ConOut) == 64);
static_assert(offsetof(EFI_SYSTEM_TABLE, StandardErrorHandle) == 72);
static_assert(offsetof(EFI_SYSTEM_TABLE, StdErr) == 80);
static_assert(offsetof(EFI_SYSTEM_TABLE, RuntimeServices) == 88);
static_assert(offsetof(EFI_SYSTEM_TABLE, BootServices) == 96);
static_assert(offsetof(EFI_SYSTEM_TABLE, NumberOfTableEntries) == 104);
static_assert(offsetof(EFI_SYSTEM_TABLE, ConfigurationTable) == 112);
static_assert(sizeof(EFI_SYSTEM_TABLE) == 120);
