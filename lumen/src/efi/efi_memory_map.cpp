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

#include <shared/Debug.hpp>
#include <shared/efi/efi_abi.hpp>

#include <efi/efi_memory_map.hpp>
#include <efi/efi_misc.hpp>

#include <ldstdio.hpp>
#include <ldstdlib.hpp>

EFI::MemoryMapIterator::MemoryMapIterator(const MemoryMapHolder* map, size_t offset)
    : map{map}, offset{offset} {}

const EFI_MEMORY_DESCRIPTOR& EFI::MemoryMapIterator::operator*() const {
    return *reinterpret_cast<const EFI_MEMORY_DESCRIPTOR*>(map->buffer + offset);
}

const EFI_MEMORY_DESCRIPTOR* EFI::MemoryMapIterator::operator->() const {
    return reinterpret_cast<const EFI_MEMORY_DESCRIPTOR*>(map->buffer + offset);
}

EFI::MemoryMapIterator& EFI::MemoryMapIterator::operator++() {
    offset += map->desc_size;
    return *this;
}

bool EFI::MemoryMapIterator::operator==(const MemoryMapIterator& other) const {
    return map == other.map && offset == other.offset;
}

bool EFI::MemoryMapIterator::operator!=(const MemoryMapIterator& other) const {
    return !(*this == other);
}

EFI::MemoryMapHolder::MemoryMapHolder()
    : mmap_size{0}, mmap_key{0}, desc_size{0}, desc_ver{0} {
    Lumen::memset(buffer, 0, BUFFER_SIZE);
}

size_t EFI::MemoryMapHolder::walkLimit() const {
    // a stride shorter than the declared record would make views overlap
    if (desc_size < sizeof(EFI_MEMORY_DESCRIPTOR)) {
        return 0;
    }

    const size_t used = mmap_size < BUFFER_SIZE ? mmap_size : BUFFER_SIZE;
    return (used / desc_size) * desc_size;
}

EFI::MemoryMapIterator EFI::MemoryMapHolder::begin() const {
    return MemoryMapIterator(this, 0);
}

EFI::MemoryMapIterator EFI::MemoryMapHolder::end() const {
    return MemoryMapIterator(this, walkLimit());
}

size_t EFI::MemoryMapHolder::DescriptorCount() const {
    const size_t limit = walkLimit();
    return limit == 0 ? 0 : limit / desc_size;
}

uint64_t EFI::MemoryMapHolder::ConventionalPages() const {
    uint64_t pages = 0;

    for (const EFI_MEMORY_DESCRIPTOR& desc : *this) {
        if (desc.Type == EfiConventionalMemory) {
            pages += desc.NumberOfPages;
        }
    }

    return pages;
}

EFI::FirmwareResult EFI::GetMemoryMap(const EFI_BOOT_SERVICES* bootServices, MemoryMapHolder& map) {
    if (bootServices == nullptr || bootServices->GetMemoryMap == nullptr) {
        map.mmap_size = 0;
        return FirmwareResult(CallFailed(EFI_INVALID_PARAMETER));
    }

    map.mmap_size = MemoryMapHolder::BUFFER_SIZE;

    EFI_STATUS status = bootServices->GetMemoryMap(
        &map.mmap_size,
        reinterpret_cast<EFI_MEMORY_DESCRIPTOR*>(map.buffer),
        &map.mmap_key,
        &map.desc_size,
        &map.desc_ver
    );

    if (status != EFI_SUCCESS) {
        if constexpr (Debug::DEBUG_FIRMWARE_ERRORS) {
            Lumen::printf("GetMemoryMap failed: %s (%zu bytes requested)\n", StatusName(status), map.mmap_size);
        }

        // on EFI_BUFFER_TOO_SMALL the firmware rewrites the size with the one it needs
        map.mmap_size = 0;
        return FirmwareResult(CallFailed(status));
    }

    if constexpr (Debug::DEBUG_FIRMWARE_INFO) {
        Lumen::printf("Memory map: %zu bytes, descriptor size %zu, version %u\n",
            map.mmap_size, map.desc_size, map.desc_ver);
    }

    return FirmwareResult::MakeSuccess();
}
