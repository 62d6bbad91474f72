#pragma once

#include <cstddef>
#include <cstdint>

#include <shared/efi/efi_abi.hpp>

#include <efi/efi_misc.hpp>
#include <lumen/config.hpp>

namespace EFI {
    class MemoryMapHolder;

    // Walks the holder's buffer in strides of the firmware-reported descriptor size,
    // which may be larger than sizeof(EFI_MEMORY_DESCRIPTOR).
    class MemoryMapIterator {
    public:
        MemoryMapIterator(const MemoryMapHolder* map, size_t offset);

        const EFI_MEMORY_DESCRIPTOR& operator*() const;
        const EFI_MEMORY_DESCRIPTOR* operator->() const;
        MemoryMapIterator& operator++();

        bool operator==(const MemoryMapIterator& other) const;
        bool operator!=(const MemoryMapIterator& other) const;

    private:
        const MemoryMapHolder* map;
        size_t offset;
    };

    class MemoryMapHolder {
    public:
        static constexpr size_t BUFFER_SIZE = Lumen::Config::MEMORY_MAP_BUFFER_SIZE;

        MemoryMapHolder();

        MemoryMapIterator begin() const;
        MemoryMapIterator end() const;

        // descriptors that lie entirely inside the used part of the buffer
        size_t DescriptorCount() const;
        uint64_t ConventionalPages() const;

        inline UINTN MapKey() const { return mmap_key; }
        inline UINTN DescriptorSize() const { return desc_size; }
        inline UINT32 DescriptorVersion() const { return desc_ver; }
        inline UINTN UsedSize() const { return mmap_size; }

    private:
        friend class MemoryMapIterator;
        friend FirmwareResult GetMemoryMap(const EFI_BOOT_SERVICES* bootServices, MemoryMapHolder& map);

        size_t walkLimit() const;

        alignas(8) uint8_t buffer[BUFFER_SIZE];
        UINTN mmap_size;
        UINTN mmap_key;
        UINTN desc_size;
        UINT32 desc_ver;
    };

    FirmwareResult GetMemoryMap(const EFI_BOOT_SERVICES* bootServices, MemoryMapHolder& map);
}
