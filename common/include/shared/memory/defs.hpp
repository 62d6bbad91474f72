#pragma once

#include <cstddef>
#include <cstdint>

namespace Shared {
    namespace Memory {
        inline constexpr uint64_t PAGE_SIZE          = 0x1000;
        inline constexpr uint64_t MIB                = 0x100000;

        inline constexpr uint64_t PagesToBytes(uint64_t pages) {
            return pages * PAGE_SIZE;
        }

        inline constexpr uint64_t PagesToMiB(uint64_t pages) {
            return PagesToBytes(pages) / MIB;
        }

        static_assert(PagesToMiB(256) == 1);
    }
}
