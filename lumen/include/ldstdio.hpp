#pragma once

#include <cstdarg>
#include <cstddef>

#include <shared/efi/efi_abi.hpp>

namespace Lumen {
    namespace Graphics {
        class Console;
    }

    // writes to the firmware console, and to the screen console once one is attached
    EFI_STATUS puts(const char* s);

    size_t vsnprintf(char* buffer, size_t bufsz, const char* format, va_list vlist);
    size_t snprintf(char* buffer, size_t bufsz, const char* format, ...);
    size_t printf(const char* format, ...);

    void AttachScreen(Graphics::Console* console);
}
