#pragma once

#include <efi/efi_misc.hpp>

namespace Panic {
    [[noreturn]] void Panic(const char* msg);
    [[noreturn]] void Panic(const char* msg, EFI::FirmwareError error);
}
