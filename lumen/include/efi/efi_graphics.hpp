#pragma once

#include <shared/Response.hpp>
#include <shared/efi/efi_abi.hpp>
#include <shared/graphics/basic.hpp>

#include <efi/efi_misc.hpp>

namespace EFI {
    Response<FirmwareError, EFI_GRAPHICS_OUTPUT_PROTOCOL*> LocateGraphicsProtocol(const EFI_SYSTEM_TABLE* table);
}

namespace Lumen {
    Response<EFI::FirmwareError, Shared::Graphics::BasicGraphics> LoadGraphics(const EFI_SYSTEM_TABLE* table);
}
