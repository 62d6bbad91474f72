#pragma once

#include <cstdint>

#include <shared/Response.hpp>
#include <shared/efi/efi_abi.hpp>

namespace EFI {
    extern EFI_SYSTEM_TABLE* sys;

    enum class FirmwareErrorCode : uint8_t {
        ProtocolNotFound,
        FirmwareCallFailed
    };

    struct FirmwareError {
        FirmwareErrorCode code;
        EFI_STATUS status;      // status returned by the failing call
    };

    typedef Response<FirmwareError, void> FirmwareResult;

    inline constexpr bool IsError(EFI_STATUS status) {
        return (status & EFI_ERROR_BIT) != 0;
    }

    inline FirmwareError CallFailed(EFI_STATUS status) {
        return FirmwareError{ .code = FirmwareErrorCode::FirmwareCallFailed, .status = status };
    }

    const char* ErrorName(FirmwareErrorCode code);
    const char* StatusName(EFI_STATUS status);
    const char* MemoryTypeName(uint32_t type);

    // stops the firmware watchdog, which otherwise resets the platform after 5 minutes
    FirmwareResult DisableWatchdog(const EFI_SYSTEM_TABLE* table);

    [[noreturn]] void Halt(void);
}
