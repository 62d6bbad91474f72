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
#include <cstring>

#include <gtest/gtest.h>

#include <shared/efi/efi_abi.hpp>
#include <shared/graphics/basic.hpp>

#include <efi/efi_graphics.hpp>
#include <efi/efi_misc.hpp>

namespace {
    constexpr uint64_t FAKE_FRAMEBUFFER = 0x80000000;

    // firmware state seen by the fake boot services
    struct FakeFirmware {
        EFI_STATUS locateStatus = EFI_SUCCESS;
        bool returnNullInterface = false;
        EFI_GUID requested{};
        EFI_GRAPHICS_OUTPUT_PROTOCOL* gop = nullptr;

        EFI_STATUS setModeStatus = EFI_SUCCESS;
        EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE* modeAfterSet = nullptr;
        int setModeCalls = 0;
        UINT32 setModeNumber = 0xFFFFFFFF;

        EFI_STATUS watchdogStatus = EFI_SUCCESS;
        int watchdogCalls = 0;
        UINTN watchdogTimeout = 1;
    };

    FakeFirmware firmware;

    EFI_STATUS EFIAPI fakeLocateProtocol(EFI_GUID* protocol, VOID*, VOID** iface) {
        firmware.requested = *protocol;

        if (firmware.locateStatus == EFI_SUCCESS && !firmware.returnNullInterface) {
            *iface = firmware.gop;
        }
        else {
            *iface = nullptr;
        }

        return firmware.locateStatus;
    }

    EFI_STATUS EFIAPI fakeSetMode(EFI_GRAPHICS_OUTPUT_PROTOCOL* self, UINT32 mode) {
        ++firmware.setModeCalls;
        firmware.setModeNumber = mode;

        if (firmware.setModeStatus == EFI_SUCCESS) {
            self->Mode = firmware.modeAfterSet;
        }

        return firmware.setModeStatus;
    }

    EFI_STATUS EFIAPI fakeSetWatchdogTimer(UINTN timeout, UINT64, UINTN, CHAR16*) {
        ++firmware.watchdogCalls;
        firmware.watchdogTimeout = timeout;
        return firmware.watchdogStatus;
    }

    class GraphicsProtocolTest : public ::testing::Test {
    protected:
        void SetUp() override {
            firmware = FakeFirmware{};
            firmware.gop = &gop;

            info.HorizontalResolution = 1024;
            info.VerticalResolution = 768;
            info.PixelFormat = PixelBlueGreenRedReserved8BitPerColor;
            info.PixelsPerScanLine = 1088;

            mode.MaxMode = 4;
            mode.Mode = 2;
            mode.Info = &info;
            mode.SizeOfInfo = sizeof(info);
            mode.FrameBufferBase = FAKE_FRAMEBUFFER;
            mode.FrameBufferSize = 768 * 1088 * 4;

            gop.SetMode = fakeSetMode;
            gop.Mode = &mode;

            bootServices.LocateProtocol = fakeLocateProtocol;
            bootServices.SetWatchdogTimer = fakeSetWatchdogTimer;
            table.BootServices = &bootServices;
        }

        EFI_GRAPHICS_OUTPUT_MODE_INFORMATION info{};
        EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE mode{};
        EFI_GRAPHICS_OUTPUT_PROTOCOL gop{};
        EFI_BOOT_SERVICES bootServices{};
        EFI_SYSTEM_TABLE table{};
    };
}

TEST_F(GraphicsProtocolTest, LocatesByGraphicsOutputGuid) {
    auto result = EFI::LocateGraphicsProtocol(&table);

    ASSERT_FALSE(result.CheckError());
    EXPECT_EQ(result.GetValue(), &gop);
    EXPECT_EQ(std::memcmp(&firmware.requested, &EFI_GRAPHICS_OUTPUT_PROTOCOL_GUID, sizeof(EFI_GUID)), 0);
}

TEST_F(GraphicsProtocolTest, NotFoundIsProtocolNotFound) {
    firmware.locateStatus = EFI_NOT_FOUND;

    auto result = EFI::LocateGraphicsProtocol(&table);

    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().code, EFI::FirmwareErrorCode::ProtocolNotFound);
    EXPECT_EQ(result.GetError().status, EFI_NOT_FOUND);
}

TEST_F(GraphicsProtocolTest, NullInterfaceIsProtocolNotFound) {
    firmware.returnNullInterface = true;

    auto result = EFI::LocateGraphicsProtocol(&table);

    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().code, EFI::FirmwareErrorCode::ProtocolNotFound);
}

TEST_F(GraphicsProtocolTest, OtherFailuresKeepTheirStatus) {
    firmware.locateStatus = EFI_DEVICE_ERROR;

    auto result = EFI::LocateGraphicsProtocol(&table);

    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().code, EFI::FirmwareErrorCode::FirmwareCallFailed);
    EXPECT_EQ(result.GetError().status, EFI_DEVICE_ERROR);
}

TEST_F(GraphicsProtocolTest, MissingTableIsInvalidParameter) {
    auto result = EFI::LocateGraphicsProtocol(nullptr);
    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().status, EFI_INVALID_PARAMETER);

    table.BootServices = nullptr;
    result = EFI::LocateGraphicsProtocol(&table);
    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().code, EFI::FirmwareErrorCode::FirmwareCallFailed);
}

TEST_F(GraphicsProtocolTest, LoadGraphicsCopiesCurrentMode) {
    auto result = Lumen::LoadGraphics(&table);

    ASSERT_FALSE(result.CheckError());

    const Shared::Graphics::BasicGraphics gfx = result.GetValue();
    EXPECT_EQ(gfx.ResX, 1024u);
    EXPECT_EQ(gfx.ResY, 768u);
    EXPECT_EQ(gfx.PPSL, 1088u);
    EXPECT_EQ(gfx.PXFMT, PixelBlueGreenRedReserved8BitPerColor);
    EXPECT_EQ(reinterpret_cast<uint64_t>(gfx.FBADDR), FAKE_FRAMEBUFFER);
    EXPECT_EQ(gfx.FBSIZE, 768u * 1088u * 4u);
    EXPECT_EQ(firmware.setModeCalls, 0);
}

TEST_F(GraphicsProtocolTest, LoadGraphicsPropagatesLookupFailure) {
    firmware.locateStatus = EFI_NOT_FOUND;

    auto result = Lumen::LoadGraphics(&table);

    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().code, EFI::FirmwareErrorCode::ProtocolNotFound);
}

TEST_F(GraphicsProtocolTest, BltOnlyModeIsRejected) {
    info.PixelFormat = PixelBltOnly;

    auto result = Lumen::LoadGraphics(&table);

    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().code, EFI::FirmwareErrorCode::FirmwareCallFailed);
    EXPECT_EQ(result.GetError().status, EFI_UNSUPPORTED);
}

TEST_F(GraphicsProtocolTest, UndersizedFramebufferIsRejected) {
    mode.FrameBufferSize = 1024 * 768 * 4;

    auto result = Lumen::LoadGraphics(&table);

    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().status, EFI_UNSUPPORTED);
}

TEST_F(GraphicsProtocolTest, FallsBackToDefaultMode) {
    gop.Mode = nullptr;
    firmware.modeAfterSet = &mode;

    auto result = Lumen::LoadGraphics(&table);

    ASSERT_FALSE(result.CheckError());
    EXPECT_EQ(firmware.setModeCalls, 1);
    EXPECT_EQ(firmware.setModeNumber, 0u);
    EXPECT_EQ(result.GetValue().ResX, 1024u);
}

TEST_F(GraphicsProtocolTest, DefaultModeFailureIsReported) {
    gop.Mode = nullptr;
    firmware.setModeStatus = EFI_DEVICE_ERROR;

    auto result = Lumen::LoadGraphics(&table);

    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().code, EFI::FirmwareErrorCode::FirmwareCallFailed);
    EXPECT_EQ(result.GetError().status, EFI_DEVICE_ERROR);
}

TEST_F(GraphicsProtocolTest, DisableWatchdogClearsTimeout) {
    auto result = EFI::DisableWatchdog(&table);

    EXPECT_FALSE(result.CheckError());
    EXPECT_EQ(firmware.watchdogCalls, 1);
    EXPECT_EQ(firmware.watchdogTimeout, 0u);
}

TEST_F(GraphicsProtocolTest, DisableWatchdogReportsFailure) {
    firmware.watchdogStatus = EFI_UNSUPPORTED;

    auto result = EFI::DisableWatchdog(&table);

    ASSERT_TRUE(result.CheckError());
    EXPECT_EQ(result.GetError().status, EFI_UNSUPPORTED);
    EXPECT_TRUE(EFI::DisableWatchdog(nullptr).CheckError());
}

TEST(FirmwareNames, StatusAndMemoryTypes) {
    EXPECT_STREQ(EFI::StatusName(EFI_SUCCESS), "EFI_SUCCESS");
    EXPECT_STREQ(EFI::StatusName(EFI_NOT_FOUND), "EFI_NOT_FOUND");
    EXPECT_STREQ(EFI::StatusName(EFI_ERROR_BIT | 99), "EFI_ERROR");
    EXPECT_STREQ(EFI::StatusName(4), "EFI_WARNING");

    EXPECT_STREQ(EFI::ErrorName(EFI::FirmwareErrorCode::ProtocolNotFound), "ProtocolNotFound");
    EXPECT_STREQ(EFI::MemoryTypeName(EfiConventionalMemory), "CONVENTIONAL_MEMORY");
    EXPECT_STREQ(EFI::MemoryTypeName(EfiMaxMemoryType), "UNKNOWN");

    EXPECT_TRUE(EFI::IsError(EFI_BUFFER_TOO_SMALL));
    EXPECT_FALSE(EFI::IsError(EFI_SUCCESS));
}
