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


#include <climits>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <shared/efi/efi_abi.hpp>

#include <efi/efi_misc.hpp>
#include <lumen/bitmap.hpp>
#include <lumen/console.hpp>

#include <ldstdio.hpp>
#include <ldstdlib.hpp>

namespace {
    std::string format(const char* fmt, ...) {
        char buffer[256];

        va_list args;
        va_start(args, fmt);
        Lumen::vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        return std::string(buffer);
    }

    struct ConOutRecorder {
        std::u16string text;
        size_t calls = 0;
        EFI_STATUS status = EFI_SUCCESS;
    };

    ConOutRecorder recorder;

    EFI_STATUS EFIAPI recordOutputString(EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL*, const CHAR16* s) {
        ++recorder.calls;
        recorder.text += s;
        return recorder.status;
    }

    class FirmwareConsoleTest : public ::testing::Test {
    protected:
        void SetUp() override {
            recorder = ConOutRecorder{};
            conOut.OutputString = recordOutputString;
            table.ConOut = &conOut;
            EFI::sys = &table;
        }

        void TearDown() override {
            Lumen::AttachScreen(nullptr);
            EFI::sys = nullptr;
        }

        EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL conOut{};
        EFI_SYSTEM_TABLE table{};
    };
}

TEST(Vsnprintf, Integers) {
    EXPECT_EQ(format("%d", 42), "42");
    EXPECT_EQ(format("%d", -42), "-42");
    EXPECT_EQ(format("%i", 0), "0");
    EXPECT_EQ(format("%+d", 5), "+5");
    EXPECT_EQ(format("% d", 5), " 5");
    EXPECT_EQ(format("%u", 3000000000u), "3000000000");
    EXPECT_EQ(format("%lld", LLONG_MIN), "-9223372036854775808");
    EXPECT_EQ(format("%llu", ULLONG_MAX), "18446744073709551615");
    EXPECT_EQ(format("%zu", static_cast<size_t>(1234)), "1234");
    EXPECT_EQ(format("%hhu", 261), "5");
    EXPECT_EQ(format("%hd", 65535), "-1");
}

TEST(Vsnprintf, Radixes) {
    EXPECT_EQ(format("%x", 255u), "ff");
    EXPECT_EQ(format("%X", 0xABCDu), "ABCD");
    EXPECT_EQ(format("%#x", 255u), "0xff");
    EXPECT_EQ(format("%#X", 255u), "0XFF");
    EXPECT_EQ(format("%#x", 0u), "0");
    EXPECT_EQ(format("%o", 8u), "10");
    EXPECT_EQ(format("%#o", 8u), "010");
    EXPECT_EQ(format("%.2x", 0x7u), "07");
}

TEST(Vsnprintf, FieldWidthAndPrecision) {
    EXPECT_EQ(format("%5d|", 42), "   42|");
    EXPECT_EQ(format("%-5d|", 42), "42   |");
    EXPECT_EQ(format("%05d", -42), "-0042");
    EXPECT_EQ(format("%.4d", 42), "0042");
    EXPECT_EQ(format("%08.3d", 7), "     007");
    EXPECT_EQ(format("%*d", 4, 7), "   7");
    EXPECT_EQ(format("%*d|", -4, 7), "7   |");
    EXPECT_EQ(format("%#010x", 0xBEEFu), "0x0000beef");
}

TEST(Vsnprintf, StringsAndCharacters) {
    EXPECT_EQ(format("%s", "hello"), "hello");
    EXPECT_EQ(format("%5s|", "ab"), "   ab|");
    EXPECT_EQ(format("%-5s|", "ab"), "ab   |");
    EXPECT_EQ(format("%.3s", "abcdef"), "abc");
    EXPECT_EQ(format("%s", static_cast<const char*>(nullptr)), "(null)");
    EXPECT_EQ(format("%c%c", 'o', 'k'), "ok");
    EXPECT_EQ(format("%3c", 'z'), "  z");
    EXPECT_EQ(format("%-3c|", 'z'), "z  |");
}

TEST(Vsnprintf, NulCharacterIsCounted) {
    char buffer[8];

    EXPECT_EQ(Lumen::snprintf(buffer, sizeof(buffer), "%3c|", 0), 4u);
    EXPECT_EQ(buffer[0], ' ');
    EXPECT_EQ(buffer[1], ' ');
    EXPECT_EQ(buffer[2], '\0');
    EXPECT_EQ(buffer[3], '|');
    EXPECT_EQ(buffer[4], '\0');

    EXPECT_EQ(Lumen::snprintf(buffer, sizeof(buffer), "%-2c|", 0), 3u);
    EXPECT_EQ(buffer[0], '\0');
    EXPECT_EQ(buffer[1], ' ');
    EXPECT_EQ(buffer[2], '|');
}

TEST(Vsnprintf, PointersAndEscapes) {
    EXPECT_EQ(format("%p", static_cast<void*>(nullptr)), "0x0000000000000000");
    EXPECT_EQ(format("%p", reinterpret_cast<void*>(0xFEE00000)), "0x00000000fee00000");
    EXPECT_EQ(format("100%%"), "100%");
    EXPECT_EQ(format("%q"), "%q");
}

TEST(Vsnprintf, TruncatesAndTerminates) {
    char buffer[6];

    size_t n = Lumen::snprintf(buffer, sizeof(buffer), "hello world");
    EXPECT_EQ(n, 5u);
    EXPECT_STREQ(buffer, "hello");

    n = Lumen::snprintf(buffer, sizeof(buffer), "%d", 123456789);
    EXPECT_EQ(n, 5u);
    EXPECT_STREQ(buffer, "12345");

    n = Lumen::snprintf(buffer, sizeof(buffer), "%s", "ok");
    EXPECT_EQ(n, 2u);
    EXPECT_STREQ(buffer, "ok");

    buffer[0] = 'x';
    EXPECT_EQ(Lumen::snprintf(buffer, 0, "anything"), 0u);
    EXPECT_EQ(buffer[0], 'x');
}

TEST(Ldstdlib, Utoa) {
    char buffer[72];

    EXPECT_EQ(Lumen::utoa(0, buffer, 10), 1);
    EXPECT_STREQ(buffer, "0");
    EXPECT_EQ(Lumen::utoa(0xDEADBEEF, buffer, 16), 8);
    EXPECT_STREQ(buffer, "deadbeef");
    EXPECT_EQ(Lumen::utoa(UINT64_MAX, buffer, 2), 64);
}

TEST(Ldstdlib, MemoryRoutines) {
    char text[] = "abcdefgh";

    Lumen::memmove(text + 2, text, 4);
    EXPECT_STREQ(text, "ababcdgh");

    Lumen::memmove(text, text + 2, 4);
    EXPECT_STREQ(text, "abcdcdgh");

    Lumen::memset(text, 'z', 3);
    EXPECT_STREQ(text, "zzzdcdgh");

    char copy[9] = {};
    Lumen::memcpy(copy, text, 8);
    EXPECT_STREQ(copy, "zzzdcdgh");

    EXPECT_EQ(Lumen::strlen(""), 0u);
    EXPECT_EQ(Lumen::strlen(text), 8u);
}

TEST_F(FirmwareConsoleTest, PutsConvertsToUcs2) {
    EXPECT_EQ(Lumen::puts("Lumen"), EFI_SUCCESS);
    EXPECT_EQ(recorder.text, u"Lumen");
}

TEST_F(FirmwareConsoleTest, NewlineReturnsToColumnZero) {
    EXPECT_EQ(Lumen::puts("a\nb\n"), EFI_SUCCESS);
    EXPECT_EQ(recorder.text, u"a\n\rb\n\r");
}

TEST_F(FirmwareConsoleTest, LongStringsAreChunked) {
    std::string line(300, 'x');
    line += "\n";

    EXPECT_EQ(Lumen::puts(line.c_str()), EFI_SUCCESS);
    EXPECT_GT(recorder.calls, 1u);

    std::u16string expected(300, u'x');
    expected += u"\n\r";
    EXPECT_EQ(recorder.text, expected);
}

TEST_F(FirmwareConsoleTest, FailureStatusIsReturned) {
    recorder.status = EFI_DEVICE_ERROR;
    EXPECT_EQ(Lumen::puts("x"), EFI_DEVICE_ERROR);
}

TEST_F(FirmwareConsoleTest, PrintfWritesFormattedText) {
    EXPECT_EQ(Lumen::printf("i = %d\n", 3), 6u);
    EXPECT_EQ(recorder.text, u"i = 3\n\r");
}

TEST_F(FirmwareConsoleTest, AttachedScreenMirrorsOutput) {
    std::vector<uint32_t> storage(64 * 32, 0x00ABABAB);
    Lumen::Graphics::MemoryBitmap bmp(storage.data(), 64, 32);
    Lumen::Graphics::Console console(bmp);

    Lumen::AttachScreen(&console);
    Lumen::printf("%s", "AB");

    EXPECT_EQ(console.CursorX(), 16);
    EXPECT_EQ(recorder.text, u"AB");
}

TEST(FirmwareConsole, NotReadyWithoutSystemTable) {
    EFI::sys = nullptr;
    EXPECT_EQ(Lumen::puts("lost"), EFI_NOT_READY);
}
