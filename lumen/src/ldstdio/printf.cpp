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

#include <cstdarg>
#include <cstddef>
#include <cstdint>

#include <lumen/config.hpp>

#include <ldstdio.hpp>
#include <ldstdlib.hpp>

namespace {
    enum class length_modifier {
        hh,
        h,
        none,
        l,
        ll,
        j,
        z,
        t
    };

    // bounded output cursor; keeps room for the terminator
    struct OutputBuffer {
        char* buffer;
        size_t bufsz;
        size_t written;

        inline void putc(char c) {
            if (written + 1 < bufsz) {
                buffer[written] = c;
            }
            ++written;
        }

        inline void puts(const char* s) {
            while (*s != '\0') {
                putc(*s++);
            }
        }

        inline void pad(char c, intmax_t count) {
            for (intmax_t i = 0; i < count; ++i) {
                putc(c);
            }
        }

        inline void terminate() {
            if (bufsz == 0) {
                return;
            }

            buffer[written < bufsz ? written : bufsz - 1] = '\0';
        }
    };

    #define case_fetch_ret(lmodif, type, ret_type) case length_modifier::lmodif: return (ret_type)va_arg(*vlist, type)
    static inline intmax_t fetch_signed_number(length_modifier lmodif, va_list* vlist) {
        switch (lmodif) {
            case length_modifier::hh: return static_cast<signed char>(va_arg(*vlist, int));
            case length_modifier::h: return static_cast<short>(va_arg(*vlist, int));
            case_fetch_ret(none, int, intmax_t);
            case_fetch_ret(l, long, intmax_t);
            case_fetch_ret(ll, long long, intmax_t);
            case_fetch_ret(j, intmax_t, intmax_t);
            case_fetch_ret(z, size_t, intmax_t);
            case_fetch_ret(t, ptrdiff_t, intmax_t);
        }

        return 0;
    }

    static inline uintmax_t fetch_unsigned_number(length_modifier lmodif, va_list* vlist) {
        switch (lmodif) {
            case length_modifier::hh: return static_cast<unsigned char>(va_arg(*vlist, unsigned int));
            case length_modifier::h: return static_cast<unsigned short>(va_arg(*vlist, unsigned int));
            case_fetch_ret(none, unsigned int, uintmax_t);
            case_fetch_ret(l, unsigned long, uintmax_t);
            case_fetch_ret(ll, unsigned long long, uintmax_t);
            case_fetch_ret(j, uintmax_t, uintmax_t);
            case_fetch_ret(z, size_t, uintmax_t);
            case_fetch_ret(t, ptrdiff_t, uintmax_t);
        }

        return 0;
    }
    #undef case_fetch_ret

    static inline void precision_fill(intmax_t* _len, intmax_t precision, char* number_buffer) {
        intmax_t len = *_len;

        if (precision > len) {
            for (intmax_t i = len; i > 0; --i) {
                number_buffer[i - 1 + precision - len] = number_buffer[i - 1];
            }
            for (intmax_t i = 0; i < precision - len; ++i) {
                number_buffer[i] = '0';
            }
            number_buffer[precision] = '\0';
            *_len = precision;
        }
    }

    // prefix is a sign or "0x"; zero padding goes between prefix and digits
    static void emit_number(
        OutputBuffer& out,
        const char* prefix,
        const char* digits,
        intmax_t len,
        intmax_t minimum_field_size,
        bool left_justify,
        bool leading_zeroes
    ) {
        const intmax_t prefix_len = static_cast<intmax_t>(Lumen::strlen(prefix));
        const intmax_t padding = minimum_field_size - prefix_len - len;

        if (left_justify) {
            out.puts(prefix);
            out.puts(digits);
            out.pad(' ', padding);
        }
        else if (leading_zeroes) {
            out.puts(prefix);
            out.pad('0', padding);
            out.puts(digits);
        }
        else {
            out.pad(' ', padding);
            out.puts(prefix);
            out.puts(digits);
        }
    }

    // 64-bit octal needs 22 digits
    static constexpr intmax_t MAX_PRECISION = 32;
    static constexpr size_t NUMBER_BUFFER_SIZE = MAX_PRECISION + 2;
}

size_t Lumen::vsnprintf(char* buffer, size_t bufsz, const char* format, va_list args) {
    OutputBuffer out{ .buffer = buffer, .bufsz = bufsz, .written = 0 };
    char c;

    // local copy, so the fetch helpers can take its address on every ABI
    va_list vlist;
    va_copy(vlist, args);

    while (*format != '\0') {
        c = *format++;

        if (c != '%') {
            out.putc(c);
            continue;
        }

        if (*format == '%') {
            out.putc('%');
            ++format;
            continue;
        }

        bool left_justify = false,
            force_sign = false,
            prepend_space = false,
            alternative_conv = false,
            leading_zeroes = false;

        bool exit_loop = false;

        while (!exit_loop) {
            c = *format++;

            switch (c) {
                case '-':
                    left_justify = true;
                    leading_zeroes = false;
                    break;
                case '+':
                    force_sign = true;
                    prepend_space = false;
                    break;
                case ' ':
                    prepend_space = !force_sign;
                    break;
                case '#':
                    alternative_conv = true;
                    break;
                case '0':
                    leading_zeroes = !left_justify;
                    break;
                default:
                    exit_loop = true;
                    --format;
                    break;
            }
        }

        intmax_t minimum_field_size = 0;

        if (*format == '*') {
            ++format;
            minimum_field_size = va_arg(vlist, int);

            if (minimum_field_size < 0) {
                left_justify = true;
                leading_zeroes = false;
                minimum_field_size = -minimum_field_size;
            }
        }
        else {
            while (*format >= '0' && *format <= '9') {
                minimum_field_size *= 10;
                minimum_field_size += static_cast<intmax_t>(*format++ - '0');
            }
        }

        intmax_t precision = -1;

        if (*format == '.') {
            ++format;

            if (*format == '*') {
                ++format;
                precision = va_arg(vlist, int);
            }
            else {
                precision = 0;
                while (*format >= '0' && *format <= '9') {
                    precision *= 10;
                    precision += static_cast<intmax_t>(*format++ - '0');
                }
            }
        }

        length_modifier lmodif = length_modifier::none;

        switch (*format) {
            case 'h':
                ++format;
                if (*format == 'h') {
                    ++format;
                    lmodif = length_modifier::hh;
                }
                else {
                    lmodif = length_modifier::h;
                }
                break;
            case 'l':
                ++format;
                if (*format == 'l') {
                    ++format;
                    lmodif = length_modifier::ll;
                }
                else {
                    lmodif = length_modifier::l;
                }
                break;
            case 'j':
                ++format;
                lmodif = length_modifier::j;
                break;
            case 'z':
                ++format;
                lmodif = length_modifier::z;
                break;
            case 't':
                ++format;
                lmodif = length_modifier::t;
                break;
            default:
                break;
        }

        c = *format;
        if (c == '\0') {
            break;
        }
        ++format;

        // a precision also switches zero padding off, as in C
        if (precision >= 0) {
            leading_zeroes = false;
        }
        if (precision > MAX_PRECISION) {
            precision = MAX_PRECISION;
        }

        char number_buffer[NUMBER_BUFFER_SIZE];

        switch (c) {
            case 'c': {
                const char ch = static_cast<char>(va_arg(vlist, int));

                if (!left_justify) {
                    out.pad(' ', minimum_field_size - 1);
                }
                out.putc(ch);
                if (left_justify) {
                    out.pad(' ', minimum_field_size - 1);
                }
                break;
            }
            case 's': {
                const char* s = va_arg(vlist, const char*);
                if (s == nullptr) {
                    s = "(null)";
                }

                intmax_t length = static_cast<intmax_t>(Lumen::strlen(s));
                if (precision >= 0 && precision < length) {
                    length = precision;
                }

                if (!left_justify) {
                    out.pad(' ', minimum_field_size - length);
                }
                for (intmax_t i = 0; i < length; ++i) {
                    out.putc(s[i]);
                }
                if (left_justify) {
                    out.pad(' ', minimum_field_size - length);
                }
                break;
            }
            case 'd':
            case 'i': {
                intmax_t number = fetch_signed_number(lmodif, &vlist);
                uintmax_t magnitude = number < 0 ? -static_cast<uintmax_t>(number) : static_cast<uintmax_t>(number);

                intmax_t len = Lumen::utoa(magnitude, number_buffer, 10);
                precision_fill(&len, precision < 0 ? 1 : precision, number_buffer);

                const char* prefix = number < 0 ? "-" : force_sign ? "+" : prepend_space ? " " : "";
                emit_number(out, prefix, number_buffer, len, minimum_field_size, left_justify, leading_zeroes);
                break;
            }
            case 'u':
            case 'o':
            case 'x':
            case 'X': {
                uintmax_t number = fetch_unsigned_number(lmodif, &vlist);
                const INT32 radix = c == 'u' ? 10 : c == 'o' ? 8 : 16;

                intmax_t len = Lumen::utoa(number, number_buffer, radix);

                if (c == 'X') {
                    for (intmax_t i = 0; i < len; ++i) {
                        if (number_buffer[i] >= 'a' && number_buffer[i] <= 'f') {
                            number_buffer[i] -= ('a' - 'A');
                        }
                    }
                }

                precision_fill(&len, precision < 0 ? 1 : precision, number_buffer);

                const char* prefix = "";
                if (alternative_conv && number != 0) {
                    prefix = c == 'o' ? "0" : c == 'X' ? "0X" : c == 'x' ? "0x" : "";
                }

                emit_number(out, prefix, number_buffer, len, minimum_field_size, left_justify, leading_zeroes);
                break;
            }
            case 'p': {
                const uintptr_t address = reinterpret_cast<uintptr_t>(va_arg(vlist, void*));

                intmax_t len = Lumen::utoa(address, number_buffer, 16);
                precision_fill(&len, 16, number_buffer);

                emit_number(out, "0x", number_buffer, len, minimum_field_size, left_justify, false);
                break;
            }
            default:
                // unknown conversion: echo it back
                out.putc('%');
                out.putc(c);
                break;
        }
    }

    va_end(vlist);

    out.terminate();
    return out.written < bufsz ? out.written : (bufsz == 0 ? 0 : bufsz - 1);
}

size_t Lumen::snprintf(char* buffer, size_t bufsz, const char* format, ...) {
    va_list args;
    va_start(args, format);

    size_t n = Lumen::vsnprintf(buffer, bufsz, format, args);

    va_end(args);
    return n;
}

size_t Lumen::printf(const char* format, ...) {
    char buffer[Config::PRINTF_BUFFER_SIZE];

    va_list args;
    va_start(args, format);

    size_t n = Lumen::vsnprintf(buffer, sizeof(buffer), format, args);

    va_end(args);
    Lumen::puts(buffer);

    return n;
}
