#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace zpr {

    // Canonical byte sequence - just a vector of bytes
    using Bytes = dp::Vector<dp::u8>;

    // Big-endian encoding for all multi-byte wire fields
    inline dp::Array<dp::u8, 2> encode_u16_be(dp::u16 value) {
        dp::Array<dp::u8, 2> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[1] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    inline dp::Array<dp::u8, 4> encode_u32_be(dp::u32 value) {
        echo::trace("encode_u32_be: value=", value);
        dp::Array<dp::u8, 4> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 24) & 0xFF);
        bytes[1] = static_cast<dp::u8>((value >> 16) & 0xFF);
        bytes[2] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[3] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    inline dp::Array<dp::u8, 8> encode_u64_be(dp::u64 value) {
        dp::Array<dp::u8, 8> bytes;
        for (dp::usize i = 0; i < 8; ++i) {
            bytes[i] = static_cast<dp::u8>((value >> (56 - 8 * i)) & 0xFF);
        }
        return bytes;
    }

    inline dp::u16 decode_u16_be(const dp::u8 *bytes) {
        return static_cast<dp::u16>((static_cast<dp::u16>(bytes[0]) << 8) | static_cast<dp::u16>(bytes[1]));
    }

    inline dp::u32 decode_u32_be(const dp::u8 *bytes) {
        dp::u32 value = (static_cast<dp::u32>(bytes[0]) << 24) | (static_cast<dp::u32>(bytes[1]) << 16) |
                        (static_cast<dp::u32>(bytes[2]) << 8) | static_cast<dp::u32>(bytes[3]);
        echo::trace("decode_u32_be: value=", value);
        return value;
    }

    inline dp::u64 decode_u64_be(const dp::u8 *bytes) {
        dp::u64 value = 0;
        for (dp::usize i = 0; i < 8; ++i) {
            value = (value << 8) | static_cast<dp::u64>(bytes[i]);
        }
        return value;
    }

    // Helpers to encode directly into a vector
    inline void append_u16_be(Bytes &buffer, dp::u16 value) {
        auto bytes = encode_u16_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    inline void append_u32_be(Bytes &buffer, dp::u32 value) {
        auto bytes = encode_u32_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    inline void append_u64_be(Bytes &buffer, dp::u64 value) {
        auto bytes = encode_u64_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    // Lowercase hex rendering, for diagnostics and examples
    inline dp::String to_hex(const dp::u8 *data, dp::usize len) {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (dp::usize i = 0; i < len; ++i) {
            out.push_back(digits[(data[i] >> 4) & 0x0F]);
            out.push_back(digits[data[i] & 0x0F]);
        }
        return dp::String(out.c_str(), out.size());
    }

    inline dp::String to_hex(const Bytes &bytes) { return to_hex(bytes.data(), bytes.size()); }

    // FNV-1a over canonical bytes; used for std::hash of the identifier types
    inline dp::usize hash_bytes(const dp::u8 *data, dp::usize len) {
        dp::u64 h = 1469598103934665603ULL;
        for (dp::usize i = 0; i < len; ++i) {
            h ^= static_cast<dp::u64>(data[i]);
            h *= 1099511628211ULL;
        }
        return static_cast<dp::usize>(h);
    }

    // Lexicographic compare of two byte ranges (-1, 0, 1)
    inline int compare_bytes(const Bytes &a, const Bytes &b) {
        dp::usize n = a.size() < b.size() ? a.size() : b.size();
        if (n > 0) {
            int c = std::memcmp(a.data(), b.data(), n);
            if (c != 0) {
                return c < 0 ? -1 : 1;
            }
        }
        if (a.size() == b.size()) {
            return 0;
        }
        return a.size() < b.size() ? -1 : 1;
    }

    inline std::string to_std(const dp::String &s) { return std::string(s.c_str(), s.size()); }

    inline dp::String to_dp(const std::string &s) { return dp::String(s.c_str(), s.size()); }

    // Helper to write exactly n bytes to a file descriptor
    // Returns dp::Res<void> - ok if all bytes written, error otherwise
    // ERROR CATEGORIZATION:
    // - not_found: connection closed (ECONNRESET, EPIPE, EBADF, ENOTCONN)
    // - io_error: other I/O errors, including a full non-blocking descriptor
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count) {
        dp::usize total_written = 0;
        while (total_written < count) {
            dp::isize n = ::write(fd, buffer + total_written, count - total_written);
            if (n < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }

                if (errno == ECONNRESET) {
                    echo::trace("write failed: connection reset by peer (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("connection reset by peer"));
                }
                if (errno == EPIPE) {
                    echo::trace("write failed: broken pipe (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("broken pipe"));
                }
                if (errno == EBADF) {
                    echo::trace("write failed: bad file descriptor (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("bad file descriptor"));
                }
                if (errno == ENOTCONN) {
                    echo::trace("write failed: socket not connected (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("socket not connected"));
                }

                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    echo::trace("write would block (fd=", fd, ", wanted=", count, ", wrote=", total_written, ")");
                    return dp::result::err(dp::Error::io_error("write would block"));
                }

                echo::trace("write failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("write error: ") + strerror(errno)));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

} // namespace zpr
