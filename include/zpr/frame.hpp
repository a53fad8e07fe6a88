#pragma once

#include <zpr/packet_info.hpp>

namespace zpr {

    /// Frame format: [packet info header][payload:N]
    /// When the header declares a length, N must equal it. All multi-byte integers are big-endian.

    /// Result of decoding a frame
    struct Frame {
        PacketInfo info;
        Bytes payload;
    };

    /// Consumer-side length check
    inline Res<void> verify_length(const PacketInfo &info, dp::usize payload_size) {
        if (!info.has_length()) {
            return dp::result::ok();
        }
        dp::u32 declared = *info.length();
        if (declared != payload_size) {
            echo::error("packet length mismatch: declared ", declared, " got ", payload_size);
            return dp::result::err(Error::length_mismatch(declared, payload_size));
        }
        return dp::result::ok();
    }

    /// Encode a frame into the sink
    /// An inconsistent declared length is refused before anything reaches the sink
    inline Res<dp::usize> write_frame(const PacketInfo &info, const dp::u8 *payload, dp::usize payload_size,
                                      Sink &sink) {
        if (info.has_length() && *info.length() != payload_size) {
            echo::error("refusing to emit frame: declared length ", *info.length(), " payload ", payload_size);
            return dp::result::err(Error::length_mismatch(*info.length(), payload_size));
        }

        auto header_res = info.write_to(sink);
        if (header_res.is_err()) {
            return dp::result::err(header_res.error());
        }

        auto payload_res = write_bytes(sink, payload, payload_size);
        if (payload_res.is_err()) {
            return dp::result::err(payload_res.error());
        }

        echo::trace("wrote frame: header=", header_res.value(), " payload=", payload_size);
        return dp::result::ok(header_res.value() + payload_res.value());
    }

    inline Res<dp::usize> write_frame(const PacketInfo &info, const Bytes &payload, Sink &sink) {
        return write_frame(info, payload.data(), payload.size(), sink);
    }

    /// Decode a frame; a declared length that does not match the bytes following the header
    /// rejects the packet before the payload is handed out
    inline Res<Frame> read_frame(const dp::u8 *data, dp::usize size) {
        Reader reader(data, size);
        auto info_res = PacketInfo::read_from(reader);
        if (info_res.is_err()) {
            return dp::result::err(info_res.error());
        }

        auto check = verify_length(info_res.value(), reader.remaining());
        if (check.is_err()) {
            return dp::result::err(check.error());
        }

        Bytes payload(reader.cursor(), reader.cursor() + reader.remaining());
        echo::trace("read frame: payload=", payload.size());
        return dp::result::ok(Frame{info_res.value(), std::move(payload)});
    }

    inline Res<Frame> read_frame(const Bytes &bytes) { return read_frame(bytes.data(), bytes.size()); }

} // namespace zpr
