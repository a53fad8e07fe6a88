#pragma once

#include <zpr/address.hpp>
#include <zpr/dn.hpp>
#include <zpr/rpc_commands.hpp>
#include <zpr/version.hpp>

#include <optional>

namespace zpr {

    /// ZPR Parameter Index
    using Zpi = dp::u8;

    /// ZPI 0, used for keying and early ZARP
    constexpr Zpi ZPI_0 = 0;

    /// Marks packets whose header is encrypted
    constexpr Zpi ZPI_ENCRYPTED_HEADER_FLAG = 0x80;

    /// Abstract message sequence number; headers carry a suffix of it
    using SeqNum = dp::u64;

    /// Security Association ID; shares its 8 bits with the ZPI
    using SaId = dp::u8;

    /// Link or docking session ID
    using LinkId = dp::u32;

    /// Packet not associated with a link (typically link setup)
    constexpr LinkId LINK_ID_UNKNOWN = 0;

    /// A node or adapter's local actor
    constexpr LinkId LOCAL_ACTOR_LINK_ID = 1;

    /// On an adapter: the dock it is connected to. On a node: its internal dock.
    constexpr LinkId DOCK_LINK_ID = 2;

    using StreamId = dp::u32;

    /// Reserved for node-to-node / control-plane traffic
    constexpr StreamId NODE_TO_NODE_STREAM_ID = 0;

    using VisaId = dp::i32;
    constexpr VisaId SPECIAL_VISA_ID = 0;

    /// Adapter-to-adapter SAID
    using A2aSaid = dp::u8;

    /// Key management algorithm identifier
    using KmId = dp::u16;
    constexpr KmId KM_ID_NULL = 0;
    constexpr KmId KM_ID_IKEV2 = 1;
    constexpr KmId KM_ID_NOISE = 2;
    constexpr KmId KM_ID_EXPERIMENTAL = 255;

    /// Bitmask indicating how an actor packet is compressed
    using CompressionMode = dp::u8;

    namespace compression_mode {
        constexpr CompressionMode DESTINATION_PORT_PRESENT = 0x20;
        constexpr CompressionMode SOURCE_PORT_PRESENT = 0x40;
    } // namespace compression_mode

    /// Forwarding next-hop, also the key used to look one up
    struct ForwardingEntry {
        LinkId link;
        StreamId stream;

        bool operator==(const ForwardingEntry &other) const { return link == other.link && stream == other.stream; }
        bool operator!=(const ForwardingEntry &other) const { return !(*this == other); }
    };

    /// One side of a unit of traffic
    struct PacketEndpoint {
        Address address;
        DistinguishedName dn; // may be the empty DN

        bool operator==(const PacketEndpoint &other) const { return address == other.address && dn == other.dn; }
        bool operator!=(const PacketEndpoint &other) const { return !(*this == other); }
    };

    /// Auxiliary header fields
    struct PacketAux {
        SeqNum seq = 0;
        LinkId link = LINK_ID_UNKNOWN;
        StreamId stream = NODE_TO_NODE_STREAM_ID;
        Zpi zpi = ZPI_0;
        dp::u16 flags = 0;

        bool operator==(const PacketAux &other) const {
            return seq == other.seq && link == other.link && stream == other.stream && zpi == other.zpi &&
                   flags == other.flags;
        }
        bool operator!=(const PacketAux &other) const { return !(*this == other); }
    };

    /// Metadata envelope for one RPC unit
    /// Built per outbound unit, consumed once by the serializer. with_length() must be given the
    /// true payload length; the framing layer refuses (producer) or rejects (consumer) mismatches.
    class PacketInfo {
      private:
        PacketEndpoint source_;
        PacketEndpoint destination_;
        RpcCommand command_;
        PacketAux aux_;
        std::optional<dp::u32> length_;

        PacketInfo(PacketEndpoint source, PacketEndpoint destination, RpcCommand command, PacketAux aux)
            : source_(std::move(source)), destination_(std::move(destination)), command_(command), aux_(aux) {}

        static Res<dp::usize> write_endpoint(Sink &sink, const PacketEndpoint &endpoint) {
            auto addr_res = endpoint.address.write_to(sink);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }
            auto dn_res = endpoint.dn.write_to(sink);
            if (dn_res.is_err()) {
                return dp::result::err(dn_res.error());
            }
            return dp::result::ok(addr_res.value() + dn_res.value());
        }

      public:
        /// Pure constructor, no validation
        static PacketInfo build(const PacketEndpoint &source, const PacketEndpoint &destination, RpcCommand command,
                                const PacketAux &aux = PacketAux()) {
            return PacketInfo(source, destination, command, aux);
        }

        /// Copy of this PacketInfo declaring `payload_len` bytes of payload
        PacketInfo with_length(dp::u32 payload_len) const {
            PacketInfo copy = *this;
            copy.length_ = payload_len;
            return copy;
        }

        const PacketEndpoint &source() const { return source_; }
        const PacketEndpoint &destination() const { return destination_; }
        RpcCommand command() const { return command_; }
        const PacketAux &aux() const { return aux_; }
        bool has_length() const { return length_.has_value(); }
        std::optional<dp::u32> length() const { return length_; }

        Res<dp::usize> write_to(Sink &sink) const {
            // Fixed-size fields: [version:1][zpi:1][flags:2][seq:8][link:4][stream:4]
            Bytes fixed;
            fixed.push_back(PACKET_INFO_VERSION_CURRENT);
            fixed.push_back(aux_.zpi);
            append_u16_be(fixed, aux_.flags);
            append_u64_be(fixed, aux_.seq);
            append_u32_be(fixed, aux_.link);
            append_u32_be(fixed, aux_.stream);

            auto fixed_res = write_bytes(sink, fixed.data(), fixed.size());
            if (fixed_res.is_err()) {
                return dp::result::err(fixed_res.error());
            }
            dp::usize total = fixed_res.value();

            auto command_res = command_.write_to(sink);
            if (command_res.is_err()) {
                return dp::result::err(command_res.error());
            }
            total += command_res.value();

            auto endpoint_res = write_endpoint(sink, source_);
            if (endpoint_res.is_err()) {
                return dp::result::err(endpoint_res.error());
            }
            total += endpoint_res.value();

            auto dest_res = write_endpoint(sink, destination_);
            if (dest_res.is_err()) {
                return dp::result::err(dest_res.error());
            }
            total += dest_res.value();

            // [has_length:1][length:4 if has_length]
            Bytes tail;
            tail.push_back(length_ ? 1 : 0);
            if (length_) {
                append_u32_be(tail, *length_);
            }
            auto tail_res = write_bytes(sink, tail.data(), tail.size());
            if (tail_res.is_err()) {
                return dp::result::err(tail_res.error());
            }
            total += tail_res.value();

            echo::trace("wrote packet info: command=", command_.to_string().c_str(), " seq=", aux_.seq,
                        " bytes=", total);
            return dp::result::ok(total);
        }

        static Res<PacketInfo> read_from(Reader &reader) {
            auto version = reader.read_u8();
            if (version.is_err()) {
                return dp::result::err(version.error());
            }
            if (!is_packet_info_version_supported(version.value())) {
                echo::error("unsupported packet info version: ", static_cast<int>(version.value()));
                return dp::result::err(Error::truncated("unsupported packet info version"));
            }

            PacketAux aux;
            auto zpi = reader.read_u8();
            if (zpi.is_err()) {
                return dp::result::err(zpi.error());
            }
            aux.zpi = zpi.value();

            auto flags = reader.read_u16();
            if (flags.is_err()) {
                return dp::result::err(flags.error());
            }
            aux.flags = flags.value();

            auto seq = reader.read_u64();
            if (seq.is_err()) {
                return dp::result::err(seq.error());
            }
            aux.seq = seq.value();

            auto link = reader.read_u32();
            if (link.is_err()) {
                return dp::result::err(link.error());
            }
            aux.link = link.value();

            auto stream = reader.read_u32();
            if (stream.is_err()) {
                return dp::result::err(stream.error());
            }
            aux.stream = stream.value();

            auto command = RpcCommand::read_from(reader);
            if (command.is_err()) {
                return dp::result::err(command.error());
            }

            auto src_addr = Address::read_from(reader);
            if (src_addr.is_err()) {
                return dp::result::err(src_addr.error());
            }
            auto src_dn = DistinguishedName::read_from(reader);
            if (src_dn.is_err()) {
                return dp::result::err(src_dn.error());
            }
            auto dst_addr = Address::read_from(reader);
            if (dst_addr.is_err()) {
                return dp::result::err(dst_addr.error());
            }
            auto dst_dn = DistinguishedName::read_from(reader);
            if (dst_dn.is_err()) {
                return dp::result::err(dst_dn.error());
            }

            PacketInfo info(PacketEndpoint{src_addr.value(), src_dn.value()},
                            PacketEndpoint{dst_addr.value(), dst_dn.value()}, command.value(), aux);

            auto has_length = reader.read_u8();
            if (has_length.is_err()) {
                return dp::result::err(has_length.error());
            }
            if (has_length.value() > 1) {
                echo::error("invalid has_length byte: ", static_cast<int>(has_length.value()));
                return dp::result::err(Error::truncated("invalid has_length byte"));
            }
            if (has_length.value() == 1) {
                auto length = reader.read_u32();
                if (length.is_err()) {
                    return dp::result::err(length.error());
                }
                info.length_ = length.value();
            }

            echo::trace("read packet info: command=", info.command_.to_string().c_str(), " seq=", aux.seq);
            return dp::result::ok(std::move(info));
        }

        bool operator==(const PacketInfo &other) const {
            return source_ == other.source_ && destination_ == other.destination_ && command_ == other.command_ &&
                   aux_ == other.aux_ && length_ == other.length_;
        }
        bool operator!=(const PacketInfo &other) const { return !(*this == other); }
    };

} // namespace zpr
