#pragma once

#include <zpr/write_to.hpp>

#include <algorithm>
#include <arpa/inet.h>
#include <functional>
#include <netinet/in.h>
#include <optional>

namespace zpr {

    /// ZPR actor packet L3 type
    /// Open enumeration: any byte is representable, only 4 and 6 are named
    enum class L3Type : dp::u8 { Ipv4 = 4, Ipv6 = 6 };

    inline dp::String l3_type_to_string(L3Type type) {
        switch (type) {
        case L3Type::Ipv4:
            return "IPv4";
        case L3Type::Ipv6:
            return "IPv6";
        }
        return dp::String("[unknown L3 type ") +
               dp::String(std::to_string(static_cast<unsigned>(static_cast<dp::u8>(type))).c_str()) + "]";
    }

    /// Address families; the numeric value is the stable wire code
    enum class AddressKind : dp::u8 {
        Ipv4 = 0x04,     // 4 bytes
        Ipv6 = 0x06,     // 16 bytes
        SocketV4 = 0x14, // 4 address bytes + 2 port bytes (substrate address)
        SocketV6 = 0x16, // 16 address bytes + 2 port bytes (substrate address)
        Hostname = 0x20, // lowercase DNS name
        Ipc = 0x30       // Unix domain socket path
    };

    inline const char *address_kind_name(AddressKind kind) {
        switch (kind) {
        case AddressKind::Ipv4:
            return "ipv4";
        case AddressKind::Ipv6:
            return "ipv6";
        case AddressKind::SocketV4:
            return "socket-v4";
        case AddressKind::SocketV6:
            return "socket-v6";
        case AddressKind::Hostname:
            return "hostname";
        case AddressKind::Ipc:
            return "ipc";
        }
        return "unknown";
    }

    inline std::optional<AddressKind> address_kind_from_code(dp::u8 code) {
        switch (code) {
        case static_cast<dp::u8>(AddressKind::Ipv4):
        case static_cast<dp::u8>(AddressKind::Ipv6):
        case static_cast<dp::u8>(AddressKind::SocketV4):
        case static_cast<dp::u8>(AddressKind::SocketV6):
        case static_cast<dp::u8>(AddressKind::Hostname):
        case static_cast<dp::u8>(AddressKind::Ipc):
            return static_cast<AddressKind>(code);
        default:
            return std::nullopt;
        }
    }

    constexpr dp::usize MAX_HOSTNAME_LEN = 253;
    constexpr dp::usize MAX_HOSTNAME_LABEL_LEN = 63;
    constexpr dp::usize MAX_IPC_PATH_LEN = 107; // sun_path minus the terminating NUL

    /// Canonical network/service endpoint identifier
    /// Immutable once constructed; only the factories below can build one, and they validate
    class Address {
      private:
        AddressKind kind_;
        Bytes value_;

        Address(AddressKind kind, Bytes value) : kind_(kind), value_(std::move(value)) {}

        static Error invalid(const char *what, AddressKind kind) {
            echo::error("invalid ", address_kind_name(kind), " address: ", what);
            return Error::invalid_address(dp::String(address_kind_name(kind)) + ": " + what);
        }

        static bool is_hostname_char(dp::u8 c) {
            return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.';
        }

        // Expects already case-folded input
        static const char *check_hostname(const Bytes &name) {
            if (name.size() > MAX_HOSTNAME_LEN) {
                return "hostname too long";
            }
            dp::usize label_start = 0;
            bool last_label_numeric = true;
            for (dp::usize i = 0; i <= name.size(); ++i) {
                if (i == name.size() || name[i] == '.') {
                    dp::usize label_len = i - label_start;
                    if (label_len == 0) {
                        return "empty hostname label";
                    }
                    if (label_len > MAX_HOSTNAME_LABEL_LEN) {
                        return "hostname label too long";
                    }
                    if (name[label_start] == '-' || name[i - 1] == '-') {
                        return "hostname label starts or ends with '-'";
                    }
                    last_label_numeric = true;
                    for (dp::usize j = label_start; j < i; ++j) {
                        if (name[j] < '0' || name[j] > '9') {
                            last_label_numeric = false;
                        }
                    }
                    label_start = i + 1;
                    continue;
                }
                if (!is_hostname_char(name[i])) {
                    return "invalid hostname character";
                }
            }
            if (last_label_numeric) {
                return "hostname top-level label is numeric";
            }
            return nullptr;
        }

        static bool parse_port(const std::string &text, dp::u16 &port) {
            if (text.empty() || text.size() > 5) {
                return false;
            }
            dp::u32 value = 0;
            for (char c : text) {
                if (c < '0' || c > '9') {
                    return false;
                }
                value = value * 10 + static_cast<dp::u32>(c - '0');
            }
            if (value > 0xFFFF) {
                return false;
            }
            port = static_cast<dp::u16>(value);
            return true;
        }

        static std::string ntop(int family, const dp::u8 *data) {
            char buf[INET6_ADDRSTRLEN] = {};
            if (::inet_ntop(family, data, buf, sizeof(buf)) == nullptr) {
                return std::string();
            }
            return std::string(buf);
        }

      public:
        /// Validate raw bytes against the rules of `kind`
        /// Hostnames are folded to lowercase; every other kind is kept byte-exact
        static Res<Address> parse(AddressKind kind, const dp::u8 *raw, dp::usize len) {
            if (len == 0) {
                return dp::result::err(invalid("empty value", kind));
            }
            Bytes value(raw, raw + len);

            switch (kind) {
            case AddressKind::Ipv4:
                if (len != 4) {
                    return dp::result::err(invalid("expected 4 bytes", kind));
                }
                break;
            case AddressKind::Ipv6:
                if (len != 16) {
                    return dp::result::err(invalid("expected 16 bytes", kind));
                }
                break;
            case AddressKind::SocketV4:
                if (len != 6) {
                    return dp::result::err(invalid("expected 6 bytes", kind));
                }
                break;
            case AddressKind::SocketV6:
                if (len != 18) {
                    return dp::result::err(invalid("expected 18 bytes", kind));
                }
                break;
            case AddressKind::Hostname: {
                for (auto &c : value) {
                    if (c >= 'A' && c <= 'Z') {
                        c = static_cast<dp::u8>(c - 'A' + 'a');
                    }
                }
                const char *problem = check_hostname(value);
                if (problem != nullptr) {
                    return dp::result::err(invalid(problem, kind));
                }
                break;
            }
            case AddressKind::Ipc:
                if (len > MAX_IPC_PATH_LEN) {
                    return dp::result::err(invalid("path too long", kind));
                }
                for (auto c : value) {
                    if (c == 0) {
                        return dp::result::err(invalid("path contains NUL", kind));
                    }
                }
                break;
            default:
                echo::error("unknown address kind: ", static_cast<int>(static_cast<dp::u8>(kind)));
                return dp::result::err(Error::invalid_address("unknown address kind"));
            }

            echo::trace("parsed ", address_kind_name(kind), " address (", len, " bytes)");
            return dp::result::ok(Address(kind, std::move(value)));
        }

        static Res<Address> parse(AddressKind kind, const Bytes &raw) { return parse(kind, raw.data(), raw.size()); }

        /// Parse the human/configuration form of a specific kind
        ///   ipv4: 10.0.0.1       socket-v4: 10.0.0.1:5000
        ///   ipv6: fd5a:5052::1   socket-v6: [fd5a:5052::1]:5002
        ///   hostname: vs.zpr     ipc: /run/zpr/node.sock
        static Res<Address> from_text(AddressKind kind, const dp::String &text) {
            std::string s = to_std(text);
            if (s.empty()) {
                return dp::result::err(invalid("empty text", kind));
            }

            switch (kind) {
            case AddressKind::Ipv4: {
                dp::u8 buf[4];
                if (::inet_pton(AF_INET, s.c_str(), buf) != 1) {
                    return dp::result::err(invalid("not a dotted-quad address", kind));
                }
                return parse(kind, buf, sizeof(buf));
            }
            case AddressKind::Ipv6: {
                dp::u8 buf[16];
                if (::inet_pton(AF_INET6, s.c_str(), buf) != 1) {
                    return dp::result::err(invalid("not an IPv6 address", kind));
                }
                return parse(kind, buf, sizeof(buf));
            }
            case AddressKind::SocketV4: {
                auto colon = s.rfind(':');
                if (colon == std::string::npos) {
                    return dp::result::err(invalid("missing port", kind));
                }
                dp::u8 buf[6];
                dp::u16 port = 0;
                if (::inet_pton(AF_INET, s.substr(0, colon).c_str(), buf) != 1) {
                    return dp::result::err(invalid("not a dotted-quad address", kind));
                }
                if (!parse_port(s.substr(colon + 1), port)) {
                    return dp::result::err(invalid("bad port", kind));
                }
                buf[4] = static_cast<dp::u8>(port >> 8);
                buf[5] = static_cast<dp::u8>(port & 0xFF);
                return parse(kind, buf, sizeof(buf));
            }
            case AddressKind::SocketV6: {
                auto close = s.find("]:");
                if (s[0] != '[' || close == std::string::npos) {
                    return dp::result::err(invalid("expected [address]:port", kind));
                }
                dp::u8 buf[18];
                dp::u16 port = 0;
                if (::inet_pton(AF_INET6, s.substr(1, close - 1).c_str(), buf) != 1) {
                    return dp::result::err(invalid("not an IPv6 address", kind));
                }
                if (!parse_port(s.substr(close + 2), port)) {
                    return dp::result::err(invalid("bad port", kind));
                }
                buf[16] = static_cast<dp::u8>(port >> 8);
                buf[17] = static_cast<dp::u8>(port & 0xFF);
                return parse(kind, buf, sizeof(buf));
            }
            case AddressKind::Hostname:
            case AddressKind::Ipc:
                return parse(kind, reinterpret_cast<const dp::u8 *>(s.data()), s.size());
            }
            return dp::result::err(Error::invalid_address("unknown address kind"));
        }

        /// Parse an address of any kind from configuration text, detecting the family
        static Res<Address> from_string(const dp::String &text) {
            std::string s = to_std(text);
            if (s.empty()) {
                echo::error("invalid address: empty text");
                return dp::result::err(Error::invalid_address("empty address text"));
            }
            if (s[0] == '[') {
                return from_text(AddressKind::SocketV6, text);
            }
            if (s[0] == '/' || s[0] == '.') {
                return from_text(AddressKind::Ipc, text);
            }
            auto colons = std::count(s.begin(), s.end(), ':');
            if (colons == 1) {
                return from_text(AddressKind::SocketV4, text);
            }
            if (colons > 1) {
                return from_text(AddressKind::Ipv6, text);
            }
            dp::u8 buf[4];
            if (::inet_pton(AF_INET, s.c_str(), buf) == 1) {
                return parse(AddressKind::Ipv4, buf, sizeof(buf));
            }
            return from_text(AddressKind::Hostname, text);
        }

        static Address ipv4(const dp::Array<dp::u8, 4> &octets) {
            return Address(AddressKind::Ipv4, Bytes(octets.begin(), octets.end()));
        }

        static Address ipv6(const dp::Array<dp::u8, 16> &octets) {
            return Address(AddressKind::Ipv6, Bytes(octets.begin(), octets.end()));
        }

        /// Combine an IP address with a port; fails for non-IP kinds
        static Res<Address> socket(const Address &ip, dp::u16 port) {
            if (ip.kind() != AddressKind::Ipv4 && ip.kind() != AddressKind::Ipv6) {
                return dp::result::err(invalid("socket address needs an IP address", ip.kind()));
            }
            Bytes value = ip.value();
            append_u16_be(value, port);
            AddressKind kind = ip.kind() == AddressKind::Ipv4 ? AddressKind::SocketV4 : AddressKind::SocketV6;
            return dp::result::ok(Address(kind, std::move(value)));
        }

        AddressKind kind() const { return kind_; }
        const Bytes &value() const { return value_; }

        bool is_ip() const { return kind_ == AddressKind::Ipv4 || kind_ == AddressKind::Ipv6; }
        bool is_socket() const { return kind_ == AddressKind::SocketV4 || kind_ == AddressKind::SocketV6; }

        /// Port of a socket address, 0 for every other kind
        dp::u16 port() const {
            if (!is_socket()) {
                return 0;
            }
            return decode_u16_be(value_.data() + value_.size() - 2);
        }

        /// IP part of an IP or socket address
        Res<Address> ip() const {
            switch (kind_) {
            case AddressKind::Ipv4:
            case AddressKind::Ipv6:
                return dp::result::ok(*this);
            case AddressKind::SocketV4:
                return dp::result::ok(Address(AddressKind::Ipv4, Bytes(value_.begin(), value_.begin() + 4)));
            case AddressKind::SocketV6:
                return dp::result::ok(Address(AddressKind::Ipv6, Bytes(value_.begin(), value_.begin() + 16)));
            default:
                return dp::result::err(invalid("no IP component", kind_));
            }
        }

        L3Type l3_type() const {
            switch (kind_) {
            case AddressKind::Ipv4:
            case AddressKind::SocketV4:
                return L3Type::Ipv4;
            case AddressKind::Ipv6:
            case AddressKind::SocketV6:
                return L3Type::Ipv6;
            default:
                return static_cast<L3Type>(0);
            }
        }

        /// [kind:1][len:2][value:len] - injective over (kind, value)
        Bytes to_canonical_bytes() const {
            Bytes out;
            out.push_back(static_cast<dp::u8>(kind_));
            append_u16_be(out, static_cast<dp::u16>(value_.size()));
            out.insert(out.end(), value_.begin(), value_.end());
            return out;
        }

        Res<dp::usize> write_to(Sink &sink) const {
            auto kind_res = write_u8(sink, static_cast<dp::u8>(kind_));
            if (kind_res.is_err()) {
                return dp::result::err(kind_res.error());
            }
            auto value_res = write_blob(sink, value_.data(), value_.size());
            if (value_res.is_err()) {
                return dp::result::err(value_res.error());
            }
            return dp::result::ok(kind_res.value() + value_res.value());
        }

        static Res<Address> read_from(Reader &reader) {
            auto code = reader.read_u8();
            if (code.is_err()) {
                return dp::result::err(code.error());
            }
            auto kind = address_kind_from_code(code.value());
            if (!kind) {
                echo::error("unknown address kind code: ", static_cast<int>(code.value()));
                return dp::result::err(Error::invalid_address(
                    dp::String("unknown address kind code ") +
                    dp::String(std::to_string(static_cast<int>(code.value())).c_str())));
            }
            auto value = reader.read_blob();
            if (value.is_err()) {
                return dp::result::err(value.error());
            }
            return parse(*kind, value.value());
        }

        dp::String to_string() const {
            switch (kind_) {
            case AddressKind::Ipv4:
                return to_dp(ntop(AF_INET, value_.data()));
            case AddressKind::Ipv6:
                return to_dp(ntop(AF_INET6, value_.data()));
            case AddressKind::SocketV4:
                return to_dp(ntop(AF_INET, value_.data()) + ":" + std::to_string(port()));
            case AddressKind::SocketV6:
                return to_dp("[" + ntop(AF_INET6, value_.data()) + "]:" + std::to_string(port()));
            case AddressKind::Hostname:
            case AddressKind::Ipc:
                return dp::String(reinterpret_cast<const char *>(value_.data()), value_.size());
            }
            return "";
        }

        bool operator==(const Address &other) const {
            return kind_ == other.kind_ && compare_bytes(value_, other.value_) == 0;
        }
        bool operator!=(const Address &other) const { return !(*this == other); }

        // Lexicographic on (kind, value)
        bool operator<(const Address &other) const {
            if (kind_ != other.kind_) {
                return static_cast<dp::u8>(kind_) < static_cast<dp::u8>(other.kind_);
            }
            return compare_bytes(value_, other.value_) < 0;
        }

        dp::usize hash() const {
            Bytes canonical = to_canonical_bytes();
            return hash_bytes(canonical.data(), canonical.size());
        }
    };

} // namespace zpr

namespace std {
    template <> struct hash<zpr::Address> {
        size_t operator()(const zpr::Address &addr) const { return addr.hash(); }
    };
} // namespace std
