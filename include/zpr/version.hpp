#pragma once

#include <datapod/datapod.hpp>

#include <string>

namespace zpr {

    /// PacketInfo header wire format versions

    /// Version 1
    /// Format: [version:1][zpi:1][flags:2][seq:8][link:4][stream:4][command:4]
    ///         [src address][src dn][dst address][dst dn][has_length:1][length:4 if has_length]
    constexpr dp::u8 PACKET_INFO_VERSION_1 = 1;

    /// What we write by default
    constexpr dp::u8 PACKET_INFO_VERSION_CURRENT = PACKET_INFO_VERSION_1;

    /// Release of the zpr definitions a service was built against, stamped into its
    /// startup log so mismatched peers can be told apart. Minor releases only add
    /// codes and kinds; a major release may change a wire layout.
    struct Version {
        dp::u8 major;
        dp::u8 minor;
        dp::u8 patch;

        dp::String to_string() const {
            std::string text = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
            return dp::String(text.c_str(), text.size());
        }

        /// Same major release: identifiers and headers written by one decode in the other
        bool wire_compatible_with(const Version &other) const { return major == other.major; }
    };

    constexpr Version LIBRARY_VERSION = {0, 1, 0};

    inline dp::String get_version_string() { return LIBRARY_VERSION.to_string(); }

    inline bool is_packet_info_version_supported(dp::u8 version) { return version == PACKET_INFO_VERSION_1; }

    inline const char *get_packet_info_version_name(dp::u8 version) {
        switch (version) {
        case PACKET_INFO_VERSION_1:
            return "V1";
        default:
            return "Unknown";
        }
    }

} // namespace zpr
