#pragma once

#include <zpr/address.hpp>
#include <zpr/dn.hpp>

namespace zpr {

    // Well-known addresses

    /// Default prefix length for local tun IPv6 ZPR addresses
    constexpr dp::u8 ZPRNET_PREFIX_LEN = 32;

    inline const dp::Array<dp::u8, 16> ZPR_INTERNAL_NETWORK = {0xfd, 0x5a, 0x50, 0x52, 0, 0, 0, 0,
                                                             0,    0,    0,    0,    0, 0, 0, 0};

    inline const dp::Array<dp::u8, 16> ZPR_TEMP_LOCAL_ADDRESS = {0xfc, 0x00, 0x00, 0x5a, 0x00, 0x50, 0x00, 0x52,
                                                               0,    0,    0,    0,    0,    0,    0,    1};

    constexpr dp::u16 DEFAULT_TETHER_PORT = 5000;
    constexpr dp::u16 DEFAULT_LINK_PORT = 5001;

    constexpr dp::u8 VISA_SERVICE_PROTO = 6; // TCP
    constexpr dp::u16 VISA_SERVICE_PORT = 5002;

    inline Address internal_network() { return Address::ipv6(ZPR_INTERNAL_NETWORK); }

    inline Address temp_local_address() { return Address::ipv6(ZPR_TEMP_LOCAL_ADDRESS); }

    /// The internal network with the low bit set: fd5a:5052::1
    inline Address visa_service_address() {
        dp::Array<dp::u8, 16> octets = ZPR_INTERNAL_NETWORK;
        octets[15] |= 1;
        return Address::ipv6(octets);
    }

    /// [fd5a:5052::1]:5002
    inline Address visa_service_endpoint() {
        // An IPv6 address always combines with a port
        return Address::socket(visa_service_address(), VISA_SERVICE_PORT).value();
    }

    // Well-known DNs

    constexpr const char *VISA_SERVICE_CN = "vs.zpr";

    inline DistinguishedName visa_service_dn() {
        dp::Vector<Rdn> components;
        components.push_back(Rdn{"CN", VISA_SERVICE_CN});
        // Constant, valid input
        return DistinguishedName::from_components(components).value();
    }

    /// SEQUENCE { SET { SEQUENCE { OID 2.5.4.3, UTF8String "vs.zpr" } } }
    inline Bytes visa_service_dn_der() {
        // CN has a registered OID, so encoding cannot fail
        return visa_service_dn().to_der().value();
    }

} // namespace zpr
