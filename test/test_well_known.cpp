#include <doctest/doctest.h>
#include <zpr/well_known.hpp>

TEST_CASE("Well-known addresses") {
    CHECK(zpr::internal_network().to_string() == "fd5a:5052::");
    CHECK(zpr::temp_local_address().to_string() == "fc00:5a:50:52::1");
    CHECK(zpr::visa_service_address().to_string() == "fd5a:5052::1");
    CHECK(zpr::ZPRNET_PREFIX_LEN == 32);

    auto endpoint = zpr::visa_service_endpoint();
    CHECK(endpoint.kind() == zpr::AddressKind::SocketV6);
    CHECK(endpoint.port() == zpr::VISA_SERVICE_PORT);
    CHECK(endpoint.to_string() == "[fd5a:5052::1]:5002");

    auto ip = endpoint.ip();
    REQUIRE(ip.is_ok());
    CHECK(ip.value() == zpr::visa_service_address());
}

TEST_CASE("Well-known ports") {
    CHECK(zpr::DEFAULT_TETHER_PORT == 5000);
    CHECK(zpr::DEFAULT_LINK_PORT == 5001);
    CHECK(zpr::VISA_SERVICE_PORT == 5002);
    CHECK(zpr::VISA_SERVICE_PROTO == 6);
}

TEST_CASE("Visa service DN") {
    auto dn = zpr::visa_service_dn();
    CHECK(dn.to_canonical_string() == "CN=vs.zpr");
    REQUIRE(dn.common_name().has_value());
    CHECK(*dn.common_name() == "vs.zpr");

    SUBCASE("Precomputed DER") {
        CHECK(zpr::to_hex(zpr::visa_service_dn_der()) == "3011310f300d0603550403"
                                                          "0c0676732e7a7072");
    }

    SUBCASE("Matches the general encoder") {
        auto der = dn.to_der();
        REQUIRE(der.is_ok());
        CHECK(zpr::to_hex(der.value()) == zpr::to_hex(zpr::visa_service_dn_der()));

        auto back = zpr::DistinguishedName::from_der(zpr::visa_service_dn_der());
        REQUIRE(back.is_ok());
        CHECK(back.value() == dn);
    }

    SUBCASE("Arbitrary CN") {
        auto dn = zpr::DistinguishedName::parse("CN=node-7.zpr");
        REQUIRE(dn.is_ok());
        auto der = dn.value().to_der();
        REQUIRE(der.is_ok());
        auto back = zpr::DistinguishedName::from_der(der.value());
        REQUIRE(back.is_ok());
        CHECK(back.value().to_canonical_string() == "CN=node-7.zpr");
    }

    SUBCASE("Long CN uses long-form lengths") {
        std::string cn(120, 'n');
        dp::Vector<zpr::Rdn> components;
        components.push_back(zpr::Rdn{"CN", zpr::to_dp(cn)});
        auto dn = zpr::DistinguishedName::from_components(components);
        REQUIRE(dn.is_ok());

        auto der = dn.value().to_der();
        REQUIRE(der.is_ok());
        // Attribute SEQUENCE content is 5 (OID) + 122 (value) = 127, still short form; SET and outer are not
        CHECK(der.value()[0] == zpr::der::TAG_SEQUENCE);
        CHECK(der.value()[1] == 0x81);
        CHECK(der.value()[2] == 132);
        CHECK(der.value()[3] == zpr::der::TAG_SET);
        CHECK(der.value()[4] == 0x81);
        CHECK(der.value()[5] == 129);
        CHECK(der.value()[6] == zpr::der::TAG_SEQUENCE);
        CHECK(der.value()[7] == 127);
        CHECK(der.value().size() == 135);

        auto back = zpr::DistinguishedName::from_der(der.value());
        REQUIRE(back.is_ok());
        CHECK(back.value() == dn.value());
    }
}
