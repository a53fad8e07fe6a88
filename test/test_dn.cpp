#include <doctest/doctest.h>
#include <zpr/dn.hpp>

#include <unordered_set>

namespace {

    zpr::DistinguishedName must_parse(const char *text) {
        auto res = zpr::DistinguishedName::parse(text);
        REQUIRE(res.is_ok());
        return res.value();
    }

    zpr::DistinguishedName single(const char *type, const char *value) {
        dp::Vector<zpr::Rdn> components;
        components.push_back(zpr::Rdn{type, value});
        auto res = zpr::DistinguishedName::from_components(components);
        REQUIRE(res.is_ok());
        return res.value();
    }

} // namespace

TEST_CASE("DN - parse and canonical string") {
    SUBCASE("Root first order is kept") {
        auto dn = must_parse("O=Acme,OU=Edge,CN=server1");
        CHECK(dn.depth() == 3);
        CHECK(dn.components()[0].type == "O");
        CHECK(dn.components()[2].value == "server1");
        CHECK(dn.to_canonical_string() == "O=Acme,OU=Edge,CN=server1");
    }

    SUBCASE("Keywords are upper-cased and spacing dropped") {
        auto dn = must_parse(" o = Acme , cn=server1 ");
        CHECK(dn.to_canonical_string() == "O=Acme,CN=server1");
        CHECK(dn == must_parse("O=Acme,CN=server1"));
    }

    SUBCASE("Known OIDs map to their keyword") {
        CHECK(must_parse("2.5.4.3=vs.zpr").to_canonical_string() == "CN=vs.zpr");
        CHECK(must_parse("0.9.2342.19200300.100.1.25=zpr").to_canonical_string() == "DC=zpr");
        CHECK(must_parse("1.2.3.4=opaque").to_canonical_string() == "1.2.3.4=opaque");
    }

    SUBCASE("Values are compared byte-exact") {
        CHECK(must_parse("O=Acme") != must_parse("O=acme"));
    }

    SUBCASE("Empty string is the root DN") {
        auto root = must_parse("");
        CHECK(root.empty());
        CHECK(root.to_canonical_string() == "");
        CHECK(root == zpr::DistinguishedName());
    }
}

TEST_CASE("DN - escaping") {
    SUBCASE("Specials") {
        auto dn = single("CN", "a,b+c=d");
        CHECK(dn.to_canonical_string() == "CN=a\\,b\\+c\\=d");
        CHECK(must_parse("CN=a\\,b\\+c\\=d") == dn);
    }

    SUBCASE("Leading and trailing spaces") {
        auto lead = single("CN", " lead");
        CHECK(lead.to_canonical_string() == "CN=\\ lead");
        CHECK(must_parse("CN=\\ lead") == lead);

        auto trail = single("CN", "trail ");
        CHECK(trail.to_canonical_string() == "CN=trail\\ ");
        CHECK(must_parse("CN=trail\\ ") == trail);
    }

    SUBCASE("Leading hash") {
        auto dn = single("CN", "#tag");
        CHECK(dn.to_canonical_string() == "CN=\\#tag");
        CHECK(must_parse("CN=\\#tag") == dn);
    }

    SUBCASE("Control bytes use hex") {
        auto dn = single("CN", "a\x01z");
        CHECK(dn.to_canonical_string() == "CN=a\\01z");
        CHECK(must_parse("CN=a\\01z") == dn);
    }

    SUBCASE("Hex escapes decode") {
        CHECK(must_parse("CN=\\41cme").components()[0].value == "Acme");
    }
}

TEST_CASE("DN - canonical string round trip") {
    const char *names[] = {
        "O=Acme,CN=server1",
        "DC=zpr,O=Acme Corp,OU=Edge Nodes,CN=node-7",
        "CN=a\\,b",
        "1.3.6.1.4.1.99999.1=custom,CN=x",
        "C=US,ST=Virginia,L=Reston,STREET=1 Main,SERIALNUMBER=42,UID=jdoe",
    };
    for (const char *text : names) {
        auto dn = must_parse(text);
        CHECK(dn.to_canonical_string() == text);
        CHECK(must_parse(dn.to_canonical_string().c_str()) == dn);
    }
}

TEST_CASE("DN - malformed input") {
    const char *bad[] = {
        "CN",           // no '='
        "=x",           // empty type
        "CN=",          // empty value
        "CN=   ",       // only spaces
        "O=Acme,,CN=x", // empty component
        "O=Acme,",      // trailing separator
        "CN=a+b",       // multi-valued RDN
        "CN=a;b",       // unescaped special
        "CN=#0403",     // hex value form
        "C N=x",        // bad type
        "1.=x",         // bad OID
        "CN=a\\",       // dangling escape
        "CN=\\zz",      // invalid escape
        "CN=\\4",       // short hex escape
        "CN=a\\00b",    // NUL
    };
    for (const char *text : bad) {
        auto res = zpr::DistinguishedName::parse(text);
        REQUIRE(res.is_err());
        CHECK(res.error().kind == zpr::ErrorKind::MalformedDN);
    }

    dp::Vector<zpr::Rdn> empty_value;
    empty_value.push_back(zpr::Rdn{"CN", ""});
    CHECK(zpr::DistinguishedName::from_components(empty_value).is_err());
}

TEST_CASE("DN - hierarchy") {
    auto a = must_parse("O=Acme");
    auto b = must_parse("O=Acme,CN=server1");
    auto other = must_parse("O=Other,CN=server1");
    auto root = must_parse("");

    SUBCASE("Ancestor is a strict prefix") {
        CHECK(a.is_ancestor_of(b));
        CHECK_FALSE(b.is_ancestor_of(a));
        CHECK_FALSE(a.is_ancestor_of(a));
        CHECK_FALSE(a.is_ancestor_of(other));
        CHECK(root.is_ancestor_of(a));
        CHECK(b.is_descendant_of(a));
        CHECK(b.is_descendant_of(root));
    }

    SUBCASE("Parent and child") {
        CHECK(b.parent() == a);
        CHECK(a.parent() == root);
        CHECK(root.parent() == root);

        auto built = a.child("cn", "server1");
        REQUIRE(built.is_ok());
        CHECK(built.value() == b);
        CHECK(a.child("CN", "").is_err());
    }

    SUBCASE("Common name is the deepest CN") {
        auto cn = b.common_name();
        REQUIRE(cn.has_value());
        CHECK(*cn == "server1");
        CHECK_FALSE(a.common_name().has_value());
    }

    SUBCASE("Ordering and hashing") {
        CHECK(root < a);
        CHECK(a < b);
        CHECK(b < other);
        CHECK_FALSE(b < a);

        std::unordered_set<zpr::DistinguishedName> set;
        set.insert(b);
        set.insert(must_parse("o=Acme, cn=server1"));
        set.insert(a);
        CHECK(set.size() == 2);
    }
}

TEST_CASE("DN - wire form") {
    SUBCASE("Layout") {
        auto bytes = zpr::to_bytes(must_parse("O=Acme"));
        REQUIRE(bytes.is_ok());
        CHECK(zpr::to_hex(bytes.value()) == "000100014f000441636d65");

        auto root = zpr::to_bytes(zpr::DistinguishedName());
        REQUIRE(root.is_ok());
        CHECK(zpr::to_hex(root.value()) == "0000");
    }

    SUBCASE("Left inverse of write_to") {
        auto dn = must_parse("DC=zpr,O=Acme,CN=a\\,b");
        auto bytes = zpr::to_bytes(dn);
        REQUIRE(bytes.is_ok());
        auto back = zpr::from_bytes<zpr::DistinguishedName>(bytes.value());
        REQUIRE(back.is_ok());
        CHECK(back.value() == dn);
    }

    SUBCASE("Invalid component on the wire") {
        zpr::Bytes bytes = {0x00, 0x01, 0x00, 0x03, 'c', ' ', 'n', 0x00, 0x01, 'x'};
        auto res = zpr::from_bytes<zpr::DistinguishedName>(bytes);
        REQUIRE(res.is_err());
        CHECK(res.error().kind == zpr::ErrorKind::MalformedDN);
    }

    SUBCASE("Count larger than the data") {
        zpr::Bytes bytes = {0x00, 0x02, 0x00, 0x01, 'O', 0x00, 0x01, 'A'};
        auto res = zpr::from_bytes<zpr::DistinguishedName>(bytes);
        REQUIRE(res.is_err());
        CHECK(res.error().kind == zpr::ErrorKind::Truncated);
    }
}

TEST_CASE("DN - DER") {
    SUBCASE("Round trip") {
        for (const char *text : {"CN=vs.zpr", "DC=zpr,O=Acme,OU=Edge,CN=node-7", "1.2.3.4=x,CN=y"}) {
            auto dn = must_parse(text);
            auto der = dn.to_der();
            REQUIRE(der.is_ok());
            auto back = zpr::DistinguishedName::from_der(der.value());
            REQUIRE(back.is_ok());
            CHECK(back.value() == dn);
        }
    }

    SUBCASE("Root DN is an empty SEQUENCE") {
        auto der = zpr::DistinguishedName().to_der();
        REQUIRE(der.is_ok());
        CHECK(zpr::to_hex(der.value()) == "3000");
    }

    SUBCASE("Keyword without an OID cannot be encoded") {
        auto der = must_parse("FOO=bar").to_der();
        REQUIRE(der.is_err());
        CHECK(der.error().kind == zpr::ErrorKind::MalformedDN);
    }

    SUBCASE("PrintableString values are accepted") {
        auto der = must_parse("CN=vs.zpr").to_der();
        REQUIRE(der.is_ok());
        zpr::Bytes bytes = der.value();
        REQUIRE(bytes[11] == zpr::der::TAG_UTF8_STRING);
        bytes[11] = zpr::der::TAG_PRINTABLE_STRING;
        auto back = zpr::DistinguishedName::from_der(bytes);
        REQUIRE(back.is_ok());
        CHECK(back.value() == must_parse("CN=vs.zpr"));
    }

    SUBCASE("Multi-valued RDN is rejected") {
        zpr::Bytes oid;
        REQUIRE(zpr::der::encode_oid("2.5.4.3", oid));

        zpr::Bytes attr;
        zpr::der::append_tlv(attr, zpr::der::TAG_OID, oid);
        zpr::der::append_tlv(attr, zpr::der::TAG_UTF8_STRING, zpr::Bytes{'a'});

        zpr::Bytes set_content;
        zpr::der::append_tlv(set_content, zpr::der::TAG_SEQUENCE, attr);
        zpr::der::append_tlv(set_content, zpr::der::TAG_SEQUENCE, attr);

        zpr::Bytes name_content;
        zpr::der::append_tlv(name_content, zpr::der::TAG_SET, set_content);
        zpr::Bytes name;
        zpr::der::append_tlv(name, zpr::der::TAG_SEQUENCE, name_content);

        auto res = zpr::DistinguishedName::from_der(name);
        REQUIRE(res.is_err());
        CHECK(res.error().kind == zpr::ErrorKind::MalformedDN);
    }

    SUBCASE("Garbage") {
        zpr::Bytes bytes = {0x30, 0x05, 0x31};
        CHECK(zpr::DistinguishedName::from_der(bytes).is_err());
    }
}

TEST_CASE("DER OID codec") {
    zpr::Bytes out;
    REQUIRE(zpr::der::encode_oid("0.9.2342.19200300.100.1.25", out));
    CHECK(zpr::to_hex(out) == "0992268993f22c640119");

    std::string dotted;
    REQUIRE(zpr::der::decode_oid(out.data(), out.size(), dotted));
    CHECK(dotted == "0.9.2342.19200300.100.1.25");

    zpr::Bytes bad;
    CHECK_FALSE(zpr::der::encode_oid("3.1", bad));
    CHECK_FALSE(zpr::der::encode_oid("1", bad));
}

TEST_CASE("DER OID codec - 64-bit arc limits") {
    SUBCASE("Largest arc round trips") {
        zpr::Bytes out;
        REQUIRE(zpr::der::encode_oid("1.2.18446744073709551615", out));
        std::string dotted;
        REQUIRE(zpr::der::decode_oid(out.data(), out.size(), dotted));
        CHECK(dotted == "1.2.18446744073709551615");
    }

    SUBCASE("Arc one past the limit is rejected") {
        zpr::Bytes out;
        CHECK_FALSE(zpr::der::encode_oid("1.2.18446744073709551616", out));
        CHECK_FALSE(zpr::der::encode_oid("1.2.18446744073709551619", out));
    }

    SUBCASE("Combined first subidentifier must not wrap") {
        zpr::Bytes ok;
        REQUIRE(zpr::der::encode_oid("2.18446744073709551535", ok));
        std::string dotted;
        REQUIRE(zpr::der::decode_oid(ok.data(), ok.size(), dotted));
        CHECK(dotted == "2.18446744073709551535");

        zpr::Bytes bad;
        CHECK_FALSE(zpr::der::encode_oid("2.18446744073709551536", bad));
    }

    SUBCASE("Overflowing OID type is a malformed DN") {
        auto res = zpr::DistinguishedName::parse("1.2.18446744073709551619=x");
        REQUIRE(res.is_err());
        CHECK(res.error().kind == zpr::ErrorKind::MalformedDN);
    }

    SUBCASE("Large OID type survives DER") {
        auto dn = zpr::DistinguishedName::parse("2.18446744073709551535=x");
        REQUIRE(dn.is_ok());
        auto der = dn.value().to_der();
        REQUIRE(der.is_ok());
        auto back = zpr::DistinguishedName::from_der(der.value());
        REQUIRE(back.is_ok());
        CHECK(back.value() == dn.value());
    }
}
