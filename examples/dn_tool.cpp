#include <zpr/zpr.hpp>

int main(int argc, char **argv) {
    if (argc < 2) {
        echo::error("Usage: ", argv[0], " <dn> [dn...]");
        echo::info("Example: ", argv[0], " \"O=Acme\" \"o=Acme, cn=server1\"");
        return 1;
    }

    dp::Vector<zpr::DistinguishedName> names;
    for (int i = 1; i < argc; ++i) {
        auto dn = zpr::DistinguishedName::parse(argv[i]);
        if (dn.is_err()) {
            echo::error("'", argv[i], "': ", dn.error().to_string().c_str());
            return 1;
        }
        names.push_back(dn.value());

        const auto &name = names.back();
        echo::info("'", argv[i], "'");
        echo::info("  canonical: ", name.to_canonical_string().c_str());
        echo::info("  depth:     ", name.depth());
        auto cn = name.common_name();
        if (cn) {
            echo::info("  CN:        ", cn->c_str());
        }

        auto der = name.to_der();
        if (der.is_ok()) {
            echo::info("  DER:       ", zpr::to_hex(der.value()).c_str());
        } else {
            echo::warn("  DER:       ", der.error().message.c_str());
        }
    }

    // Ancestry between every ordered pair
    for (dp::usize i = 0; i < names.size(); ++i) {
        for (dp::usize j = 0; j < names.size(); ++j) {
            if (i != j && names[i].is_ancestor_of(names[j])) {
                echo::info(names[i].to_canonical_string().c_str(), " is an ancestor of ",
                           names[j].to_canonical_string().c_str());
            }
        }
    }
    return 0;
}
