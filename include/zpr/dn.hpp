#pragma once

#include <zpr/write_to.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace zpr {

    /// Attribute types with a registered keyword and OID
    struct AttributeTypeInfo {
        const char *keyword;
        const char *oid;
    };

    constexpr AttributeTypeInfo KNOWN_ATTRIBUTE_TYPES[] = {
        {"CN", "2.5.4.3"},
        {"SERIALNUMBER", "2.5.4.5"},
        {"C", "2.5.4.6"},
        {"L", "2.5.4.7"},
        {"ST", "2.5.4.8"},
        {"STREET", "2.5.4.9"},
        {"O", "2.5.4.10"},
        {"OU", "2.5.4.11"},
        {"DC", "0.9.2342.19200300.100.1.25"},
        {"UID", "0.9.2342.19200300.100.1.1"},
    };

    inline const AttributeTypeInfo *find_attribute_by_keyword(const std::string &keyword) {
        for (const auto &info : KNOWN_ATTRIBUTE_TYPES) {
            if (keyword == info.keyword) {
                return &info;
            }
        }
        return nullptr;
    }

    inline const AttributeTypeInfo *find_attribute_by_oid(const std::string &oid) {
        for (const auto &info : KNOWN_ATTRIBUTE_TYPES) {
            if (oid == info.oid) {
                return &info;
            }
        }
        return nullptr;
    }

    /// One relative name component: (attribute-type, value)
    struct Rdn {
        dp::String type;  // canonical: upper-case keyword or dotted OID
        dp::String value; // raw, unescaped

        bool operator==(const Rdn &other) const { return type == other.type && value == other.value; }
        bool operator!=(const Rdn &other) const { return !(*this == other); }
    };

    // ============================================================================
    // Minimal DER helpers for X.509 Name encoding
    // ============================================================================
    namespace der {

        constexpr dp::u8 TAG_OID = 0x06;
        constexpr dp::u8 TAG_UTF8_STRING = 0x0C;
        constexpr dp::u8 TAG_PRINTABLE_STRING = 0x13;
        constexpr dp::u8 TAG_IA5_STRING = 0x16;
        constexpr dp::u8 TAG_SEQUENCE = 0x30;
        constexpr dp::u8 TAG_SET = 0x31;

        /// Definite length, short form below 128, long form above
        inline void append_length(Bytes &out, dp::usize len) {
            if (len < 0x80) {
                out.push_back(static_cast<dp::u8>(len));
                return;
            }
            dp::u8 buf[sizeof(dp::usize)];
            dp::usize n = 0;
            while (len > 0) {
                buf[n++] = static_cast<dp::u8>(len & 0xFF);
                len >>= 8;
            }
            out.push_back(static_cast<dp::u8>(0x80 | n));
            while (n > 0) {
                out.push_back(buf[--n]);
            }
        }

        inline void append_tlv(Bytes &out, dp::u8 tag, const Bytes &content) {
            out.push_back(tag);
            append_length(out, content.size());
            out.insert(out.end(), content.begin(), content.end());
        }

        /// Dotted OID text to DER content bytes; false if the text is not an OID
        inline bool encode_oid(const std::string &dotted, Bytes &out) {
            dp::Vector<dp::u64> arcs;
            dp::u64 current = 0;
            bool have_digit = false;
            for (dp::usize i = 0; i <= dotted.size(); ++i) {
                if (i == dotted.size() || dotted[i] == '.') {
                    if (!have_digit) {
                        return false;
                    }
                    arcs.push_back(current);
                    current = 0;
                    have_digit = false;
                    continue;
                }
                char c = dotted[i];
                if (c < '0' || c > '9') {
                    return false;
                }
                auto digit = static_cast<dp::u64>(c - '0');
                if (current > (UINT64_MAX - digit) / 10) {
                    return false;
                }
                current = current * 10 + digit;
                have_digit = true;
            }
            if (arcs.size() < 2 || arcs[0] > 2 || (arcs[0] < 2 && arcs[1] > 39)) {
                return false;
            }
            // First subidentifier is arcs[0] * 40 + arcs[1] and must not wrap
            if (arcs[1] > UINT64_MAX - 80) {
                return false;
            }

            auto append_base128 = [&out](dp::u64 v) {
                dp::u8 buf[10];
                dp::usize n = 0;
                do {
                    buf[n++] = static_cast<dp::u8>(v & 0x7F);
                    v >>= 7;
                } while (v > 0);
                while (n > 1) {
                    out.push_back(static_cast<dp::u8>(buf[--n] | 0x80));
                }
                out.push_back(buf[0]);
            };

            append_base128(arcs[0] * 40 + arcs[1]);
            for (dp::usize i = 2; i < arcs.size(); ++i) {
                append_base128(arcs[i]);
            }
            return true;
        }

        /// DER OID content bytes to dotted text; false on malformed encoding
        inline bool decode_oid(const dp::u8 *data, dp::usize len, std::string &out) {
            if (len == 0 || (data[len - 1] & 0x80) != 0) {
                return false;
            }
            out.clear();
            dp::u64 value = 0;
            bool first = true;
            for (dp::usize i = 0; i < len; ++i) {
                if (value > (UINT64_MAX >> 7)) {
                    return false;
                }
                value = (value << 7) | (data[i] & 0x7F);
                if ((data[i] & 0x80) != 0) {
                    continue;
                }
                if (first) {
                    dp::u64 a0 = value < 80 ? value / 40 : 2;
                    out = std::to_string(a0) + "." + std::to_string(value - a0 * 40);
                    first = false;
                } else {
                    out += "." + std::to_string(value);
                }
                value = 0;
            }
            return true;
        }

        /// Cursor over DER TLVs; every failure is reported as a malformed DN
        class TlvReader {
          private:
            const dp::u8 *data_;
            dp::usize size_;
            dp::usize pos_;

          public:
            TlvReader(const dp::u8 *data, dp::usize size) : data_(data), size_(size), pos_(0) {}

            bool at_end() const { return pos_ == size_; }

            /// Read the next TLV; false on truncated or oversized lengths
            bool next(dp::u8 &tag, const dp::u8 *&content, dp::usize &len) {
                if (size_ - pos_ < 2) {
                    return false;
                }
                tag = data_[pos_++];
                dp::u8 first = data_[pos_++];
                if (first < 0x80) {
                    len = first;
                } else {
                    dp::usize n = first & 0x7F;
                    if (n == 0 || n > 4 || size_ - pos_ < n) {
                        return false;
                    }
                    len = 0;
                    for (dp::usize i = 0; i < n; ++i) {
                        len = (len << 8) | data_[pos_++];
                    }
                }
                if (len > size_ - pos_) {
                    return false;
                }
                content = data_ + pos_;
                pos_ += len;
                return true;
            }
        };

    } // namespace der

    /// Hierarchical identifier naming a principal or resource
    ///
    /// Components are ordered root first: [O=Acme, CN=server1] names server1 beneath Acme,
    /// and its canonical string is "O=Acme,CN=server1".
    ///
    /// Canonical form: attribute keywords upper-case (known OIDs replaced by their keyword),
    /// values compared byte-exact, no space after ','. Specials `, + = \ " < > ;`, a leading
    /// '#' or space, a trailing space and control bytes are escaped.
    class DistinguishedName {
      private:
        dp::Vector<Rdn> components_;

        explicit DistinguishedName(dp::Vector<Rdn> components) : components_(std::move(components)) {}

        static Error malformed(const std::string &what) {
            echo::error("malformed DN: ", what.c_str());
            return Error::malformed_dn(to_dp(what));
        }

        static bool is_alpha(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }
        static bool is_digit(char c) { return c >= '0' && c <= '9'; }

        static int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }

        static bool is_special(char c) {
            return c == ',' || c == '+' || c == '=' || c == '\\' || c == '"' || c == '<' || c == '>' || c == ';';
        }

        static std::string trim_spaces(const std::string &s) {
            dp::usize begin = 0;
            dp::usize end = s.size();
            while (begin < end && s[begin] == ' ') {
                ++begin;
            }
            while (end > begin && s[end - 1] == ' ') {
                --end;
            }
            return s.substr(begin, end - begin);
        }

        /// Validate and canonicalize an attribute type
        static Res<std::string> canonical_type(const std::string &raw) {
            std::string type = trim_spaces(raw);
            if (type.empty()) {
                return dp::result::err(malformed("empty attribute type"));
            }

            if (is_digit(type[0])) {
                Bytes scratch;
                if (!der::encode_oid(type, scratch)) {
                    return dp::result::err(malformed("invalid attribute OID '" + type + "'"));
                }
                const AttributeTypeInfo *info = find_attribute_by_oid(type);
                return dp::result::ok(info != nullptr ? std::string(info->keyword) : type);
            }

            if (!is_alpha(type[0])) {
                return dp::result::err(malformed("invalid attribute type '" + type + "'"));
            }
            for (auto &c : type) {
                if (!is_alpha(c) && !is_digit(c) && c != '-') {
                    return dp::result::err(malformed("invalid attribute type '" + type + "'"));
                }
                if (c >= 'a' && c <= 'z') {
                    c = static_cast<char>(c - 'a' + 'A');
                }
            }
            return dp::result::ok(type);
        }

        /// Decode the escaped string form of a value
        static Res<std::string> unescape_value(const std::string &raw) {
            std::string out;
            dp::usize significant = 0; // length of out up to the last non-insignificant char
            dp::usize i = 0;

            while (i < raw.size() && raw[i] == ' ') {
                ++i;
            }
            if (i < raw.size() && raw[i] == '#') {
                return dp::result::err(malformed("hex-encoded attribute values are not supported"));
            }

            for (; i < raw.size(); ++i) {
                char c = raw[i];
                if (c == '\\') {
                    if (i + 1 >= raw.size()) {
                        return dp::result::err(malformed("dangling escape"));
                    }
                    char n = raw[i + 1];
                    if (hex_value(n) >= 0) {
                        if (i + 2 >= raw.size() || hex_value(raw[i + 2]) < 0) {
                            return dp::result::err(malformed("bad hex escape"));
                        }
                        out.push_back(static_cast<char>(hex_value(n) * 16 + hex_value(raw[i + 2])));
                        i += 2;
                    } else if (is_special(n) || n == ' ' || n == '#') {
                        out.push_back(n);
                        i += 1;
                    } else {
                        return dp::result::err(malformed(std::string("invalid escape '\\") + n + "'"));
                    }
                    significant = out.size();
                    continue;
                }
                if (c == '+' || c == '=' || c == '"' || c == '<' || c == '>' || c == ';') {
                    return dp::result::err(malformed(std::string("unescaped '") + c + "' in value"));
                }
                out.push_back(c);
                if (c != ' ') {
                    significant = out.size();
                }
            }

            out.resize(significant);
            if (out.empty()) {
                return dp::result::err(malformed("empty attribute value"));
            }
            if (out.find('\0') != std::string::npos) {
                return dp::result::err(malformed("NUL in attribute value"));
            }
            return dp::result::ok(out);
        }

        static std::string escape_value(const std::string &value) {
            static const char digits[] = "0123456789ABCDEF";
            std::string out;
            for (dp::usize i = 0; i < value.size(); ++i) {
                char c = value[i];
                auto byte = static_cast<dp::u8>(c);
                if (is_special(c) || (i == 0 && (c == '#' || c == ' ')) || (i + 1 == value.size() && c == ' ')) {
                    out.push_back('\\');
                    out.push_back(c);
                } else if (byte < 0x20 || byte == 0x7F) {
                    out.push_back('\\');
                    out.push_back(digits[byte >> 4]);
                    out.push_back(digits[byte & 0x0F]);
                } else {
                    out.push_back(c);
                }
            }
            return out;
        }

        static int compare_rdn(const Rdn &a, const Rdn &b) {
            int c = to_std(a.type).compare(to_std(b.type));
            if (c == 0) {
                c = to_std(a.value).compare(to_std(b.value));
            }
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }

      public:
        /// The empty (root) DN
        DistinguishedName() = default;

        /// Parse the string form; the empty string is the root DN
        static Res<DistinguishedName> parse(const dp::String &text) {
            std::string s = to_std(text);
            dp::Vector<Rdn> components;
            if (trim_spaces(s).empty()) {
                return dp::result::ok(DistinguishedName());
            }

            dp::usize start = 0;
            for (dp::usize i = 0; i <= s.size(); ++i) {
                if (i + 1 < s.size() && s[i] == '\\') {
                    ++i; // the escaped char never splits
                    continue;
                }
                if (i < s.size() && s[i] != ',') {
                    continue;
                }

                std::string piece = s.substr(start, i - start);
                start = i + 1;
                if (trim_spaces(piece).empty()) {
                    return dp::result::err(malformed("empty component"));
                }
                auto eq = piece.find('=');
                if (eq == std::string::npos) {
                    return dp::result::err(malformed("missing '=' in component '" + piece + "'"));
                }
                auto type = canonical_type(piece.substr(0, eq));
                if (type.is_err()) {
                    return dp::result::err(type.error());
                }
                auto value = unescape_value(piece.substr(eq + 1));
                if (value.is_err()) {
                    return dp::result::err(value.error());
                }
                components.push_back(Rdn{to_dp(type.value()), to_dp(value.value())});
            }

            echo::trace("parsed DN with ", components.size(), " components");
            return dp::result::ok(DistinguishedName(std::move(components)));
        }

        /// Build from (type, value) pairs; values are taken literally (no unescaping)
        static Res<DistinguishedName> from_components(const dp::Vector<Rdn> &components) {
            dp::Vector<Rdn> canonical;
            for (const auto &rdn : components) {
                auto type = canonical_type(to_std(rdn.type));
                if (type.is_err()) {
                    return dp::result::err(type.error());
                }
                std::string value = to_std(rdn.value);
                if (value.empty()) {
                    return dp::result::err(malformed("empty attribute value"));
                }
                if (value.find('\0') != std::string::npos) {
                    return dp::result::err(malformed("NUL in attribute value"));
                }
                canonical.push_back(Rdn{to_dp(type.value()), rdn.value});
            }
            return dp::result::ok(DistinguishedName(std::move(canonical)));
        }

        /// New DN with one more component beneath this one
        Res<DistinguishedName> child(const dp::String &type, const dp::String &value) const {
            dp::Vector<Rdn> components = components_;
            components.push_back(Rdn{type, value});
            return from_components(components);
        }

        dp::String to_canonical_string() const {
            std::string out;
            for (dp::usize i = 0; i < components_.size(); ++i) {
                if (i > 0) {
                    out.push_back(',');
                }
                out += to_std(components_[i].type);
                out.push_back('=');
                out += escape_value(to_std(components_[i].value));
            }
            return to_dp(out);
        }

        /// True iff this DN is a strict, order-preserving prefix of other
        bool is_ancestor_of(const DistinguishedName &other) const {
            if (components_.size() >= other.components_.size()) {
                return false;
            }
            for (dp::usize i = 0; i < components_.size(); ++i) {
                if (components_[i] != other.components_[i]) {
                    return false;
                }
            }
            return true;
        }

        bool is_descendant_of(const DistinguishedName &other) const { return other.is_ancestor_of(*this); }

        /// DN without its last component; the root DN is its own parent
        DistinguishedName parent() const {
            if (components_.empty()) {
                return *this;
            }
            return DistinguishedName(dp::Vector<Rdn>(components_.begin(), components_.end() - 1));
        }

        dp::usize depth() const { return components_.size(); }
        bool empty() const { return components_.empty(); }
        const dp::Vector<Rdn> &components() const { return components_; }

        /// Value of the last CN component, if any
        std::optional<dp::String> common_name() const {
            for (dp::usize i = components_.size(); i > 0; --i) {
                if (components_[i - 1].type == "CN") {
                    return components_[i - 1].value;
                }
            }
            return std::nullopt;
        }

        // ============================================================================
        // Wire form: [count:2] then per component [type blob][value blob]
        // ============================================================================

        Res<dp::usize> write_to(Sink &sink) const {
            if (components_.size() > 0xFFFF) {
                echo::error("DN has too many components: ", components_.size());
                return dp::result::err(Error::write_error(dp::Error::invalid_argument("too many DN components")));
            }
            auto count_res = write_u16(sink, static_cast<dp::u16>(components_.size()));
            if (count_res.is_err()) {
                return dp::result::err(count_res.error());
            }
            dp::usize total = count_res.value();
            for (const auto &rdn : components_) {
                auto type_res = write_blob(sink, rdn.type);
                if (type_res.is_err()) {
                    return dp::result::err(type_res.error());
                }
                auto value_res = write_blob(sink, rdn.value);
                if (value_res.is_err()) {
                    return dp::result::err(value_res.error());
                }
                total += type_res.value() + value_res.value();
            }
            echo::trace("wrote DN: ", components_.size(), " components, ", total, " bytes");
            return dp::result::ok(total);
        }

        static Res<DistinguishedName> read_from(Reader &reader) {
            auto count = reader.read_u16();
            if (count.is_err()) {
                return dp::result::err(count.error());
            }
            dp::Vector<Rdn> components;
            for (dp::u16 i = 0; i < count.value(); ++i) {
                auto type = reader.read_blob_string();
                if (type.is_err()) {
                    return dp::result::err(type.error());
                }
                auto value = reader.read_blob_string();
                if (value.is_err()) {
                    return dp::result::err(value.error());
                }
                components.push_back(Rdn{type.value(), value.value()});
            }
            return from_components(components);
        }

        // ============================================================================
        // X.509 Name DER: SEQUENCE OF SET { SEQUENCE { OID, UTF8String } }
        // ============================================================================

        Res<Bytes> to_der() const {
            Bytes rdn_sequence;
            for (const auto &rdn : components_) {
                std::string type = to_std(rdn.type);
                const AttributeTypeInfo *info = find_attribute_by_keyword(type);
                Bytes oid;
                if (!der::encode_oid(info != nullptr ? std::string(info->oid) : type, oid)) {
                    return dp::result::err(malformed("attribute type '" + type + "' has no OID"));
                }

                const auto *raw = reinterpret_cast<const dp::u8 *>(rdn.value.c_str());
                Bytes value(raw, raw + rdn.value.size());
                Bytes attr;
                der::append_tlv(attr, der::TAG_OID, oid);
                der::append_tlv(attr, der::TAG_UTF8_STRING, value);

                Bytes set;
                der::append_tlv(set, der::TAG_SEQUENCE, attr);
                der::append_tlv(rdn_sequence, der::TAG_SET, set);
            }

            Bytes out;
            der::append_tlv(out, der::TAG_SEQUENCE, rdn_sequence);
            return dp::result::ok(std::move(out));
        }

        static Res<DistinguishedName> from_der(const dp::u8 *data, dp::usize len) {
            der::TlvReader outer(data, len);
            dp::u8 tag = 0;
            const dp::u8 *content = nullptr;
            dp::usize content_len = 0;
            if (!outer.next(tag, content, content_len) || tag != der::TAG_SEQUENCE || !outer.at_end()) {
                return dp::result::err(malformed("DER name is not a single SEQUENCE"));
            }

            dp::Vector<Rdn> components;
            der::TlvReader sets(content, content_len);
            while (!sets.at_end()) {
                const dp::u8 *set = nullptr;
                dp::usize set_len = 0;
                if (!sets.next(tag, set, set_len) || tag != der::TAG_SET) {
                    return dp::result::err(malformed("expected SET in DER name"));
                }

                der::TlvReader set_reader(set, set_len);
                const dp::u8 *attr = nullptr;
                dp::usize attr_len = 0;
                if (!set_reader.next(tag, attr, attr_len) || tag != der::TAG_SEQUENCE) {
                    return dp::result::err(malformed("expected attribute SEQUENCE in DER name"));
                }
                if (!set_reader.at_end()) {
                    return dp::result::err(malformed("multi-valued RDNs are not supported"));
                }

                der::TlvReader attr_reader(attr, attr_len);
                const dp::u8 *oid = nullptr;
                dp::usize oid_len = 0;
                std::string dotted;
                if (!attr_reader.next(tag, oid, oid_len) || tag != der::TAG_OID ||
                    !der::decode_oid(oid, oid_len, dotted)) {
                    return dp::result::err(malformed("bad attribute OID in DER name"));
                }

                const dp::u8 *value = nullptr;
                dp::usize value_len = 0;
                if (!attr_reader.next(tag, value, value_len) || !attr_reader.at_end()) {
                    return dp::result::err(malformed("bad attribute value in DER name"));
                }
                if (tag != der::TAG_UTF8_STRING && tag != der::TAG_PRINTABLE_STRING && tag != der::TAG_IA5_STRING) {
                    return dp::result::err(malformed("unsupported DER string type"));
                }

                components.push_back(
                    Rdn{to_dp(dotted), dp::String(reinterpret_cast<const char *>(value), value_len)});
            }
            return from_components(components);
        }

        static Res<DistinguishedName> from_der(const Bytes &bytes) { return from_der(bytes.data(), bytes.size()); }

        bool operator==(const DistinguishedName &other) const {
            if (components_.size() != other.components_.size()) {
                return false;
            }
            for (dp::usize i = 0; i < components_.size(); ++i) {
                if (components_[i] != other.components_[i]) {
                    return false;
                }
            }
            return true;
        }
        bool operator!=(const DistinguishedName &other) const { return !(*this == other); }

        bool operator<(const DistinguishedName &other) const {
            dp::usize n = components_.size() < other.components_.size() ? components_.size() : other.components_.size();
            for (dp::usize i = 0; i < n; ++i) {
                int c = compare_rdn(components_[i], other.components_[i]);
                if (c != 0) {
                    return c < 0;
                }
            }
            return components_.size() < other.components_.size();
        }

        dp::usize hash() const {
            dp::String canonical = to_canonical_string();
            return hash_bytes(reinterpret_cast<const dp::u8 *>(canonical.c_str()), canonical.size());
        }
    };

    using DN = DistinguishedName;

} // namespace zpr

namespace std {
    template <> struct hash<zpr::DistinguishedName> {
        size_t operator()(const zpr::DistinguishedName &dn) const { return dn.hash(); }
    };
} // namespace std
