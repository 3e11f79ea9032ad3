#include "address.hpp"

using namespace ble;

namespace {

template<typename I> std::string n2hexstr(I w, size_t hex_len = sizeof(I) << 1) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string rc(hex_len, '0');
    for (size_t i = 0, j = (hex_len - 1) * 4; i < hex_len; ++i, j -= 4)
        rc[i] = digits[(w >> j) & 0x0f];
    return rc;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::optional<address_bytes> ble::parse_address(std::string_view s) {
    address_bytes r{};
    // Either 12 bare digits or 6 octets with a separator between each
    bool separated = s.size() == 17;
    if (!separated && s.size() != 12) return std::nullopt;

    char sep = separated ? s[2] : '\0';
    if (separated && sep != ':' && sep != '-') return std::nullopt;

    size_t pos = 0;
    for (size_t i = 0; i < r.size(); ++i) {
        if (separated && i > 0) {
            if (s[pos] != sep) return std::nullopt;
            ++pos;
        }
        int hi = hex_value(s[pos]);
        int lo = hex_value(s[pos + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        r[i] = static_cast<uint8_t>((hi << 4) | lo);
        pos += 2;
    }
    return r;
}

std::string ble::to_string(address_bytes const& a) {
    std::string mac;
    mac.reserve(18);
    for (auto b : a) {
        mac += n2hexstr(b, 2);
        mac.push_back(':');
    }
    mac.pop_back();
    return mac;
}

std::optional<std::string> ble::canonical_address(std::string_view s) {
    auto a = parse_address(s);
    if (!a) return std::nullopt;
    return to_string(*a);
}
