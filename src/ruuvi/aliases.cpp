#include "aliases.hpp"

#include "ble/address.hpp"

using namespace ruuvi;

alias ruuvi::parse_alias(std::string_view s) {
    auto i = s.find('=');
    if (i == std::string_view::npos)
        throw config_error("Invalid alias '" + std::string(s) + "', expected ADDRESS=NAME");
    return { std::string(s.substr(0, i)), std::string(s.substr(i + 1)) };
}

alias_table::alias_table(std::vector<alias> const& aliases) {
    names.reserve(aliases.size());
    for (auto const& a : aliases) {
        auto address = ble::canonical_address(a.address);
        if (!address) throw config_error("Invalid device address in alias: '" + a.address + "'");
        if (a.name.empty()) throw config_error("Empty alias for " + *address);

        auto [it, inserted] = names.emplace(*address, a.name);
        if (!inserted) {
            throw config_error("Duplicate alias for " + *address + ": '" + it->second +
                               "' and '" + a.name + "'");
        }
    }
}

std::string alias_table::resolve(std::string_view address) const {
    auto canonical = ble::canonical_address(address);
    if (!canonical) return std::string(address);

    auto it = names.find(*canonical);
    if (it != names.end()) return it->second;
    return std::move(*canonical);
}
