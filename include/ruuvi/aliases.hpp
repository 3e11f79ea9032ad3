#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <ruuvi/errors.hpp>

namespace ruuvi {

struct alias {
    std::string address;
    std::string name;
};

/**
 * @brief parse_alias Parses "DE:AD:BE:EF:00:00=Sauna"
 * @throws config_error if there is no '='
 */
alias parse_alias(std::string_view s);

/**
 * @brief The alias_table class Immutable mapping from device address to display name.
 * Addresses are compared in canonical form, so "aa:bb:..", "AA:BB:.." and "AABB.." match.
 */
class alias_table {
public:
    alias_table() = default;

    /**
     * @throws config_error on duplicate or unparseable addresses, and on empty names
     */
    explicit alias_table(std::vector<alias> const& aliases);

    /**
     * @brief resolve Alias of address, or its canonical form if it has none.
     * Strings that are not addresses are returned unchanged.
     */
    std::string resolve(std::string_view address) const;

    size_t size() const noexcept { return names.size(); }

private:
    std::unordered_map<std::string, std::string> names;
};

}  // namespace ruuvi
