#ifndef CPSWAP_TOKEN_HPP
#define CPSWAP_TOKEN_HPP

#include <cstdint>
#include <string>

#include "cpswap/errors.hpp"

namespace cpswap {

// ERC20-like asset identity. Two tokens are the same asset when chain id and
// address match; symbol, name and decimals are descriptive only.
class Token {
public:
    Token(
        uint64_t chain_id,
        std::string address,
        uint8_t decimals,
        std::string symbol = {},
        std::string name = {}
    );

    uint64_t chain_id() const { return chain_id_; }
    const std::string& address() const { return address_; }
    uint8_t decimals() const { return decimals_; }
    const std::string& symbol() const { return symbol_; }
    const std::string& name() const { return name_; }

    // Address comparison is case-insensitive (checksummed hex).
    bool equals(const Token& other) const;

    // Canonical pair order: lower address first. Same token or different
    // chains is invalid_asset.
    result<bool> sorts_before(const Token& other) const;

    bool operator==(const Token& other) const { return equals(other); }
    bool operator!=(const Token& other) const { return !equals(other); }

private:
    uint64_t chain_id_;
    std::string address_;
    uint8_t decimals_;
    std::string symbol_;
    std::string name_;
};

} // namespace cpswap

#endif // CPSWAP_TOKEN_HPP
