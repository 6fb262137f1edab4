#include "cpswap/token.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace cpswap {

namespace {

std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

Token::Token(
    uint64_t chain_id,
    std::string address,
    uint8_t decimals,
    std::string symbol,
    std::string name
) : chain_id_(chain_id),
    address_(std::move(address)),
    decimals_(decimals),
    symbol_(std::move(symbol)),
    name_(std::move(name)) {}

bool Token::equals(const Token& other) const {
    return chain_id_ == other.chain_id_ && lowercase(address_) == lowercase(other.address_);
}

result<bool> Token::sorts_before(const Token& other) const {
    if (chain_id_ != other.chain_id_ || equals(other)) {
        return errc::invalid_asset;
    }
    return lowercase(address_) < lowercase(other.address_);
}

} // namespace cpswap
