#include "cpswap/errors.hpp"

namespace cpswap {

namespace {

class CpswapCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "cpswap"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::invalid_asset:
            return "asset is not part of the pair";
        case errc::invalid_token:
            return "amount is not denominated in the liquidity token";
        case errc::invalid_amount:
            return "invalid amount";
        case errc::insufficient_reserves:
            return "insufficient reserves";
        case errc::insufficient_input_amount:
            return "insufficient input amount";
        case errc::missing_parameter:
            return "missing parameter: kLast is required when the protocol fee is on";
        case errc::parse_error:
            return "cannot parse integer";
        }
        return "unknown cpswap error";
    }
};

} // namespace

const std::error_category& cpswap_category() noexcept {
    static const CpswapCategory category;
    return category;
}

} // namespace cpswap
