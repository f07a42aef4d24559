#include "dca/execution/simulated_exchange.hpp"

#include <limits>

namespace dca {

namespace {

constexpr std::uint64_t kBasisPoints = 10000;

}  // namespace

SimulatedExchange::SimulatedExchange(std::uint64_t price_scale,
                                     std::uint32_t slippage_bps)
    : price_scale_(price_scale == 0 ? 1 : price_scale),
      slippage_bps_(slippage_bps > kBasisPoints
                        ? static_cast<std::uint32_t>(kBasisPoints)
                        : slippage_bps) {}

// -----------------------------------------------------------------------------
// swap(): price the slice at the oracle price, minus slippage
// -----------------------------------------------------------------------------
std::optional<domain::Amount> SimulatedExchange::swap(
    const domain::PairConfig& /*pair*/, domain::Amount amount_in,
    domain::Price price) {
  if (!accepting_.load() || amount_in == 0) {
    return std::nullopt;
  }

  unsigned __int128 gross =
      static_cast<unsigned __int128>(amount_in) * price / price_scale_;
  gross -= gross * slippage_bps_ / kBasisPoints;

  if (gross > std::numeric_limits<domain::Amount>::max()) {
    // Output not representable in the target asset's ledger width.
    return std::nullopt;
  }

  swap_count_.fetch_add(1);
  return static_cast<domain::Amount>(gross);
}

}  // namespace dca
