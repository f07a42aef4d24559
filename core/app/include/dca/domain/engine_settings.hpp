#pragma once

#include "dca/domain/order.hpp"

#include <string>

namespace dca {
namespace domain {

// -----------------------------------------------------------------------------
// PairConfig — the single funding/target asset pair served by the engine
// -----------------------------------------------------------------------------
// Both assets must be non-empty and distinct. Set once by
// DcaEngine::initialize(); immutable afterwards.
// -----------------------------------------------------------------------------
struct PairConfig {
  std::string funding_asset;
  std::string target_asset;
};

// -----------------------------------------------------------------------------
// EngineSettings — administrative state of a running engine
// -----------------------------------------------------------------------------
//
// @brief  Identities and fee that gate who may do what.
//
// @details
// admin_id      — may initialize, set the agent and set the fee.
// agent_id      — the trusted automation agent; the only caller allowed to
//                 execute or pre-authorize swaps.
// execution_fee — minimum fee_payment accepted at order creation. The fee
//                 is collected once per order, not per swap.
// pair          — empty until initialized.
//
// Owned by DcaEngine and mutated only under its lock. ExecutionEngine and
// OrderFactory hold a const reference and read it at call time, so an
// agent or fee change takes effect on the very next operation.
// -----------------------------------------------------------------------------
struct EngineSettings {
  AccountId admin_id;
  AccountId agent_id;
  Amount execution_fee{0};
  PairConfig pair;
  bool initialized{false};
};

}  // namespace domain
}  // namespace dca
