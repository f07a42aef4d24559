#include "dca/scheduling/due_order_scanner.hpp"

#include <algorithm>
#include <utility>

namespace dca {

namespace {

// Ranking key: earlier eligibility first, lower id on ties.
using RankKey = std::pair<domain::UnixSeconds, domain::OrderId>;

RankKey rankOf(const domain::Order& order) {
  return {order.nextEligibleTime(), order.id};
}

}  // namespace

DueOrderScanner::DueOrderScanner(const OrderStore& store) : store_(store) {}

bool DueOrderScanner::isDue(const domain::Order& order,
                            domain::UnixSeconds now) {
  return now >= order.nextEligibleTime() && now <= order.end_time;
}

// -----------------------------------------------------------------------------
// findDue(): single pass keeping the best-ranked candidate
// -----------------------------------------------------------------------------
std::optional<domain::OrderId> DueOrderScanner::findDue(
    domain::UnixSeconds now) const {
  std::optional<RankKey> best;

  for (domain::OrderId id : store_.activeIds()) {
    const domain::Order* order = store_.get(id);
    if (order == nullptr || !isDue(*order, now)) {
      continue;
    }
    RankKey key = rankOf(*order);
    if (!best || key < *best) {
      best = key;
    }
  }

  if (!best) {
    return std::nullopt;
  }
  return best->second;
}

// -----------------------------------------------------------------------------
// findAllDue()
// -----------------------------------------------------------------------------
std::vector<domain::OrderId> DueOrderScanner::findAllDue(
    domain::UnixSeconds now) const {
  std::vector<RankKey> due;

  for (domain::OrderId id : store_.activeIds()) {
    const domain::Order* order = store_.get(id);
    if (order != nullptr && isDue(*order, now)) {
      due.push_back(rankOf(*order));
    }
  }

  std::sort(due.begin(), due.end());

  std::vector<domain::OrderId> ids;
  ids.reserve(due.size());
  for (const auto& [eligible_at, id] : due) {
    ids.push_back(id);
  }
  return ids;
}

}  // namespace dca
