#include "dca/store/order_store.hpp"

#include <utility>

namespace dca {

// -----------------------------------------------------------------------------
// insert(): mapping first, then index, rolling back on failure
// -----------------------------------------------------------------------------
bool OrderStore::insert(const domain::Order& order) {
  auto [it, inserted] = orders_.emplace(order.id, order);
  if (!inserted) {
    return false;
  }

  try {
    positions_.emplace(order.id, active_ids_.size());
    active_ids_.push_back(order.id);
  } catch (...) {
    positions_.erase(order.id);
    orders_.erase(it);
    throw;
  }

  return true;
}

// -----------------------------------------------------------------------------
// get() / find()
// -----------------------------------------------------------------------------
const domain::Order* OrderStore::get(domain::OrderId id) const {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

domain::Order* OrderStore::find(domain::OrderId id) {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

// -----------------------------------------------------------------------------
// removeById(): swap-with-last removal from the index
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderStore::removeById(domain::OrderId id) {
  auto order_it = orders_.find(id);
  if (order_it == orders_.end()) {
    return std::nullopt;
  }

  auto pos_it = positions_.find(id);
  const std::size_t slot = pos_it->second;
  const domain::OrderId last_id = active_ids_.back();

  // Move the last id into the vacated slot and fix its recorded position.
  // When the target already is the last element this is a self-assignment.
  active_ids_[slot] = last_id;
  positions_[last_id] = slot;
  active_ids_.pop_back();
  positions_.erase(pos_it);

  domain::Order removed = std::move(order_it->second);
  orders_.erase(order_it);
  return removed;
}

}  // namespace dca
