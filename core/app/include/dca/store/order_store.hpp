#pragma once

#include "dca/domain/order.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dca {

// -----------------------------------------------------------------------------
// OrderStore — active orders plus an enumeration index
// -----------------------------------------------------------------------------
//
// @brief  Owns every active (not yet terminated) order, keyed by OrderId,
//         and an index of active ids used by the DueOrderScanner.
//
// @details
// Three containers are kept in lock step:
//
//   orders_     OrderId → Order        (authoritative order state)
//   active_ids_ vector<OrderId>        (dense list for enumeration)
//   positions_  OrderId → index into active_ids_
//
// Bijection invariant: an id is a key of orders_ iff it appears exactly
// once in active_ids_, iff it is a key of positions_ with the matching
// index. insert() and removeById() are the only mutators of the three.
//
// Removal swaps the target with the last element of active_ids_ and pops,
// so it is O(1) but reorders the index. activeIds() therefore carries no
// ordering guarantee; the scanner applies its own explicit tie-break.
//
// Exception safety:
//   insert() gives the strong guarantee: if growing the index throws, the
//   order is erased again and the store is unchanged.
//   removeById() does not allocate and cannot throw after the lookup.
//
// Thread model:
//   Not synchronised. DcaEngine holds its mutex around every access, so no
//   caller ever observes the index mid-update.
// -----------------------------------------------------------------------------
class OrderStore {
 public:
  OrderStore() = default;

  OrderStore(const OrderStore&) = delete;
  OrderStore& operator=(const OrderStore&) = delete;

  // Inserts `order` under order.id. Returns false (and changes nothing) if
  // the id is already present.
  bool insert(const domain::Order& order);

  // Read-only lookup. nullptr if the id is not active. The pointer is
  // invalidated by the next insert() or removeById().
  const domain::Order* get(domain::OrderId id) const;

  // Mutable lookup for the ExecutionEngine. Same lifetime rules as get().
  domain::Order* find(domain::OrderId id);

  // Removes the order from the mapping and the index. Returns the removed
  // order, or nullopt if the id was not active.
  std::optional<domain::Order> removeById(domain::OrderId id);

  std::size_t count() const { return orders_.size(); }

  bool containsId(domain::OrderId id) const {
    return orders_.find(id) != orders_.end();
  }

  // Active ids in unspecified order.
  const std::vector<domain::OrderId>& activeIds() const { return active_ids_; }

 private:
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::vector<domain::OrderId> active_ids_;
  std::unordered_map<domain::OrderId, std::size_t> positions_;
};

}  // namespace dca
