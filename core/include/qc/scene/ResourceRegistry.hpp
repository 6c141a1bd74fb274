#pragma once
#include "qc/scene/Types.hpp"
#include <cstddef>
#include <map>
#include <vector>

namespace qc {

// Id -> kind for every live scene resource. Chart layers bring their own
// ids (LayerRecipe); allocate() serves commands that omit "id".
class ResourceRegistry {
public:
  Id allocate(ResourceKind kind);
  bool reserve(Id id, ResourceKind kind);  // false if taken or invalid
  bool exists(Id id) const { return kinds_.count(id) != 0; }
  bool kindOf(Id id, ResourceKind& out) const;
  bool release(Id id) { return kinds_.erase(id) > 0; }

  std::vector<Id> list(ResourceKind kind) const;  // ascending
  std::size_t size() const { return kinds_.size(); }

private:
  // Auto ids start above the range recipes reserve.
  static constexpr Id kFirstAutoId = 1000000;

  Id next_{kFirstAutoId};
  std::map<Id, ResourceKind> kinds_;
};

} // namespace qc
