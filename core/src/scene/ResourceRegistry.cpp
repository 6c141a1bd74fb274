#include "qc/scene/ResourceRegistry.hpp"

namespace qc {

Id ResourceRegistry::allocate(ResourceKind kind) {
  while (next_ == kInvalidId || exists(next_)) next_++;
  kinds_.emplace(next_, kind);
  return next_++;
}

bool ResourceRegistry::reserve(Id id, ResourceKind kind) {
  if (id == kInvalidId) return false;
  return kinds_.emplace(id, kind).second;
}

bool ResourceRegistry::kindOf(Id id, ResourceKind& out) const {
  auto it = kinds_.find(id);
  if (it == kinds_.end()) return false;
  out = it->second;
  return true;
}

std::vector<Id> ResourceRegistry::list(ResourceKind kind) const {
  std::vector<Id> out;
  for (const auto& kv : kinds_) {
    if (kv.second == kind) out.push_back(kv.first);
  }
  return out;
}

} // namespace qc
