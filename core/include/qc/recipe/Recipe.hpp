#pragma once
#include "qc/ids/Id.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace qc {

// A single JSON command string to be applied via CommandProcessor.
using CmdString = std::string;

// Vertex/instance data for a buffer a recipe created.
struct BufferPayload {
  Id bufferId{0};
  std::vector<float> data;
};

// Result of building a recipe: the commands to create/dispose it and the
// data its buffers carry.
struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
  std::vector<CmdString> disposeCommands;  // applied in order to tear down
  std::vector<BufferPayload> buffers;
};

// Base class for all recipes. A recipe translates a declarative description
// into engine commands using deterministic ID allocation (idBase + offset).
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual RecipeBuildResult build() const = 0;

protected:
  Id idBase_;

  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }
};

} // namespace qc
