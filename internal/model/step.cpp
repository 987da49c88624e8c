#include "step.hpp"

namespace upgrader::model {

std::string ToString(const StepKey& key) {
  return std::to_string(key.file_id) + ":" + std::to_string(key.upgrader_id);
}

} // namespace upgrader::model
