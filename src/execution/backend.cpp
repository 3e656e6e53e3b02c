#include "execution/backend.hpp"

namespace runner {

execution_backend::~execution_backend() = default;

}  // namespace runner
