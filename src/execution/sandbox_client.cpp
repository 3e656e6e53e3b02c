#include "execution/sandbox_client.hpp"

namespace runner {

sandbox_client::~sandbox_client() = default;

}  // namespace runner
