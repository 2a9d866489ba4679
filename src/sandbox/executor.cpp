#include "sandbox/executor.hpp"

namespace verifier {

sandbox_executor::~sandbox_executor() = default;

}  // namespace verifier
