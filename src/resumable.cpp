#include "eff-scope/resumable.hpp"

namespace effscope {

const char* to_string(coroutine_state status) {
  switch (status) {
    case coroutine_state::idle:
      return "idle";
    case coroutine_state::running:
      return "running";
    case coroutine_state::suspended:
      return "suspended";
    case coroutine_state::completed:
      return "completed";
  }
  return "unknown";
}

}  // namespace effscope
