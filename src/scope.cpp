#include "eff-scope/scope.hpp"
#include <algorithm>
#include <atomic>
#include "eff-scope/trace.hpp"

namespace effscope {

namespace {
std::atomic<uint64_t> last_scope_id{0};
// Indices into `open_scopes` of the active regions, innermost last.
thread_local std::vector<std::size_t> open_regions;

scope_tag push_frame(const std::type_info& kind, bool region, scope_set allowed) {
  scope_tag tag{++last_scope_id, open_scopes.size()};
  open_scopes.push_back(scope_frame{tag, &kind, region, std::move(allowed)});
  if (region) {
    open_regions.push_back(tag.depth);
  }
  return tag;
}
}  // namespace

thread_local std::vector<scope_frame> open_scopes;

scope_tag mint_scope(const std::type_info& kind) {
  auto tag = push_frame(kind, false, {});
#ifdef EFF_SCOPE_TRACE
  fmt::print(stderr, "[eff-scope] open scope #{} [{}] depth={}\n", tag.id,
      demangle(kind.name()), tag.depth);
#endif
  return tag;
}

scope_tag open_region(const std::type_info& kind, scope_set allowed) {
  auto tag = push_frame(kind, true, std::move(allowed));
#ifdef EFF_SCOPE_TRACE
  fmt::print(stderr, "[eff-scope] open region #{} [{}] depth={} allowed={}\n",
      tag.id, demangle(kind.name()), tag.depth,
      open_scopes.back().allowed.size());
#endif
  return tag;
}

void close_scope(scope_tag tag) {
  if (open_scopes.empty() || open_scopes.back().tag != tag) {
    fatal_scope_violation(
        tag, "close_scope", "scopes must be closed in stack order");
  }
#ifdef EFF_SCOPE_TRACE
  fmt::print(stderr, "[eff-scope] close scope #{} [{}] depth={}\n", tag.id,
      demangle(open_scopes.back().kind->name()), tag.depth);
#endif
  if (open_scopes.back().region) {
    open_regions.pop_back();
  }
  open_scopes.pop_back();
}

bool is_open(scope_tag tag) {
  return tag.depth < open_scopes.size() &&
      open_scopes[tag.depth].tag.id == tag.id;
}

bool is_visible(scope_tag tag) {
  if (!is_open(tag)) {
    return false;
  }
  if (open_regions.empty()) {
    return true;
  }
  auto region = open_regions.back();
  return tag.depth > region || open_scopes[region].allowed.contains(tag);
}

void check_scope(scope_tag tag, const char* operation) {
  if (!is_open(tag)) {
    fatal_scope_violation(tag, operation, "handle used after its handler returned");
  }
  if (!is_visible(tag)) {
    fatal_scope_violation(
        tag, operation, "handle is not in the running computation's scope set");
  }
}

std::size_t count_open_scopes(const std::type_info& kind) {
  return std::count_if(open_scopes.begin(), open_scopes.end(),
      [&](const scope_frame& frame) { return *frame.kind == kind; });
}

region_view::region_view(std::size_t depth) {
  auto first_hidden =
      std::lower_bound(open_regions.begin(), open_regions.end(), depth);
  hidden.assign(first_hidden, open_regions.end());
  open_regions.erase(first_hidden, open_regions.end());
#ifdef EFF_SCOPE_TRACE
  fmt::print(stderr, "[eff-scope] region view at depth={} hides {}\n", depth,
      hidden.size());
#endif
}

region_view::~region_view() {
  open_regions.insert(open_regions.end(), hidden.begin(), hidden.end());
}

}  // namespace effscope
