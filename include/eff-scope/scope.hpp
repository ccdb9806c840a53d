#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <typeinfo>
#include <vector>

namespace effscope {

// Identifies one dynamic extent. `id` is never reused within a process;
// `depth` is the position of the extent on the open-scope stack.
struct scope_tag {
  uint64_t id = 0;
  std::size_t depth = 0;

  friend bool operator==(const scope_tag&, const scope_tag&) = default;
};

class scope_set {
  std::vector<scope_tag> tags;

 public:
  scope_set() = default;
  scope_set(std::initializer_list<scope_tag> init) {
    for (auto tag : init) {
      insert(tag);
    }
  }

  void insert(scope_tag tag) {
    if (!contains(tag)) {
      tags.push_back(tag);
    }
  }

  void merge(const scope_set& other) {
    for (auto tag : other) {
      insert(tag);
    }
  }

  bool contains(scope_tag tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
  }

  bool empty() const { return tags.empty(); }
  std::size_t size() const { return tags.size(); }
  std::vector<scope_tag>::const_iterator begin() const { return tags.begin(); }
  std::vector<scope_tag>::const_iterator end() const { return tags.end(); }
};

// One entry of the open-scope stack. Regions are frames pushed by the effect
// runtime while running an `eff` value: inside a region only the tags in
// `allowed`, plus tags minted after the region was opened, may be used.
struct scope_frame {
  scope_tag tag;
  const std::type_info* kind;
  bool region;
  scope_set allowed;
};

extern thread_local std::vector<scope_frame> open_scopes;

// Opens a handler scope with a tag distinct from every tag minted before.
scope_tag mint_scope(const std::type_info& kind);

scope_tag open_region(const std::type_info& kind, scope_set allowed);

// Closes the innermost scope. `tag` must be on top of the stack.
void close_scope(scope_tag tag);

bool is_open(scope_tag tag);

// Open, and usable from the innermost region.
bool is_visible(scope_tag tag);

// Aborts with a diagnostic unless `tag` is visible.
void check_scope(scope_tag tag, const char* operation);

std::size_t count_open_scopes(const std::type_info& kind);

// While alive, only the regions opened below `depth` are active. A handler's
// callbacks run under this view of the handler's own depth, so regions its
// body opened do not restrict them.
class region_view {
  std::vector<std::size_t> hidden;

 public:
  explicit region_view(std::size_t depth);
  ~region_view();

  region_view(const region_view&) = delete;
  region_view& operator=(const region_view&) = delete;
};

}  // namespace effscope
