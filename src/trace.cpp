#include "eff-scope/trace.hpp"
#define UNW_LOCAL_ONLY
#include <cxxabi.h>
#include <libunwind.h>
#include <cstdio>
#include <cstdlib>
#include "eff-scope/scope.hpp"

namespace effscope {

std::string demangle(const char* name) {
  int status;
  char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
  if (status == 0) {
    std::string result(demangled);
    free(demangled);
    return result;
  } else {
    return name;
  }
}

void print_frames(const char* prefix) {
  unw_cursor_t cursor;
  unw_context_t uc;
  unw_getcontext(&uc);
  unw_init_local(&cursor, &uc);
  int i = 0;
  while (unw_step(&cursor) > 0) {
    unw_word_t sp, ip, off;
    unw_get_reg(&cursor, UNW_REG_SP, &sp);
    unw_get_reg(&cursor, UNW_REG_IP, &ip);
    char proc_name[512];
    if (unw_get_proc_name(&cursor, proc_name, sizeof(proc_name), &off) == 0) {
      fmt::print(stderr, "{:16} [{}] sp={:#x} ip={:#x} {} +{:#x}\n", prefix,
          i++, sp, ip, demangle(proc_name), off);
    } else {
      fmt::print(stderr, "{:16} [{}] sp={:#x} ip={:#x} ??\n", prefix, i++, sp,
          ip);
    }
  }
}

namespace {
void print_open_scopes() {
  fmt::print(stderr, "open scopes ({}):\n", open_scopes.size());
  for (auto it = open_scopes.rbegin(); it != open_scopes.rend(); it++) {
    fmt::print(stderr, "  [{}] #{} {}{}\n", it->tag.depth, it->tag.id,
        it->region ? "region " : "", demangle(it->kind->name()));
  }
}
}  // namespace

void fatal_scope_violation(const scope_tag& tag,
    std::string_view operation,
    std::string_view reason) {
  fmt::print(stderr, "eff-scope: scope violation in {}: {} (scope #{} depth={})\n",
      operation, reason, tag.id, tag.depth);
  print_open_scopes();
  print_frames("scope violation");
  std::fflush(stderr);
  abort();
}

void fatal_protocol_violation(std::string_view operation,
    std::string_view reason) {
  fmt::print(
      stderr, "eff-scope: protocol violation in {}: {}\n", operation, reason);
  print_open_scopes();
  print_frames("protocol violation");
  std::fflush(stderr);
  abort();
}

}  // namespace effscope
