#pragma once

#define EFF_SCOPE_VERSION_MAJOR 0
#define EFF_SCOPE_VERSION_MINOR 1
#define EFF_SCOPE_VERSION_PATCH 0
#define EFF_SCOPE_VERSION_STRING "0.1.0"

#if __cplusplus < 202002L
#error "eff-scope requires C++20 (concepts and coroutines)"
#endif

#if defined(__clang__) || defined(__GNUC__)
#define EFF_SCOPE_NOINLINE __attribute__((noinline))
#else
#define EFF_SCOPE_NOINLINE
#endif
