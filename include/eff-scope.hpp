#pragma once

// Value-level effect handles. Every capability (state, exceptions, early
// return, io, coroutines) is reached through a handle that a handler mints
// for one dynamic extent; using a handle outside that extent aborts with a
// diagnostic.

#include "eff-scope/config.hpp"
#include "eff-scope/trace.hpp"
#include "eff-scope/scope.hpp"
#include "eff-scope/either.hpp"
#include "eff-scope/handle.hpp"
#include "eff-scope/eff.hpp"
#include "eff-scope/state.hpp"
#include "eff-scope/exception.hpp"
#include "eff-scope/early_return.hpp"
#include "eff-scope/io.hpp"
#include "eff-scope/compound.hpp"
#include "eff-scope/counter.hpp"
#include "eff-scope/coroutine.hpp"
#include "eff-scope/stream.hpp"
#include "eff-scope/resumable.hpp"
