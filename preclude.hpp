#pragma once

#include <tl/expected.hpp>
#include <spdlog/spdlog.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <utility>

namespace ext {
using namespace tl;
}

template <std::invocable F>
struct Defer {
  Defer(F&& f) : f(std::forward<F>(f)) {}
  ~Defer() { f(); }
  F f;
};
