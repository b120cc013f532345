// Paired with macro-end.hpp, deliberately no include guard.

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
// clang-only attributes like [[clang::coro_return_type]]
#pragma GCC diagnostic ignored "-Wattributes"
#endif
