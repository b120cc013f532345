// Paired with macro-begin.hpp, deliberately no include guard.

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif
