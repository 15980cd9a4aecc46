// intentionally no include guard, always paired with macro-begin.hpp

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC visibility pop
#endif
