// intentionally no include guard, always paired with macro-end.hpp

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC visibility push(default)
#endif
