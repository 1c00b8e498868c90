/*****************************************************************/ /**
 * @file   compiler.h
 * @brief  Contains macros to abstract compiler differences.
 *
 * @author Raphael Dib Nehme
 * @date   October 2025
 *********************************************************************/
#ifndef __HG_FREEZER_MACROS_COMPILER
#define __HG_FREEZER_MACROS_COMPILER

#if defined(_MSC_VER)
  #define FREEZER_MSVC 1
#else
  #define FREEZER_MSVC 0
#endif

#if defined(__clang__)
  #define FREEZER_CLANG 1
#else
  #define FREEZER_CLANG 0
#endif

#if defined(__GNUC__) && !FREEZER_CLANG
  #define FREEZER_GCC 1
#else
  #define FREEZER_GCC 0
#endif

#if FREEZER_MSVC
  /// @brief Forces inlining of a function
  #define FREEZER_FORCE_INLINE __forceinline
#elif FREEZER_GCC || FREEZER_CLANG
  /// @brief Forces inlining of a function
  #define FREEZER_FORCE_INLINE inline __attribute__((always_inline))
#else
  /// @brief Forces inlining of a function
  #define FREEZER_FORCE_INLINE inline
#endif

#if FREEZER_GCC || FREEZER_CLANG
  /// @brief Hints that `x` is usually true
  #define FREEZER_LIKELY(x)   __builtin_expect(!!(x), 1)
  /// @brief Hints that `x` is usually false
  #define FREEZER_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
  #define FREEZER_LIKELY(x)   (x)
  #define FREEZER_UNLIKELY(x) (x)
#endif

#define __FREEZER_STRINGIFY(x) #x
#define FREEZER_STRINGIFY(x)   __FREEZER_STRINGIFY(x)

#endif // !__HG_FREEZER_MACROS_COMPILER
