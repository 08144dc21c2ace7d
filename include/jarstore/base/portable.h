#ifndef JARSTORE_BASE_PORTABLE_H
#define JARSTORE_BASE_PORTABLE_H

/// Compiler specific attributes.
///
/// On-disk structs of a jar are PACKED so their byte layout does not depend
/// on the compiler's padding rules. Fields of packed structs may be
/// misaligned, copy them out before binding them to a reference.
///
/// JAR_LIKELY and JAR_UNLIKELY mark the expected outcome of a branch, mostly
/// the error checks of system calls.
#if defined(__GNUC__) || defined(__clang__)
#define PACKED __attribute__((packed))
#define JAR_LIKELY(x) (__builtin_expect(!!(x), 1))
#define JAR_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define PACKED
#define JAR_LIKELY(x) (x)
#define JAR_UNLIKELY(x) (x)
#endif

#endif
