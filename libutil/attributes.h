/* libutil/attributes.h
 *
 * Compiler annotations; empty where the compiler has none.
 */

#ifndef LIBUTIL_ATTRIBUTES_H
#define LIBUTIL_ATTRIBUTES_H 1

#if defined(__GNUC__) || defined(__clang__)
/** For error returns that mustn't be dropped (stream I/O) */
#define ATTRIBUTE_WARNUNUSED __attribute__((warn_unused_result))
#define ATTRIBUTE_PRINTF(fmt, args) __attribute__((format(printf, fmt, args)))
#else
#define ATTRIBUTE_WARNUNUSED
#define ATTRIBUTE_PRINTF(fmt, args)
#endif

#endif
