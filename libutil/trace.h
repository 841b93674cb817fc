/* libutil/trace.h
 *
 * Debug tracing
 */

#ifndef LIBUTIL_TRACE_H
#define LIBUTIL_TRACE_H

#include <string>
#include <memory>
#include <stdint.h>
#include <stdio.h>
#include "attributes.h"

namespace util {

/** One line (or more) of trace output.
 *
 * Holds the trace lock from construction to destruction, so that a
 * whole "TRACE << a << b << c" expression comes out in one piece even
 * with several connection threads logging at once.
 */
class Tracer
{
    bool m_emit;
public:
    Tracer(const char *env_var, const char *file, unsigned int line);
    ~Tracer();

    void Printf(const char *format, ...) const
	ATTRIBUTE_PRINTF(2, 3);

    Tracer(const Tracer& other);
};

inline const Tracer& operator<<(const Tracer& n, const char* s) { n.Printf("%s",s?s:"NULL"); return n; }
inline const Tracer& operator<<(const Tracer& n, char* s) { n.Printf("%s",s?s:"NULL"); return n; }
inline const Tracer& operator<<(const Tracer& n, const std::string& s) { n.Printf("%s", s.c_str()); return n; }
inline const Tracer& operator<<(const Tracer& n, bool b) { n.Printf("%s", b?"true":"false"); return n; }
inline const Tracer& operator<<(const Tracer& n, char i) { n.Printf("'%c'",i); return n; }
inline const Tracer& operator<<(const Tracer& n, unsigned char ui) { n.Printf("%u",ui); return n; }
inline const Tracer& operator<<(const Tracer& n, short i) { n.Printf("%d",i); return n; }
inline const Tracer& operator<<(const Tracer& n, unsigned short ui) { n.Printf("%u",ui); return n; }
inline const Tracer& operator<<(const Tracer& n, int i) { n.Printf("%d",i); return n; }
inline const Tracer& operator<<(const Tracer& n, unsigned int ui) { n.Printf("%u",ui); return n; }
inline const Tracer& operator<<(const Tracer& n, long i) { n.Printf("%ld",i); return n; }
inline const Tracer& operator<<(const Tracer& n, unsigned long ul) { n.Printf("%lu",ul); return n; }
inline const Tracer& operator<<(const Tracer& n, const void *p) { n.Printf("%p",p); return n; }
inline const Tracer& operator<<(const Tracer& n, double d) { n.Printf("%f",d); return n; }
       const Tracer& operator<<(const Tracer& n, unsigned long long ull);
       const Tracer& operator<<(const Tracer& n, long long ll);

template<typename T>
inline const Tracer& operator<<(const Tracer& n, const T* ptr)
{
    return n << ((const void*)ptr);
}

template<typename T>
inline const Tracer& operator<<(const Tracer& n, T* ptr)
{
    return n << ((const void*)ptr);
}

/** For STL sequences (two-parameter) eg vector, list
 */
template<typename X, typename Y, template<typename,typename> class SEQ>
inline const Tracer& operator<<(const Tracer& n, const SEQ<X,Y>& m)
{
    n << "{ ";
    for (typename SEQ<X,Y>::const_iterator i = m.begin(); i != m.end(); ++i)
    {
	n << *i << ", ";
    }
    n << "}";
    return n;
}

/** For STL associative containers (four-parameter) eg map
 */
template<typename W, typename X, typename Y, typename Z,
	 template<typename,typename,typename,typename> class SEQ>
inline const Tracer& operator<<(const Tracer& n, const SEQ<W,X,Y,Z>& m)
{
    n << "{ ";
    for (typename SEQ<W,X,Y,Z>::const_iterator i = m.begin(); i != m.end(); ++i)
    {
	n << *i << ", ";
    }
    n << "}";
    return n;
}

template<typename X, typename Y>
inline const Tracer& operator<<(const Tracer& n, const std::pair<X,Y>& p)
{
    n << "(" << p.first << ", " << p.second << ")";
    return n;
}

template<typename X>
inline const Tracer& operator<<(const Tracer&n, const std::unique_ptr<X>& ptr)
{
    n << ptr.get();
    return n;
}

class LogNameList
{
    const char *m_name;
    static LogNameList *sm_head;
    LogNameList *m_next;

public:
    explicit LogNameList(const char *name);

    /** Prints the LOG_ variables that this program understands.
     *
     * Used by the command-line tools' --help.
     */
    static void ShowLogNames(FILE *f);
};

/** A tracer that does nothing, for release builds.
 */
struct NullTracer {
};

template<typename T>
inline const NullTracer& operator<<(const NullTracer& n, const T&) { return n; }

inline const NullTracer& operator<<(const NullTracer& n, int) { return n; }

} // namespace util

#if DEBUG
#define TRACE ::util::Tracer(NULL, __FILE__, __LINE__)
#define LOG(x) ::util::Tracer(::LOG_IMPL_ ##x, __FILE__, __LINE__)
#define LOG_DECL(x) \
    static util::LogNameList LOG_NAME_ ##x (#x);	\
    static const char LOG_IMPL_ ##x [] = "LOG_" #x
#else
#define TRACE util::NullTracer()
#define LOG(x) util::NullTracer()
#define LOG_DECL(x) extern char LOG_IMPL_ ##x
#endif

#endif
