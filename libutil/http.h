#ifndef LIBUTIL_HTTP_H
#define LIBUTIL_HTTP_H

#include <string>
#include <stdint.h>
#include <time.h>

namespace util {

/** Classes implementing HTTP/1.1
 */
namespace http {

/** An absolute http or https URL, taken apart. */
struct URL
{
    std::string scheme;  ///< Lower-case, "http" or "https"
    std::string host;
    unsigned short port; ///< Default for the scheme if not given
    std::string path;    ///< Path plus any query; at least "/"

    /** Host plus port, as for a "Host:" header. */
    std::string HostHeader() const;

    std::string ToString() const;
};

/** Returns EINVAL unless url is an absolute http:// or https:// URL
 * with a host part.
 */
unsigned int ParseURL(const std::string& url, URL *result);

/** RFC 3986 section 5.2 reference resolution, including dot-segment
 * removal. An absolute link is returned as-is.
 */
std::string ResolveURL(const std::string& base, const std::string& link);

bool IsHttpURL(const char*);
inline bool IsHttpURL(const std::string& s) { return IsHttpURL(s.c_str()); }

/** An inclusive byte range, 0 <= start <= end < size. */
struct ByteRange
{
    uint64_t start;
    uint64_t end;

    uint64_t Length() const { return end - start + 1; }
};

enum RangeResult {
    RANGE_NONE,          ///< No header, or one we don't understand: send it all
    RANGE_OK,            ///< Send *range, as a 206
    RANGE_UNSATISFIABLE  ///< Start beyond the end: 416
};

/** Interprets a "Range:" header value against a resource of the given
 * size.
 *
 * Only a single "bytes=<start>-<end>" range is understood; either side
 * may be empty (an empty start means 0, an empty end means the last
 * byte). The end is clamped to the resource. Anything else, including
 * an end before the start, is RANGE_NONE.
 */
RangeResult ParseRange(const std::string& header, uint64_t size,
		       ByteRange *range);

/** RFC 1123 date, e.g. "Sun, 06 Nov 1994 08:49:37 GMT". */
std::string FormatDate(time_t t);

} // namespace http

} // namespace util

#endif
