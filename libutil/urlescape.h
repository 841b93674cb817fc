#ifndef LIBUTIL_URLESCAPE_H
#define LIBUTIL_URLESCAPE_H 1

#include <string>

namespace util {

/** Percent-encodes everything except RFC 3986 unreserved characters
 * and '/', so that a path stays a path.
 */
std::string URLEscape(const std::string&);

/** Decodes %xx sequences; malformed ones are passed through. */
std::string URLUnEscape(const std::string&);

} // namespace util

#endif
