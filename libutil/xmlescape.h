#ifndef LIBUTIL_XMLESCAPE_H
#define LIBUTIL_XMLESCAPE_H

#include <string>

namespace util {

/** Escapes & < > " and ', and drops control characters other than
 * newline.
 */
std::string XmlEscape(const std::string&);

/** Undoes the five predefined entities and numeric character
 * references (as UTF-8). Unknown entities are left alone.
 */
std::string XmlUnEscape(const std::string&);

} // namespace util

#endif
