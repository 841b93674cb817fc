#ifndef LIBCAST_TIME_CODE_H
#define LIBCAST_TIME_CODE_H 1

#include <string>

namespace cast {

/** "01:02:03" -> 3723. Fractional seconds ("01:02:03.500") are
 * dropped; anything not of the form H:M:S gives 0.
 */
unsigned int ParseTimeCode(const std::string& hhmmss);

/** 3723 -> "01:02:03" */
std::string FormatTimeCode(unsigned int seconds);

} // namespace cast

#endif
