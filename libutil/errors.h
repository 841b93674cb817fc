#ifndef LIBUTIL_ERRORS_H
#define LIBUTIL_ERRORS_H 1

#include "config.h"
#include <errno.h>
#include <boost/cerrno.hpp>

/** Error codes beyond the system's errno values.
 *
 * Everything in dlnacast returns unsigned int, 0 for success or one of
 * these (or a plain errno) for failure.
 */
enum {
    EDUMMY = 6000,

    /** Couldn't retrieve a document (transport failure, timeout, or a
     * non-2xx HTTP status).
     */
    EFETCH,

    /** Retrieved a document, but it wasn't well-formed XML.
     */
    EPARSE,

    /** A SOAP action failed, either at the transport level or with an
     * HTTP error status from the device.
     */
    ECONTROL,

    EDUMMY2
};

namespace util {

/** Human-readable version of an error code, including the ones above.
 */
const char *StrError(unsigned int error);

} // namespace util

#endif
