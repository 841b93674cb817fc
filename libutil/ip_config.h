#ifndef LIBUTIL_IP_CONFIG_H
#define LIBUTIL_IP_CONFIG_H 1

#include "ip.h"

namespace util {

/** The address of the interface that traffic to the wider network
 * would leave by.
 *
 * Found by connect()ing a UDP socket towards a public address and
 * asking for its local name; no packet is sent. Returns 127.0.0.1 if
 * there is no route (or no network at all).
 */
IPAddress GetOutboundAddress();

} // namespace util

#endif
