/* libupnp/ssdp.h */

#ifndef LIBUPNP_SSDP_H
#define LIBUPNP_SSDP_H 1

#include <set>
#include <string>
#include <vector>

namespace upnp {

/** Classes implementing SSDP, the discovery protocol used in UPnP.
 *
 * Only the control-point half is here: we search, we don't advertise.
 */
namespace ssdp {

/** One reply to an M-SEARCH.
 */
struct Device
{
    std::string location;      ///< URL of the description document
    std::string search_target; ///< ST, or the target searched-for if none
    std::string usn;
    std::string server;        ///< Informational only
};

typedef std::vector<Device> Devices;

/** Accumulates replies across a whole discovery run, keeping one per
 * (location, USN) pair, in order of arrival.
 */
class ResultSet
{
    typedef std::pair<std::string, std::string> key_t;
    std::set<key_t> m_seen;
    Devices m_devices;

public:
    /** Parses one datagram. Replies without a LOCATION are ignored;
     * replies without an ST are credited to search_target.
     *
     * Returns true if this was a new device.
     */
    bool OnReply(const std::string& datagram,
		 const std::string& search_target);

    /** Returns true if this was a new device. */
    bool Add(const Device&);

    const Devices& GetDevices() const { return m_devices; }
};

/** Searches for each of targets in turn, waiting up to timeout_ms for
 * replies to each.
 *
 * Always returns 0; if the network's down, you just get no devices.
 */
unsigned Discover(unsigned int timeout_ms, unsigned int mx,
		  const std::vector<std::string>& targets,
		  Devices *devices);

/** Searches for s_default_targets. */
unsigned Discover(unsigned int timeout_ms, unsigned int mx,
		  Devices *devices);

/** "uuid:abc::urn:schemas..." -> "uuid:abc" */
std::string RootUUID(const std::string& usn);

extern const char *const s_default_targets[];
extern const unsigned int s_num_default_targets;

} // namespace ssdp


// Common search UUIDs

extern const char s_device_type_media_renderer[];
extern const char s_service_type_av_transport[];
extern const char s_service_type_rendering_control[];

} // namespace upnp

#endif
