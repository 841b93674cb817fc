#ifndef LIBCAST_DEVICE_FINDER_H
#define LIBCAST_DEVICE_FINDER_H 1

#include <string>
#include <vector>
#include "libupnp/description.h"
#include "libupnp/ssdp.h"

namespace cast {

struct DiscoveryOptions
{
    unsigned int timeout_ms; ///< Per search target
    unsigned int mx;
    std::vector<std::string> targets; ///< Empty for the usual ones
    unsigned int description_timeout_ms;

    DiscoveryOptions()
	: timeout_ms(2000), mx(2), description_timeout_ms(5000) {}
};

/** A device that can be sent media.
 */
struct Renderer
{
    upnp::ssdp::Device device;
    upnp::Description description;
};

typedef std::vector<Renderer> Renderers;

/** Lower is better: 0 for an AVTransport search target, 1 for a
 * MediaRenderer, 2 for upnp:rootdevice, 3 for anything else.
 */
unsigned int RankSearchTarget(const std::string& st);

/** One renderer per root UUID: the one found by the best-ranked search
 * target, or the first found among equals. Order of first discovery is
 * kept.
 */
void SelectRenderers(const Renderers& candidates, Renderers *selected);

/** Fetches each device's description, drops devices that can't be
 * fetched or have no AVTransport, then SelectRenderers().
 */
void ResolveRenderers(const upnp::ssdp::Devices& devices,
		      unsigned int description_timeout_ms,
		      Renderers *renderers);

/** Discovers, then ResolveRenderers(). Finding nothing isn't an error.
 */
unsigned int FindRenderers(const DiscoveryOptions& options,
			   Renderers *renderers);

unsigned int FindRenderers(unsigned int timeout_ms, Renderers *renderers);

} // namespace cast

#endif
