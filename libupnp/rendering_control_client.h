#ifndef LIBUPNP_RENDERING_CONTROL_CLIENT_H
#define LIBUPNP_RENDERING_CONTROL_CLIENT_H 1

#include "client.h"

namespace upnp {

/** Client for the RenderingControl service of a MediaRenderer.
 */
class RenderingControlClient: public ServiceClient
{
public:
    explicit RenderingControlClient(const std::string& control_url,
				    unsigned int timeout_ms = 5000);

    /** Volume is clamped to 0..100. */
    unsigned int SetVolume(uint32_t instance, const std::string& channel,
			   int volume, soap::Fault *fault = NULL);
    unsigned int GetVolume(uint32_t instance, const std::string& channel,
			   std::string *response, soap::Fault *fault = NULL);

    /** CurrentVolume, rounded down if the renderer sends a fraction. */
    unsigned int GetVolume(uint32_t instance, const std::string& channel,
			   unsigned int *volume, soap::Fault *fault = NULL);

    unsigned int SetMute(uint32_t instance, const std::string& channel,
			 bool mute, soap::Fault *fault = NULL);
    unsigned int GetMute(uint32_t instance, const std::string& channel,
			 std::string *response, soap::Fault *fault = NULL);
    unsigned int GetMute(uint32_t instance, const std::string& channel,
			 bool *mute, soap::Fault *fault = NULL);
};

} // namespace upnp

#endif
