#ifndef LIBUPNP_AVTRANSPORT_CLIENT_H
#define LIBUPNP_AVTRANSPORT_CLIENT_H 1

#include "client.h"

namespace upnp {

namespace dlna { struct FormatHint; }

/** Client for the AVTransport service of a MediaRenderer.
 *
 * Every call is one SOAP action, so every call returns 0 or ECONTROL
 * (see soap::Fault for the details).
 */
class AVTransportClient: public ServiceClient
{
    unsigned int Simple(const char *action, uint32_t instance,
			soap::Fault *fault);

public:
    explicit AVTransportClient(const std::string& control_url,
			       unsigned int timeout_ms = 5000);

    unsigned int SetAVTransportURI(uint32_t instance, const std::string& uri,
				   const std::string& metadata,
				   soap::Fault *fault = NULL);
    unsigned int Play(uint32_t instance, const std::string& speed = "1",
		      soap::Fault *fault = NULL);
    unsigned int Pause(uint32_t instance, soap::Fault *fault = NULL);
    unsigned int Stop(uint32_t instance, soap::Fault *fault = NULL);

    /** Target is "HH:MM:SS"; it isn't checked here. */
    unsigned int Seek(uint32_t instance, const std::string& target,
		      soap::Fault *fault = NULL);

    /** Raw response envelopes; see xml::GetTagContent. */
    unsigned int GetPositionInfo(uint32_t instance, std::string *response,
				 soap::Fault *fault = NULL);
    unsigned int GetMediaInfo(uint32_t instance, std::string *response,
			      soap::Fault *fault = NULL);

    /** SetAVTransportURI with DIDL-Lite metadata describing the item;
     * if the renderer rejects that, tries once more with none.
     */
    unsigned int SetURIWithMetadata(uint32_t instance,
				    const std::string& content_url,
				    const std::string& title,
				    const dlna::FormatHint *hint = NULL,
				    soap::Fault *fault = NULL);
};

} // namespace upnp

#endif
