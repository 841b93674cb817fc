#ifndef UPNP_DESCRIPTION_H
#define UPNP_DESCRIPTION_H 1

#include <string>
#include <vector>

namespace upnp {

struct ServiceData
{
    std::string type;
    std::string id;
    std::string control_url; ///< Absolute
};

typedef std::vector<ServiceData> Services;

/** The parts of a UPnP device description that a controller needs.
 */
class Description
{
    std::string m_friendly_name;
    std::string m_url_base;
    std::string m_av_transport_control_url;
    std::string m_rendering_control_control_url;

    /** The services in this device (and any embedded devices), in
     * document order.
     */
    Services m_services;

public:
    Description();

    /** Parse an XML device description.
     *
     * If several services of one kind are listed, the last one wins.
     *
     * @param description_xml The (possibly nested) device description XML
     * @param url             URL of description (for resolving relative URLs)
     *
     * Returns EPARSE if the document isn't well-formed.
     */
    unsigned Parse(const std::string& description_xml,
		   const std::string& url);

    /** Fetches and parses; EFETCH if it can't be retrieved (including
     * non-2xx responses), EPARSE if it's not XML.
     */
    unsigned Fetch(const std::string& url, unsigned int timeout_ms = 5000);

    const std::string& GetFriendlyName() const { return m_friendly_name; }
    const std::string& GetURLBase() const { return m_url_base; }

    /** Empty if the device has no AVTransport service */
    const std::string& GetAVTransportControlURL() const
    {
	return m_av_transport_control_url;
    }

    /** Empty if the device has no RenderingControl service */
    const std::string& GetRenderingControlControlURL() const
    {
	return m_rendering_control_control_url;
    }

    const Services& GetServices() const { return m_services; };
};

} // namespace upnp

#endif
