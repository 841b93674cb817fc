#ifndef LIBUPNP_CLIENT_H
#define LIBUPNP_CLIENT_H 1

#include <string>
#include "libutil/http.h"

namespace upnp {

namespace soap { class Inbound; }
namespace soap { class Outbound; }
namespace soap { struct Fault; }

/** SOAP client for one service on one device.
 *
 * Each action is a fresh HTTP (or HTTPS) connection; the timeout
 * bounds connecting, sending and receiving.
 */
class ServiceClient
{
    std::string m_control_url;
    util::http::URL m_url;
    unsigned int m_url_error;
    std::string m_service_type;
    unsigned int m_timeout_ms;

public:
    ServiceClient(const std::string& control_url,
		  const std::string& service_type,
		  unsigned int timeout_ms = 5000);
    virtual ~ServiceClient();

    const std::string& GetControlURL() const { return m_control_url; }
    const std::string& GetServiceType() const { return m_service_type; }

    /** Returns ECONTROL for any failure, transport or HTTP; if fault is
     * non-NULL, it says which.
     *
     * The response body is returned whatever the status.
     */
    unsigned int SoapAction(const char *action_name,
			    const soap::Outbound& in,
			    std::string *response,
			    soap::Fault *fault = NULL);

    /** As above, with the response parsed. EPARSE if the body of a
     * successful response isn't XML.
     */
    unsigned int SoapAction(const char *action_name,
			    const soap::Outbound& in,
			    soap::Inbound *result,
			    soap::Fault *fault = NULL);

    unsigned int SoapAction(const char *action_name,
			    soap::Inbound *result);
};

} // namespace upnp

#endif
