#ifndef LIBUPNP_SOAP_H
#define LIBUPNP_SOAP_H

#include <map>
#include <string>
#include <list>
#include <stdint.h>

/** Classes implementing UPnP.
 */
namespace upnp {

/** Classes implementing SOAP, the UPnP RPC protocol.
 */
namespace soap {

/** Inbound SOAP parameters (responses, as we're a client).
 */
class Inbound
{
    typedef std::map<std::string, std::string> params_t;
    params_t m_params;

public:
    Inbound();
    ~Inbound();

    /** Collects every leaf element of a response envelope, by local
     * name. Returns EPARSE if it isn't XML at all.
     */
    unsigned int Parse(const std::string& envelope);

    void Set(const std::string& tag, const std::string& value)
    {
	m_params[tag] = value;
    }

    bool Has(const char*) const;

    std::string GetString(const char*) const;
    uint32_t GetUInt(const char*) const;
    bool GetBool(const char*) const;
};

/** Outbound SOAP parameters (requests, as we're a client).
 *
 * Windows Media Connect needs its parameters in the right order
 * (and in fact SOAP1.1 para 7.1, rather disappointingly, says
 * that order is significant). So we preserve parameter order here.
 */
class Outbound
{
    typedef std::list<std::pair<std::string, std::string> > params_t;
    params_t m_params;

public:
    Outbound();
    ~Outbound();

    void Add(const char*, const char *s);
    void Add(const char*, const std::string& s);
    void Add(const char*, uint32_t i);

    typedef params_t::const_iterator const_iterator;
    const_iterator begin() const { return m_params.begin(); }
    const_iterator end() const { return m_params.end(); }
};

/** The whole SOAP 1.1 request body for an action, argument values
 * escaped.
 */
std::string CreateEnvelope(const std::string& action_name,
			   const std::string& service_type,
			   const Outbound& params);

/** What went wrong with a failed action.
 */
struct Fault
{
    unsigned int http_status;     ///< 0 if we never got a response
    std::string snippet;          ///< Start of the response body
    unsigned int upnp_error_code; ///< 0 if the body didn't say
    std::string upnp_error_description;
    unsigned int transport_error; ///< errno, if http_status is 0

    Fault();
    void Clear();
};

enum { SNIPPET_LENGTH = 200 };

/** Fills in a Fault from an HTTP error response.
 */
void ParseFault(unsigned int http_status, const std::string& body,
		Fault *fault);

bool ParseBool(const std::string& s);

} // namespace soap
} // namespace upnp

#endif
