#include "client.h"
#include "soap.h"
#include "libutil/errors.h"
#include "libutil/http_client.h"
#include "libutil/trace.h"

LOG_DECL(SOAP);

namespace upnp {

ServiceClient::ServiceClient(const std::string& control_url,
			     const std::string& service_type,
			     unsigned int timeout_ms)
    : m_control_url(control_url),
      m_service_type(service_type),
      m_timeout_ms(timeout_ms)
{
    m_url_error = util::http::ParseURL(control_url, &m_url);
    if (m_url_error)
	TRACE << "Bad control URL '" << control_url << "'\n";
}

ServiceClient::~ServiceClient()
{
}

unsigned int ServiceClient::SoapAction(const char *action_name,
				       const soap::Outbound& in,
				       std::string *response,
				       soap::Fault *fault)
{
    if (fault)
	fault->Clear();

    if (m_url_error)
    {
	if (fault)
	    fault->transport_error = m_url_error;
	return ECONTROL;
    }

    std::string headers = "SOAPACTION: \"";
    headers += m_service_type;
    headers += "#";
    headers += action_name;
    headers += "\"\r\nContent-Type: text/xml; charset=\"utf-8\"\r\n";

    std::string body = soap::CreateEnvelope(action_name, m_service_type, in);

    LOG(SOAP) << "Soaping " << m_url.ToString() << ":\n" << headers << body
	      << "\n";

    util::http::Fetcher fetcher(m_url.ToString(), headers.c_str(),
				body.c_str(), "POST", m_timeout_ms);
    unsigned int rc = fetcher.FetchToString(response);
    if (rc)
    {
	TRACE << action_name << " to " << m_control_url << " failed: "
	      << util::StrError(rc) << "\n";
	if (fault)
	    fault->transport_error = rc;
	return ECONTROL;
    }

    unsigned int status = fetcher.GetStatus();
    LOG(SOAP) << action_name << " gave " << status << ":\n" << *response
	      << "\n";

    if (status >= 400)
    {
	TRACE << action_name << " failed with HTTP " << status << "\n";
	if (fault)
	    soap::ParseFault(status, *response, fault);
	return ECONTROL;
    }

    return 0;
}

unsigned int ServiceClient::SoapAction(const char *action_name,
				       const soap::Outbound& in,
				       soap::Inbound *result,
				       soap::Fault *fault)
{
    std::string response;
    unsigned int rc = SoapAction(action_name, in, &response, fault);
    if (rc)
	return rc;
    return result->Parse(response);
}

unsigned int ServiceClient::SoapAction(const char *action_name,
				       soap::Inbound *result)
{
    soap::Outbound no_params;
    return SoapAction(action_name, no_params, result);
}

} // namespace upnp

#ifdef TEST

# include "libutil/http_server.h"
# include "libutil/string_stream.h"
# include "libutil/xml.h"
# include "libutil/xmlescape.h"
# include <assert.h>

/** Answers Frobnicate, faults everything else.
 */
class MockService: public util::http::ContentFactory
{
public:
    std::string last_action;
    std::string last_body;
    std::string last_content_type;

    bool StreamForPath(const util::http::Request *rq,
		       util::http::Response *rs) override
    {
	if (rq->path != "/control")
	    return false;

	last_action = rq->GetHeader("SOAPACTION");
	last_body = rq->body;
	last_content_type = rq->GetHeader("Content-Type");

	if (last_action == "\"urn:test:service:Frob:1#Frobnicate\"")
	{
	    rs->body_source.reset(new util::StringStream(
		"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
		"<s:Body><u:FrobnicateResponse xmlns:u=\"urn:test:service:Frob:1\">"
		"<Result>" + util::XmlEscape(xml::GetTagContent(rq->body, "Thing"))
		+ "</Result></u:FrobnicateResponse></s:Body></s:Envelope>"));
	}
	else
	{
	    rs->status_line = "HTTP/1.1 500 Internal Server Error\r\n";
	    rs->body_source.reset(new util::StringStream(
		"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
		"<s:Body><s:Fault><faultcode>s:Client</faultcode>"
		"<faultstring>UPnPError</faultstring><detail>"
		"<UPnPError xmlns=\"urn:schemas-upnp-org:control-1-0\">"
		"<errorCode>401</errorCode>"
		"<errorDescription>Invalid Action</errorDescription>"
		"</UPnPError></detail></s:Fault></s:Body></s:Envelope>"));
	}
	rs->content_type = "text/xml; charset=\"utf-8\"";
	return true;
    }
};

int main()
{
    util::http::Server ws;
    MockService ms;
    ws.AddContentFactory("/", &ms);
    unsigned int rc = ws.Init();
    assert(rc == 0);

    std::string url = "http://127.0.0.1:"
	+ std::to_string((unsigned)ws.GetPort()) + "/control";

    upnp::ServiceClient sc(url, "urn:test:service:Frob:1");

    upnp::soap::Outbound out;
    out.Add("InstanceID", 0u);
    out.Add("Thing", "fish & chips");
    upnp::soap::Inbound in;
    upnp::soap::Fault f;
    rc = sc.SoapAction("Frobnicate", out, &in, &f);
    assert(rc == 0);
    assert(in.GetString("Result") == "fish & chips");
    assert(ms.last_content_type == "text/xml; charset=\"utf-8\"");
    assert(ms.last_body.find("<u:Frobnicate xmlns:u=\"urn:test:service:Frob:1\">"
			     "<InstanceID>0</InstanceID>"
			     "<Thing>fish &amp; chips</Thing>")
	   != std::string::npos);
    assert(f.http_status == 0);

    std::string response;
    rc = sc.SoapAction("Defenestrate", out, &response, &f);
    assert(rc == ECONTROL);
    assert(ms.last_action == "\"urn:test:service:Frob:1#Defenestrate\"");
    assert(f.http_status == 500);
    assert(f.upnp_error_code == 401);
    assert(f.upnp_error_description == "Invalid Action");
    assert(f.transport_error == 0);
    assert(!response.empty());

    // No fault wanted
    rc = sc.SoapAction("Defenestrate", out, &response);
    assert(rc == ECONTROL);

    ws.Shutdown();

    rc = sc.SoapAction("Frobnicate", out, &response, &f);
    assert(rc == ECONTROL);
    assert(f.http_status == 0);
    assert(f.transport_error != 0);

    upnp::ServiceClient bad("gopher://x/control", "urn:test:service:Frob:1");
    rc = bad.SoapAction("Frobnicate", out, &response, &f);
    assert(rc == ECONTROL);
    assert(f.transport_error == EINVAL);

    return 0;
}

#endif
