#include "soap.h"
#include "libutil/errors.h"
#include "libutil/trace.h"
#include "libutil/xml.h"
#include "libutil/xmlescape.h"
#include <stdlib.h>
#include <string.h>
#include <boost/format.hpp>

namespace upnp {
namespace soap {


        /* Inbound */


Inbound::Inbound()
{
}

Inbound::~Inbound()
{
}

namespace {

/** Records each element with no child elements, by local name.
 */
class SoapXMLObserver: public xml::SaxParserObserver
{
    Inbound *m_params;
    std::string m_tag;
    std::string m_value;

public:
    explicit SoapXMLObserver(Inbound *params) : m_params(params) {}

    unsigned int OnBegin(const char *tag) override
    {
	m_tag = xml::LocalName(tag);
	m_value.clear();
	return 0;
    }

    unsigned int OnContent(const char *content) override
    {
	if (!m_tag.empty())
	    m_value += content;
	return 0;
    }

    unsigned int OnEnd(const char*) override
    {
	if (!m_tag.empty())
	    m_params->Set(m_tag, m_value);
	m_tag.clear();
	m_value.clear();
	return 0;
    }
};

} // anon namespace

unsigned int Inbound::Parse(const std::string& envelope)
{
    SoapXMLObserver sxo(this);
    xml::SaxParser parser(&sxo);
    unsigned int rc = parser.Parse(envelope);
    if (rc)
    {
	TRACE << "Failed to parse SOAP response\n";
	return EPARSE;
    }
    return 0;
}

bool Inbound::Has(const char *tag) const
{
    return m_params.find(tag) != m_params.end();
}

std::string Inbound::GetString(const char *tag) const
{
    params_t::const_iterator i = m_params.find(tag);
    if (i == m_params.end())
	return std::string();
    return i->second;
}

uint32_t Inbound::GetUInt(const char *tag) const
{
    return (uint32_t)strtoul(GetString(tag).c_str(), NULL, 10);
}

bool Inbound::GetBool(const char *tag) const
{
    return ParseBool(GetString(tag));
}


        /* Outbound */


Outbound::Outbound()
{
}

Outbound::~Outbound()
{
}

void Outbound::Add(const char *tag, const char *value)
{
    m_params.push_back(std::make_pair(std::string(tag), std::string(value)));
}

void Outbound::Add(const char *tag, const std::string& value)
{
    m_params.push_back(std::make_pair(std::string(tag), value));
}

void Outbound::Add(const char *tag, uint32_t value)
{
    Add(tag, (boost::format("%u") % value).str());
}

std::string CreateEnvelope(const std::string& action_name,
			   const std::string& service_type,
			   const Outbound& params)
{
    std::string body =
	"<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
	"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\""
	" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
	"<s:Body>"
	"<u:" + action_name + " xmlns:u=\"" + service_type + "\">";

    for (Outbound::const_iterator i = params.begin(); i != params.end(); ++i)
	body += "<" + i->first + ">" + util::XmlEscape(i->second)
	    + "</" + i->first + ">";

    body += "</u:" + action_name + ">"
	"</s:Body>"
	"</s:Envelope>";
    return body;
}


        /* Fault */


Fault::Fault()
    : http_status(0),
      upnp_error_code(0),
      transport_error(0)
{
}

void Fault::Clear()
{
    http_status = 0;
    snippet.clear();
    upnp_error_code = 0;
    upnp_error_description.clear();
    transport_error = 0;
}

void ParseFault(unsigned int http_status, const std::string& body,
		Fault *fault)
{
    fault->Clear();
    fault->http_status = http_status;
    fault->snippet = body.substr(0, SNIPPET_LENGTH);

    std::string code = xml::GetTagContent(body, "errorCode");
    if (!code.empty())
	fault->upnp_error_code = (unsigned int)strtoul(code.c_str(), NULL, 10);
    fault->upnp_error_description = xml::GetTagContent(body,
						       "errorDescription");
}

bool ParseBool(const std::string& s)
{
    if (s == "1") return true;
    if (s == "0") return false;
    if (!strcasecmp(s.c_str(),"true")) return true;
    if (!strcasecmp(s.c_str(),"false")) return false;
    if (!strcasecmp(s.c_str(),"yes")) return true;
    return false;
}

} // namespace soap
} // namespace upnp

#ifdef TEST

# include <assert.h>

static const char response[] =
    "<?xml version=\"1.0\"?>\n"
    "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\""
    " s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n"
    " <s:Body>\n"
    "  <u:GetPositionInfoResponse"
    " xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\">\n"
    "   <Track>1</Track>\n"
    "   <TrackDuration>01:30:00</TrackDuration>\n"
    "   <TrackMetaData>&lt;DIDL-Lite/&gt;</TrackMetaData>\n"
    "   <TrackURI/>\n"
    "   <RelTime>00:01:02</RelTime>\n"
    "  </u:GetPositionInfoResponse>\n"
    " </s:Body>\n"
    "</s:Envelope>\n";

static const char fault[] =
    "<?xml version=\"1.0\"?>"
    "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
    "<s:Body><s:Fault>"
    "<faultcode>s:Client</faultcode><faultstring>UPnPError</faultstring>"
    "<detail><UPnPError xmlns=\"urn:schemas-upnp-org:control-1-0\">"
    "<errorCode>714</errorCode>"
    "<errorDescription>Illegal MIME-type</errorDescription>"
    "</UPnPError></detail>"
    "</s:Fault></s:Body></s:Envelope>";

int main()
{
    upnp::soap::Outbound out;
    out.Add("InstanceID", 0u);
    out.Add("CurrentURI", "http://1.2.3.4:5/a&b.mp4");
    out.Add("CurrentURIMetaData", std::string("<DIDL-Lite/>"));

    std::string env = upnp::soap::CreateEnvelope(
	"SetAVTransportURI", "urn:schemas-upnp-org:service:AVTransport:1",
	out);
    assert(env ==
	   "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
	   "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\""
	   " s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
	   "<s:Body>"
	   "<u:SetAVTransportURI"
	   " xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\">"
	   "<InstanceID>0</InstanceID>"
	   "<CurrentURI>http://1.2.3.4:5/a&amp;b.mp4</CurrentURI>"
	   "<CurrentURIMetaData>&lt;DIDL-Lite/&gt;</CurrentURIMetaData>"
	   "</u:SetAVTransportURI>"
	   "</s:Body>"
	   "</s:Envelope>");
    assert(xml::CheckWellFormed(env) == 0);

    upnp::soap::Inbound in;
    unsigned int rc = in.Parse(response);
    assert(rc == 0);
    assert(in.GetUInt("Track") == 1);
    assert(in.GetString("TrackDuration") == "01:30:00");
    assert(in.GetString("TrackMetaData") == "<DIDL-Lite/>");
    assert(in.Has("TrackURI"));
    assert(in.GetString("TrackURI").empty());
    assert(in.GetString("RelTime") == "00:01:02");
    assert(!in.Has("GetPositionInfoResponse"));
    assert(!in.Has("Body"));
    assert(!in.Has("Nope"));

    upnp::soap::Fault f;
    upnp::soap::ParseFault(500, fault, &f);
    assert(f.http_status == 500);
    assert(f.upnp_error_code == 714);
    assert(f.upnp_error_description == "Illegal MIME-type");
    assert(f.snippet.length() == upnp::soap::SNIPPET_LENGTH);
    assert(f.snippet == std::string(fault, upnp::soap::SNIPPET_LENGTH));
    assert(f.transport_error == 0);

    upnp::soap::ParseFault(404, "Not here", &f);
    assert(f.http_status == 404);
    assert(f.snippet == "Not here");
    assert(f.upnp_error_code == 0);
    assert(f.upnp_error_description.empty());

    assert(upnp::soap::ParseBool("1"));
    assert(upnp::soap::ParseBool("TRUE"));
    assert(upnp::soap::ParseBool("yes"));
    assert(!upnp::soap::ParseBool("0"));
    assert(!upnp::soap::ParseBool("false"));
    assert(!upnp::soap::ParseBool(""));

    return 0;
}

#endif
