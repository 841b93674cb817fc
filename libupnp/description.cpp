#include "description.h"
#include "libutil/errors.h"
#include "libutil/http.h"
#include "libutil/http_client.h"
#include "libutil/trace.h"
#include "libutil/xml.h"
#include <boost/algorithm/string/trim.hpp>

LOG_DECL(UPNP);

namespace upnp {

namespace {

/** Collects friendlyName, URLBase and the service list.
 *
 * Matches on local names only, as devices are inconsistent about
 * namespace prefixes.
 */
class DescriptionObserver: public xml::SaxParserObserver
{
    std::vector<std::string> m_stack;
    std::string m_content;
    ServiceData m_service;
    bool m_in_service;

public:
    std::string friendly_name;
    std::string url_base;
    std::vector<ServiceData> services;

    DescriptionObserver() : m_in_service(false) {}

    // Being a SaxParserObserver
    unsigned int OnBegin(const char *tag) override;
    unsigned int OnEnd(const char *tag) override;
    unsigned int OnContent(const char *content) override;
};

unsigned int DescriptionObserver::OnBegin(const char *tag)
{
    std::string name = xml::LocalName(tag);
    if (name == "service")
    {
	m_in_service = true;
	m_service = ServiceData();
    }
    m_stack.push_back(name);
    m_content.clear();
    return 0;
}

unsigned int DescriptionObserver::OnContent(const char *content)
{
    m_content += content;
    return 0;
}

unsigned int DescriptionObserver::OnEnd(const char*)
{
    if (m_stack.empty())
	return 0;

    std::string name = m_stack.back();
    m_stack.pop_back();
    std::string value = boost::algorithm::trim_copy(m_content);
    m_content.clear();

    if (name == "friendlyName")
    {
	// The root device's, not an embedded device's
	if (friendly_name.empty())
	    friendly_name = value;
    }
    else if (name == "URLBase")
	url_base = value;
    else if (m_in_service)
    {
	if (name == "serviceType")
	    m_service.type = value;
	else if (name == "serviceId")
	    m_service.id = value;
	else if (name == "controlURL")
	    m_service.control_url = value;
	else if (name == "service")
	{
	    services.push_back(m_service);
	    m_in_service = false;
	}
    }
    return 0;
}

} // anon namespace

Description::Description()
{
}

unsigned Description::Parse(const std::string& description,
			    const std::string& url)
{
    unsigned int rc = xml::CheckWellFormed(description);
    if (rc)
    {
	TRACE << "Description from " << url << " isn't well-formed\n";
	return EPARSE;
    }

    DescriptionObserver obs;
    xml::SaxParser parser(&obs);
    rc = parser.Parse(description);
    if (rc)
    {
	TRACE << "Can't parse description\n";
	return EPARSE;
    }

    m_friendly_name = obs.friendly_name.empty() ? "Unknown Device"
	                                        : obs.friendly_name;
    m_url_base = obs.url_base;
    m_services.clear();
    m_av_transport_control_url.clear();
    m_rendering_control_control_url.clear();

    std::string base_url = m_url_base.empty() ? url : m_url_base;

    for (std::vector<ServiceData>::const_iterator i = obs.services.begin();
	 i != obs.services.end();
	 ++i)
    {
	if (i->control_url.empty())
	{
	    LOG(UPNP) << "Service " << i->type << " has no controlURL\n";
	    continue;
	}

	ServiceData sd = *i;
	if (!util::http::IsHttpURL(sd.control_url))
	    sd.control_url = util::http::ResolveURL(base_url, sd.control_url);

	LOG(UPNP) << sd.type << " (" << sd.id << ") at " << sd.control_url
		  << "\n";

	if (sd.type.find("AVTransport") != std::string::npos)
	    m_av_transport_control_url = sd.control_url;
	else if (sd.type.find("RenderingControl") != std::string::npos)
	    m_rendering_control_control_url = sd.control_url;

	m_services.push_back(sd);
    }

    return 0;
}

unsigned Description::Fetch(const std::string& url, unsigned int timeout_ms)
{
    util::http::Fetcher hc(url, NULL, NULL, NULL, timeout_ms);
    std::string xml;
    unsigned int rc = hc.FetchToString(&xml);
    if (rc)
    {
	TRACE << "Can't fetch description " << url << ": " << rc << "\n";
	return EFETCH;
    }
    if (hc.GetStatus() < 200 || hc.GetStatus() > 299)
    {
	TRACE << "Description " << url << " gave HTTP " << hc.GetStatus()
	      << "\n";
	return EFETCH;
    }

    return Parse(xml, url);
}

} // namespace upnp

#ifdef TEST

# include "libutil/http_server.h"
# include "libutil/string_stream.h"
# include <assert.h>
# include <string.h>

static const char desc1[] =
"<?xml version=\"1.0\"?>\n"
"<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
"  <specVersion><major>1</major><minor>0</minor></specVersion>\n"
"  <URLBase>http://192.168.1.50:8080/</URLBase>\n"
"  <device>\n"
"    <deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>\n"
"    <friendlyName>Living Room &amp; Kitchen</friendlyName>\n"
"    <UDN>uuid:1234</UDN>\n"
"    <serviceList>\n"
"      <service>\n"
"        <serviceType>urn:schemas-upnp-org:service:RenderingControl:1</serviceType>\n"
"        <serviceId>urn:upnp-org:serviceId:RenderingControl</serviceId>\n"
"        <controlURL>RenderingControl/control</controlURL>\n"
"      </service>\n"
"      <service>\n"
"        <serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>\n"
"        <serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>\n"
"        <controlURL>/AVTransport/control</controlURL>\n"
"      </service>\n"
"      <service>\n"
"        <serviceType>urn:schemas-upnp-org:service:ConnectionManager:1</serviceType>\n"
"        <serviceId>urn:upnp-org:serviceId:ConnectionManager</serviceId>\n"
"      </service>\n"
"    </serviceList>\n"
"  </device>\n"
"</root>\n";

/* Prefixed, no URLBase, absolute AVTransport URL, and two
 * RenderingControls.
 */
static const char desc2[] =
"<d:root xmlns:d=\"urn:schemas-upnp-org:device-1-0\">"
" <d:device>"
"  <d:serviceList>"
"   <d:service>"
"    <d:serviceType>urn:schemas-upnp-org:service:AVTransport:1</d:serviceType>"
"    <d:controlURL>http://10.0.0.9:49152/upnp/control/avt</d:controlURL>"
"   </d:service>"
"   <d:service>"
"    <d:serviceType>urn:schemas-upnp-org:service:RenderingControl:1</d:serviceType>"
"    <d:controlURL>../rc1</d:controlURL>"
"   </d:service>"
"   <d:service>"
"    <d:serviceType>urn:schemas-upnp-org:service:RenderingControl:1</d:serviceType>"
"    <d:controlURL>rc2</d:controlURL>"
"   </d:service>"
"  </d:serviceList>"
" </d:device>"
"</d:root>";

class DescriptionContentFactory: public util::http::ContentFactory
{
public:
    bool StreamForPath(const util::http::Request *rq,
		       util::http::Response *rs) override
    {
	if (rq->path == "/desc.xml")
	{
	    rs->body_source.reset(new util::StringStream(desc1));
	    rs->content_type = "text/xml";
	    return true;
	}
	if (rq->path == "/broken.xml")
	{
	    rs->body_source.reset(
		new util::StringStream("<root><device></root>"));
	    rs->content_type = "text/xml";
	    return true;
	}
	return false;
    }
};

int main()
{
    upnp::Description d;
    unsigned int rc = d.Parse(desc1, "http://192.168.1.50:8080/desc.xml");
    assert(rc == 0);
    assert(d.GetFriendlyName() == "Living Room & Kitchen");
    assert(d.GetAVTransportControlURL()
	   == "http://192.168.1.50:8080/AVTransport/control");
    assert(d.GetRenderingControlControlURL()
	   == "http://192.168.1.50:8080/RenderingControl/control");
    assert(d.GetServices().size() == 2);
    assert(d.GetServices()[1].id == "urn:upnp-org:serviceId:AVTransport");

    upnp::Description d2;
    rc = d2.Parse(desc2, "http://10.0.0.9:49152/a/b/desc.xml");
    assert(rc == 0);
    assert(d2.GetFriendlyName() == "Unknown Device");
    assert(d2.GetAVTransportControlURL()
	   == "http://10.0.0.9:49152/upnp/control/avt");
    assert(d2.GetRenderingControlControlURL()
	   == "http://10.0.0.9:49152/a/b/rc2");
    assert(d2.GetServices().size() == 3);
    assert(d2.GetServices()[1].control_url == "http://10.0.0.9:49152/a/rc1");

    upnp::Description d3;
    rc = d3.Parse("<root><device></root>", "http://h/");
    assert(rc == EPARSE);
    rc = d3.Parse("", "http://h/");
    assert(rc == EPARSE);

    // Over the wire
    util::http::Server ws;
    DescriptionContentFactory dcf;
    ws.AddContentFactory("/", &dcf);
    rc = ws.Init();
    assert(rc == 0);

    std::string base = "http://127.0.0.1:"
	+ std::to_string((unsigned)ws.GetPort());

    upnp::Description d4;
    rc = d4.Fetch(base + "/desc.xml");
    assert(rc == 0);
    assert(d4.GetAVTransportControlURL()
	   == "http://192.168.1.50:8080/AVTransport/control");

    rc = d4.Fetch(base + "/nothere.xml");
    assert(rc == EFETCH);

    rc = d4.Fetch(base + "/broken.xml");
    assert(rc == EPARSE);

    ws.Shutdown();

    rc = d4.Fetch(base + "/desc.xml", 1000);
    assert(rc == EFETCH);

    return 0;
}

#endif
