#include "mock_renderer.h"
#include "ssdp.h"
#include "libutil/string_stream.h"
#include "libutil/trace.h"
#include "libutil/xml.h"
#include "libutil/xmlescape.h"
#include <unistd.h>
#include <boost/format.hpp>

namespace upnp {

MockRenderer::MockRenderer()
    : m_volume("20"),
      m_mute("0"),
      m_state("NO_MEDIA_PRESENT"),
      m_track_duration("00:42:00"),
      m_media_duration("00:42:00"),
      m_reject_metadata(false),
      m_reject_uri(false),
      m_delay_ms(0),
      m_friendly_name("Mock Renderer")
{
}

void MockRenderer::SetRejectMetadata(bool b)
{
    boost::mutex::scoped_lock lock(m_mutex);
    m_reject_metadata = b;
}

void MockRenderer::SetRejectURI(bool b)
{
    boost::mutex::scoped_lock lock(m_mutex);
    m_reject_uri = b;
}

void MockRenderer::SetDelayMS(unsigned int ms)
{
    boost::mutex::scoped_lock lock(m_mutex);
    m_delay_ms = ms;
}

void MockRenderer::SetDurations(const std::string& track,
				const std::string& media)
{
    boost::mutex::scoped_lock lock(m_mutex);
    m_track_duration = track;
    m_media_duration = media;
}

void MockRenderer::SetFriendlyName(const std::string& name)
{
    boost::mutex::scoped_lock lock(m_mutex);
    m_friendly_name = name;
}

unsigned int MockRenderer::GetCallCount(const std::string& action) const
{
    boost::mutex::scoped_lock lock(m_mutex);
    std::map<std::string, unsigned int>::const_iterator i
	= m_calls.find(action);
    return i == m_calls.end() ? 0 : i->second;
}

std::string MockRenderer::GetURI() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_uri;
}

std::string MockRenderer::GetMetadata() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_metadata;
}

std::string MockRenderer::GetTransportState() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_state;
}

std::string MockRenderer::GetLastSeekTarget() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_last_seek;
}

static std::string OrNotImplemented(const std::string& s)
{
    return s.empty() ? std::string("NOT_IMPLEMENTED") : s;
}

/** Returns the contents of the response element, or of the fault
 * detail.
 */
std::string MockRenderer::OnAction(const std::string& action,
				   const std::string& body, bool *fault)
{
    boost::mutex::scoped_lock lock(m_mutex);
    ++m_calls[action];
    *fault = false;

    if (action == "SetAVTransportURI")
    {
	std::string metadata = xml::GetTagContent(body, "CurrentURIMetaData");
	if (m_reject_uri || (m_reject_metadata && !metadata.empty()))
	{
	    *fault = true;
	    return "<errorCode>714</errorCode>"
		"<errorDescription>Illegal MIME-type</errorDescription>";
	}
	m_uri = xml::GetTagContent(body, "CurrentURI");
	m_metadata = metadata;
	m_state = "STOPPED";
	return "";
    }
    if (action == "Play")
    {
	if (m_uri.empty())
	{
	    *fault = true;
	    return "<errorCode>701</errorCode>"
		"<errorDescription>Transition not available</errorDescription>";
	}
	m_state = "PLAYING";
	return "";
    }
    if (action == "Pause")
    {
	m_state = "PAUSED_PLAYBACK";
	return "";
    }
    if (action == "Stop")
    {
	m_state = "STOPPED";
	return "";
    }
    if (action == "Seek")
    {
	m_last_seek = xml::GetTagContent(body, "Target");
	return "";
    }
    if (action == "GetPositionInfo")
    {
	return "<Track>1</Track>"
	    "<TrackDuration>" + OrNotImplemented(m_track_duration)
	    + "</TrackDuration>"
	    "<TrackMetaData></TrackMetaData>"
	    "<TrackURI>" + util::XmlEscape(m_uri) + "</TrackURI>"
	    "<RelTime>00:00:05</RelTime>"
	    "<AbsTime>NOT_IMPLEMENTED</AbsTime>"
	    "<RelCount>2147483647</RelCount>"
	    "<AbsCount>2147483647</AbsCount>";
    }
    if (action == "GetMediaInfo")
    {
	return "<NrTracks>1</NrTracks>"
	    "<MediaDuration>" + OrNotImplemented(m_media_duration)
	    + "</MediaDuration>"
	    "<CurrentURI>" + util::XmlEscape(m_uri) + "</CurrentURI>";
    }
    if (action == "SetVolume")
    {
	m_volume = xml::GetTagContent(body, "DesiredVolume");
	return "";
    }
    if (action == "GetVolume")
	return "<CurrentVolume>" + m_volume + "</CurrentVolume>";
    if (action == "SetMute")
    {
	m_mute = xml::GetTagContent(body, "DesiredMute");
	return "";
    }
    if (action == "GetMute")
	return "<CurrentMute>" + m_mute + "</CurrentMute>";

    *fault = true;
    return "<errorCode>401</errorCode>"
	"<errorDescription>Invalid Action</errorDescription>";
}

std::string MockRenderer::Description(const util::http::Request *rq)
{
    boost::mutex::scoped_lock lock(m_mutex);
    return (boost::format(
	"<?xml version=\"1.0\"?>\n"
	"<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
	"<specVersion><major>1</major><minor>0</minor></specVersion>\n"
	"<device>\n"
	"<deviceType>%s</deviceType>\n"
	"<friendlyName>%s</friendlyName>\n"
	"<UDN>uuid:mock-renderer-%u</UDN>\n"
	"<serviceList>\n"
	"<service><serviceType>%s</serviceType>"
	"<serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>"
	"<controlURL>/AVTransport/control</controlURL></service>\n"
	"<service><serviceType>%s</serviceType>"
	"<serviceId>urn:upnp-org:serviceId:RenderingControl</serviceId>"
	"<controlURL>RenderingControl/control</controlURL></service>\n"
	"</serviceList>\n"
	"</device>\n"
	"</root>\n")
	    % s_device_type_media_renderer
	    % util::XmlEscape(m_friendly_name)
	    % rq->local_ep.port
	    % s_service_type_av_transport
	    % s_service_type_rendering_control).str();
}

bool MockRenderer::StreamForPath(const util::http::Request *rq,
				 util::http::Response *rs)
{
    if (rq->path == "/description.xml")
    {
	rs->body_source.reset(new util::StringStream(Description(rq)));
	rs->content_type = "text/xml; charset=\"utf-8\"";
	return true;
    }

    if (rq->path != "/AVTransport/control"
	&& rq->path != "/RenderingControl/control")
	return false;

    // SOAPACTION: "urn:schemas-upnp-org:service:AVTransport:1#Play"
    std::string soapaction = rq->GetHeader("SOAPACTION");
    std::string::size_type hash = soapaction.find('#');
    std::string action;
    if (hash != std::string::npos)
    {
	action = soapaction.substr(hash+1);
	if (!action.empty() && action[action.length()-1] == '"')
	    action.erase(action.length()-1);
    }
    std::string service_type = soapaction.substr(
	soapaction.empty() || soapaction[0] != '"' ? 0 : 1,
	hash == std::string::npos ? std::string::npos : hash - 1);

    unsigned int delay_ms;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	delay_ms = m_delay_ms;
    }
    if (delay_ms)
	::usleep(delay_ms * 1000);

    bool fault;
    std::string result = OnAction(action, rq->body, &fault);

    std::string body =
	"<?xml version=\"1.0\"?>\n"
	"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\""
	" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
	"<s:Body>";
    if (fault)
    {
	body += "<s:Fault><faultcode>s:Client</faultcode>"
	    "<faultstring>UPnPError</faultstring><detail>"
	    "<UPnPError xmlns=\"urn:schemas-upnp-org:control-1-0\">"
	    + result
	    + "</UPnPError></detail></s:Fault>";
	rs->status_line = "HTTP/1.1 500 Internal Server Error\r\n";
    }
    else
    {
	body += "<u:" + action + "Response xmlns:u=\"" + service_type + "\">"
	    + result + "</u:" + action + "Response>";
    }
    body += "</s:Body></s:Envelope>";

    rs->body_source.reset(new util::StringStream(body));
    rs->content_type = "text/xml; charset=\"utf-8\"";
    return true;
}

} // namespace upnp
