#include "ssdp.h"
#include "config.h"
#include "libutil/http_parser.h"
#include "libutil/ip_config.h"
#include "libutil/line_reader.h"
#include "libutil/socket.h"
#include "libutil/string_stream.h"
#include "libutil/trace.h"
#include <errno.h>
#include <time.h>
#include <sys/time.h>
#include <boost/format.hpp>

LOG_DECL(SSDP);

namespace upnp {

namespace ssdp {

bool ResultSet::Add(const Device& device)
{
    key_t key = std::make_pair(device.location, device.usn);
    if (m_seen.find(key) != m_seen.end())
	return false;
    m_seen.insert(key);
    m_devices.push_back(device);
    return true;
}

bool ResultSet::OnReply(const std::string& datagram,
			const std::string& search_target)
{
    util::StringStream ss(datagram);

    // SSDP packets look like HTTP headers
    util::GreedyLineReader glr(&ss);
    util::http::Parser hh(&glr);

    std::string status_line;
    unsigned int rc = glr.GetLine(&status_line);
    if (rc)
	return false;

    util::http::Headers headers;
    rc = hh.GetHeaders(&headers);
    if (rc)
    {
	LOG(SSDP) << "Don't like SSDP header\n" << datagram << "\n";
	return false;
    }

    Device device;
    device.location = util::http::GetHeader(headers, "location");
    if (device.location.empty())
    {
	LOG(SSDP) << "Reply with no location ignored\n";
	return false;
    }
    device.search_target = util::http::GetHeader(headers, "st");
    if (device.search_target.empty())
	device.search_target = search_target;
    device.usn = util::http::GetHeader(headers, "usn");
    device.server = util::http::GetHeader(headers, "server");

    bool added = Add(device);
    if (added)
    {
	LOG(SSDP) << "Found " << device.usn << " at " << device.location
		  << " (" << device.search_target << ")\n";
    }
    return added;
}

static unsigned int NowMS()
{
    struct timeval tv;
    ::gettimeofday(&tv, NULL);
    return (unsigned int)(tv.tv_sec * 1000 + tv.tv_usec / 1000);
}

static void SearchOne(util::DatagramSocket *socket, unsigned int timeout_ms,
		      unsigned int mx, const std::string& target,
		      ResultSet *results)
{
    std::string search = (boost::format("M-SEARCH * HTTP/1.1\r\n"
					"HOST: 239.255.255.250:1900\r\n"
					"MAN: \"ssdp:discover\"\r\n"
					"MX: %u\r\n"
					"ST: %s\r\n"
					"\r\n") % mx % target).str();

    util::IPEndPoint ipe;
    ipe.addr = util::IPAddress::FromDottedQuad(239,255,255,250);
    ipe.port = 1900;
    unsigned int rc = socket->Write(search, ipe);
    if (rc)
    {
	TRACE << "Can't send M-SEARCH for " << target << ": " << rc << "\n";
	return;
    }

    unsigned int start = NowMS();
    for (;;)
    {
	unsigned int elapsed = NowMS() - start;
	if (elapsed >= timeout_ms)
	    break;

	rc = socket->WaitForRead(timeout_ms - elapsed);
	if (rc == EWOULDBLOCK)
	    break;
	if (rc)
	{
	    TRACE << "SSDP wait failed: " << rc << "\n";
	    return;
	}

	std::string packet;
	util::IPEndPoint wasfrom;
	rc = socket->Read(&packet, &wasfrom);
	if (rc)
	{
	    TRACE << "SSDP read failed: " << rc << "\n";
	    return;
	}

	LOG(SSDP) << "From " << wasfrom.ToString() << ":\n" << packet;

	results->OnReply(packet, target);
    }
}

unsigned Discover(unsigned int timeout_ms, unsigned int mx,
		  const std::vector<std::string>& targets,
		  Devices *devices)
{
    devices->clear();

    util::DatagramSocket socket;
    if (!socket.IsOpen())
    {
	TRACE << "Can't create SSDP socket\n";
	return 0;
    }

    util::IPEndPoint ipe;
    ipe.addr = util::IPAddress::ANY;
    ipe.port = 0;
    unsigned int rc = socket.Bind(ipe);
    if (rc)
    {
	TRACE << "Can't bind SSDP socket: " << rc << "\n";
	return 0;
    }

    util::IPAddress outbound = util::GetOutboundAddress();
    rc = socket.SetOutgoingMulticastInterface(outbound);
    if (rc)
	LOG(SSDP) << "Can't set multicast interface " << outbound.ToString()
		  << ": " << rc << "\n";
    rc = socket.SetMulticastTTL(2);
    if (rc)
	LOG(SSDP) << "Can't set multicast TTL: " << rc << "\n";

    ResultSet results;
    for (std::vector<std::string>::const_iterator i = targets.begin();
	 i != targets.end();
	 ++i)
    {
	SearchOne(&socket, timeout_ms, mx, *i, &results);
    }

    *devices = results.GetDevices();
    LOG(SSDP) << devices->size() << " device(s) found\n";
    return 0;
}

unsigned Discover(unsigned int timeout_ms, unsigned int mx,
		  Devices *devices)
{
    std::vector<std::string> targets(s_default_targets,
				     s_default_targets + s_num_default_targets);
    return Discover(timeout_ms, mx, targets, devices);
}

std::string RootUUID(const std::string& usn)
{
    std::string::size_type colons = usn.find("::");
    if (colons == std::string::npos)
	return usn;
    return std::string(usn, 0, colons);
}

const char *const s_default_targets[] = {
    "ssdp:all",
    "upnp:rootdevice",
    s_device_type_media_renderer,
    s_service_type_av_transport,
};

const unsigned int s_num_default_targets =
    sizeof(s_default_targets)/sizeof(*s_default_targets);

} // namespace ssdp


        /* The UUIDs */

const char s_device_type_media_renderer[] =
    "urn:schemas-upnp-org:device:MediaRenderer:1";

const char s_service_type_av_transport[] =
    "urn:schemas-upnp-org:service:AVTransport:1";

const char s_service_type_rendering_control[] =
    "urn:schemas-upnp-org:service:RenderingControl:1";

} // namespace upnp


#ifdef TEST

# include <assert.h>

static const char reply1[] =
    "HTTP/1.1 200 OK\r\n"
    "CACHE-CONTROL: max-age=1800\r\n"
    "EXT:\r\n"
    "LOCATION: http://192.168.1.50:8080/description.xml\r\n"
    "SERVER: Linux/3.0 UPnP/1.0 TV/1.0\r\n"
    "ST: urn:schemas-upnp-org:service:AVTransport:1\r\n"
    "USN: uuid:1234::urn:schemas-upnp-org:service:AVTransport:1\r\n"
    "\r\n";

/* Same device, answering a different search, with lower-case headers
 * and no ST.
 */
static const char reply2[] =
    "HTTP/1.1 200 OK\r\n"
    "location:   http://192.168.1.50:8080/description.xml  \r\n"
    "usn: uuid:1234::urn:schemas-upnp-org:service:AVTransport:1\r\n"
    "\r\n";

static const char reply3[] =
    "HTTP/1.1 200 OK\r\n"
    "Location: http://192.168.1.50:8080/description.xml\r\n"
    "ST: upnp:rootdevice\r\n"
    "USN: uuid:1234::upnp:rootdevice\r\n";

static const char no_location[] =
    "HTTP/1.1 200 OK\r\n"
    "LOCATION:\r\n"
    "ST: upnp:rootdevice\r\n"
    "USN: uuid:5678::upnp:rootdevice\r\n"
    "\r\n";

int main()
{
    upnp::ssdp::ResultSet rs;

    assert(rs.OnReply(reply1, "ssdp:all"));
    assert(!rs.OnReply(reply1, "ssdp:all"));
    assert(!rs.OnReply(reply1, "upnp:rootdevice"));
    assert(!rs.OnReply(reply2, upnp::s_service_type_av_transport));
    assert(rs.OnReply(reply3, "upnp:rootdevice"));
    assert(!rs.OnReply(no_location, "upnp:rootdevice"));
    assert(!rs.OnReply("", "upnp:rootdevice"));

    const upnp::ssdp::Devices& d = rs.GetDevices();
    assert(d.size() == 2);
    assert(d[0].location == "http://192.168.1.50:8080/description.xml");
    assert(d[0].search_target == upnp::s_service_type_av_transport);
    assert(d[0].usn
	   == "uuid:1234::urn:schemas-upnp-org:service:AVTransport:1");
    assert(d[0].server == "Linux/3.0 UPnP/1.0 TV/1.0");
    assert(d[1].search_target == "upnp:rootdevice");

    upnp::ssdp::ResultSet rs2;
    assert(rs2.OnReply(reply2, "urn:x"));
    assert(rs2.GetDevices()[0].search_target == "urn:x");
    assert(rs2.GetDevices()[0].location
	   == "http://192.168.1.50:8080/description.xml");

    assert(upnp::ssdp::RootUUID(d[0].usn) == "uuid:1234");
    assert(upnp::ssdp::RootUUID("uuid:5678") == "uuid:5678");

    // Whatever the network, this mustn't fail
    upnp::ssdp::Devices devices;
    std::vector<std::string> targets;
    targets.push_back("urn:dlnacast-test:device:Nothing:1");
    unsigned int rc = upnp::ssdp::Discover(200, 1, targets, &devices);
    assert(rc == 0);

    return 0;
}

#endif
