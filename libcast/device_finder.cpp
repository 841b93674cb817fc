#include "device_finder.h"
#include "libutil/errors.h"
#include "libutil/trace.h"
#include <map>
#include <set>

LOG_DECL(FINDER);

namespace cast {

unsigned int RankSearchTarget(const std::string& st)
{
    if (st.find(upnp::s_service_type_av_transport) != std::string::npos)
	return 0;
    if (st.find(upnp::s_device_type_media_renderer) != std::string::npos)
	return 1;
    if (st == "upnp:rootdevice")
	return 2;
    return 3;
}

void SelectRenderers(const Renderers& candidates, Renderers *selected)
{
    typedef std::map<std::string, size_t> index_t;
    index_t best; // Root UUID -> index in *selected

    selected->clear();

    for (Renderers::const_iterator i = candidates.begin();
	 i != candidates.end();
	 ++i)
    {
	std::string uuid = upnp::ssdp::RootUUID(i->device.usn);
	index_t::const_iterator j = best.find(uuid);
	if (j == best.end())
	{
	    best[uuid] = selected->size();
	    selected->push_back(*i);
	    continue;
	}

	Renderer& current = (*selected)[j->second];
	if (RankSearchTarget(i->device.search_target)
	    < RankSearchTarget(current.device.search_target))
	{
	    LOG(FINDER) << uuid << ": preferring " << i->device.search_target
			<< " over " << current.device.search_target << "\n";
	    current = *i;
	}
    }
}

void ResolveRenderers(const upnp::ssdp::Devices& devices,
		      unsigned int description_timeout_ms,
		      Renderers *renderers)
{
    // Many replies share one description; fetch each only once
    std::map<std::string, upnp::Description> fetched;
    std::set<std::string> failed;

    Renderers candidates;

    for (upnp::ssdp::Devices::const_iterator i = devices.begin();
	 i != devices.end();
	 ++i)
    {
	if (failed.count(i->location))
	    continue;

	std::map<std::string, upnp::Description>::const_iterator j
	    = fetched.find(i->location);
	if (j == fetched.end())
	{
	    upnp::Description desc;
	    unsigned int rc = desc.Fetch(i->location, description_timeout_ms);
	    if (rc)
	    {
		TRACE << "Skipping " << i->location << ": "
		      << util::StrError(rc) << "\n";
		failed.insert(i->location);
		continue;
	    }
	    j = fetched.insert(std::make_pair(i->location, desc)).first;
	}

	if (j->second.GetAVTransportControlURL().empty())
	{
	    LOG(FINDER) << j->second.GetFriendlyName()
			<< " isn't a renderer\n";
	    continue;
	}

	Renderer r;
	r.device = *i;
	r.description = j->second;
	candidates.push_back(r);
    }

    SelectRenderers(candidates, renderers);
}

unsigned int FindRenderers(const DiscoveryOptions& options,
			   Renderers *renderers)
{
    upnp::ssdp::Devices devices;
    unsigned int rc;
    if (options.targets.empty())
	rc = upnp::ssdp::Discover(options.timeout_ms, options.mx, &devices);
    else
	rc = upnp::ssdp::Discover(options.timeout_ms, options.mx,
				  options.targets, &devices);
    if (rc)
	return rc;

    LOG(FINDER) << devices.size() << " replies\n";

    ResolveRenderers(devices, options.description_timeout_ms, renderers);

    LOG(FINDER) << renderers->size() << " renderers\n";
    return 0;
}

unsigned int FindRenderers(unsigned int timeout_ms, Renderers *renderers)
{
    DiscoveryOptions options;
    options.timeout_ms = timeout_ms;
    return FindRenderers(options, renderers);
}

} // namespace cast

#ifdef TEST

# include "libupnp/mock_renderer.h"
# include "libutil/http_server.h"
# include <assert.h>

static cast::Renderer Candidate(const char *usn, const char *st,
				const char *name)
{
    cast::Renderer r;
    r.device.usn = usn;
    r.device.search_target = st;
    r.device.location = std::string("http://10.0.0.1/") + name;
    return r;
}

static const struct {
    const char *st;
    unsigned int rank;
} ranktests[] = {
    { "urn:schemas-upnp-org:service:AVTransport:1", 0 },
    { "uuid:x::urn:schemas-upnp-org:service:AVTransport:1", 0 },
    { "urn:schemas-upnp-org:device:MediaRenderer:1", 1 },
    { "upnp:rootdevice", 2 },
    { "ssdp:all", 3 },
    { "urn:schemas-upnp-org:device:MediaServer:1", 3 },
    { "", 3 },
};

int main()
{
    for (unsigned int i=0; i<sizeof(ranktests)/sizeof(ranktests[0]); ++i)
	assert(cast::RankSearchTarget(ranktests[i].st) == ranktests[i].rank);

    cast::Renderers candidates, selected;
    candidates.push_back(Candidate("uuid:tv::upnp:rootdevice",
				   "upnp:rootdevice", "tv-root"));
    candidates.push_back(Candidate("uuid:radio", "ssdp:all", "radio"));
    candidates.push_back(Candidate(
	"uuid:tv::urn:schemas-upnp-org:service:AVTransport:1",
	"urn:schemas-upnp-org:service:AVTransport:1", "tv-avt"));
    candidates.push_back(Candidate(
	"uuid:tv::urn:schemas-upnp-org:device:MediaRenderer:1",
	"urn:schemas-upnp-org:device:MediaRenderer:1", "tv-mr"));
    candidates.push_back(Candidate("uuid:radio::upnp:rootdevice",
				   "upnp:rootdevice", "radio-root"));
    candidates.push_back(Candidate("uuid:radio::upnp:rootdevice",
				   "upnp:rootdevice", "radio-root-again"));

    cast::SelectRenderers(candidates, &selected);
    assert(selected.size() == 2);
    assert(selected[0].device.location == "http://10.0.0.1/tv-avt");
    assert(selected[1].device.location == "http://10.0.0.1/radio-root");

    // Against real descriptions
    util::http::Server ws;
    upnp::MockRenderer renderer;
    renderer.SetFriendlyName("Living Room");
    ws.AddContentFactory("/", &renderer);
    unsigned int rc = ws.Init();
    assert(rc == 0);

    std::string base = "http://127.0.0.1:"
	+ std::to_string((unsigned)ws.GetPort());
    std::string uuid = "uuid:mock-renderer-"
	+ std::to_string((unsigned)ws.GetPort());

    upnp::ssdp::Devices devices;
    upnp::ssdp::Device d;
    d.location = base + "/description.xml";
    d.usn = uuid + "::upnp:rootdevice";
    d.search_target = "upnp:rootdevice";
    devices.push_back(d);
    d.location = base + "/nothing-here.xml";
    d.usn = "uuid:gone::upnp:rootdevice";
    devices.push_back(d);
    d.location = base + "/description.xml";
    d.usn = uuid + "::" + upnp::s_device_type_media_renderer;
    d.search_target = upnp::s_device_type_media_renderer;
    devices.push_back(d);

    cast::Renderers renderers;
    cast::ResolveRenderers(devices, 5000, &renderers);
    assert(renderers.size() == 1);
    assert(renderers[0].device.search_target
	   == upnp::s_device_type_media_renderer);
    assert(renderers[0].description.GetFriendlyName() == "Living Room");
    assert(renderers[0].description.GetAVTransportControlURL()
	   == base + "/AVTransport/control");
    assert(renderers[0].description.GetRenderingControlControlURL()
	   == base + "/RenderingControl/control");

    ws.Shutdown();

    // Nothing listening: nothing found, but not an error
    cast::DiscoveryOptions options;
    options.timeout_ms = 200;
    options.targets.push_back("urn:example-com:device:Nonexistent:1");
    rc = cast::FindRenderers(options, &renderers);
    assert(rc == 0);

    return 0;
}

#endif
