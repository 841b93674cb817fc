#include "avtransport_client.h"
#include "didl.h"
#include "dlna.h"
#include "soap.h"
#include "ssdp.h"
#include "libutil/errors.h"
#include "libutil/trace.h"

LOG_DECL(UPNP);

namespace upnp {

AVTransportClient::AVTransportClient(const std::string& control_url,
				     unsigned int timeout_ms)
    : ServiceClient(control_url, s_service_type_av_transport, timeout_ms)
{
}

unsigned int AVTransportClient::Simple(const char *action, uint32_t instance,
				       soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    std::string response;
    return SoapAction(action, out, &response, fault);
}

unsigned int AVTransportClient::SetAVTransportURI(uint32_t instance,
						  const std::string& uri,
						  const std::string& metadata,
						  soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    out.Add("CurrentURI", uri);
    out.Add("CurrentURIMetaData", metadata);
    std::string response;
    return SoapAction("SetAVTransportURI", out, &response, fault);
}

unsigned int AVTransportClient::Play(uint32_t instance,
				     const std::string& speed,
				     soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    out.Add("Speed", speed);
    std::string response;
    return SoapAction("Play", out, &response, fault);
}

unsigned int AVTransportClient::Pause(uint32_t instance, soap::Fault *fault)
{
    return Simple("Pause", instance, fault);
}

unsigned int AVTransportClient::Stop(uint32_t instance, soap::Fault *fault)
{
    return Simple("Stop", instance, fault);
}

unsigned int AVTransportClient::Seek(uint32_t instance,
				     const std::string& target,
				     soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    out.Add("Unit", "REL_TIME");
    out.Add("Target", target);
    std::string response;
    return SoapAction("Seek", out, &response, fault);
}

unsigned int AVTransportClient::GetPositionInfo(uint32_t instance,
						std::string *response,
						soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    out.Add("MediaBrowserID", 0u);
    return SoapAction("GetPositionInfo", out, response, fault);
}

unsigned int AVTransportClient::GetMediaInfo(uint32_t instance,
					     std::string *response,
					     soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    return SoapAction("GetMediaInfo", out, response, fault);
}

unsigned int AVTransportClient::SetURIWithMetadata(
    uint32_t instance, const std::string& content_url,
    const std::string& title, const dlna::FormatHint *hint,
    soap::Fault *fault)
{
    std::string mime_type = dlna::GuessMimeType(content_url);
    std::string metadata = didl::Metadata(content_url, title, mime_type,
					  hint);

    LOG(UPNP) << "Setting " << content_url << " as " << mime_type << "\n";

    unsigned int rc = SetAVTransportURI(instance, content_url, metadata,
					fault);
    if (rc != ECONTROL)
	return rc;

    // Some renderers reject DIDL they don't like, but accept a bare URI
    TRACE << "Renderer refused metadata, retrying without\n";
    return SetAVTransportURI(instance, content_url, std::string(), fault);
}

} // namespace upnp

#ifdef TEST

# include "mock_renderer.h"
# include "libutil/xml.h"
# include <assert.h>

int main()
{
    util::http::Server ws;
    upnp::MockRenderer renderer;
    ws.AddContentFactory("/", &renderer);
    unsigned int rc = ws.Init();
    assert(rc == 0);

    std::string url = "http://127.0.0.1:"
	+ std::to_string((unsigned)ws.GetPort()) + "/AVTransport/control";
    upnp::AVTransportClient avt(url);

    // Metadata accepted first time
    rc = avt.SetURIWithMetadata(0, "http://10.0.0.1:8000/Film%20One.mkv",
				"Film One");
    assert(rc == 0);
    assert(renderer.GetCallCount("SetAVTransportURI") == 1);
    assert(renderer.GetURI() == "http://10.0.0.1:8000/Film%20One.mkv");
    assert(renderer.GetMetadata().find("<dc:title>Film One</dc:title>")
	   != std::string::npos);
    assert(renderer.GetMetadata().find("video/x-matroska:DLNA.ORG_PN=AVC_MKV")
	   != std::string::npos);

    // Metadata rejected: exactly one retry, without
    renderer.SetRejectMetadata(true);
    rc = avt.SetURIWithMetadata(0, "http://10.0.0.1:8000/b.mp4", "b");
    assert(rc == 0);
    assert(renderer.GetCallCount("SetAVTransportURI") == 3);
    assert(renderer.GetURI() == "http://10.0.0.1:8000/b.mp4");
    assert(renderer.GetMetadata().empty());

    // Everything rejected: still exactly one retry, and the error comes out
    renderer.SetRejectURI(true);
    upnp::soap::Fault f;
    rc = avt.SetURIWithMetadata(0, "http://10.0.0.1:8000/c.mp4", "c", NULL,
				&f);
    assert(rc == ECONTROL);
    assert(renderer.GetCallCount("SetAVTransportURI") == 5);
    assert(f.http_status == 500);
    assert(f.upnp_error_code == 714);
    renderer.SetRejectURI(false);
    renderer.SetRejectMetadata(false);

    rc = avt.Play(0);
    assert(rc == 0);
    assert(renderer.GetTransportState() == "PLAYING");
    rc = avt.Pause(0);
    assert(rc == 0);
    assert(renderer.GetTransportState() == "PAUSED_PLAYBACK");
    rc = avt.Seek(0, "00:10:00");
    assert(rc == 0);
    assert(renderer.GetLastSeekTarget() == "00:10:00");

    std::string response;
    rc = avt.GetPositionInfo(0, &response);
    assert(rc == 0);
    assert(xml::GetTagContent(response, "RelTime") == "00:00:05");
    assert(xml::GetTagContent(response, "TrackDuration") == "00:42:00");
    rc = avt.GetMediaInfo(0, &response);
    assert(rc == 0);
    assert(xml::GetTagContent(response, "MediaDuration") == "00:42:00");

    rc = avt.Stop(0);
    assert(rc == 0);
    assert(renderer.GetTransportState() == "STOPPED");

    ws.Shutdown();

    // No renderer: one attempt with metadata, one without
    rc = avt.SetURIWithMetadata(0, "http://10.0.0.1:8000/c.mp4", "c", NULL,
				&f);
    assert(rc == ECONTROL);
    assert(f.http_status == 0);
    assert(f.transport_error != 0);

    return 0;
}

#endif
