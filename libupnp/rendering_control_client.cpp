#include "rendering_control_client.h"
#include "soap.h"
#include "ssdp.h"
#include "libutil/errors.h"
#include "libutil/trace.h"
#include "libutil/xml.h"
#include <math.h>
#include <stdlib.h>

LOG_DECL(UPNP);

namespace upnp {

RenderingControlClient::RenderingControlClient(const std::string& control_url,
					       unsigned int timeout_ms)
    : ServiceClient(control_url, s_service_type_rendering_control,
		    timeout_ms)
{
}

unsigned int RenderingControlClient::SetVolume(uint32_t instance,
					       const std::string& channel,
					       int volume,
					       soap::Fault *fault)
{
    if (volume < 0)
	volume = 0;
    else if (volume > 100)
	volume = 100;

    soap::Outbound out;
    out.Add("InstanceID", instance);
    out.Add("Channel", channel);
    out.Add("DesiredVolume", (uint32_t)volume);
    std::string response;
    return SoapAction("SetVolume", out, &response, fault);
}

unsigned int RenderingControlClient::GetVolume(uint32_t instance,
					       const std::string& channel,
					       std::string *response,
					       soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    out.Add("Channel", channel);
    return SoapAction("GetVolume", out, response, fault);
}

unsigned int RenderingControlClient::GetVolume(uint32_t instance,
					       const std::string& channel,
					       unsigned int *volume,
					       soap::Fault *fault)
{
    std::string response;
    unsigned int rc = GetVolume(instance, channel, &response, fault);
    if (rc)
	return rc;

    std::string text = xml::GetTagContent(response, "CurrentVolume");
    char *endptr = NULL;
    double d = strtod(text.c_str(), &endptr);
    if (text.empty() || *endptr || !isfinite(d))
    {
	LOG(UPNP) << "Don't understand volume '" << text << "'\n";
	return EPARSE;
    }
    if (d < 0)
	d = 0;
    else if (d > 100)
	d = 100;
    *volume = (unsigned int)d;
    return 0;
}

unsigned int RenderingControlClient::SetMute(uint32_t instance,
					     const std::string& channel,
					     bool mute, soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    out.Add("Channel", channel);
    out.Add("DesiredMute", mute ? "1" : "0");
    std::string response;
    return SoapAction("SetMute", out, &response, fault);
}

unsigned int RenderingControlClient::GetMute(uint32_t instance,
					     const std::string& channel,
					     std::string *response,
					     soap::Fault *fault)
{
    soap::Outbound out;
    out.Add("InstanceID", instance);
    out.Add("Channel", channel);
    return SoapAction("GetMute", out, response, fault);
}

unsigned int RenderingControlClient::GetMute(uint32_t instance,
					     const std::string& channel,
					     bool *mute, soap::Fault *fault)
{
    std::string response;
    unsigned int rc = GetMute(instance, channel, &response, fault);
    if (rc)
	return rc;
    *mute = soap::ParseBool(xml::GetTagContent(response, "CurrentMute"));
    return 0;
}

} // namespace upnp

#ifdef TEST

# include "mock_renderer.h"
# include "libutil/string_stream.h"
# include <assert.h>
# include <stdio.h>

/** Reports whatever volume text follows "/volume/" in the path; some
 * renderers report decimals, some report nonsense.
 */
class ReportedVolume: public util::http::ContentFactory
{
public:
    bool StreamForPath(const util::http::Request *rq,
		       util::http::Response *rs) override
    {
	if (rq->path.compare(0, 8, "/volume/"))
	    return false;
	rs->body_source.reset(new util::StringStream(
	    "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
	    "<s:Body><u:GetVolumeResponse xmlns:u=\"x\">"
	    "<CurrentVolume>" + rq->path.substr(8) + "</CurrentVolume>"
	    "</u:GetVolumeResponse></s:Body></s:Envelope>"));
	return true;
    }
};

static const struct {
    const char *reported;
    unsigned int rc;
    unsigned int volume;
} volume_tests[] = {
    { "37.0",   0,      37 },
    { "37",     0,      37 },
    { "99.9",   0,      99 },
    { "150",    0,      100 },
    { "1e300",  0,      100 },
    { "-3",     0,      0 },
    { "nan",    EPARSE, 0 },
    { "inf",    EPARSE, 0 },
    { "-inf",   EPARSE, 0 },
    { "loud",   EPARSE, 0 },
    { "",       EPARSE, 0 },
};

int main()
{
    util::http::Server ws;
    upnp::MockRenderer renderer;
    ReportedVolume reported;
    ws.AddContentFactory("/", &renderer);
    ws.AddContentFactory("/", &reported);
    unsigned int rc = ws.Init();
    assert(rc == 0);

    std::string url = "http://127.0.0.1:"
	+ std::to_string((unsigned)ws.GetPort())
	+ "/RenderingControl/control";
    upnp::RenderingControlClient rcc(url);

    rc = rcc.SetVolume(0, "Master", 37);
    assert(rc == 0);

    std::string response;
    rc = rcc.GetVolume(0, "Master", &response);
    assert(rc == 0);
    assert(xml::GetTagContent(response, "CurrentVolume") == "37");

    unsigned int volume = 0;
    rc = rcc.GetVolume(0, "Master", &volume);
    assert(rc == 0);
    assert(volume == 37);

    rc = rcc.SetVolume(0, "Master", 150);
    assert(rc == 0);
    rc = rcc.GetVolume(0, "Master", &volume);
    assert(rc == 0);
    assert(volume == 100);

    rc = rcc.SetVolume(0, "Master", -5);
    assert(rc == 0);
    rc = rcc.GetVolume(0, "Master", &volume);
    assert(rc == 0);
    assert(volume == 0);

    bool mute = true;
    rc = rcc.GetMute(0, "Master", &mute);
    assert(rc == 0);
    assert(!mute);
    rc = rcc.SetMute(0, "Master", true);
    assert(rc == 0);
    rc = rcc.GetMute(0, "Master", &response);
    assert(rc == 0);
    assert(xml::GetTagContent(response, "CurrentMute") == "1");
    rc = rcc.GetMute(0, "Master", &mute);
    assert(rc == 0);
    assert(mute);

    for (unsigned int i=0; i<sizeof(volume_tests)/sizeof(volume_tests[0]);
	 ++i)
    {
	upnp::RenderingControlClient odd("http://127.0.0.1:"
	    + std::to_string((unsigned)ws.GetPort()) + "/volume/"
	    + volume_tests[i].reported);
	volume = 42;
	rc = odd.GetVolume(0, "Master", &volume);
	if (rc != volume_tests[i].rc)
	{
	    fprintf(stderr, "Volume '%s' gave %u expected %u\n",
		    volume_tests[i].reported, rc, volume_tests[i].rc);
	}
	assert(rc == volume_tests[i].rc);
	if (rc == 0)
	    assert(volume == volume_tests[i].volume);
	else
	    assert(volume == 42);
    }

    ws.Shutdown();

    upnp::soap::Fault f;
    rc = rcc.GetVolume(0, "Master", &volume, &f);
    assert(rc == ECONTROL);
    assert(f.transport_error != 0);

    return 0;
}

#endif
