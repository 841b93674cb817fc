#include "playback_session.h"
#include "media_info.h"
#include "media_server.h"
#include "time_code.h"
#include "libutil/errors.h"
#include "libutil/file.h"
#include "libutil/ip_config.h"
#include "libutil/trace.h"
#include "libutil/urlescape.h"
#include "libutil/xml.h"
#include "libupnp/avtransport_client.h"
#include "libupnp/dlna.h"
#include "libupnp/rendering_control_client.h"
#include "libupnp/soap.h"
#include <boost/format.hpp>
#include <sys/stat.h>

LOG_DECL(SESSION);

namespace cast {

const char *StateName(State s)
{
    switch (s)
    {
    case IDLE:     return "idle";
    case STARTING: return "starting";
    case PLAYING:  return "playing";
    case PAUSED:   return "paused";
    }
    return "?";
}

std::string SubtitleRef::ToString() const
{
    switch (m_kind)
    {
    case EXTERNAL_FILE:
	return "file " + m_path;
    case EMBEDDED_TRACK:
	return (boost::format("track %u") % m_track).str();
    default:
	break;
    }
    return "none";
}


        /* PlaybackSession::Resources */


PlaybackSession::Resources::Resources()
{
}

PlaybackSession::Resources::~Resources()
{
    if (start_thread.joinable())
	start_thread.join();
}

void PlaybackSession::Resources::Swap(Resources *other)
{
    content.swap(other->content);
    server.swap(other->server);
    avt.swap(other->avt);
    rcc.swap(other->rcc);
    start_thread.swap(other->start_thread);
}


        /* PlaybackSession */


PlaybackSession::PlaybackSession(const SessionOptions& options)
    : m_options(options),
      m_inspector(NULL),
      m_generation(0),
      m_state(IDLE)
{
}

PlaybackSession::~PlaybackSession()
{
    Stop();
}

void PlaybackSession::SetMediaInspector(MediaInspector *inspector)
{
    boost::mutex::scoped_lock lock(m_mutex);
    m_inspector = inspector;
}

void PlaybackSession::Release(Resources *res, bool remote_stop)
{
    if (res->start_thread.joinable())
	res->start_thread.join();

    if (remote_stop && res->avt)
    {
	unsigned int rc = res->avt->Stop(m_options.instance_id);
	if (rc)
	    LOG(SESSION) << "Remote stop failed (ignored): "
			 << util::StrError(rc) << "\n";
    }

    if (res->server)
	res->server->Shutdown();
    res->server.reset();
    res->content.reset();
    res->avt.reset();
    res->rcc.reset();
}

unsigned int PlaybackSession::Start(const std::string& control_url,
				    const std::string& media_path,
				    const std::string& rendering_control_url,
				    const SubtitleRef& subtitle,
				    unsigned short port)
{
    Stop();

    struct stat st;
    if (::stat(media_path.c_str(), &st) < 0 || !S_ISREG(st.st_mode))
    {
	TRACE << "Can't play " << media_path << ": not a file\n";
	return ENOENT;
    }

    Resources res;
    res.content.reset(new MediaContentFactory(util::GetDirName(media_path),
					      "/"));
    res.server.reset(new util::http::Server);
    res.server->AddContentFactory("/", res.content.get());
    unsigned int rc = res.server->Init(port, m_options.socket);
    if (rc)
    {
	TRACE << "Can't start media server on port " << port << ": "
	      << util::StrError(rc) << "\n";
	return rc;
    }

    std::string url = (boost::format("http://%s:%u/%s")
		       % util::GetOutboundAddress().ToString()
		       % res.server->GetPort()
		       % util::URLEscape(util::GetLeafName(media_path))).str();

    res.avt.reset(new upnp::AVTransportClient(control_url,
					      m_options.soap_timeout_ms));
    if (!rendering_control_url.empty())
	res.rcc.reset(new upnp::RenderingControlClient(
			  rendering_control_url, m_options.soap_timeout_ms));

    LOG(SESSION) << "Starting " << url << " on " << control_url
		 << " (subtitles: " << subtitle.ToString() << ")\n";

    // Anything still here belongs to a Start() that raced with this one
    Resources superseded;
    {
	boost::mutex::scoped_lock lock(m_mutex);

	unsigned int generation = ++m_generation;
	m_resources.Swap(&superseded);
	m_resources.Swap(&res);
	m_state = STARTING;
	m_file = media_path;
	m_url = url;
	m_subtitle = subtitle;

	try
	{
	    m_resources.start_thread = boost::thread(
		&PlaybackSession::StartSequence, this, generation);
	}
	catch (boost::thread_resource_error&)
	{
	    TRACE << "Can't start thread\n";
	    ++m_generation;
	    m_resources.Swap(&res);
	    m_state = IDLE;
	    m_file.clear();
	    m_url.clear();
	    m_subtitle = SubtitleRef();
	    rc = EAGAIN;
	}
    }

    Release(&superseded, true);
    Release(&res, false);
    return rc;
}

void PlaybackSession::StartSequence(unsigned int generation)
{
    std::shared_ptr<upnp::AVTransportClient> avt;
    std::string file, url;
    MediaInspector *inspector;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	if (generation != m_generation)
	    return;
	avt = m_resources.avt;
	file = m_file;
	url = m_url;
	inspector = m_inspector;
    }

    upnp::dlna::FormatHint hint;
    bool have_hint = false;
    if (inspector)
    {
	FormatSummary summary;
	unsigned int rc = inspector->InspectFormat(file, &summary);
	if (rc == 0)
	{
	    hint.container = summary.container;
	    hint.codec = summary.codec;
	    have_hint = true;
	}
	else
	    LOG(SESSION) << "Can't inspect " << file << ": "
			 << util::StrError(rc) << "\n";
    }

    std::string title = util::StripExtension(util::GetLeafName(file));
    upnp::soap::Fault fault;
    unsigned int rc = avt->SetURIWithMetadata(m_options.instance_id, url,
					      title,
					      have_hint ? &hint : NULL,
					      &fault);
    if (rc == 0)
    {
	{
	    boost::mutex::scoped_lock lock(m_mutex);
	    if (generation != m_generation)
	    {
		LOG(SESSION) << "Start superseded before Play\n";
		return;
	    }
	}
	rc = avt->Play(m_options.instance_id, "1", &fault);
    }

    Resources failed;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	if (generation != m_generation)
	{
	    LOG(SESSION) << "Start superseded, result discarded\n";
	    return;
	}

	if (rc == 0)
	{
	    m_state = PLAYING;
	    LOG(SESSION) << "Playing " << url << "\n";
	    return;
	}

	TRACE << "Renderer won't play " << url << ": " << util::StrError(rc)
	      << " (HTTP " << fault.http_status << ", UPnP error "
	      << fault.upnp_error_code << " "
	      << fault.upnp_error_description << ")\n";

	// Not the thread itself, which can't join itself; the next Stop()
	// reaps it
	failed.content.swap(m_resources.content);
	failed.server.swap(m_resources.server);
	failed.avt.swap(m_resources.avt);
	failed.rcc.swap(m_resources.rcc);
	m_state = IDLE;
	m_file.clear();
	m_url.clear();
	m_subtitle = SubtitleRef();
    }

    Release(&failed, false);
}

void PlaybackSession::Stop()
{
    Resources res;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	++m_generation;
	m_resources.Swap(&res);
	if (m_state != IDLE)
	    LOG(SESSION) << "Stopping " << m_url << " ("
			 << StateName(m_state) << ")\n";
	m_state = IDLE;
	m_file.clear();
	m_url.clear();
	m_subtitle = SubtitleRef();
    }

    Release(&res, true);
}

unsigned int PlaybackSession::Pause()
{
    std::shared_ptr<upnp::AVTransportClient> avt;
    unsigned int generation;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	if (m_state != PLAYING)
	    return 0;
	avt = m_resources.avt;
	generation = m_generation;
    }

    unsigned int rc = avt->Pause(m_options.instance_id);
    if (rc)
	return rc;

    boost::mutex::scoped_lock lock(m_mutex);
    if (generation == m_generation && m_state == PLAYING)
	m_state = PAUSED;
    return 0;
}

unsigned int PlaybackSession::Resume()
{
    std::shared_ptr<upnp::AVTransportClient> avt;
    unsigned int generation;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	if (m_state != PAUSED)
	    return 0;
	avt = m_resources.avt;
	generation = m_generation;
    }

    unsigned int rc = avt->Play(m_options.instance_id);
    if (rc)
	return rc;

    boost::mutex::scoped_lock lock(m_mutex);
    if (generation == m_generation && m_state == PAUSED)
	m_state = PLAYING;
    return 0;
}

unsigned int PlaybackSession::Seek(const std::string& target)
{
    std::shared_ptr<upnp::AVTransportClient> avt;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	if (m_state != PLAYING && m_state != PAUSED)
	    return 0;
	avt = m_resources.avt;
    }

    LOG(SESSION) << "Seek to " << target << "\n";
    return avt->Seek(m_options.instance_id, target);
}

unsigned int PlaybackSession::Seek(unsigned int seconds)
{
    return Seek(FormatTimeCode(seconds));
}

unsigned int PlaybackSession::GetVolume() const
{
    std::shared_ptr<upnp::RenderingControlClient> rcc;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	if (m_state != PLAYING && m_state != PAUSED)
	    return 0;
	rcc = m_resources.rcc;
    }
    if (!rcc)
	return 0;

    unsigned int volume = 0;
    unsigned int rc = rcc->GetVolume(m_options.instance_id, m_options.channel,
				     &volume);
    if (rc)
    {
	LOG(SESSION) << "GetVolume failed: " << util::StrError(rc) << "\n";
	return 0;
    }
    return volume;
}

unsigned int PlaybackSession::SetVolume(int volume)
{
    std::shared_ptr<upnp::RenderingControlClient> rcc;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	rcc = m_resources.rcc;
    }
    if (!rcc)
	return ENOENT;

    return rcc->SetVolume(m_options.instance_id, m_options.channel, volume);
}

bool PlaybackSession::GetMute() const
{
    std::shared_ptr<upnp::RenderingControlClient> rcc;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	if (m_state != PLAYING && m_state != PAUSED)
	    return false;
	rcc = m_resources.rcc;
    }
    if (!rcc)
	return false;

    bool mute = false;
    unsigned int rc = rcc->GetMute(m_options.instance_id, m_options.channel,
				   &mute);
    if (rc)
    {
	LOG(SESSION) << "GetMute failed: " << util::StrError(rc) << "\n";
	return false;
    }
    return mute;
}

unsigned int PlaybackSession::SetMute(bool mute)
{
    std::shared_ptr<upnp::RenderingControlClient> rcc;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	rcc = m_resources.rcc;
    }
    if (!rcc)
	return ENOENT;

    return rcc->SetMute(m_options.instance_id, m_options.channel, mute);
}

static bool IsKnownTime(const std::string& s)
{
    return !s.empty() && s != "NOT_IMPLEMENTED";
}

unsigned int PlaybackSession::GetPosition(PositionInfo *info) const
{
    std::shared_ptr<upnp::AVTransportClient> avt;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	if (m_state != PLAYING && m_state != PAUSED)
	    return ENOTCONN;
	avt = m_resources.avt;
    }

    std::string response;
    unsigned int rc = avt->GetPositionInfo(m_options.instance_id, &response);
    if (rc)
	return rc;

    info->rel_time = xml::GetTagContent(response, "RelTime");
    if (!IsKnownTime(info->rel_time))
	info->rel_time = "00:00:00";

    info->duration = xml::GetTagContent(response, "TrackDuration");
    if (!IsKnownTime(info->duration))
	info->duration = xml::GetTagContent(response, "Duration");
    if (!IsKnownTime(info->duration))
    {
	info->duration.clear();
	rc = avt->GetMediaInfo(m_options.instance_id, &response);
	if (rc == 0)
	{
	    std::string media_duration = xml::GetTagContent(response,
							    "MediaDuration");
	    if (IsKnownTime(media_duration))
		info->duration = media_duration;
	}
	else
	    LOG(SESSION) << "GetMediaInfo failed (ignored): "
			 << util::StrError(rc) << "\n";
    }
    return 0;
}

State PlaybackSession::GetState() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_state;
}

bool PlaybackSession::IsActive() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_state == PLAYING || m_state == PAUSED;
}

bool PlaybackSession::IsPaused() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_state == PAUSED;
}

std::string PlaybackSession::GetCurrentFile() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_file;
}

std::string PlaybackSession::GetMediaURL() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_url;
}

SubtitleRef PlaybackSession::GetSubtitle() const
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_subtitle;
}

} // namespace cast

#ifdef TEST

# include "libupnp/mock_renderer.h"
# include <assert.h>
# include <stdio.h>
# include <stdlib.h>
# include <string.h>
# include <unistd.h>

class FakeInspector: public cast::MediaInspector
{
public:
    unsigned int inspections;

    FakeInspector() : inspections(0) {}

    unsigned int InspectFormat(const std::string&,
			     cast::FormatSummary *summary) override
    {
	++inspections;
	summary->container = "matroska";
	summary->codec = "hevc";
	return 0;
    }

    unsigned int InspectSubtitles(const std::string&,
				cast::SubtitleInfo*) override
    {
	return ENOSYS;
    }
};

/** Waits up to five seconds for the session to leave STARTING.
 */
static cast::State WaitForStart(const cast::PlaybackSession& ps)
{
    for (unsigned int i=0; i<100; ++i)
    {
	cast::State s = ps.GetState();
	if (s != cast::STARTING)
	    return s;
	usleep(50*1000);
    }
    return ps.GetState();
}

static bool EndsWith(const std::string& s, const std::string& tail)
{
    return s.size() >= tail.size()
	&& s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

int main()
{
    char dirname[] = "/tmp/playback_session.XXXXXX";
    char *dir = mkdtemp(dirname);
    assert(dir);

    std::string filename = std::string(dir) + "/Test Film.mkv";
    FILE *f = fopen(filename.c_str(), "wb");
    assert(f);
    fputs("not really a film", f);
    fclose(f);

    util::http::Server ws;
    upnp::MockRenderer renderer;
    ws.AddContentFactory("/", &renderer);
    unsigned int rc = ws.Init();
    assert(rc == 0);

    std::string base = "http://127.0.0.1:"
	+ std::to_string((unsigned)ws.GetPort());
    std::string avt_url = base + "/AVTransport/control";
    std::string rcc_url = base + "/RenderingControl/control";

    assert(!strcmp(cast::StateName(cast::PAUSED), "paused"));
    assert(cast::SubtitleRef().ToString() == "none");
    assert(cast::SubtitleRef::EmbeddedTrack(3).ToString() == "track 3");
    assert(cast::SubtitleRef::ExternalFile("/a/b.srt").ToString()
	   == "file /a/b.srt");

    cast::PlaybackSession ps;
    assert(ps.GetState() == cast::IDLE);
    assert(!ps.IsActive());

    // Nothing to play
    rc = ps.Start(avt_url, std::string(dir) + "/missing.mkv", rcc_url);
    assert(rc == ENOENT);
    rc = ps.Start(avt_url, dir, rcc_url);
    assert(rc == ENOENT);
    assert(ps.GetState() == cast::IDLE);

    // Port in use
    rc = ps.Start(avt_url, filename, rcc_url, cast::SubtitleRef(),
		  ws.GetPort());
    assert(rc != 0);
    assert(ps.GetState() == cast::IDLE);

    // Inactive: nothing happens
    assert(ps.Pause() == 0);
    assert(ps.Resume() == 0);
    assert(ps.Seek(10u) == 0);
    assert(renderer.GetCallCount("Seek") == 0);
    cast::PositionInfo pi;
    assert(ps.GetPosition(&pi) == ENOTCONN);
    assert(ps.GetVolume() == 0);
    assert(!ps.GetMute());
    ps.Stop();
    assert(ps.GetState() == cast::IDLE);

    // The real thing
    FakeInspector inspector;
    ps.SetMediaInspector(&inspector);
    rc = ps.Start(avt_url, filename, rcc_url,
		  cast::SubtitleRef::EmbeddedTrack(2));
    assert(rc == 0);
    assert(WaitForStart(ps) == cast::PLAYING);
    assert(ps.IsActive());
    assert(!ps.IsPaused());
    assert(inspector.inspections == 1);
    assert(ps.GetCurrentFile() == filename);
    assert(ps.GetSubtitle().GetKind() == cast::SubtitleRef::EMBEDDED_TRACK);
    assert(ps.GetSubtitle().GetTrack() == 2);
    assert(EndsWith(ps.GetMediaURL(), "/Test%20Film.mkv"));
    assert(renderer.GetURI() == ps.GetMediaURL());
    assert(renderer.GetMetadata().find("<dc:title>Test Film</dc:title>")
	   != std::string::npos);
    // Inspected as HEVC, so no AVC profile
    assert(renderer.GetMetadata().find("AVC_") == std::string::npos);
    assert(renderer.GetTransportState() == "PLAYING");

    assert(ps.Resume() == 0);
    assert(renderer.GetCallCount("Play") == 1);

    rc = ps.Pause();
    assert(rc == 0);
    assert(ps.GetState() == cast::PAUSED);
    assert(ps.IsPaused());
    assert(ps.IsActive());
    assert(renderer.GetTransportState() == "PAUSED_PLAYBACK");
    assert(ps.Pause() == 0);
    assert(renderer.GetCallCount("Pause") == 1);

    rc = ps.Resume();
    assert(rc == 0);
    assert(ps.GetState() == cast::PLAYING);
    assert(renderer.GetCallCount("Play") == 2);

    rc = ps.Seek(3723u);
    assert(rc == 0);
    assert(renderer.GetLastSeekTarget() == "01:02:03");
    rc = ps.Seek("00:00:30");
    assert(rc == 0);
    assert(renderer.GetLastSeekTarget() == "00:00:30");

    rc = ps.SetVolume(37);
    assert(rc == 0);
    assert(ps.GetVolume() == 37);
    rc = ps.SetMute(true);
    assert(rc == 0);
    assert(ps.GetMute());
    rc = ps.SetMute(false);
    assert(rc == 0);
    assert(!ps.GetMute());

    renderer.SetDurations("00:20:00", "00:30:00");
    rc = ps.GetPosition(&pi);
    assert(rc == 0);
    assert(pi.rel_time == "00:00:05");
    assert(pi.duration == "00:20:00");

    renderer.SetDurations("", "00:30:00");
    rc = ps.GetPosition(&pi);
    assert(rc == 0);
    assert(pi.duration == "00:30:00");

    renderer.SetDurations("", "");
    rc = ps.GetPosition(&pi);
    assert(rc == 0);
    assert(pi.rel_time == "00:00:05");
    assert(pi.duration.empty());

    ps.Stop();
    assert(ps.GetState() == cast::IDLE);
    assert(ps.GetCurrentFile().empty());
    assert(ps.GetMediaURL().empty());
    assert(ps.GetSubtitle().GetKind() == cast::SubtitleRef::NONE);
    assert(renderer.GetCallCount("Stop") == 1);
    assert(renderer.GetTransportState() == "STOPPED");
    ps.Stop();
    assert(ps.GetState() == cast::IDLE);
    ps.SetMediaInspector(NULL);

    // Renderer refuses: back to IDLE, torn down
    renderer.SetRejectURI(true);
    rc = ps.Start(avt_url, filename, rcc_url);
    assert(rc == 0);
    assert(WaitForStart(ps) == cast::IDLE);
    assert(ps.GetMediaURL().empty());
    assert(ps.SetVolume(10) == ENOENT);
    renderer.SetRejectURI(false);

    // Stopped while starting: stays stopped
    renderer.SetDelayMS(500);
    unsigned int plays = renderer.GetCallCount("Play");
    rc = ps.Start(avt_url, filename, rcc_url);
    assert(rc == 0);
    assert(ps.GetState() == cast::STARTING);
    assert(!ps.IsActive());
    ps.Stop();
    assert(ps.GetState() == cast::IDLE);
    usleep(1500*1000);
    assert(ps.GetState() == cast::IDLE);
    assert(renderer.GetCallCount("Play") == plays);
    renderer.SetDelayMS(0);

    // No RenderingControl
    rc = ps.Start(avt_url, filename);
    assert(rc == 0);
    assert(WaitForStart(ps) == cast::PLAYING);
    assert(ps.SetVolume(50) == ENOENT);
    assert(ps.SetMute(true) == ENOENT);
    assert(ps.GetVolume() == 0);
    assert(!ps.GetMute());

    // Start while playing stops the old one first
    unsigned int stops = renderer.GetCallCount("Stop");
    rc = ps.Start(avt_url, filename, rcc_url);
    assert(rc == 0);
    assert(renderer.GetCallCount("Stop") == stops + 1);
    assert(WaitForStart(ps) == cast::PLAYING);

    ps.Stop();

    ws.Shutdown();

    unlink(filename.c_str());
    rmdir(dir);

    return 0;
}

#endif
