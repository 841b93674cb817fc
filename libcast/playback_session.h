#ifndef LIBCAST_PLAYBACK_SESSION_H
#define LIBCAST_PLAYBACK_SESSION_H 1

#include <memory>
#include <string>
#include <stdint.h>
#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include "libutil/http_server.h"

namespace upnp { class AVTransportClient; }
namespace upnp { class RenderingControlClient; }

/** Classes for sending local media to DLNA renderers.
 */
namespace cast {

class MediaInspector;
class MediaContentFactory;

enum State {
    IDLE,
    STARTING, ///< Waiting for the renderer to accept the URI and play
    PLAYING,
    PAUSED
};

const char *StateName(State);

/** Which subtitles the user picked, if any: an external file or an
 * embedded track, never both.
 */
class SubtitleRef
{
public:
    enum Kind { NONE, EXTERNAL_FILE, EMBEDDED_TRACK };

private:
    Kind m_kind;
    std::string m_path;
    unsigned int m_track;

    SubtitleRef(Kind kind, const std::string& path, unsigned int track)
	: m_kind(kind), m_path(path), m_track(track) {}

public:
    SubtitleRef() : m_kind(NONE), m_track(0) {}

    static SubtitleRef ExternalFile(const std::string& path)
    {
	return SubtitleRef(EXTERNAL_FILE, path, 0);
    }
    static SubtitleRef EmbeddedTrack(unsigned int track)
    {
	return SubtitleRef(EMBEDDED_TRACK, std::string(), track);
    }

    Kind GetKind() const { return m_kind; }
    const std::string& GetPath() const { return m_path; }
    unsigned int GetTrack() const { return m_track; }

    std::string ToString() const;
};

struct SessionOptions
{
    unsigned int soap_timeout_ms;
    uint32_t instance_id;
    std::string channel;       ///< RenderingControl channel
    util::http::SocketOptions socket;

    SessionOptions()
	: soap_timeout_ms(5000),
	  instance_id(0),
	  channel("Master")
    {}
};

struct PositionInfo
{
    std::string rel_time; ///< "HH:MM:SS"
    std::string duration; ///< "HH:MM:SS", or empty if the renderer won't say
};

/** One local file playing on one renderer.
 *
 * Owns the HTTP server the renderer streams from, and the SOAP clients
 * that drive it. Starting is asynchronous; poll GetState() or
 * IsActive() to see how it went.
 *
 * All methods may be called from any thread.
 */
class PlaybackSession: private boost::noncopyable
{
    SessionOptions m_options;
    MediaInspector *m_inspector;

    mutable boost::mutex m_mutex;

    /** Bumped by every Start and Stop, so that a start sequence can
     * tell that it's been superseded.
     */
    unsigned int m_generation;
    State m_state;

    /** Everything a session owns. Server is declared after content, so
     * that it's destroyed first.
     */
    struct Resources
    {
	std::unique_ptr<MediaContentFactory> content;
	std::unique_ptr<util::http::Server> server;
	std::shared_ptr<upnp::AVTransportClient> avt;
	std::shared_ptr<upnp::RenderingControlClient> rcc;
	boost::thread start_thread;

	Resources();
	~Resources();
	void Swap(Resources *other);
    };
    Resources m_resources;

    std::string m_file;
    std::string m_url;
    SubtitleRef m_subtitle;

    void StartSequence(unsigned int generation);
    void Release(Resources *resources, bool remote_stop);

public:
    explicit PlaybackSession(const SessionOptions& options = SessionOptions());
    ~PlaybackSession();

    /** Used, if set, to refine the DLNA profile sent to the renderer.
     */
    void SetMediaInspector(MediaInspector*);

    /** Stops any current session, serves media_path's directory on port
     * (0 for any), and asks the renderer to play it.
     *
     * Returns an error only if the local part fails (e.g. the port's in
     * use); renderer failures show up later as a return to IDLE.
     */
    unsigned int Start(const std::string& av_transport_control_url,
		       const std::string& media_path,
		       const std::string& rendering_control_url = std::string(),
		       const SubtitleRef& subtitle = SubtitleRef(),
		       unsigned short port = 0);

    /** Always succeeds; telling the renderer is best-effort. */
    void Stop();

    /** Only when PLAYING; otherwise does nothing and returns 0. */
    unsigned int Pause();

    /** Only when PAUSED; otherwise does nothing and returns 0. */
    unsigned int Resume();

    /** Only when active; otherwise does nothing and returns 0. */
    unsigned int Seek(const std::string& hhmmss);
    unsigned int Seek(unsigned int seconds);

    /** 0 if it can't be found out. */
    unsigned int GetVolume() const;

    /** Returns ENOENT if the renderer has no RenderingControl. */
    unsigned int SetVolume(int volume);

    /** False if it can't be found out. */
    bool GetMute() const;

    /** Returns ENOENT if the renderer has no RenderingControl. */
    unsigned int SetMute(bool mute);

    /** Returns ENOTCONN if not active, ECONTROL if the renderer won't
     * say.
     */
    unsigned int GetPosition(PositionInfo *info) const;

    State GetState() const;

    /** PLAYING or PAUSED */
    bool IsActive() const;
    bool IsPaused() const;

    /** Empty if IDLE */
    std::string GetCurrentFile() const;
    std::string GetMediaURL() const;
    SubtitleRef GetSubtitle() const;
};

} // namespace cast

#endif
