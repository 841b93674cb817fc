#ifndef LIBUPNP_MOCK_RENDERER_H
#define LIBUPNP_MOCK_RENDERER_H 1

#include <map>
#include <string>
#include <boost/thread/mutex.hpp>
#include "libutil/http_server.h"

namespace upnp {

/** A pretend MediaRenderer, for testing controllers against.
 *
 * Mount it on a util::http::Server; it answers AVTransport and
 * RenderingControl actions at /AVTransport/control and
 * /RenderingControl/control, keeping just enough state to echo values
 * back, and serves a device description at /description.xml.
 */
class MockRenderer: public util::http::ContentFactory
{
    mutable boost::mutex m_mutex;
    std::map<std::string, unsigned int> m_calls;
    std::string m_uri;
    std::string m_metadata;
    std::string m_volume;
    std::string m_mute;
    std::string m_state;
    std::string m_last_seek;
    std::string m_track_duration;
    std::string m_media_duration;
    bool m_reject_metadata;
    bool m_reject_uri;
    unsigned int m_delay_ms;
    std::string m_friendly_name;

    std::string OnAction(const std::string& action, const std::string& body,
			 bool *fault);
    std::string Description(const util::http::Request*);

public:
    MockRenderer();

    /** SetAVTransportURI faults if given any metadata */
    void SetRejectMetadata(bool b);

    /** SetAVTransportURI always faults */
    void SetRejectURI(bool b);

    /** Every action takes this long to answer */
    void SetDelayMS(unsigned int ms);

    /** As returned by GetPositionInfo and GetMediaInfo; empty means
     * "NOT_IMPLEMENTED".
     */
    void SetDurations(const std::string& track, const std::string& media);

    void SetFriendlyName(const std::string& name);

    unsigned int GetCallCount(const std::string& action) const;
    std::string GetURI() const;
    std::string GetMetadata() const;
    std::string GetTransportState() const;
    std::string GetLastSeekTarget() const;

    // Being a ContentFactory
    bool StreamForPath(const util::http::Request*,
		       util::http::Response*) override;
};

} // namespace upnp

#endif
