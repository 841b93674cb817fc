#ifndef LIBUPNP_DLNA_H
#define LIBUPNP_DLNA_H 1

#include <string>

namespace upnp {

/** DLNA conventions layered on top of UPnP AV: MIME types, profile
 * names and the fourth field of protocolInfo.
 */
namespace dlna {

/** What a media inspector found out about a file, where anyone asked.
 *
 * Only the codec matters here: AVC profiles are only claimed for h264.
 */
struct FormatHint
{
    std::string container; ///< e.g. "mp4", "matroska"
    std::string codec;     ///< Video codec, e.g. "h264", "hevc"
};

/** Guess a MIME type from the extension of a file name or URL (any
 * query or fragment is ignored). Returns fallback if unrecognised.
 */
std::string GuessMimeType(const std::string& path,
			  const char *fallback = "video/mp4");

/** The fourth protocolInfo field for the given MIME type.
 *
 * If hint names a codec other than h264, the AVC profile names are
 * dropped, leaving just the flags.
 */
std::string Profile(const std::string& mime_type,
		    const FormatHint *hint = NULL);

/** "http-get:*:<mime>:<profile>" */
std::string ProtocolInfo(const std::string& mime_type,
			 const FormatHint *hint = NULL);

/** Value of the contentFeatures.dlna.org header we serve: the flags,
 * with no profile name.
 */
std::string ContentFeatures();

/** Streaming-transfer and range-seek supported, no conversion.
 */
extern const char s_flags[];

} // namespace dlna
} // namespace upnp

#endif
