#ifndef LIBUPNP_DIDL_H
#define LIBUPNP_DIDL_H 1

#include <string>

namespace upnp {

namespace dlna { struct FormatHint; }

/** Classes implementing DIDL, a metadata standard used in UPnP.
 */
namespace didl {

/** "object.item.videoItem", "object.item.audioItem" or plain
 * "object.item", by the top-level MIME type.
 */
const char *UpnpClass(const std::string& mime_type);

/** Construct a DIDL fragment describing one playable resource.
 *
 * The result is a single DIDL <%item>; to make it valid DIDL, you need
 * to prepend s_header and append s_footer (or use Metadata()).
 */
std::string Item(const std::string& url, const std::string& title,
		 const std::string& mime_type,
		 const dlna::FormatHint *hint = NULL);

/** A complete DIDL-Lite document, suitable for CurrentURIMetaData.
 */
std::string Metadata(const std::string& url, const std::string& title,
		     const std::string& mime_type,
		     const dlna::FormatHint *hint = NULL);

extern const char s_header[];
extern const char s_footer[];

} // namespace didl
} // namespace upnp

#endif
