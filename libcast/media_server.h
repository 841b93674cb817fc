#ifndef LIBCAST_MEDIA_SERVER_H
#define LIBCAST_MEDIA_SERVER_H 1

#include "libutil/http_server.h"

namespace cast {

/** Serves one directory to renderers, with the headers DLNA wants.
 *
 * Adds transferMode.dlna.org, contentFeatures.dlna.org and no-cache
 * headers to every file served, and types files by extension.
 */
class MediaContentFactory: public util::http::FileContentFactory
{
protected:
    // Being a FileContentFactory
    void OnFile(const std::string& filename, const struct stat& st,
		util::http::Response *rs) override;

public:
    MediaContentFactory(const std::string& file_root,
			const std::string& page_root);
};

} // namespace cast

#endif
