#include "dlna.h"
#include "libutil/file.h"
#include <string.h>
#include <boost/algorithm/string/predicate.hpp>

namespace upnp {
namespace dlna {

const char s_flags[] =
    "DLNA.ORG_OP=11;DLNA.ORG_CI=0;DLNA.ORG_FLAGS=01500000000000000000000000000000";

static const struct {
    const char *extension;
    const char *mimetype;
} mimemap[] = {
    { "3gp",  "video/3gpp" },
    { "aac",  "audio/aac" },
    { "avi",  "video/x-msvideo" },
    { "flac", "audio/flac" },
    { "jpeg", "image/jpeg" },
    { "jpg",  "image/jpeg" },
    { "m2ts", "video/mp2t" },
    { "m4a",  "audio/mp4" },
    { "m4v",  "video/mp4" },
    { "mkv",  "video/x-matroska" },
    { "mov",  "video/quicktime" },
    { "mp3",  "audio/mpeg" },
    { "mp4",  "video/mp4" },
    { "mpeg", "video/mpeg" },
    { "mpg",  "video/mpeg" },
    { "oga",  "audio/ogg" },
    { "ogg",  "audio/ogg" },
    { "ogv",  "video/ogg" },
    { "png",  "image/png" },
    { "srt",  "text/plain" },
    { "ts",   "video/mp2t" },
    { "wav",  "audio/x-wav" },
    { "webm", "video/webm" },
    { "wma",  "audio/x-ms-wma" },
    { "wmv",  "video/x-ms-wmv" },
};

std::string GuessMimeType(const std::string& path, const char *fallback)
{
    std::string leaf = path;
    std::string::size_type query = leaf.find_first_of("?#");
    if (query != std::string::npos)
	leaf.erase(query);
    leaf = util::GetLeafName(leaf.c_str());

    std::string extension = util::GetExtension(leaf.c_str());
    if (extension.empty())
	return fallback;

    for (unsigned int i=0; i<sizeof(mimemap)/sizeof(*mimemap); ++i)
    {
	if (!strcasecmp(extension.c_str(), mimemap[i].extension))
	    return mimemap[i].mimetype;
    }
    return fallback;
}

std::string Profile(const std::string& mime_type, const FormatHint *hint)
{
    bool avc = !hint || hint->codec.empty() || hint->codec == "h264";

    if (mime_type == "video/mp4")
	return avc ? std::string("DLNA.ORG_PN=AVC_MP4_HD_24_AC3;") + s_flags
	           : std::string(s_flags);
    if (mime_type == "video/x-matroska")
	return avc ? std::string("DLNA.ORG_PN=AVC_MKV_HD_24_AC3;") + s_flags
	           : std::string(s_flags);
    if (boost::algorithm::starts_with(mime_type, "audio/"))
	return std::string("DLNA.ORG_PN=MP3;") + s_flags;
    return s_flags;
}

std::string ProtocolInfo(const std::string& mime_type,
			 const FormatHint *hint)
{
    return "http-get:*:" + mime_type + ":" + Profile(mime_type, hint);
}

std::string ContentFeatures()
{
    return s_flags;
}

} // namespace dlna
} // namespace upnp

#ifdef TEST

# include <assert.h>

int main()
{
    using namespace upnp::dlna;

    assert(GuessMimeType("/films/Film One.mp4") == "video/mp4");
    assert(GuessMimeType("http://1.2.3.4:5/a%20b.MKV") == "video/x-matroska");
    assert(GuessMimeType("http://1.2.3.4:5/song.mp3?x=y.avi") == "audio/mpeg");
    assert(GuessMimeType("http://1.2.3.4:5/film") == "video/mp4");
    assert(GuessMimeType("http://1.2.3.4:5/film.xyz") == "video/mp4");
    assert(GuessMimeType("notes.xyz", "application/octet-stream")
	   == "application/octet-stream");
    assert(GuessMimeType("a.dir/film") == "video/mp4");

    const std::string flags =
	"DLNA.ORG_OP=11;DLNA.ORG_CI=0;DLNA.ORG_FLAGS=01500000000000000000000000000000";

    assert(Profile("video/mp4") == "DLNA.ORG_PN=AVC_MP4_HD_24_AC3;" + flags);
    assert(Profile("video/x-matroska")
	   == "DLNA.ORG_PN=AVC_MKV_HD_24_AC3;" + flags);
    assert(Profile("video/webm") == flags);
    assert(Profile("audio/flac") == "DLNA.ORG_PN=MP3;" + flags);
    assert(Profile("image/png") == flags);
    assert(ContentFeatures() == flags);

    FormatHint h264;
    h264.container = "mp4";
    h264.codec = "h264";
    FormatHint hevc;
    hevc.container = "matroska";
    hevc.codec = "hevc";
    assert(Profile("video/mp4", &h264)
	   == "DLNA.ORG_PN=AVC_MP4_HD_24_AC3;" + flags);
    assert(Profile("video/x-matroska", &hevc) == flags);
    assert(Profile("video/mp4", &hevc) == flags);
    assert(Profile("audio/mpeg", &hevc) == "DLNA.ORG_PN=MP3;" + flags);

    assert(ProtocolInfo("video/mp4")
	   == "http-get:*:video/mp4:DLNA.ORG_PN=AVC_MP4_HD_24_AC3;" + flags);

    return 0;
}

#endif
