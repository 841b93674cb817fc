#include "didl.h"
#include "dlna.h"
#include "libutil/xmlescape.h"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>

namespace upnp {
namespace didl {

const char s_header[] =
    "<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\""
    " xmlns:dc=\"http://purl.org/dc/elements/1.1/\""
    " xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\">";
const char s_footer[] = "</DIDL-Lite>";

const char *UpnpClass(const std::string& mime_type)
{
    if (boost::algorithm::starts_with(mime_type, "video/"))
	return "object.item.videoItem";
    if (boost::algorithm::starts_with(mime_type, "audio/"))
	return "object.item.audioItem";
    return "object.item";
}

std::string Item(const std::string& url, const std::string& title,
		 const std::string& mime_type,
		 const dlna::FormatHint *hint)
{
    return (boost::format("<item id=\"0\" parentID=\"0\" restricted=\"1\">"
			  "<dc:title>%s</dc:title>"
			  "<upnp:class>%s</upnp:class>"
			  "<res protocolInfo=\"%s\">%s</res>"
			  "</item>")
	    % util::XmlEscape(title)
	    % UpnpClass(mime_type)
	    % util::XmlEscape(dlna::ProtocolInfo(mime_type, hint))
	    % util::XmlEscape(url)).str();
}

std::string Metadata(const std::string& url, const std::string& title,
		     const std::string& mime_type,
		     const dlna::FormatHint *hint)
{
    return s_header + Item(url, title, mime_type, hint) + s_footer;
}

} // namespace didl
} // namespace upnp

#ifdef TEST

# include "libutil/xml.h"
# include <assert.h>
# include <stdio.h>
# include <string.h>

int main()
{
    assert(!strcmp(upnp::didl::UpnpClass("video/mp4"),
		   "object.item.videoItem"));
    assert(!strcmp(upnp::didl::UpnpClass("audio/mpeg"),
		   "object.item.audioItem"));
    assert(!strcmp(upnp::didl::UpnpClass("image/png"), "object.item"));

    std::string didl = upnp::didl::Metadata(
	"http://192.168.1.2:8000/Tom%20&%20Jerry.mkv", "Tom & Jerry",
	"video/x-matroska");

    const char *expected =
	"<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\""
	" xmlns:dc=\"http://purl.org/dc/elements/1.1/\""
	" xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\">"
	"<item id=\"0\" parentID=\"0\" restricted=\"1\">"
	"<dc:title>Tom &amp; Jerry</dc:title>"
	"<upnp:class>object.item.videoItem</upnp:class>"
	"<res protocolInfo=\"http-get:*:video/x-matroska:"
	"DLNA.ORG_PN=AVC_MKV_HD_24_AC3;DLNA.ORG_OP=11;DLNA.ORG_CI=0;"
	"DLNA.ORG_FLAGS=01500000000000000000000000000000\">"
	"http://192.168.1.2:8000/Tom%20&amp;%20Jerry.mkv</res>"
	"</item>"
	"</DIDL-Lite>";

    if (didl != expected)
    {
	fprintf(stderr, "Got:\n%s\nExpected:\n%s\n", didl.c_str(), expected);
    }
    assert(didl == expected);
    assert(xml::CheckWellFormed(didl) == 0);
    assert(xml::GetTagContent(didl, "title") == "Tom & Jerry");

    upnp::dlna::FormatHint hint;
    hint.codec = "hevc";
    std::string item = upnp::didl::Item("http://h/a.mp4", "a", "video/mp4",
					&hint);
    assert(item.find("protocolInfo=\"http-get:*:video/mp4:DLNA.ORG_OP=11;")
	   != std::string::npos);

    return 0;
}

#endif
