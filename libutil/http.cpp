#include "http.h"
#include <string.h>
#include <stdlib.h>
#include <stdio.h>
#include <errno.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>

namespace util {

namespace http {


        /* URLs */


std::string URL::HostHeader() const
{
    if ((scheme == "http" && port == 80)
	|| (scheme == "https" && port == 443))
	return host;

    char buffer[16];
    snprintf(buffer, sizeof(buffer), ":%u", (unsigned)port);
    return host + buffer;
}

std::string URL::ToString() const
{
    return scheme + "://" + HostHeader() + path;
}

unsigned int ParseURL(const std::string& url, URL *result)
{
    std::string::size_type colon = url.find("://");
    if (colon == std::string::npos)
	return EINVAL;

    std::string scheme = boost::algorithm::to_lower_copy(url.substr(0, colon));
    unsigned short default_port;
    if (scheme == "http")
	default_port = 80;
    else if (scheme == "https")
	default_port = 443;
    else
	return EINVAL;

    std::string::size_type hoststart = colon + 3;
    std::string::size_type slash = url.find_first_of("/?#", hoststart);
    std::string hostpart = url.substr(hoststart,
				      slash == std::string::npos
				      ? std::string::npos : slash - hoststart);

    // Drop any userinfo
    std::string::size_type at = hostpart.rfind('@');
    if (at != std::string::npos)
	hostpart.erase(0, at+1);

    std::string host = hostpart;
    unsigned short port = default_port;
    std::string::size_type portcolon = hostpart.rfind(':');
    if (portcolon != std::string::npos)
    {
	host = hostpart.substr(0, portcolon);
	std::string portstr = hostpart.substr(portcolon+1);
	if (!portstr.empty())
	{
	    if (portstr.find_first_not_of("0123456789") != std::string::npos)
		return EINVAL;
	    unsigned long ul = strtoul(portstr.c_str(), NULL, 10);
	    if (ul == 0 || ul > 65535)
		return EINVAL;
	    port = (unsigned short)ul;
	}
    }

    if (host.empty())
	return EINVAL;

    std::string path;
    if (slash != std::string::npos)
	path = url.substr(slash);
    std::string::size_type hash = path.find('#');
    if (hash != std::string::npos)
	path.erase(hash);
    if (path.empty() || path[0] != '/')
	path = "/" + path;

    result->scheme = scheme;
    result->host = host;
    result->port = port;
    result->path = path;
    return 0;
}

namespace {

/** The five components of RFC 3986 appendix B. */
struct URIParts
{
    bool has_scheme;
    std::string scheme;
    bool has_authority;
    std::string authority;
    std::string path;
    bool has_query;
    std::string query;
    bool has_fragment;
    std::string fragment;
};

void SplitURI(const std::string& s, URIParts *parts)
{
    parts->has_scheme = parts->has_authority = false;
    parts->has_query = parts->has_fragment = false;

    std::string::size_type pos = 0;

    std::string::size_type colon = s.find_first_of(":/?#");
    if (colon != std::string::npos && colon > 0 && s[colon] == ':')
    {
	parts->has_scheme = true;
	parts->scheme = s.substr(0, colon);
	pos = colon + 1;
    }

    if (s.compare(pos, 2, "//") == 0)
    {
	pos += 2;
	std::string::size_type end = s.find_first_of("/?#", pos);
	if (end == std::string::npos)
	    end = s.length();
	parts->has_authority = true;
	parts->authority = s.substr(pos, end - pos);
	pos = end;
    }

    std::string::size_type end = s.find_first_of("?#", pos);
    if (end == std::string::npos)
	end = s.length();
    parts->path = s.substr(pos, end - pos);
    pos = end;

    if (pos < s.length() && s[pos] == '?')
    {
	end = s.find('#', pos);
	if (end == std::string::npos)
	    end = s.length();
	parts->has_query = true;
	parts->query = s.substr(pos+1, end - pos - 1);
	pos = end;
    }

    if (pos < s.length() && s[pos] == '#')
    {
	parts->has_fragment = true;
	parts->fragment = s.substr(pos+1);
    }
}

/** RFC 3986 section 5.2.4 */
std::string RemoveDotSegments(const std::string& path)
{
    std::string input = path;
    std::string output;

    while (!input.empty())
    {
	if (input.compare(0, 3, "../") == 0)
	    input.erase(0, 3);
	else if (input.compare(0, 2, "./") == 0)
	    input.erase(0, 2);
	else if (input.compare(0, 3, "/./") == 0)
	    input.erase(0, 2);
	else if (input == "/.")
	    input = "/";
	else if (input.compare(0, 4, "/../") == 0 || input == "/..")
	{
	    if (input == "/..")
		input = "/";
	    else
		input.erase(0, 3);
	    std::string::size_type lastslash = output.rfind('/');
	    if (lastslash == std::string::npos)
		output.clear();
	    else
		output.erase(lastslash);
	}
	else if (input == "." || input == "..")
	    input.clear();
	else
	{
	    std::string::size_type next = input.find('/', 1);
	    if (next == std::string::npos)
		next = input.length();
	    output += input.substr(0, next);
	    input.erase(0, next);
	}
    }
    return output;
}

/** RFC 3986 section 5.2.3 */
std::string MergePaths(const URIParts& base, const std::string& refpath)
{
    if (base.has_authority && base.path.empty())
	return "/" + refpath;

    std::string::size_type lastslash = base.path.rfind('/');
    if (lastslash == std::string::npos)
	return refpath;
    return base.path.substr(0, lastslash+1) + refpath;
}

std::string Recompose(const URIParts& parts)
{
    std::string result;
    if (parts.has_scheme)
	result += parts.scheme + ":";
    if (parts.has_authority)
	result += "//" + parts.authority;
    result += parts.path;
    if (parts.has_query)
	result += "?" + parts.query;
    if (parts.has_fragment)
	result += "#" + parts.fragment;
    return result;
}

} // anon namespace

std::string ResolveURL(const std::string& base,
		       const std::string& link)
{
    URIParts b, r, t;
    SplitURI(base, &b);
    SplitURI(link, &r);

    if (r.has_scheme)
    {
	t = r;
	t.path = RemoveDotSegments(r.path);
    }
    else
    {
	if (r.has_authority)
	{
	    t.has_authority = true;
	    t.authority = r.authority;
	    t.path = RemoveDotSegments(r.path);
	    t.has_query = r.has_query;
	    t.query = r.query;
	}
	else
	{
	    if (r.path.empty())
	    {
		t.path = b.path;
		if (r.has_query)
		{
		    t.has_query = true;
		    t.query = r.query;
		}
		else
		{
		    t.has_query = b.has_query;
		    t.query = b.query;
		}
	    }
	    else
	    {
		if (r.path[0] == '/')
		    t.path = RemoveDotSegments(r.path);
		else
		    t.path = RemoveDotSegments(MergePaths(b, r.path));
		t.has_query = r.has_query;
		t.query = r.query;
	    }
	    t.has_authority = b.has_authority;
	    t.authority = b.authority;
	}
	t.has_scheme = b.has_scheme;
	t.scheme = b.scheme;
    }
    t.has_fragment = r.has_fragment;
    t.fragment = r.fragment;

    return Recompose(t);
}

bool IsHttpURL(const char *url)
{
    return !strncasecmp(url, "http://", 7) || !strncasecmp(url, "https://", 8);
}


        /* Ranges */


static bool ParseDecimal(const std::string& s, uint64_t *result)
{
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
	return false;
    if (s.length() > 19)
	return false;
    *result = strtoull(s.c_str(), NULL, 10);
    return true;
}

RangeResult ParseRange(const std::string& header, uint64_t size,
		       ByteRange *range)
{
    std::string h = boost::algorithm::trim_copy(header);
    if (h.empty())
	return RANGE_NONE;

    std::string::size_type equals = h.find('=');
    if (equals == std::string::npos
	|| boost::algorithm::trim_copy(h.substr(0, equals)) != "bytes")
	return RANGE_NONE;

    std::string byte_range = h.substr(equals+1);
    if (byte_range.find(',') != std::string::npos)
	return RANGE_NONE;

    std::string::size_type dash = byte_range.find('-');
    if (dash == std::string::npos)
	return RANGE_NONE;

    std::string startstr =
	boost::algorithm::trim_copy(byte_range.substr(0, dash));
    std::string endstr =
	boost::algorithm::trim_copy(byte_range.substr(dash+1));

    uint64_t start = 0;
    if (!startstr.empty() && !ParseDecimal(startstr, &start))
	return RANGE_NONE;

    uint64_t end = size ? size-1 : 0;
    if (!endstr.empty() && !ParseDecimal(endstr, &end))
	return RANGE_NONE;

    if (start >= size)
	return RANGE_UNSATISFIABLE;

    if (end < start)
	return RANGE_NONE;

    if (end >= size)
	end = size - 1;

    range->start = start;
    range->end = end;
    return RANGE_OK;
}


        /* Dates */


std::string FormatDate(time_t t)
{
    static const char *const days[] = {
	"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"
    };
    static const char *const months[] = {
	"Jan", "Feb", "Mar", "Apr", "May", "Jun",
	"Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };

    struct tm tm;
    gmtime_r(&t, &tm);

    char buffer[40];
    snprintf(buffer, sizeof(buffer), "%s, %02d %s %04d %02d:%02d:%02d GMT",
	     days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon],
	     tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buffer;
}

} // namespace http

} // namespace util

#ifdef TEST

# include <assert.h>
# include "trace.h"

static const struct {
    const char *base;
    const char *link;
    const char *expect;
} tests[] = {
    { "http://foo.bar/foo", "frink",        "http://foo.bar/frink" },
    { "http://foo.bar/foo/", "frink",       "http://foo.bar/foo/frink" },
    { "http://foo.bar/foo/", "/frink",      "http://foo.bar/frink" },
    { "http://foo.bar",      "wurdle",      "http://foo.bar/wurdle" },
    { "http://foo.bar",      "/wurdle",     "http://foo.bar/wurdle" },
    { "http://foo.bar:2888", "wurdle",      "http://foo.bar:2888/wurdle" },
    { "http://foo.bar:2888","/wurdle",      "http://foo.bar:2888/wurdle" },

    // Typical renderer descriptions
    { "http://192.168.1.20:49152/description.xml",
      "/upnp/control/AVTransport1",
      "http://192.168.1.20:49152/upnp/control/AVTransport1" },
    { "http://192.168.1.20:49152/dmr/desc.xml",
      "control/rc",
      "http://192.168.1.20:49152/dmr/control/rc" },
    { "http://192.168.1.20:49152/dmr/desc.xml",
      "../AVTransport/control",
      "http://192.168.1.20:49152/AVTransport/control" },
    { "http://192.168.1.20:49152/dmr/desc.xml",
      "http://192.168.1.21:8080/ctl",
      "http://192.168.1.21:8080/ctl" },

    // RFC 3986 section 5.4.1
    { "http://a/b/c/d;p?q", "g",       "http://a/b/c/g" },
    { "http://a/b/c/d;p?q", "./g",     "http://a/b/c/g" },
    { "http://a/b/c/d;p?q", "g/",      "http://a/b/c/g/" },
    { "http://a/b/c/d;p?q", "/g",      "http://a/g" },
    { "http://a/b/c/d;p?q", "//g",     "http://g" },
    { "http://a/b/c/d;p?q", "?y",      "http://a/b/c/d;p?y" },
    { "http://a/b/c/d;p?q", "g?y",     "http://a/b/c/g?y" },
    { "http://a/b/c/d;p?q", "#s",      "http://a/b/c/d;p?q#s" },
    { "http://a/b/c/d;p?q", "",        "http://a/b/c/d;p?q" },
    { "http://a/b/c/d;p?q", ".",       "http://a/b/c/" },
    { "http://a/b/c/d;p?q", "..",      "http://a/b/" },
    { "http://a/b/c/d;p?q", "../g",    "http://a/b/g" },
    { "http://a/b/c/d;p?q", "../../g", "http://a/g" },
    { "http://a/b/c/d;p?q", "../../../g", "http://a/g" },
    { "http://a/b/c/d;p?q", "/./g",    "http://a/g" },
    { "http://a/b/c/d;p?q", "g/../h",  "http://a/b/c/h" },
};

static const struct {
    const char *header;
    uint64_t size;
    util::http::RangeResult result;
    uint64_t start;
    uint64_t end;
} rangetests[] = {
    { "",                 1000, util::http::RANGE_NONE, 0, 0 },
    { "bytes=0-",         1000, util::http::RANGE_OK, 0, 999 },
    { "bytes=500-",       1000, util::http::RANGE_OK, 500, 999 },
    { "bytes=100-199",    1000, util::http::RANGE_OK, 100, 199 },
    { "bytes=900-5000",   1000, util::http::RANGE_OK, 900, 999 },
    { "bytes=-500",       1000, util::http::RANGE_OK, 0, 500 },
    { "bytes=-",          1000, util::http::RANGE_OK, 0, 999 },
    { " bytes=10-20 ",    1000, util::http::RANGE_OK, 10, 20 },
    { "bytes=999-",       1000, util::http::RANGE_OK, 999, 999 },
    { "bytes=1000-",      1000, util::http::RANGE_UNSATISFIABLE, 0, 0 },
    { "bytes=2000-3000",  1000, util::http::RANGE_UNSATISFIABLE, 0, 0 },
    { "bytes=0-",            0, util::http::RANGE_UNSATISFIABLE, 0, 0 },
    { "bytes=200-100",    1000, util::http::RANGE_NONE, 0, 0 },
    { "items=0-10",       1000, util::http::RANGE_NONE, 0, 0 },
    { "bytes=abc-",       1000, util::http::RANGE_NONE, 0, 0 },
    { "bytes=10-x",       1000, util::http::RANGE_NONE, 0, 0 },
    { "bytes=100",        1000, util::http::RANGE_NONE, 0, 0 },
    { "bytes=0-1,5-6",    1000, util::http::RANGE_NONE, 0, 0 },
    { "bytes",            1000, util::http::RANGE_NONE, 0, 0 },
};

#define COUNTOF(x) (sizeof(x)/sizeof(x[0]))

int main()
{
    for (unsigned int i=0; i<COUNTOF(tests); ++i)
    {
	std::string result = util::http::ResolveURL(tests[i].base,
						    tests[i].link);
	if (result != tests[i].expect)
	{
	    TRACE << "Resolve(" << tests[i].base << ", " << tests[i].link
		  << ") = '" << result << "' should be '" << tests[i].expect
		  << "')\n";
	    return 1;
	}
    }

    for (unsigned int i=0; i<COUNTOF(rangetests); ++i)
    {
	util::http::ByteRange br = { 0, 0 };
	util::http::RangeResult rr = util::http::ParseRange(rangetests[i].header,
							    rangetests[i].size,
							    &br);
	if (rr != rangetests[i].result)
	{
	    TRACE << "ParseRange(" << rangetests[i].header << ") = "
		  << (int)rr << " should be " << (int)rangetests[i].result
		  << "\n";
	    return 1;
	}
	if (rr == util::http::RANGE_OK)
	{
	    assert(br.start == rangetests[i].start);
	    assert(br.end == rangetests[i].end);
	}
    }

    util::http::URL url;
    unsigned int rc = util::http::ParseURL("http://foo.bar:2888/wurdle?x=1#frag",
					   &url);
    assert(rc == 0);
    assert(url.scheme == "http");
    assert(url.host == "foo.bar");
    assert(url.port == 2888);
    assert(url.path == "/wurdle?x=1");
    assert(url.HostHeader() == "foo.bar:2888");

    rc = util::http::ParseURL("HTTPS://renderer.local", &url);
    assert(rc == 0);
    assert(url.scheme == "https");
    assert(url.port == 443);
    assert(url.path == "/");
    assert(url.HostHeader() == "renderer.local");
    assert(url.ToString() == "https://renderer.local/");

    rc = util::http::ParseURL("ftp://foo.bar/", &url);
    assert(rc == EINVAL);
    rc = util::http::ParseURL("/just/a/path", &url);
    assert(rc == EINVAL);
    rc = util::http::ParseURL("http://:80/", &url);
    assert(rc == EINVAL);
    rc = util::http::ParseURL("http://foo.bar:99999/", &url);
    assert(rc == EINVAL);

    assert(util::http::IsHttpURL("http://x/"));
    assert(util::http::IsHttpURL("https://x/"));
    assert(!util::http::IsHttpURL("/x"));

    assert(util::http::FormatDate(784111777) == "Sun, 06 Nov 1994 08:49:37 GMT");

    return 0;
}

#endif
