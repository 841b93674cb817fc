#include "http_parser.h"
#include "line_reader.h"
#include "trace.h"
#include <stdlib.h>
#include <errno.h>
#include <boost/tokenizer.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>

namespace util {

namespace http {

typedef boost::tokenizer<boost::char_separator<char> > tokenizer;

unsigned int Parser::GetRequestLine(std::string *verb, std::string *path,
				    std::string *version)
{
    boost::char_separator<char> sep(" \t");

    std::string line;
    unsigned int rc;

    // RFC 7230 3.5: ignore at least one empty line before a request
    do {
	rc = m_line_reader->GetLine(&line);
	if (rc)
	    return rc;
    } while (line.empty());

    tokenizer bt(line, sep);
    tokenizer::iterator bti = bt.begin();
    tokenizer::iterator end = bt.end();

    if (bti == end)
    {
	TRACE << "Don't like request line '" << line << "'\n";
	return EINVAL;
    }
    *verb = *bti;
    ++bti;
    if (bti == end)
    {
	TRACE << "Don't like request line '" << line << "'\n";
	return EINVAL;
    }
    *path = *bti;
    ++bti;
    if (bti == end)
    {
	TRACE << "Don't like request line '" << line << "'\n";
	return EINVAL;
    }
    if (version)
	*version = *bti;
    return 0;
}

unsigned int Parser::GetResponseLine(unsigned int *status,
				     std::string *version)
{
    boost::char_separator<char> sep(" \t");

    std::string line;
    unsigned int rc = m_line_reader->GetLine(&line);
    if (rc)
	return rc;

    tokenizer bt(line, sep);
    tokenizer::iterator bti = bt.begin();
    tokenizer::iterator end = bt.end();

    if (bti == end)
    {
	TRACE << "Don't like response line '" << line << "'\n";
	return EINVAL;
    }
    if (version)
	*version = *bti;
    ++bti;
    if (bti == end)
    {
	TRACE << "Don't like response line '" << line << "'\n";
	return EINVAL;
    }
    *status = (unsigned int)strtoul(bti->c_str(), NULL, 10);
    return 0;
}

unsigned int Parser::GetHeaderLine(std::string *pkey, std::string *pvalue)
{
    for (;;)
    {
	std::string line;
	unsigned int rc = m_line_reader->GetLine(&line);
	if (rc)
	    return rc;

	pkey->clear();
	pvalue->clear();

	boost::algorithm::trim(line);
	if (line.empty())
	    return 0;

	std::string::size_type colon = line.find(':');
	if (colon == std::string::npos)
	{
	    TRACE << "Ignoring header line '" << line << "'\n";
	    continue;
	}

	*pkey = boost::algorithm::trim_copy(line.substr(0, colon));
	*pvalue = boost::algorithm::trim_copy(line.substr(colon+1));
	if (!pkey->empty())
	    return 0;
    }
}

unsigned int Parser::GetHeaders(Headers *headers)
{
    for (;;)
    {
	std::string key, value;
	unsigned int rc = GetHeaderLine(&key, &value);
	if (rc == ENODATA)
	    return 0;
	if (rc)
	    return rc;
	if (key.empty())
	    return 0;
	(*headers)[boost::algorithm::to_lower_copy(key)] = value;
    }
}

std::string GetHeader(const Headers& headers, const std::string& name)
{
    Headers::const_iterator i =
	headers.find(boost::algorithm::to_lower_copy(name));
    if (i == headers.end())
	return std::string();
    return i->second;
}

} // namespace http

} // namespace util

#ifdef TEST

#include "string_stream.h"
#include <assert.h>

int main()
{
    util::StringStream ss(
	"\r\n"
	"GET /film%20one.mkv HTTP/1.1\r\n"
	"Host: 192.168.1.5:8000\r\n"
	"range:   bytes=0-  \r\n"
	"junk without colon\r\n"
	"Connection:close\r\n"
	"\r\n"
	"HTTP/1.1 200 OK\r\n"
	"CACHE-CONTROL: max-age=1800\r\n"
	"Location: http://192.168.1.20:49152/desc.xml\r\n"
	"ST: urn:schemas-upnp-org:service:AVTransport:1\r\n");

    util::GreedyLineReader lr(&ss);
    util::http::Parser hp(&lr);

    std::string verb, path, version;
    unsigned int rc = hp.GetRequestLine(&verb, &path, &version);
    assert(rc == 0);
    assert(verb == "GET");
    assert(path == "/film%20one.mkv");
    assert(version == "HTTP/1.1");

    util::http::Headers headers;
    rc = hp.GetHeaders(&headers);
    assert(rc == 0);
    assert(headers.size() == 3);
    assert(util::http::GetHeader(headers, "Range") == "bytes=0-");
    assert(util::http::GetHeader(headers, "CONNECTION") == "close");
    assert(util::http::GetHeader(headers, "host") == "192.168.1.5:8000");
    assert(util::http::GetHeader(headers, "Content-Length") == "");

    unsigned int status = 0;
    rc = hp.GetResponseLine(&status, NULL);
    assert(rc == 0);
    assert(status == 200);

    // No terminating blank line, as in many SSDP replies
    headers.clear();
    rc = hp.GetHeaders(&headers);
    assert(rc == 0);
    assert(util::http::GetHeader(headers, "location")
	   == "http://192.168.1.20:49152/desc.xml");
    assert(util::http::GetHeader(headers, "st")
	   == "urn:schemas-upnp-org:service:AVTransport:1");

    return 0;
}

#endif
