#include "xml.h"
#include "trace.h"
#include "errors.h"
#include "stream.h"
#include "xmlescape.h"
#include <string.h>
#include <vector>
#include <boost/algorithm/string/trim.hpp>

namespace xml {

static const char WHITESPACE[] = " \t\r\n";

static bool IsNameEnd(char c)
{
    return c == '>' || c == '/' || strchr(WHITESPACE, c) != NULL;
}

SaxParser::SaxParser(SaxParserObserver *observer)
    : m_observer(observer)
{
}

unsigned int SaxParser::Parse(util::Stream *s)
{
    std::string doc;
    char buffer[4096];

    for (;;)
    {
	size_t nread = 0;
	unsigned int rc = s->Read(buffer, sizeof(buffer), &nread);
	if (rc)
	{
	    TRACE << "Read gave error " << rc << "\n";
	    return rc;
	}
	if (nread == 0)
	    break;
	doc.append(buffer, nread);
    }

    return Parse(doc);
}

unsigned int SaxParser::Parse(const std::string& doc)
{
    std::string::size_type pos = 0;

    while (pos < doc.length())
    {
	std::string::size_type lt = doc.find('<', pos);
	std::string::size_type end = (lt == std::string::npos)
	    ? doc.length() : lt;

	if (end > pos)
	{
	    std::string content = util::XmlUnEscape(doc.substr(pos, end-pos));
	    unsigned int rc = m_observer->OnContent(content.c_str());
	    if (rc)
		return rc;
	}

	if (lt == std::string::npos)
	    return 0;

	pos = lt;
	unsigned int rc = ParseTag(doc, &pos);
	if (rc)
	    return rc;
    }

    return 0;
}

/** On entry, *pos indexes a '<'; on exit, it's just past the matching '>'.
 */
unsigned int SaxParser::ParseTag(const std::string& doc,
				 std::string::size_type *pos)
{
    std::string::size_type p = *pos + 1;
    std::string::size_type close;

    if (doc.compare(p, 1, "?") == 0)
    {
	close = doc.find("?>", p);
	if (close == std::string::npos)
	    return EPARSE;
	*pos = close + 2;
	return 0;
    }

    if (doc.compare(p, 3, "!--") == 0)
    {
	close = doc.find("-->", p+3);
	if (close == std::string::npos)
	    return EPARSE;
	*pos = close + 3;
	return 0;
    }

    if (doc.compare(p, 8, "![CDATA[") == 0)
    {
	close = doc.find("]]>", p+8);
	if (close == std::string::npos)
	    return EPARSE;
	std::string content = doc.substr(p+8, close - (p+8));
	*pos = close + 3;
	return m_observer->OnContent(content.c_str());
    }

    if (doc.compare(p, 1, "!") == 0)
    {
	// DOCTYPE, possibly with an internal subset
	std::string::size_type bra = doc.find('[', p);
	close = doc.find('>', p);
	if (bra != std::string::npos && close != std::string::npos
	    && bra < close)
	    close = doc.find("]>", bra);
	if (close == std::string::npos)
	    return EPARSE;
	*pos = doc.find('>', close) + 1;
	return 0;
    }

    if (doc.compare(p, 1, "/") == 0)
    {
	++p;
	close = doc.find('>', p);
	if (close == std::string::npos)
	    return EPARSE;
	std::string name = boost::algorithm::trim_copy(doc.substr(p, close-p));
	if (name.empty())
	    return EPARSE;
	*pos = close + 1;
	return m_observer->OnEnd(name.c_str());
    }

    // Start tag
    std::string::size_type nameend = p;
    while (nameend < doc.length() && !IsNameEnd(doc[nameend]))
	++nameend;
    if (nameend == p || nameend == doc.length())
	return EPARSE;

    std::string name = doc.substr(p, nameend-p);
    unsigned int rc = m_observer->OnBegin(name.c_str());
    if (rc)
	return rc;

    p = nameend;
    for (;;)
    {
	p = doc.find_first_not_of(WHITESPACE, p);
	if (p == std::string::npos)
	    return EPARSE;

	if (doc[p] == '>')
	{
	    *pos = p+1;
	    return 0;
	}

	if (doc[p] == '/')
	{
	    if (doc.compare(p, 2, "/>") != 0)
		return EPARSE;
	    *pos = p+2;
	    return m_observer->OnEnd(name.c_str());
	}

	// <tag  attr="thing">
	//       ^
	std::string::size_type attrend = p;
	while (attrend < doc.length() && doc[attrend] != '='
	       && !IsNameEnd(doc[attrend]))
	    ++attrend;
	if (attrend == doc.length())
	    return EPARSE;
	std::string attrname = doc.substr(p, attrend-p);
	std::string value;

	p = doc.find_first_not_of(WHITESPACE, attrend);
	if (p == std::string::npos)
	    return EPARSE;
	if (doc[p] == '=')
	{
	    p = doc.find_first_not_of(WHITESPACE, p+1);
	    if (p == std::string::npos)
		return EPARSE;
	    char quote = doc[p];
	    if (quote == '\"' || quote == '\'')
	    {
		std::string::size_type endquote = doc.find(quote, p+1);
		if (endquote == std::string::npos)
		    return EPARSE;
		value = doc.substr(p+1, endquote-p-1);
		p = endquote+1;
	    }
	    else
	    {
		std::string::size_type valend = p;
		while (valend < doc.length() && !IsNameEnd(doc[valend]))
		    ++valend;
		value = doc.substr(p, valend-p);
		p = valend;
	    }
	}

	rc = m_observer->OnAttribute(attrname.c_str(),
				     util::XmlUnEscape(value).c_str());
	if (rc)
	    return rc;
    }
}


        /* CheckWellFormed */


namespace {

class WellFormedObserver: public SaxParserObserver
{
    std::vector<std::string> m_stack;
    bool m_seen_root;

public:
    WellFormedObserver() : m_seen_root(false) {}

    bool IsComplete() const { return m_seen_root && m_stack.empty(); }

    // Being a SaxParserObserver
    unsigned int OnBegin(const char *tag) override
    {
	if (m_stack.empty() && m_seen_root)
	{
	    TRACE << "Second root element <" << tag << ">\n";
	    return EPARSE;
	}
	m_seen_root = true;
	m_stack.push_back(tag);
	return 0;
    }

    unsigned int OnEnd(const char *tag) override
    {
	if (m_stack.empty() || m_stack.back() != tag)
	{
	    TRACE << "Unexpected </" << tag << ">\n";
	    return EPARSE;
	}
	m_stack.pop_back();
	return 0;
    }

    unsigned int OnContent(const char *content) override
    {
	if (m_stack.empty() && content[strspn(content, WHITESPACE)])
	{
	    TRACE << "Content outside root element\n";
	    return EPARSE;
	}
	return 0;
    }
};

} // anon namespace

unsigned int CheckWellFormed(const std::string& doc)
{
    WellFormedObserver wfo;
    SaxParser parser(&wfo);
    unsigned int rc = parser.Parse(doc);
    if (rc)
	return EPARSE;
    if (!wfo.IsComplete())
	return EPARSE;
    return 0;
}


        /* Lenient extraction */


std::string LocalName(const std::string& tag)
{
    std::string::size_type colon = tag.rfind(':');
    if (colon == std::string::npos)
	return tag;
    return tag.substr(colon+1);
}

/** Reads the tag name starting at pos, which indexes just past "<" or "</". */
static std::string NameAt(const std::string& text, std::string::size_type pos)
{
    std::string::size_type end = pos;
    while (end < text.length() && !IsNameEnd(text[end]))
	++end;
    return text.substr(pos, end-pos);
}

std::string GetTagContent(const std::string& text, const std::string& tag)
{
    std::string::size_type pos = 0;

    for (;;)
    {
	pos = text.find('<', pos);
	if (pos == std::string::npos)
	    return std::string();
	++pos;

	if (pos >= text.length() || strchr("/?!", text[pos]))
	    continue;

	std::string name = NameAt(text, pos);
	if (LocalName(name) != tag)
	    continue;

	std::string::size_type gt = text.find('>', pos);
	if (gt == std::string::npos)
	    return std::string();
	if (text[gt-1] == '/')
	    return std::string(); // <tag/>

	std::string::size_type content = gt+1;
	std::string::size_type search = content;
	for (;;)
	{
	    std::string::size_type endtag = text.find("</", search);
	    if (endtag == std::string::npos)
		return std::string();
	    if (LocalName(NameAt(text, endtag+2)) == tag)
	    {
		std::string value = text.substr(content, endtag-content);
		boost::algorithm::trim(value);
		return util::XmlUnEscape(value);
	    }
	    search = endtag+2;
	}
    }
}

} // namespace xml

#ifdef TEST

#include "string_stream.h"
#include <assert.h>

class TestObserver: public xml::SaxParserObserver
{
    std::string m_events;

public:
    const std::string& Events() const { return m_events; }

    unsigned int OnBegin(const char *tag) override
    {
	m_events += "<" + std::string(tag) + ">";
	return 0;
    }

    unsigned int OnEnd(const char *tag) override
    {
	m_events += "</" + std::string(tag) + ">";
	return 0;
    }

    unsigned int OnAttribute(const char *name, const char *value) override
    {
	m_events += "[" + std::string(name) + "=" + value + "]";
	return 0;
    }

    unsigned int OnContent(const char *content) override
    {
	if (content[strspn(content, " \t\r\n")])
	    m_events += content;
	return 0;
    }
};

static const struct {
    const char *doc;
    unsigned int expect;
} wftests[] = {
    { "<root/>", 0 },
    { "<?xml version=\"1.0\"?>\n<root><a>x</a><b/></root>\n", 0 },
    { "<!-- hello --><root a='1' b=\"2\">t<![CDATA[<not a tag>]]></root>", 0 },
    { "<!DOCTYPE root [ <!ENTITY x \"y\"> ]><root/>", 0 },
    { "<s:Envelope xmlns:s=\"x\"><s:Body></s:Body></s:Envelope>", 0 },
    { "", EPARSE },
    { "just text", EPARSE },
    { "<root>", EPARSE },
    { "<root></wrong>", EPARSE },
    { "<a><b></a></b>", EPARSE },
    { "<a/><b/>", EPARSE },
    { "<root/>trailing", EPARSE },
    { "<root attr=\"unterminated></root>", EPARSE },
    { "<root><!-- unterminated </root>", EPARSE },
    { "</root>", EPARSE },
    { "<>", EPARSE },
};

#define COUNTOF(x) (sizeof(x)/sizeof(x[0]))

int main()
{
    TestObserver to;
    xml::SaxParser parser(&to);
    util::StringStream ss(
	"<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
	"<!-- description -->\n"
	"<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
	"  <friendlyName>Living Room &amp; Kitchen</friendlyName>\n"
	"  <icon width = \"48\" url='/i.png'/>\n"
	"  <x:y a=b>z</x:y>\n"
	"</root>\n");
    unsigned int rc = parser.Parse(&ss);
    assert(rc == 0);
    if (to.Events() != "<root>[xmlns=urn:schemas-upnp-org:device-1-0]"
	"<friendlyName>Living Room & Kitchen</friendlyName>"
	"<icon>[width=48][url=/i.png]</icon>"
	"<x:y>[a=b]z</x:y>"
	"</root>")
    {
	TRACE << "Got " << to.Events() << "\n";
	assert(false);
    }

    for (unsigned int i=0; i<COUNTOF(wftests); ++i)
    {
	rc = xml::CheckWellFormed(wftests[i].doc);
	if (rc != wftests[i].expect)
	{
	    TRACE << "CheckWellFormed(" << wftests[i].doc << ") = " << rc
		  << " should be " << wftests[i].expect << "\n";
	    return 1;
	}
    }

    assert(xml::LocalName("u:GetVolumeResponse") == "GetVolumeResponse");
    assert(xml::LocalName("root") == "root");

    const char *response =
	"<?xml version=\"1.0\"?>"
	"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
	"<s:Body>"
	"<u:GetVolumeResponse xmlns:u=\"urn:schemas-upnp-org:service:RenderingControl:1\">"
	"<CurrentVolume> 37 </CurrentVolume>"
	"</u:GetVolumeResponse>"
	"</s:Body>"
	"</s:Envelope>";
    assert(xml::GetTagContent(response, "CurrentVolume") == "37");
    assert(xml::GetTagContent(response, "Body").find("GetVolumeResponse")
	   != std::string::npos);
    assert(xml::GetTagContent(response, "CurrentMute") == "");

    assert(xml::GetTagContent("<a:TrackDuration xmlns:a=\"x\">0:01:02</a:TrackDuration>",
			      "TrackDuration") == "0:01:02");
    assert(xml::GetTagContent("<Title>A &amp; B</Title>", "Title") == "A & B");
    assert(xml::GetTagContent("<RelTimeX>1</RelTimeX><RelTime>2</RelTime>",
			      "RelTime") == "2");
    assert(xml::GetTagContent("<RelTime/>", "RelTime") == "");
    assert(xml::GetTagContent("<RelTime>unterminated", "RelTime") == "");

    return 0;
}

#endif
