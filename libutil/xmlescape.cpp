#include "xmlescape.h"
#include <string.h>
#include <stdlib.h>

namespace util {

std::string XmlEscape(const std::string& s)
{
    std::string result;
    result.reserve(s.length());

    for (unsigned int i=0; i<s.length(); ++i)
    {
	unsigned char c = (unsigned char)s[i];
	if (c == '&')
	    result += "&amp;";
	else if (c == '\"')
	    result += "&quot;";
	else if (c == '\'')
	    result += "&apos;";
	else if (c == '<')
	    result += "&lt;";
	else if (c == '>')
	    result += "&gt;";
	else if (c == '\t')
	    result += "&#9;";
	else if (c == '\r')
	    result += "&#13;"; // Else parsers fold it into the newline
	else if (c >= ' ' || c == '\n') // No other control characters
	    result += (char)c;
    }
    return result;
}

static void AppendUTF8(unsigned long ch, std::string *result)
{
    if (ch < 0x80)
	*result += (char)ch;
    else if (ch < 0x800)
    {
	*result += (char)(0xC0 | (ch >> 6));
	*result += (char)(0x80 | (ch & 0x3F));
    }
    else if (ch < 0x10000)
    {
	*result += (char)(0xE0 | (ch >> 12));
	*result += (char)(0x80 | ((ch >> 6) & 0x3F));
	*result += (char)(0x80 | (ch & 0x3F));
    }
    else
    {
	*result += (char)(0xF0 | (ch >> 18));
	*result += (char)(0x80 | ((ch >> 12) & 0x3F));
	*result += (char)(0x80 | ((ch >> 6) & 0x3F));
	*result += (char)(0x80 | (ch & 0x3F));
    }
}

std::string XmlUnEscape(const std::string& s)
{
    std::string result;
    result.reserve(s.length());

    const char *p = s.c_str();
    while (*p)
    {
	if (*p == '&')
	{
	    const char *p2 = strchr(p, ';');
	    if (!p2)
	    {
		result += p;
		return result;
	    }
	    std::string entity(p+1, p2);
	    if (entity == "quot")
		result += '\"';
	    else if (entity == "amp")
		result += '&';
	    else if (entity == "apos")
		result += '\'';
	    else if (entity == "lt")
		result += '<';
	    else if (entity == "gt")
		result += '>';
	    else if (entity.length() > 1 && entity[0] == '#')
	    {
		unsigned long ch;
		if (entity[1] == 'x' || entity[1] == 'X')
		    ch = strtoul(entity.c_str()+2, NULL, 16);
		else
		    ch = strtoul(entity.c_str()+1, NULL, 10);
		if (ch > 0 && ch < 0x110000)
		    AppendUTF8(ch, &result);
	    }
	    else
		result.append(p, p2+1);
	    p = p2+1;
	}
	else
	{
	    result += *p;
	    ++p;
	}
    }
    return result;
}

} // namespace util

#ifdef TEST

#include <assert.h>

int main()
{
    assert(util::XmlEscape("foo") == "foo");
    assert(util::XmlEscape("\"hi\"") == "&quot;hi&quot;");
    assert(util::XmlEscape("X&Y") == "X&amp;Y");
    assert(util::XmlEscape("X<>Y") == "X&lt;&gt;Y");
    assert(util::XmlEscape("Don't") == "Don&apos;t");
    assert(util::XmlEscape("Beyonc\xC3\xA9 foo") == "Beyonc\xC3\xA9 foo");
    assert(util::XmlEscape("You\xE2\x80\x99re My Flame.flac")
	   == "You\xE2\x80\x99re My Flame.flac");
    assert(util::XmlEscape("a\tb\x01") == "a&#9;b");
    assert(util::XmlEscape("one\r\ntwo\n") == "one&#13;\ntwo\n");
    assert(util::XmlEscape("\x1b[0m\x7f") == "[0m\x7f");
    assert(util::XmlUnEscape(util::XmlEscape("Act 1\tScene 2\r\n"))
	   == "Act 1\tScene 2\r\n");

    assert(util::XmlUnEscape("foo") == "foo");
    assert(util::XmlUnEscape("&quot;hi&quot;") == "\"hi\"");
    assert(util::XmlUnEscape("&amp;quot;hi&amp;quot;") == "&quot;hi&quot;");
    assert(util::XmlUnEscape("X&amp;Y") == "X&Y");
    assert(util::XmlUnEscape("X&lt;&gt;Y") == "X<>Y");
    assert(util::XmlUnEscape("Don&apos;t") == "Don't");
    assert(util::XmlUnEscape("&#65;&#x42;") == "AB");
    assert(util::XmlUnEscape("caf&#233;") == "caf\xC3\xA9");
    assert(util::XmlUnEscape("&nbsp;") == "&nbsp;");
    assert(util::XmlUnEscape("a & b") == "a & b");
    assert(util::XmlUnEscape("Beyonc\xC3\xA9 foo") == "Beyonc\xC3\xA9 foo");

    return 0;
}

#endif
