#include "urlescape.h"
#include "trace.h"
#include <string.h>
#include <stdlib.h>
#include <stdio.h>
#include <ctype.h>

namespace util {

static bool IsUnreserved(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
	|| (c >= '0' && c <= '9') || (c && strchr("-._~/", c) != NULL);
}

std::string URLEscape(const std::string& s)
{
    std::string result;
    result.reserve(s.length());

    for (unsigned int i=0; i<s.length(); ++i)
    {
	unsigned char c = (unsigned char)s[i];
	if (IsUnreserved(c))
	    result += (char)c;
	else
	{
	    char buf[4];
	    sprintf(buf, "%%%02X", c);
	    result += buf;
	}
    }
    return result;
}

std::string URLUnEscape(const std::string& s)
{
    std::string result;
    result.reserve(s.length());
    char buf[4];
    buf[2] = '\0';

    const char *p = s.c_str();
    while (*p)
    {
	if (*p == '%' && isxdigit((unsigned char)p[1])
	    && isxdigit((unsigned char)p[2]))
	{
	    buf[0] = p[1];
	    buf[1] = p[2];
	    result += (char)strtoul(buf, NULL, 16);
	    p += 3;
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

#define COUNTOF(x) (sizeof(x)/sizeof(x[0]))

static const struct {
    const char *test;
    const char *expect;
} urltests[] = {
    { "foo", "foo" },
    { "808 State", "808%20State" },
    { "X&Y", "X%26Y" },
    { "Film (2019).mkv", "Film%20%282019%29.mkv" },
    { "dir/sub/file-1_a~b.mp4", "dir/sub/file-1_a~b.mp4" },
    { "Beyonc\xC3\xA9.mp3", "Beyonc%C3%A9.mp3" },
    { "100%", "100%25" },
    { "a?b#c", "a%3Fb%23c" },
};

int main()
{
    for (unsigned int i=0; i<COUNTOF(urltests); ++i)
    {
	std::string result = util::URLEscape(urltests[i].test);
	if (result != urltests[i].expect)
	{
	    TRACE << "Escape(" << urltests[i].test
		  << ") = '" << result << "' should be '" << urltests[i].expect
		  << "')\n";
	    return 1;
	}
	std::string r2 = util::URLUnEscape(result);
	if (r2 != urltests[i].test)
	{
	    TRACE << "UnEscape(" << result
		  << ") = '" << r2 << "' should be '" << urltests[i].test
		  << "')\n";
	    return 1;
	}
    }

    assert(util::URLUnEscape("%7e%7E") == "~~");
    assert(util::URLUnEscape("50%") == "50%");
    assert(util::URLUnEscape("%zz") == "%zz");

    return 0;
}

#endif
