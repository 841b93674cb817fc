#include "time_code.h"
#include <stdlib.h>
#include <ctype.h>
#include <boost/format.hpp>
#include <boost/tokenizer.hpp>

namespace cast {

static bool AllDigits(const std::string& s)
{
    if (s.empty())
	return false;
    for (std::string::size_type i=0; i<s.length(); ++i)
	if (!isdigit((unsigned char)s[i]))
	    return false;
    return true;
}

unsigned int ParseTimeCode(const std::string& hhmmss)
{
    std::string s = hhmmss;
    std::string::size_type dot = s.find('.');
    if (dot != std::string::npos)
    {
	if (dot + 1 < s.length() && !AllDigits(s.substr(dot+1)))
	    return 0;
	s.erase(dot);
    }

    typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
    boost::char_separator<char> sep(":", "", boost::keep_empty_tokens);
    tokenizer tok(s, sep);

    unsigned int fields[3];
    unsigned int n = 0;
    for (tokenizer::iterator i = tok.begin(); i != tok.end(); ++i)
    {
	if (n == 3 || !AllDigits(*i))
	    return 0;
	fields[n++] = (unsigned int)strtoul(i->c_str(), NULL, 10);
    }
    if (n != 3)
	return 0;

    return fields[0]*3600 + fields[1]*60 + fields[2];
}

std::string FormatTimeCode(unsigned int seconds)
{
    return (boost::format("%02u:%02u:%02u")
	    % (seconds / 3600) % ((seconds / 60) % 60) % (seconds % 60)).str();
}

} // namespace cast

#ifdef TEST

# include <assert.h>

static const struct {
    const char *text;
    unsigned int seconds;
} tests[] = {
    { "00:00:00", 0 },
    { "01:02:03", 3723 },
    { "0:0:5", 5 },
    { "00:42:00.000", 2520 },
    { "100:00:01", 360001 },
    { "", 0 },
    { "12:34", 0 },
    { "1:2:3:4", 0 },
    { "aa:bb:cc", 0 },
    { "01::03", 0 },
    { "01:02:03.x", 0 },
    { "-1:00:00", 0 },
    { "NOT_IMPLEMENTED", 0 },
};

int main()
{
    for (unsigned int i=0; i<sizeof(tests)/sizeof(tests[0]); ++i)
	assert(cast::ParseTimeCode(tests[i].text) == tests[i].seconds);

    assert(cast::FormatTimeCode(0) == "00:00:00");
    assert(cast::FormatTimeCode(3723) == "01:02:03");
    assert(cast::FormatTimeCode(59) == "00:00:59");
    assert(cast::FormatTimeCode(360001) == "100:00:01");
    assert(cast::ParseTimeCode(cast::FormatTimeCode(86399)) == 86399);

    return 0;
}

#endif
