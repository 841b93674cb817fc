#include "line_reader.h"
#include "stream.h"
#include "trace.h"
#include <string.h>
#include <errno.h>

namespace util {

GreedyLineReader::GreedyLineReader(Stream *stream)
    : m_stream(stream),
      m_buffered(0)
{
}

unsigned GreedyLineReader::GetLine(std::string *line)
{
    for (;;)
    {
	const char *lf = (const char*)memchr(m_buffer, '\n', m_buffered);

	if (!lf)
	{
	    if (m_buffered == MAX_LINE)
	    {
		line->assign(m_buffer, m_buffered);
		m_buffered = 0;
		return 0;
	    }

	    size_t nread;
	    unsigned rc = m_stream->Read(m_buffer + m_buffered,
					 MAX_LINE - m_buffered, &nread);
	    if (rc != 0)
		return rc;
	    if (nread == 0)
	    {
		if (m_buffered)
		{
		    // Unterminated last line
		    line->assign(m_buffer, m_buffered);
		    m_buffered = 0;
		    return 0;
		}
		return ENODATA;
	    }
	    m_buffered += nread;
	}
	else
	{
	    const char *end = lf;
	    if (end > m_buffer && end[-1] == '\r')
		--end;
	    line->assign((const char*)m_buffer, end);

	    size_t toskip = (size_t)(lf + 1 - m_buffer);
	    m_buffered -= toskip;
	    memmove(m_buffer, lf+1, m_buffered);
	    return 0;
	}
    }
}

void GreedyLineReader::ReadLeftovers(void *buffer, size_t n, size_t *nread)
{
    if (n > m_buffered)
	n = m_buffered;
    memcpy(buffer, m_buffer, n);
    m_buffered -= n;
    memmove(m_buffer, m_buffer + n, m_buffered);
    *nread = n;
}

} // namespace util

#ifdef TEST

#include "string_stream.h"
#include <assert.h>

struct Test
{
    const char *input;
    const char *lines[10];
    const char *leftovers;
};

static const Test tests[] = {
{
    "GET / HTTP/1.0\r\n"
    "\r\n",

    { "GET / HTTP/1.0",
      "",
      NULL },
    ""
},
{
    "HTTP/1.1 200 OK\r\n"
    "ST: upnp:rootdevice\n"
    "LOCATION: http://192.168.1.20:49152/description.xml\r\n"
    "\r\n",

    { "HTTP/1.1 200 OK",
      "ST: upnp:rootdevice",
      "LOCATION: http://192.168.1.20:49152/description.xml",
      "",
      NULL },
    ""
},
{
    "POST /ctl HTTP/1.1\r\n"
    "Content-Length: 5\r\n"
    "\r\n"
    "hello",

    { "POST /ctl HTTP/1.1",
      "Content-Length: 5",
      "",
      NULL },
    "hello"
},
};

static void DoTest(const Test *t)
{
    util::StringStream ss(t->input);

    util::GreedyLineReader lr(&ss);
    const char *const *ptr = &t->lines[0];

    while (*ptr)
    {
	std::string line;
	unsigned int rc = lr.GetLine(&line);
	assert(rc == 0);
	if (line != *ptr)
	{
	    TRACE << "** Fail, expected '" << *ptr << "' got '" << line
		  << "'\n";
	}
	assert(line == *ptr);
	++ptr;
    }

    char buffer[64];
    size_t nbytes;
    lr.ReadLeftovers(buffer, sizeof(buffer), &nbytes);
    assert(std::string(buffer, nbytes) == t->leftovers);
    assert(lr.LeftoverBytes() == 0);
}

int main(int, char *[])
{
    for (unsigned int i=0; i<sizeof(tests)/sizeof(tests[0]); ++i)
	DoTest(&tests[i]);

    // EOF
    util::StringStream ss("last");
    util::GreedyLineReader lr(&ss);
    std::string line;
    unsigned int rc = lr.GetLine(&line);
    assert(rc == 0);
    assert(line == "last");
    rc = lr.GetLine(&line);
    assert(rc == ENODATA);

    // Over-long lines come back in MAX_LINE pieces
    util::StringStream ss2(std::string(5000, 'a') + "\r\nnext\r\n");
    util::GreedyLineReader lr2(&ss2);
    rc = lr2.GetLine(&line);
    assert(rc == 0);
    assert(line == std::string(4096, 'a'));
    rc = lr2.GetLine(&line);
    assert(rc == 0);
    assert(line == std::string(5000-4096, 'a'));
    rc = lr2.GetLine(&line);
    assert(rc == 0);
    assert(line == "next");

    return 0;
}

#endif
