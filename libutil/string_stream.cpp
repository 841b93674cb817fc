#include "string_stream.h"
#include <string.h>
#include <algorithm>

namespace util {

StringStream::StringStream()
{
}

StringStream::StringStream(const std::string& s)
    : m_string(s)
{
}

StringStream::~StringStream()
{
}

unsigned StringStream::ReadAt(void *buffer, uint64_t pos, size_t len,
			      size_t *pread)
{
    if (pos >= m_string.length())
    {
	*pread = 0;
	return 0;
    }
    size_t remain = m_string.length() - (size_t)pos;
    size_t nread = std::min(len, remain);
    memcpy(buffer, m_string.data() + pos, nread);
    *pread = nread;
    return 0;
}

unsigned StringStream::WriteAt(const void *buffer, uint64_t pos, size_t len,
			       size_t *pwrote)
{
    if (pos > m_string.length())
	m_string.append((size_t)pos - m_string.length(), '\0');
    m_string.replace((size_t)pos, len, (const char*)buffer, len);
    *pwrote = len;
    return 0;
}

uint64_t StringStream::GetLength()
{
    return m_string.length();
}

} // namespace util

#ifdef TEST

#include <assert.h>
#include <errno.h>

int main()
{
    util::StringStream ss;
    unsigned int rc = ss.WriteString("hello, world");
    assert(rc == 0);
    assert(ss.GetLength() == 12);
    assert(ss.Tell() == 12);

    char buffer[8];
    size_t nread;
    rc = ss.ReadAt(buffer, 7, sizeof(buffer), &nread);
    assert(rc == 0);
    assert(nread == 5);
    assert(!memcmp(buffer, "world", 5));

    // Reading off the end is EOF, not an error
    rc = ss.ReadAt(buffer, 100, sizeof(buffer), &nread);
    assert(rc == 0);
    assert(nread == 0);

    ss.Seek(0);
    rc = ss.ReadAll(buffer, 5);
    assert(rc == 0);
    assert(!memcmp(buffer, "hello", 5));

    ss.Seek(7);
    rc = ss.WriteString("there");
    assert(rc == 0);
    assert(ss.str() == "hello, there");

    // Premature EOF
    ss.Seek(10);
    rc = ss.ReadAll(buffer, 5);
    assert(rc == EIO);

    return 0;
}

#endif
