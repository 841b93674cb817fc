#include "stream.h"
#include <errno.h>
#include <string.h>
#include <algorithm>

namespace util {


        /* Stream */


unsigned Stream::Read(void*, size_t, size_t*) { return EPERM; }
unsigned Stream::Write(const void*, size_t, size_t*) { return EPERM; }
unsigned Stream::Seek(uint64_t) { return ESPIPE; }
uint64_t Stream::Tell() { return 0; }
uint64_t Stream::GetLength() { return 0; }
unsigned Stream::ReadAt(void*, uint64_t, size_t, size_t*) { return ESPIPE; }

unsigned Stream::ReadAll(void *buffer, size_t len)
{
    char *ptr = (char*)buffer;
    size_t done = 0;

    while (done < len)
    {
	size_t n = 0;
	unsigned int rc = Read(ptr + done, len - done, &n);
	if (rc)
	    return rc;
	if (n == 0)
	    return EIO; // EOF before len
	done += n;
    }
    return 0;
}

unsigned Stream::WriteAll(const void *buffer, size_t len)
{
    const char *ptr = (const char*)buffer;
    size_t done = 0;

    while (done < len)
    {
	size_t n = 0;
	unsigned int rc = Write(ptr + done, len - done, &n);
	if (rc)
	    return rc;
	if (n == 0)
	    return EIO;
	done += n;
    }
    return 0;
}

unsigned Stream::WriteString(const std::string& s)
{
    return WriteAll(s.data(), s.size());
}


        /* SeekableStream */


SeekableStream::SeekableStream()
    : m_pos(0)
{
}

unsigned SeekableStream::Read(void *buffer, size_t len, size_t *pread)
{
    unsigned int rc = ReadAt(buffer, m_pos, len, pread);
    if (!rc)
	m_pos += *pread;
    return rc;
}

unsigned SeekableStream::Write(const void *buffer, size_t len, size_t *pwrote)
{
    unsigned int rc = WriteAt(buffer, m_pos, len, pwrote);
    if (!rc)
	m_pos += *pwrote;
    return rc;
}

} // namespace util

#ifdef TEST

# include <assert.h>

/** Hands out (or takes in) at most three bytes per call, like a
 * congested socket.
 */
class TrickleStream: public util::Stream
{
public:
    std::string data;
    size_t pos;

    TrickleStream() : pos(0) {}

    unsigned GetStreamFlags() const override { return READABLE|WRITABLE; }

    unsigned Read(void *buffer, size_t len, size_t *pread) override
    {
	size_t n = std::min(std::min(len, (size_t)3), data.size() - pos);
	memcpy(buffer, data.data() + pos, n);
	pos += n;
	*pread = n;
	return 0;
    }

    unsigned Write(const void *buffer, size_t len, size_t *pwrote) override
    {
	size_t n = std::min(len, (size_t)3);
	data.append((const char*)buffer, n);
	*pwrote = n;
	return 0;
    }
};

int main()
{
    TrickleStream ts;
    unsigned int rc = ts.WriteString("M-SEARCH * HTTP/1.1");
    assert(rc == 0);
    assert(ts.data == "M-SEARCH * HTTP/1.1");

    char buffer[20];
    rc = ts.ReadAll(buffer, 8);
    assert(rc == 0);
    assert(!memcmp(buffer, "M-SEARCH", 8));

    // Only 11 left
    rc = ts.ReadAll(buffer, 12);
    assert(rc == EIO);

    // Defaults for things that can't seek
    assert(ts.Seek(10) == ESPIPE);
    size_t n;
    assert(ts.ReadAt(buffer, 0, 1, &n) == ESPIPE);
    assert(ts.GetHandle() == util::NOT_POLLABLE);

    return 0;
}

#endif
