#include "config.h"
#include "file_stream.h"
#include "trace.h"
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace util {

FileStream::FileStream()
    : m_fd(-1)
{
}

FileStream::~FileStream()
{
    if (m_fd >= 0)
	::close(m_fd);
}

unsigned FileStream::Open(const char *filename, FileMode mode)
{
    int flags = (mode == READ) ? O_RDONLY : (O_RDWR|O_CREAT|O_TRUNC);

    if (m_fd >= 0)
	::close(m_fd);

    m_fd = ::open(filename, flags, 0644);
    if (m_fd < 0)
	return (unsigned)errno;

#if HAVE_POSIX_FADVISE
    if (mode == READ)
	posix_fadvise(m_fd, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif

    return 0;
}

unsigned FileStream::ReadAt(void *buffer, uint64_t pos, size_t len,
			    size_t *pnread)
{
    ssize_t rc = ::pread(m_fd, buffer, len, (off_t)pos);
    if (rc < 0)
    {
	TRACE << "FileStream::ReadAt failed len=" << len << " errno "
	      << errno << "\n";
	*pnread = 0;
	return (unsigned)errno;
    }
    *pnread = (size_t)rc;
    return 0;
}

unsigned FileStream::WriteAt(const void *buffer, uint64_t pos, size_t len,
			     size_t *pwrote)
{
    ssize_t rc = ::pwrite(m_fd, buffer, len, (off_t)pos);
    if (rc < 0)
    {
	*pwrote = 0;
	return (unsigned)errno;
    }
    *pwrote = (size_t)rc;
    return 0;
}

uint64_t FileStream::GetLength()
{
    struct stat st;
    int rc = ::fstat(m_fd, &st);
    if (rc < 0)
	return 0;
    return (uint64_t)st.st_size;
}

unsigned OpenFileStream(const char *filename, FileMode mode,
			std::unique_ptr<Stream> *result)
{
    std::unique_ptr<FileStream> fs(new FileStream);
    unsigned int rc = fs->Open(filename, mode);
    if (rc)
	return rc;
    result->reset(fs.release());
    return 0;
}

} // namespace util

#ifdef TEST

#include <assert.h>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>

int main()
{
    char filename[] = "file_stream.test.XXXXXX";
    int fd = mkstemp(filename);
    assert(fd >= 0);
    ::close(fd);

    {
	util::FileStream fs;
	unsigned int rc = fs.Open(filename, util::WRITE);
	assert(rc == 0);
	assert(fs.GetHandle() >= 0);

	rc = fs.WriteString("0123456789");
	assert(rc == 0);
	assert(fs.GetLength() == 10);

	char buffer[4];
	size_t nread;
	rc = fs.ReadAt(buffer, 6, sizeof(buffer), &nread);
	assert(rc == 0);
	assert(nread == 4);
	assert(!memcmp(buffer, "6789", 4));
    }

    std::unique_ptr<util::Stream> sp;
    unsigned int rc = util::OpenFileStream(filename, util::READ, &sp);
    assert(rc == 0);
    assert(sp->GetLength() == 10);

    unlink(filename);

    rc = util::OpenFileStream(filename, util::READ, &sp);
    assert(rc == ENOENT);

    return 0;
}

#endif
