#ifndef LIBUTIL_FILE_STREAM_H
#define LIBUTIL_FILE_STREAM_H

#include "stream.h"
#include <memory>
#include <boost/noncopyable.hpp>

namespace util {

enum FileMode {
    READ,  ///< Existing file, read-only
    WRITE  ///< Created or truncated, read/write
};

/** A SeekableStream on a POSIX file descriptor.
 *
 * GetHandle() exposes the descriptor so that the HTTP server can use
 * zero-copy transfers.
 */
class FileStream final: public SeekableStream, private boost::noncopyable
{
    int m_fd;

public:
    FileStream();
    ~FileStream();

    unsigned Open(const char *filename, FileMode mode) ATTRIBUTE_WARNUNUSED;

    // Being a SeekableStream
    unsigned GetStreamFlags() const override
    {
	return READABLE|WRITABLE|SEEKABLE|POLLABLE;
    }
    unsigned ReadAt(void *buffer, uint64_t pos, size_t len,
		    size_t *pread) override;
    unsigned WriteAt(const void *buffer, uint64_t pos, size_t len,
		     size_t *pwrote) override;
    uint64_t GetLength() override;

    int GetHandle() override { return m_fd; }
};

unsigned OpenFileStream(const char *filename, FileMode mode,
			std::unique_ptr<Stream> *result) ATTRIBUTE_WARNUNUSED;

} // namespace util

#endif
