#ifndef LIBUTIL_STREAM_H
#define LIBUTIL_STREAM_H

#include "attributes.h"
#include <string>
#include <stdint.h>
#include <stddef.h>

namespace util {

enum { NOT_POLLABLE = -1 };

/** Abstract base class for anything which can be streamed.
 */
class Stream
{
public:
    virtual ~Stream() {}

    enum {
	READABLE =  1, ///< Supports Read()
	WRITABLE =  2, ///< Supports Write()
	SEEKABLE =  8, ///< Supports Seek()/Tell()
	POLLABLE = 16  ///< Supports GetHandle()
    };
    virtual unsigned int GetStreamFlags() const = 0;

    /** Returns 0 for success or an errno for failure. EOF is not a failure.
     *
     * If result is 0, *pread is 0 iff (len == 0 or EOF).
     *
     * @pre GetStreamFlags() & READABLE
     */
    virtual unsigned Read(void *buffer, size_t len, size_t *pread)
	ATTRIBUTE_WARNUNUSED;

    /** Returns 0 for success or an errno for failure.
     *
     * EOF (e.g. on a socket) is an error.
     *
     * @pre GetStreamFlags() & WRITABLE
     */
    virtual unsigned Write(const void *buffer, size_t len, size_t *pwrote)
	ATTRIBUTE_WARNUNUSED;

    /** Non-seekable streams return ESPIPE.
     */
    virtual unsigned int Seek(uint64_t pos);

    virtual uint64_t Tell();

    virtual uint64_t GetLength();

    /** Atomic seek-and-read. Returns ESPIPE for non-seekable streams.
     *
     * @pre GetStreamFlags() & SEEKABLE
     */
    virtual unsigned ReadAt(void *buffer, uint64_t pos, size_t len,
			    size_t *pread) ATTRIBUTE_WARNUNUSED;

    /** Get the underlying file descriptor, or NOT_POLLABLE if none.
     *
     * The HTTP server uses this to send files with sendfile(2).
     */
    virtual int GetHandle() { return NOT_POLLABLE; }


    /* The following helper functions could be implemented using the
     * class interface, and are members for notational reasons only.
     */


    /** Returns 0 for success or an errno if all bytes not read. Premature
     * EOF is a failure, returning EIO.
     */
    unsigned ReadAll(void *buffer, size_t len) ATTRIBUTE_WARNUNUSED;

    /** Returns 0 for success or an errno if all bytes not written. Premature
     * EOF is a failure, returning EIO.
     */
    unsigned WriteAll(const void *buffer, size_t len) ATTRIBUTE_WARNUNUSED;

    /** Does not add a newline.
     */
    unsigned WriteString(const std::string&) ATTRIBUTE_WARNUNUSED;
};

/** Abstract base class for anything which can be streamed, and which is
 * also seekable.
 */
class SeekableStream: public Stream
{
    uint64_t m_pos;

public:
    SeekableStream();

    unsigned Read(void *buffer, size_t len, size_t *pread) override;
    unsigned Write(const void *buffer, size_t len, size_t *pwrote) override;

    unsigned int Seek(uint64_t pos) override { m_pos = pos; return 0; }
    uint64_t Tell() override { return m_pos; }

    uint64_t GetLength() override = 0;

    unsigned ReadAt(void *buffer, uint64_t pos, size_t len,
		    size_t *pread) override = 0;

    virtual unsigned WriteAt(const void *buffer, uint64_t pos, size_t len,
			     size_t *pwrote) ATTRIBUTE_WARNUNUSED = 0;
};

} // namespace util

#endif
