#ifndef LIBUTIL_LINE_READER_H
#define LIBUTIL_LINE_READER_H 1

#include <string>
#include <stddef.h>

namespace util {

class Stream;

/** Returns single lines of text from a Stream.
 *
 * Useful for HTTP headers and the like.
 */
class LineReader
{
public:
    virtual ~LineReader() {}

    /** Returns exactly one line of input, without its terminator.
     *
     * Returns an error (ENODATA) on EOF.
     */
    virtual unsigned GetLine(std::string *line) = 0;
};

/** A LineReader which assumes that it can read the whole stream, but knows
 * nothing about the actual type of the stream.
 */
class GreedyLineReader: public LineReader
{
    Stream *m_stream;
    size_t m_buffered;

    enum { MAX_LINE = 4096 };
    char m_buffer[MAX_LINE];

public:
    explicit GreedyLineReader(Stream*);

    /** Repeatedly Read()s the stream until LF, EOF, or maximum. A CR
     * before the LF is dropped too.
     */
    unsigned GetLine(std::string *line) override;

    /** Returns anything that hasn't been assembled into a line yet.
     *
     * Because this is a greedy line-reader, and can't peek ahead in
     * the stream, there might be quite a lot of this (up to nearly
     * MAX_LINE bytes). Anything beyond n bytes stays buffered.
     */
    void ReadLeftovers(void *buffer, size_t n, size_t *nread);

    size_t LeftoverBytes() const { return m_buffered; }
};

} // namespace util

#endif
