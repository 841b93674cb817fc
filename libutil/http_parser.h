#ifndef LIBUTIL_HTTP_PARSER_H
#define LIBUTIL_HTTP_PARSER_H 1

#include <string>
#include <map>

namespace util {

class LineReader;

namespace http {

/** Header fields, keyed by lower-cased name. Repeated fields keep the
 * last value.
 */
typedef std::map<std::string, std::string> Headers;

/** Parses HTTP-style header blocks: requests, responses, and SSDP
 * datagrams (which are the same thing over UDP).
 */
class Parser
{
    LineReader *m_line_reader;

public:
    explicit Parser(LineReader *line_reader) : m_line_reader(line_reader) {}

    unsigned int GetRequestLine(std::string *verb, std::string *path,
				std::string *version);
    unsigned int GetResponseLine(unsigned int *status, std::string *version);

    /** Returns an empty "key" and no error for final, blank line.
     *
     * Lines with no colon are skipped. Both key and value are
     * whitespace-trimmed; the key keeps its original case.
     */
    unsigned int GetHeaderLine(std::string *key, std::string *value);

    /** Reads header lines up to and including the blank line.
     *
     * EOF before the blank line is not an error (SSDP datagrams often
     * lack it).
     */
    unsigned int GetHeaders(Headers *headers);
};

/** Lookup in Headers by any-case name; empty if absent. */
std::string GetHeader(const Headers& headers, const std::string& name);

} // namespace http

} // namespace util

#endif
