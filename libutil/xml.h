#ifndef LIBUTIL_XML_H
#define LIBUTIL_XML_H 1

#include <string>

namespace util { class Stream; }

/** Classes for XML support
 *
 * Device descriptions and SOAP responses are small, so everything here
 * works on whole documents held in memory.
 */
namespace xml {

class SaxParserObserver
{
public:
    virtual ~SaxParserObserver() {}

    /** Non-zero return codes from any of these stop the parse, and are
     * returned from SaxParser::Parse.
     */
    virtual unsigned int OnBegin(const char* /*tag*/) { return 0; }
    virtual unsigned int OnEnd(const char* /*tag*/) { return 0; }
    virtual unsigned int OnAttribute(const char* /*name*/,
				     const char* /*value*/) { return 0; }
    virtual unsigned int OnContent(const char* /*content*/) { return 0; }
};

/** Simple, SAX-like XML parser.
 *
 * Tag names are reported exactly as written, prefixes and all.
 * Content and attribute values arrive unescaped; CDATA sections arrive
 * as content, verbatim. The XML declaration, processing instructions,
 * comments and DOCTYPE are skipped.
 *
 * This parser doesn't itself check that tags balance; see
 * CheckWellFormed for that.
 */
class SaxParser
{
    SaxParserObserver *m_observer;

    unsigned int ParseTag(const std::string& doc, std::string::size_type *pos);

public:
    explicit SaxParser(SaxParserObserver *observer);

    /** Returns EPARSE for unterminated markup. */
    unsigned int Parse(const std::string& doc);

    /** Reads the stream to EOF, then parses it. */
    unsigned int Parse(util::Stream*);
};

/** Returns EPARSE unless the document has exactly one root element,
 * properly nested tags, and nothing but whitespace outside the root.
 */
unsigned int CheckWellFormed(const std::string& doc);

/** "s:Envelope" -> "Envelope"; "Envelope" -> "Envelope" */
std::string LocalName(const std::string& tag);

/** Lenient extractor for SOAP responses.
 *
 * Returns the trimmed, unescaped content of the first <tag> or
 * <prefix:tag> element, whatever its attributes. Returns an empty
 * string if there's no such element (or it's empty).
 */
std::string GetTagContent(const std::string& text, const std::string& tag);

} // namespace xml

#endif
