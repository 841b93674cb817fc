#ifndef LIBCAST_MEDIA_INFO_H
#define LIBCAST_MEDIA_INFO_H 1

#include <string>
#include <vector>

namespace cast {

/** What an inspector can tell us about a media file's format.
 */
struct FormatSummary
{
    std::string container;     ///< e.g. "mp4", "matroska", "unknown"
    std::string codec;         ///< Video codec, e.g. "h264"; empty if unknown
    unsigned int bitrate_kbps; ///< 0 if unknown

    FormatSummary() : bitrate_kbps(0) {}
};

struct SubtitleTrack
{
    unsigned int index;        ///< Stream index within the container
    std::string codec;
    std::string language;
    std::string title;

    SubtitleTrack() : index(0) {}
};

struct SubtitleInfo
{
    std::vector<SubtitleTrack> embedded_tracks;
    std::vector<std::string> external_files; ///< Full paths
};

/** Media analysis, done by somebody else (typically an external
 * program). Implementations are provided by front-ends.
 */
class MediaInspector
{
public:
    virtual ~MediaInspector() {}

    virtual unsigned int InspectFormat(const std::string& path,
				     FormatSummary *summary) = 0;
    virtual unsigned int InspectSubtitles(const std::string& path,
					SubtitleInfo *info) = 0;
};

/** Builds a command line that rewrites a file into something renderers
 * are happier with. Implementations are provided by front-ends.
 */
class OptimizeCommandBuilder
{
public:
    virtual ~OptimizeCommandBuilder() {}

    enum Strategy {
	REMUX,     ///< Change container only
	TRANSCODE  ///< Re-encode to target_mbps
    };

    /** Returns ENOENT if no change is needed or possible.
     */
    virtual unsigned int BuildOptimizeCommand(const std::string& path,
					      unsigned int target_mbps,
					      Strategy strategy,
					      std::string *command) = 0;
};

} // namespace cast

#endif
