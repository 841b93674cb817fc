#ifndef LIBUTIL_FILE_H
#define LIBUTIL_FILE_H

#include <string>
#include <vector>
#include <sys/stat.h>

/** Utility classes and routines which didn't fit anywhere else.
 */
namespace util {

/** "/srv/media/film.mkv" -> "film.mkv" */
std::string GetLeafName(const char *filename);
inline std::string GetLeafName(const std::string& s) { return GetLeafName(s.c_str()); }

/** "/srv/media/film.mkv" -> "/srv/media"; "film.mkv" -> "."; "/film.mkv" -> "/" */
std::string GetDirName(const char *filename);
inline std::string GetDirName(const std::string& s) { return GetDirName(s.c_str()); }

/** "film.mkv" -> "mkv" (no dot); "" if there's no extension */
std::string GetExtension(const char *filename);
inline std::string GetExtension(const std::string& s) { return GetExtension(s.c_str()); }

/** "/srv/media/film.mkv" -> "/srv/media/film" */
std::string StripExtension(const char *filename);
inline std::string StripExtension(const std::string& s) { return StripExtension(s.c_str()); }

/** True if any "/"-separated component of the path is "..".
 */
bool HasParentReference(const std::string& path);

struct Dirent
{
    std::string name;
    struct stat st;
};

/** Lists a directory, sorted by name, excluding "." and "..".
 */
unsigned int ReadDirectory(const std::string& path,
			   std::vector<Dirent> *entries);

} // namespace util

#endif
