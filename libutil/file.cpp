#include "file.h"
#include "trace.h"
#include <dirent.h>
#include <errno.h>
#include <string.h>
#include <algorithm>

namespace util {

std::string GetLeafName(const char *filename)
{
    const char *rslash = strrchr(filename, '/');
    if (rslash)
	return std::string(rslash+1);
    return filename;
}

std::string GetDirName(const char *filename)
{
    const char *rslash = strrchr(filename, '/');
    if (!rslash)
	return ".";
    if (rslash == filename)
	return "/";
    return std::string(filename, rslash);
}

std::string GetExtension(const char *filename)
{
    const char *dot = strrchr(filename, '.');
    if (!dot)
	return "";
    const char *slash = strrchr(filename, '/');
    if (slash && slash > dot)
	return "";
    return std::string(dot+1);
}

std::string StripExtension(const char *filename)
{
    const char *dot = strrchr(filename, '.');
    if (!dot)
	return filename;
    const char *slash = strrchr(filename, '/');
    if (slash && slash > dot)
	return filename;
    return std::string(filename, dot);
}

bool HasParentReference(const std::string& path)
{
    std::string::size_type start = 0;
    for (;;)
    {
	std::string::size_type slash = path.find('/', start);
	std::string component(path, start,
			      slash == std::string::npos
			          ? std::string::npos : slash - start);
	if (component == "..")
	    return true;
	if (slash == std::string::npos)
	    return false;
	start = slash + 1;
    }
}

static bool DirentLess(const Dirent& a, const Dirent& b)
{
    return a.name < b.name;
}

unsigned int ReadDirectory(const std::string& path,
			   std::vector<Dirent> *entries)
{
    entries->clear();

    DIR *dir = opendir(path.c_str());
    if (!dir)
	return (unsigned)errno;

    while (struct dirent *de = readdir(dir))
    {
	if (!strcmp(de->d_name, ".") || !strcmp(de->d_name, ".."))
	    continue;

	Dirent d;
	d.name = de->d_name;
	std::string full = path + "/" + d.name;
	if (::stat(full.c_str(), &d.st) < 0)
	{
	    TRACE << "Can't stat " << full << ": " << errno << "\n";
	    continue;
	}
	entries->push_back(d);
    }
    closedir(dir);

    std::sort(entries->begin(), entries->end(), DirentLess);
    return 0;
}

} // namespace util

#ifdef TEST

#include <assert.h>

static const struct {
    const char *path;
    const char *leaf;
    const char *dir;
    const char *ext;
    const char *stripped;
} tests[] = {
    { "/srv/media/film.mkv", "film.mkv", "/srv/media", "mkv", "/srv/media/film" },
    { "film.mp4",            "film.mp4", ".",          "mp4", "film" },
    { "/film",               "film",     "/",          "",    "/film" },
    { "/srv/a.b/film",       "film",     "/srv/a.b",   "",    "/srv/a.b/film" },
    { "Two Words.tar.gz",    "Two Words.tar.gz", ".",  "gz",  "Two Words.tar" },
};

#define COUNTOF(x) (sizeof(x)/sizeof(x[0]))

int main()
{
    for (unsigned int i=0; i<COUNTOF(tests); ++i)
    {
	assert(util::GetLeafName(tests[i].path) == tests[i].leaf);
	assert(util::GetDirName(tests[i].path) == tests[i].dir);
	assert(util::GetExtension(tests[i].path) == tests[i].ext);
	assert(util::StripExtension(tests[i].path) == tests[i].stripped);
    }

    assert(util::HasParentReference(".."));
    assert(util::HasParentReference("/../etc/passwd"));
    assert(util::HasParentReference("a/b/.."));
    assert(!util::HasParentReference("/a..b/c"));
    assert(!util::HasParentReference("/film...mkv"));

    std::vector<util::Dirent> entries;
    unsigned int rc = util::ReadDirectory("/", &entries);
    assert(rc == 0);
    assert(!entries.empty());
    for (size_t i=1; i<entries.size(); ++i)
	assert(entries[i-1].name < entries[i].name);

    rc = util::ReadDirectory("/no/such/directory/here", &entries);
    assert(rc == ENOENT);

    return 0;
}

#endif
