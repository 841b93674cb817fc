#include "errors.h"
#include <string.h>

namespace util {

const char *StrError(unsigned int error)
{
    switch (error)
    {
    case 0:        return "Success";
    case EFETCH:   return "Can't fetch document";
    case EPARSE:   return "Document is not well-formed XML";
    case ECONTROL: return "Control action failed";
    default:
	return strerror((int)error);
    }
}

} // namespace util

#ifdef TEST

#include <assert.h>

int main()
{
    assert(EFETCH > EDUMMY);
    assert(ECONTROL < EDUMMY2);
    assert(!strcmp(util::StrError(0), "Success"));
    assert(!strcmp(util::StrError(ECONTROL), "Control action failed"));
    assert(!strcmp(util::StrError(ENOENT), strerror(ENOENT)));
    return 0;
}

#endif
