#include "trace.h"
#include "config.h"
#include <boost/format.hpp>
#include <boost/thread/recursive_mutex.hpp>
#include <stdarg.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <errno.h>
#include <unistd.h>
#include <map>
#if HAVE_SYS_SYSCALL_H
#include <sys/syscall.h>
#endif

namespace util {

static boost::recursive_mutex s_trace_mutex;

static FILE *s_logfile = NULL;

class LogFileOpener
{
public:
    LogFileOpener();
    ~LogFileOpener();
};

LogFileOpener::LogFileOpener()
{
    const char *filename = getenv("LOG_FILE");

    if (filename)
    {
	s_logfile = fopen(filename, "wb+");
	if (s_logfile)
	    fprintf(stderr, "*** Logging to %s\n", filename);
	else
	    fprintf(stderr, "Can't open log file '%s': %u\n", filename, errno);
    }
}

LogFileOpener::~LogFileOpener()
{
    if (s_logfile)
    {
	fclose(s_logfile);
	s_logfile = NULL;
    }
}

#if DEBUG
LogFileOpener s_logfile_opener;
#endif

static FILE *Output()
{
    return s_logfile ? s_logfile : stdout;
}

Tracer::Tracer(const char *env_var, const char *file, unsigned int line)
    : m_emit(false)
{
    s_trace_mutex.lock();

    if (getenv("LOG_ALL"))
	m_emit = true;
    else if (env_var)
    {
	const char *value = getenv(env_var);
	if (value && *value)
	    m_emit = true;
    }
    else
	m_emit = true;

    if (!m_emit)
	return;

    if (getenv("LOG_TIME"))
    {
	struct timeval tv;
	gettimeofday(&tv, NULL);
	fprintf(Output(), "%09u.%06u:", (unsigned)tv.tv_sec,
		(unsigned)tv.tv_usec);
    }

    if (getenv("LOG_TID"))
    {
#if HAVE_SYS_SYSCALL_H && defined(SYS_gettid)
	unsigned int raw_tid = (unsigned int)syscall(SYS_gettid);
#else
	unsigned int raw_tid = (unsigned int)getpid();
#endif
	// Small numbers are easier to follow than kernel tids
	static std::map<unsigned int, unsigned int> tidmap;
	if (tidmap.find(raw_tid) == tidmap.end())
	{
	    unsigned int tid = (unsigned int)tidmap.size();
	    tidmap[raw_tid] = tid;
	}
	fprintf(Output(), "%03u:", tidmap[raw_tid]);
    }

    if (!strncmp(file, "../", 3))
	file += 3;

    fprintf(Output(), "%-25s:%4u: ", file, line);
}

Tracer::Tracer(const Tracer&)
    : m_emit(false)
{
    s_trace_mutex.lock();
}

void Tracer::Printf(const char *format, ...) const
{
    if (!m_emit)
	return;

    va_list args;
    va_start(args, format);
    vfprintf(Output(), format, args);
    va_end(args);
}

Tracer::~Tracer()
{
    if (m_emit)
	fflush(Output());

    s_trace_mutex.unlock();
}


LogNameList *LogNameList::sm_head = NULL;

LogNameList::LogNameList(const char *name)
    : m_name(name),
      m_next(NULL)
{
    LogNameList** phead = &sm_head;

    while (*phead)
    {
	if (!strcmp((*phead)->m_name, name))
	    return;
	phead = &(*phead)->m_next;
    }
    *phead = this;
}

void LogNameList::ShowLogNames(FILE *f)
{
    if (sm_head)
    {
	fprintf(f, "Log by setting these environment variables:");
	for (const LogNameList *ptr = sm_head; ptr; ptr = ptr->m_next)
	{
	    fprintf(f, " LOG_%s", ptr->m_name);
	}
	fprintf(f, "\n    or LOG_ALL.\n");
    }
}

const Tracer& operator<<(const Tracer& n, unsigned long long ull)
{
    n.Printf("%s", (boost::format("%llu") % ull).str().c_str());
    return n;
}

const Tracer& operator<<(const Tracer& n, long long ll)
{
    n.Printf("%s", (boost::format("%lld") % ll).str().c_str());
    return n;
}

} // namespace util

#ifdef TEST

#include <vector>
#include <map>
#include <list>
#include <assert.h>
#include <boost/thread/thread.hpp>

static void TraceALot(unsigned int which)
{
    for (unsigned int i=0; i<100; ++i)
	TRACE << "thread " << which << " line " << i << "\n";
}

int main()
{
    bool b = false;
    char c = 'a';
    unsigned char uc = 200;
    short ss = -257;
    unsigned short us = 40000;
    int si = -80000;
    unsigned int ui =        3000000000u;
    long sl = -80001;
    unsigned long ul =       3000000001u;
    long long sll =  -5000000000LL;
    unsigned long long ull = 5000000000ULL;

    std::string s = "X";

    std::vector<int> iv;
    iv.push_back(1);
    iv.push_back(2);
    std::list<std::string> sl2;
    sl2.push_back("Master");
    std::map<std::string, unsigned> sm;
    sm["CurrentVolume"] = 37;

    TRACE << b << " "
	  << c << " " << uc << " "
	  << ss << " " << us << " "
	  << si << " " << ui << " "
	  << sl << " " << ul << " "
	  << sll << " " << ull << " "
	  << s << " " << s.c_str() << " "
	  << iv << " " << sl2 << " " << sm << "\n";

    boost::thread t1(&TraceALot, 1);
    boost::thread t2(&TraceALot, 2);
    t1.join();
    t2.join();

    util::LogNameList::ShowLogNames(stdout);

    return 0;
}

#endif
