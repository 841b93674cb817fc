#include "config.h"
#include "libcast/device_finder.h"
#include "libcast/playback_session.h"
#include "libcast/time_code.h"
#include "libutil/errors.h"
#include "libutil/ip.h"
#include "libutil/trace.h"
#include <getopt.h>
#include <poll.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

/** Command-line program for sending a local video to a DLNA renderer.
 */
namespace dlnacast {

static unsigned int s_timeout_secs = 2;
static unsigned short s_port = 0;
static const char *s_device = NULL;
static const char *s_subtitle = NULL;

static void Usage(FILE *f)
{
    fprintf(f,
	 "Usage: dlnacast [options] list\n"
	 "       dlnacast [options] play <file>\n"
"Send a local media file to a DLNA/UPnP renderer (TV, stick, speaker).\n"
"\n"
"The options are:\n"
" -t, --timeout=SECS   How long to wait for devices to answer (default 2)\n"
" -p, --port=PORT      Serve the file on PORT (default: any free port)\n"
" -d, --device=NAME    Play on the device called NAME, or the NAME'th one\n"
"                        listed (default: the first one found)\n"
" -s, --subtitle=SUB   Subtitles: a file, or the number of an embedded track\n"
" -h, --help           These notes\n"
" -v, --version        Show version\n"
"\n"
"  While playing, type a command and press Enter:\n"
"    p  pause or resume    f  forward 30s    b  back 30s\n"
"    +  volume up          -  volume down    m  toggle mute\n"
"    q  stop and quit (as does end-of-file on standard input)\n"
"\n"
"From " PACKAGE_NAME " " PACKAGE_VERSION " built on " __DATE__ ".\n"
	);
    util::LogNameList::ShowLogNames(f);
}

static void Version()
{
    printf("dlnacast, part of " PACKAGE_NAME " " PACKAGE_VERSION ".\n");
}

static unsigned int Find(cast::Renderers *renderers)
{
    cast::DiscoveryOptions options;
    options.timeout_ms = s_timeout_secs * 1000;
    unsigned int rc = cast::FindRenderers(options, renderers);
    if (rc)
    {
	fprintf(stderr, "Can't search for devices: %s\n", util::StrError(rc));
	return rc;
    }
    if (renderers->empty())
    {
	fprintf(stderr, "No renderers found\n");
	return ENOENT;
    }
    return 0;
}


        /* List */


static int List()
{
    cast::Renderers renderers;
    if (Find(&renderers))
	return 1;

    for (unsigned int i=0; i<renderers.size(); ++i)
    {
	const cast::Renderer& r = renderers[i];
	printf("%2u  %s\n", i+1, r.description.GetFriendlyName().c_str());
	printf("      %s\n", r.device.location.c_str());
	printf("      AVTransport:      %s\n",
	       r.description.GetAVTransportControlURL().c_str());
	if (!r.description.GetRenderingControlControlURL().empty())
	    printf("      RenderingControl: %s\n",
		   r.description.GetRenderingControlControlURL().c_str());
    }
    return 0;
}


        /* Play */


static const cast::Renderer *ChooseRenderer(const cast::Renderers& renderers)
{
    if (!s_device)
	return &renderers[0];

    char *endptr;
    unsigned long index = strtoul(s_device, &endptr, 10);
    if (*s_device && !*endptr)
    {
	if (index >= 1 && index <= renderers.size())
	    return &renderers[index-1];
	return NULL;
    }

    for (cast::Renderers::const_iterator i = renderers.begin();
	 i != renderers.end();
	 ++i)
    {
	if (i->description.GetFriendlyName() == s_device)
	    return &*i;
    }
    return NULL;
}

static cast::SubtitleRef ChooseSubtitle()
{
    if (!s_subtitle)
	return cast::SubtitleRef();

    char *endptr;
    unsigned long track = strtoul(s_subtitle, &endptr, 10);
    if (*s_subtitle && !*endptr)
	return cast::SubtitleRef::EmbeddedTrack((unsigned int)track);
    return cast::SubtitleRef::ExternalFile(s_subtitle);
}

static void PrintPosition(const cast::PlaybackSession& session)
{
    cast::PositionInfo pi;
    unsigned int rc = session.GetPosition(&pi);
    if (rc)
    {
	TRACE << "Can't get position: " << util::StrError(rc) << "\n";
	return;
    }
    printf("\r%s / %s %s", pi.rel_time.c_str(),
	   pi.duration.empty() ? "--:--:--" : pi.duration.c_str(),
	   session.IsPaused() ? "(paused)" : "        ");
    fflush(stdout);
}

/** Returns false if the user wants to stop.
 */
static bool OnCommand(const char *line, cast::PlaybackSession *session)
{
    unsigned int rc = 0;
    cast::PositionInfo pi;

    switch (line[0])
    {
    case 'q':
	return false;
    case 'p':
	rc = session->IsPaused() ? session->Resume() : session->Pause();
	break;
    case 'f':
    case 'b':
	rc = session->GetPosition(&pi);
	if (rc == 0)
	{
	    unsigned int secs = cast::ParseTimeCode(pi.rel_time);
	    if (line[0] == 'f')
		secs += 30;
	    else
		secs = (secs > 30) ? secs - 30 : 0;
	    rc = session->Seek(secs);
	}
	break;
    case '+':
    case '-':
    {
	int volume = (int)session->GetVolume();
	rc = session->SetVolume(line[0] == '+' ? volume + 5 : volume - 5);
	break;
    }
    case 'm':
	rc = session->SetMute(!session->GetMute());
	break;
    default:
	break;
    }

    if (rc)
	fprintf(stderr, "\nRenderer says no: %s\n", util::StrError(rc));
    return true;
}

static int Play(const char *filename)
{
    cast::Renderers renderers;
    if (Find(&renderers))
	return 1;

    const cast::Renderer *renderer = ChooseRenderer(renderers);
    if (!renderer)
    {
	fprintf(stderr, "No renderer '%s' (try 'dlnacast list')\n", s_device);
	return 1;
    }

    printf("Playing %s on %s\n", filename,
	   renderer->description.GetFriendlyName().c_str());

    cast::PlaybackSession session;
    unsigned int rc = session.Start(
	renderer->description.GetAVTransportControlURL(), filename,
	renderer->description.GetRenderingControlControlURL(),
	ChooseSubtitle(), s_port);
    if (rc)
    {
	fprintf(stderr, "Can't play %s: %s\n", filename, util::StrError(rc));
	return 1;
    }

    while (session.GetState() == cast::STARTING)
	usleep(100*1000);

    if (!session.IsActive())
    {
	fprintf(stderr, "Renderer refused to play %s\n", filename);
	return 1;
    }

    printf("Serving %s\n", session.GetMediaURL().c_str());

    bool quit = false;
    while (!quit && session.IsActive())
    {
	PrintPosition(session);

	struct pollfd pfd;
	pfd.fd = 0;
	pfd.events = POLLIN;
	pfd.revents = 0;
	int prc = ::poll(&pfd, 1, 1000);
	if (prc < 0 && errno != EINTR)
	    break;
	if (prc <= 0)
	    continue;

	char line[80];
	if (!fgets(line, sizeof(line), stdin))
	    break; // EOF
	quit = !OnCommand(line, &session);
    }

    printf("\n");
    session.Stop();
    return 0;
}


        /* Main program */


int Main(int argc, char *argv[])
{
    static const struct option options[] =
    {
	{ "help", no_argument, NULL, 'h' },
	{ "version", no_argument, NULL, 'v' },
	{ "timeout", required_argument, NULL, 't' },
	{ "port", required_argument, NULL, 'p' },
	{ "device", required_argument, NULL, 'd' },
	{ "subtitle", required_argument, NULL, 's' },
	{ NULL, 0, NULL, 0 }
    };

    int option_index;
    int option;
    while ((option = getopt_long(argc, argv, "hvt:p:d:s:", options,
				 &option_index))
	   != -1)
    {
	switch (option)
	{
	case 'h':
	    Usage(stdout);
	    return 0;
	case 'v':
	    Version();
	    return 0;
	case 't':
	    s_timeout_secs = (unsigned int)strtoul(optarg, NULL, 10);
	    if (!s_timeout_secs)
		s_timeout_secs = 1;
	    break;
	case 'p':
	    if (util::ParsePort(optarg, &s_port))
	    {
		fprintf(stderr, "Bad port '%s'\n", optarg);
		Usage(stderr);
		return 1;
	    }
	    break;
	case 'd':
	    s_device = optarg;
	    break;
	case 's':
	    s_subtitle = optarg;
	    break;
	default:
	    Usage(stderr);
	    return 1;
	}
    }

    if (argc == optind)
    {
	Usage(stderr);
	return 1;
    }

    if (!strcmp(argv[optind], "list") && argc == optind+1)
	return List();

    if (!strcmp(argv[optind], "play") && argc == optind+2)
	return Play(argv[optind+1]);

    Usage(stderr);
    return 1;
}

} // namespace dlnacast

int main(int argc, char *argv[])
{
    return dlnacast::Main(argc, argv);
}
