#include "ip_config.h"
#include "socket.h"
#include "trace.h"
#include "errors.h"

namespace util {

IPAddress GetOutboundAddress()
{
    DatagramSocket s;
    if (!s.IsOpen())
	return IPAddress::LOOPBACK;

    IPEndPoint target = { IPAddress::FromDottedQuad(8,8,8,8), 80 };
    unsigned int rc = s.Connect(target);
    if (rc)
    {
	TRACE << "No outbound route (" << rc << "), using loopback\n";
	return IPAddress::LOOPBACK;
    }

    IPEndPoint ep = s.GetLocalEndPoint();
    if (ep.addr == IPAddress::ANY)
	return IPAddress::LOOPBACK;
    return ep.addr;
}

} // namespace util

#ifdef TEST

#include <assert.h>

int main()
{
    util::IPAddress ip = util::GetOutboundAddress();

    // Whatever the network, we must get a usable unicast address
    assert(ip != util::IPAddress::ANY);

    TRACE << "Outbound address " << ip.ToString() << "\n";

    return 0;
}

#endif
