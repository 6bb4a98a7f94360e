#include <gtest/gtest.h>
#include "libnsdp/transport/udp_transport.h"
#include <climits>

using namespace libnsdp;

TEST(UdpTransport, PollTimeoutClamped) {
    EXPECT_EQ(UdpTransport::pollTimeout(0), 0);
    EXPECT_EQ(UdpTransport::pollTimeout(10000), 10000);
    EXPECT_EQ(UdpTransport::pollTimeout(static_cast<uint32_t>(INT_MAX)), INT_MAX);
    EXPECT_EQ(UdpTransport::pollTimeout(static_cast<uint32_t>(INT_MAX) + 1u), INT_MAX);
    EXPECT_EQ(UdpTransport::pollTimeout(0xFFFFFFFFu), INT_MAX);
}

TEST(UdpTransport, UnknownInterface) {
    UdpTransport transport("nsdp-no-such-if0");
    auto r = transport.open();
    EXPECT_TRUE(r.failed());
    EXPECT_FALSE(transport.isOpen());
    EXPECT_EQ(transport.interfaceName(), "nsdp-no-such-if0");
}
