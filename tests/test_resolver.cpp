#include <gtest/gtest.h>
#include <core/resolver.hpp>

TEST(ResolvedAddress, UnknownSentinel) {
    auto addr = ResolvedAddress::unknown();
    EXPECT_FALSE(addr.known());
    EXPECT_EQ(addr.str(), "unknown");
}

TEST(ResolvedAddress, Known) {
    auto addr = ResolvedAddress::of("192.0.2.7");
    EXPECT_TRUE(addr.known());
    EXPECT_EQ(addr.str(), "192.0.2.7");
}

TEST(SystemResolver, NumericAddressNeedsNoLookup) {
    SystemResolver resolver;
    auto addr = resolver.resolve("192.0.2.7");
    EXPECT_TRUE(addr.known());
    EXPECT_EQ(addr.str(), "192.0.2.7");
}

TEST(SystemResolver, UnresolvableHostIsUnknown) {
    // .invalid is reserved and never resolves (RFC 6761)
    SystemResolver resolver;
    auto addr = resolver.resolve("no-such-host.invalid");
    EXPECT_FALSE(addr.known());
    EXPECT_EQ(addr.str(), "unknown");
}

TEST(SystemResolver, EmptyHostIsUnknown) {
    SystemResolver resolver;
    EXPECT_EQ(resolver.resolve("").str(), "unknown");
}
