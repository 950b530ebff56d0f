#include <gtest/gtest.h>
#include "core/Logging.h"
#include "net/NamespacePathResolver.h"

namespace sock_scan {

class NamespacePathResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }

    static NamespacePathResolver::VersionProbe fixed(KernelVersion v) {
        return [v](KernelVersion& out, std::string&) {
            out = v;
            return true;
        };
    }
};

TEST_F(NamespacePathResolverTest, ModernKernelUsesNsNet) {
    NamespacePathResolver r(fixed({5, 15, 0}));
    EXPECT_EQ(r.suffix(), "ns/net");
    EXPECT_FALSE(r.fallback_used());
}

TEST_F(NamespacePathResolverTest, BoundaryIsThreeEight) {
    NamespacePathResolver exact(fixed({3, 8, 0}));
    EXPECT_EQ(exact.suffix(), NamespacePathResolver::kModernSuffix);

    NamespacePathResolver below(fixed({3, 7, 10}));
    EXPECT_EQ(below.suffix(), NamespacePathResolver::kLegacySuffix);

    NamespacePathResolver ancient(fixed({2, 6, 32}));
    EXPECT_EQ(ancient.suffix(), "net/dev");
}

TEST_F(NamespacePathResolverTest, ProbeFailureFallsBackToModern) {
    NamespacePathResolver r([](KernelVersion&, std::string& err) {
        err = "unparsable release";
        return false;
    });
    EXPECT_EQ(r.suffix(), "ns/net");
    EXPECT_TRUE(r.fallback_used());
    EXPECT_NE(r.fallback_reason().find("unparsable release"), std::string::npos);
}

TEST_F(NamespacePathResolverTest, NullProbeFallsBack) {
    NamespacePathResolver r(nullptr);
    EXPECT_EQ(r.suffix(), "ns/net");
    EXPECT_TRUE(r.fallback_used());
}

TEST_F(NamespacePathResolverTest, ResolvesOnce) {
    int calls = 0;
    NamespacePathResolver r([&calls](KernelVersion& v, std::string&) {
        ++calls;
        v = calls == 1 ? KernelVersion{3, 2, 0} : KernelVersion{6, 0, 0};
        return true;
    });
    EXPECT_FALSE(r.resolved());
    EXPECT_EQ(r.suffix(), "net/dev");
    EXPECT_TRUE(r.resolved());
    EXPECT_EQ(r.suffix(), "net/dev");
    EXPECT_EQ(calls, 1);
}

TEST_F(NamespacePathResolverTest, RunningKernelResolves) {
    NamespacePathResolver r;
    const std::string& s = r.suffix();
    EXPECT_TRUE(s == "ns/net" || s == "net/dev");
}

}
