#include <gtest/gtest.h>
#include <core/credentials.hpp>

static HostCredential host(const std::string& id, int max_sessions = 0) {
    HostCredential h;
    h.host_id = id;
    h.address = id + ".lan";
    h.user = "plex";
    h.password = "hunter2";
    h.port = 2222;
    h.max_sessions = max_sessions;
    return h;
}

TEST(Credentials, LookupByHostId) {
    HostCredentialStore store({host("nas"), host("seedbox")});
    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.contains("nas"));
    EXPECT_FALSE(store.contains("other"));

    auto r = store.get("seedbox");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.address, "seedbox.lan");
    EXPECT_EQ(store.find("other"), nullptr);
}

TEST(Credentials, UnknownHostIsInvalidDestination) {
    HostCredentialStore store;
    EXPECT_TRUE(store.empty());
    auto r = store.get("nas");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidDestination);
}

TEST(Credentials, PutReplaces) {
    HostCredentialStore store;
    store.put(host("nas"));
    auto changed = host("nas");
    changed.address = "10.0.0.5";
    store.put(changed);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find("nas")->address, "10.0.0.5");
}

TEST(Credentials, HostIdsSorted) {
    HostCredentialStore store({host("zeta"), host("alpha"), host("mid")});
    std::vector<std::string> expected = {"alpha", "mid", "zeta"};
    EXPECT_EQ(store.host_ids(), expected);
}

TEST(Credentials, SessionLimitOverride) {
    HostCredentialStore store({host("nas", 1), host("seedbox")});
    EXPECT_EQ(store.session_limit("nas", 4), 1);
    EXPECT_EQ(store.session_limit("seedbox", 4), 4);
}

TEST(Credentials, DescribeHostOmitsSecrets) {
    auto h = host("nas");
    std::string text = describe_host(h);
    EXPECT_EQ(text, "plex@nas.lan:2222");
    EXPECT_EQ(text.find("hunter2"), std::string::npos);
}
