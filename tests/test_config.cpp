#include <gtest/gtest.h>
#include <core/config.hpp>
#include "fake_remote.hpp"
#include <cstdlib>

static const char* SAMPLE = R"(
hosts:
  seedbox:
    address: "seedbox.example.net"
    port: 2200
    user: "media"
    password: "pw"
    max_sessions: 1
    remote_base: "/home/media/watch"
  nas:
    host: "10.0.0.2"
    username: "plex"
    key_path: "/keys/id_ed25519"
run:
  max_attempts: 5
  scheduler_concurrency: 8
  backoff_base_ms: 250
  backoff_jitter: 0.1
  verify_checksum: false
notify:
  webhook_url: "https://hooks.example.net/plex"
  when: "failure"
)";

// Clears the REMOTE_* overlay variables (and the config path override) around each test
class ConfigEnvTest : public ::testing::Test {
protected:
    const char* vars[8] = {"REMOTE_HOST", "REMOTE_PORT", "REMOTE_USERNAME", "REMOTE_PASSWORD",
                           "REMOTE_PATH_BASE", "REMOTE_KEY_PATH", "PLEXMOVER_WEBHOOK_URL",
                           "PLEXMOVER_CONFIG"};
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }
    void clear() {
        for (auto* v : vars) unsetenv(v);
    }
};

TEST(Config, ParsesHostsRunAndNotify) {
    auto r = Config::parse(SAMPLE);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    ASSERT_EQ(c.hosts().size(), 2u);
    const auto* seedbox = c.hosts().find("seedbox");
    ASSERT_NE(seedbox, nullptr);
    EXPECT_EQ(seedbox->address, "seedbox.example.net");
    EXPECT_EQ(seedbox->port, 2200);
    EXPECT_EQ(seedbox->max_sessions, 1);
    EXPECT_EQ(seedbox->remote_base, "/home/media/watch");

    const auto* nas = c.hosts().find("nas");
    ASSERT_NE(nas, nullptr);
    EXPECT_EQ(nas->address, "10.0.0.2");
    EXPECT_EQ(nas->user, "plex");
    EXPECT_EQ(nas->port, 22);
    ASSERT_TRUE(nas->ssh_key_path.has_value());
    EXPECT_EQ(*nas->ssh_key_path, "/keys/id_ed25519");

    EXPECT_EQ(c.run().max_attempts, 5);
    EXPECT_EQ(c.run().scheduler_concurrency, 8);
    EXPECT_EQ(c.run().per_host_concurrency, 2);
    EXPECT_EQ(c.run().backoff_base.count(), 250);
    EXPECT_FALSE(c.run().verify_checksum);
    EXPECT_TRUE(c.run().skip_identical);

    EXPECT_EQ(c.notify().webhook_url, "https://hooks.example.net/plex");
    EXPECT_EQ(c.notify().when, NotifyWhen::Failure);
    EXPECT_TRUE(c.validate().is_ok());
}

TEST(Config, EmptyDocumentUsesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.hosts().empty());
    EXPECT_EQ(r.value.run().max_attempts, 3);
    EXPECT_EQ(r.value.notify().when, NotifyWhen::Always);
}

TEST(Config, MalformedYamlIsError) {
    auto r = Config::parse("hosts: [unclosed");
    EXPECT_TRUE(r.is_err());
}

TEST(Config, HostsMustBeMap) {
    auto r = Config::parse("hosts:\n  - a\n  - b\n");
    EXPECT_TRUE(r.is_err());
}

TEST(Config, ValidateRejectsBadValues) {
    auto r = Config::parse(SAMPLE);
    ASSERT_TRUE(r.is_ok());

    Config c = r.value;
    c.mutable_run().max_attempts = 0;
    EXPECT_TRUE(c.validate().is_err());

    c = r.value;
    c.mutable_run().backoff_jitter = 1.5;
    EXPECT_TRUE(c.validate().is_err());

    c = r.value;
    auto h = *c.hosts().find("nas");
    h.user.clear();
    c.mutable_hosts().put(h);
    EXPECT_TRUE(c.validate().is_err());

    c = r.value;
    h = *c.hosts().find("nas");
    h.port = 70000;
    c.mutable_hosts().put(h);
    EXPECT_TRUE(c.validate().is_err());
}

TEST(Config, NotifyWhenValues) {
    EXPECT_EQ(parse_notify_when("always"), NotifyWhen::Always);
    EXPECT_EQ(parse_notify_when("failure"), NotifyWhen::Failure);
    EXPECT_EQ(parse_notify_when("never"), NotifyWhen::Never);
    EXPECT_EQ(parse_notify_when("bogus"), NotifyWhen::Always);
}

TEST_F(ConfigEnvTest, EnvironmentDefinesDefaultHost) {
    setenv("REMOTE_HOST", "plex.lan", 1);
    setenv("REMOTE_USERNAME", "mover", 1);
    setenv("REMOTE_PORT", "2022", 1);
    setenv("REMOTE_PATH_BASE", "/data/incoming", 1);

    Config c;
    c.apply_environment();
    const auto* h = c.hosts().find("default");
    ASSERT_NE(h, nullptr);
    EXPECT_EQ(h->address, "plex.lan");
    EXPECT_EQ(h->user, "mover");
    EXPECT_EQ(h->port, 2022);
    EXPECT_EQ(h->remote_base, "/data/incoming");
}

TEST_F(ConfigEnvTest, NoEnvironmentLeavesHostsAlone) {
    auto r = Config::parse(SAMPLE);
    ASSERT_TRUE(r.is_ok());
    Config c = r.value;
    c.apply_environment();
    EXPECT_EQ(c.hosts().size(), 2u);
    EXPECT_FALSE(c.hosts().contains("default"));
}

TEST(Config, BareHostsKeyIsEmpty) {
    auto r = Config::parse("hosts:\n#  seedbox:\n#    address: x\nrun:\n  max_attempts: 2\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.hosts().empty());
    EXPECT_EQ(r.value.run().max_attempts, 2);
}

TEST_F(ConfigEnvTest, FreshInitWorksWithEnvironmentOnlyHost) {
    TempDir dir;
    auto config_path = dir.path() / "config.yaml";
    setenv("PLEXMOVER_CONFIG", config_path.c_str(), 1);

    ASSERT_TRUE(create_default_config().is_ok());
    ASSERT_TRUE(config_exists());

    // Untouched template alone has no hosts
    auto bare = Config::load(dir.path() / "absent.env");
    EXPECT_TRUE(bare.is_err());

    setenv("REMOTE_HOST", "plex.lan", 1);
    setenv("REMOTE_USERNAME", "mover", 1);
    auto loaded = Config::load(dir.path() / "absent.env");

    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.hosts().size(), 1u);
    const auto* h = loaded.value.hosts().find("default");
    ASSERT_NE(h, nullptr);
    EXPECT_EQ(h->address, "plex.lan");
    EXPECT_EQ(h->user, "mover");
}

TEST_F(ConfigEnvTest, EnvFileDoesNotOverrideExistingVariables) {
    TempDir dir;
    auto path = dir.write(".env",
                          "# comment\n"
                          "export REMOTE_HOST=\"from-file.lan\"\n"
                          "REMOTE_USERNAME='filer'\n"
                          "not a pair\n");
    setenv("REMOTE_USERNAME", "from-shell", 1);

    int set = load_env_file(path);

    EXPECT_EQ(set, 1);
    EXPECT_STREQ(std::getenv("REMOTE_HOST"), "from-file.lan");
    EXPECT_STREQ(std::getenv("REMOTE_USERNAME"), "from-shell");
}

TEST_F(ConfigEnvTest, MissingEnvFileSetsNothing) {
    TempDir dir;
    EXPECT_EQ(load_env_file(dir.path() / "absent.env"), 0);
}

// ── Batches ─────────────────────────────────────────────────

TEST(Batch, RelativeDestinationsJoinRemoteBase) {
    auto config = Config::parse(SAMPLE);
    ASSERT_TRUE(config.is_ok());

    auto jobs = parse_batch(R"(
jobs:
  - source: "/media/Movie.2024.mkv"
    host: seedbox
    dest: "films/Movie.2024.mkv"
    expected_size: 1234
    sha256: "abcd"
    id: movie
  - source: "/media/Show.S01E01.mkv"
    host: seedbox
  - source: "/media/Other.mkv"
    host: nas
    dest: "/volume1/other.mkv"
)", config.value);

    ASSERT_TRUE(jobs.is_ok()) << jobs.error;
    ASSERT_EQ(jobs.value.size(), 3u);

    const auto& first = jobs.value[0];
    EXPECT_EQ(first.job_id, "movie");
    EXPECT_EQ(first.dest_host_id, "seedbox");
    EXPECT_EQ(first.dest_path, "/home/media/watch/films/Movie.2024.mkv");
    ASSERT_TRUE(first.expected_size.has_value());
    EXPECT_EQ(*first.expected_size, 1234u);
    EXPECT_EQ(*first.expected_sha256, "abcd");

    EXPECT_EQ(jobs.value[1].dest_path, "/home/media/watch/Show.S01E01.mkv");
    EXPECT_TRUE(jobs.value[1].job_id.empty());
    EXPECT_EQ(jobs.value[2].dest_path, "/volume1/other.mkv");
}

TEST(Batch, HostDefaultsToDefault) {
    Config config;
    auto jobs = parse_batch("jobs:\n  - source: /a.mkv\n    dest: /b.mkv\n", config);
    ASSERT_TRUE(jobs.is_ok());
    EXPECT_EQ(jobs.value[0].dest_host_id, "default");
}

TEST(Batch, MissingSourceIsError) {
    Config config;
    auto jobs = parse_batch("jobs:\n  - dest: /b.mkv\n", config);
    EXPECT_TRUE(jobs.is_err());
}

TEST(Batch, NeedsJobsList) {
    Config config;
    EXPECT_TRUE(parse_batch("files: []\n", config).is_err());
    auto empty = parse_batch("jobs: []\n", config);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value.empty());
}

TEST(Batch, MissingFileIsError) {
    Config config;
    TempDir dir;
    EXPECT_TRUE(load_batch_file(dir.path() / "nope.yaml", config).is_err());
}

TEST(Batch, JobForFileUsesRemoteBase) {
    auto config = Config::parse(SAMPLE);
    ASSERT_TRUE(config.is_ok());
    auto job = job_for_file("/downloads/Film.mkv", "seedbox", config.value);
    EXPECT_EQ(job.dest_host_id, "seedbox");
    EXPECT_EQ(job.dest_path, "/home/media/watch/Film.mkv");

    auto fallback = job_for_file("/downloads/Film.mkv", "", config.value);
    EXPECT_EQ(fallback.dest_host_id, "default");
}
