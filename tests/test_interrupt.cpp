#include <gtest/gtest.h>
#include <cli/plexmover_cli.hpp>
#include <transfer/job_scheduler.hpp>
#include "fake_remote.hpp"

class InterruptTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeRemoteHost host{"seedbox"};
    FakeSessionFactory factory;
    HostCredentialStore hosts;
    RunSettings settings = fast_settings();
    FakeClock clock;

    void SetUp() override {
        factory.add_host(host);
        hosts.put(fake_host_credential("seedbox"));
    }
};

TEST_F(InterruptTest, NothingToCancelWithoutActiveRun) {
    EXPECT_FALSE(cancel_active_run());
}

TEST_F(InterruptTest, NoticeGoesThroughRegisteredOutput) {
    ConnectionManager connections(hosts, settings, factory);
    TransferEngine engine(settings);
    RetryCoordinator coordinator(connections, engine, settings, clock, 1);
    JobScheduler scheduler(connections, coordinator, settings);

    std::vector<std::string> printed;
    {
        ActiveRunGuard guard(scheduler, [&](const std::string& text) { printed.push_back(text); });
        EXPECT_TRUE(cancel_active_run());
    }
    ASSERT_EQ(printed.size(), 1u);
    EXPECT_NE(printed[0].find("cancelling transfers"), std::string::npos);

    // The cancel reached the scheduler: the next run starts cancelled
    auto job = make_job("late", dir.write("late.mkv", payload(1000)), "seedbox", "/srv/media/late.mkv");
    auto report = scheduler.run({job});
    EXPECT_EQ(report.results[0].error_kind, ErrorKind::Cancelled);
    EXPECT_EQ(host.upload_count(), 0);
    connections.close_all();
}

TEST_F(InterruptTest, GuardUnregistersOnExit) {
    ConnectionManager connections(hosts, settings, factory);
    TransferEngine engine(settings);
    RetryCoordinator coordinator(connections, engine, settings, clock, 1);
    JobScheduler scheduler(connections, coordinator, settings);

    int announcements = 0;
    {
        ActiveRunGuard guard(scheduler, [&](const std::string&) { announcements++; });
    }
    EXPECT_FALSE(cancel_active_run());
    EXPECT_EQ(announcements, 0);
}
