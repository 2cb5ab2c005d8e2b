#include <gtest/gtest.h>
#include <cli/report_view.hpp>

TEST(ReportView, ExitCodes) {
    EXPECT_EQ(exit_code_for(RunStatus::Success), 0);
    EXPECT_EQ(exit_code_for(RunStatus::PartialFailure), 2);
    EXPECT_EQ(exit_code_for(RunStatus::Failed), 1);
}

TEST(ReportView, ListsEveryJobAndStatus) {
    RunReport report;
    report.run_id = "run-1";
    TransferJob job;
    job.job_id = "pilot";
    job.dest_host_id = "nas";
    job.dest_path = "/tv/Pilot.mkv";
    report.jobs = {job};

    TransferResult r;
    r.job_id = "pilot";
    r.status = TransferStatus::Failed;
    r.error_kind = ErrorKind::ConnectionLost;
    r.error = "Connection reset by peer";
    r.attempts = 3;
    r.staging_left = true;
    report.results = {r};
    report.overall_status = RunStatus::Failed;

    std::string text = render_report(report);
    EXPECT_NE(text.find("pilot"), std::string::npos);
    EXPECT_NE(text.find("nas:/tv/Pilot.mkv"), std::string::npos);
    EXPECT_NE(text.find("ConnectionLost after 3 attempts"), std::string::npos);
    EXPECT_NE(text.find("/tv/Pilot.mkv.partial"), std::string::npos);
    EXPECT_NE(text.find("run-1"), std::string::npos);
}

TEST(ReportView, HostListingHidesPasswords) {
    HostCredential h;
    h.host_id = "nas";
    h.address = "10.0.0.2";
    h.user = "plex";
    h.password = "hunter2";
    HostCredentialStore hosts({h});

    std::string text = render_hosts(hosts, 2);
    EXPECT_NE(text.find("plex@10.0.0.2:22"), std::string::npos);
    EXPECT_EQ(text.find("hunter2"), std::string::npos);
}
