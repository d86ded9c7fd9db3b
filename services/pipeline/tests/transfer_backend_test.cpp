#include "../include/errors.hpp"
#include "../include/process.hpp"
#include "../include/rsync_backend.hpp"
#include "../include/smb_backend.hpp"
#include "../include/transfer_backend.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

JobRecord movie(const std::string& dest) {
    JobDescriptor d;
    d.title = "Arrival";
    d.content_type = "movie";
    d.year = 2016;
    d.quality = "1080p";
    d.source_url = "https://cdn.example.net/arrival.mkv";
    d.backend_id = "nas";
    d.destination_path = dest;
    JobRecord j = make_record("m1", d, 1000);
    j.local_path = "/tmp/mediadown/job_m1.mkv";
    return j;
}

bool contains(const std::vector<std::string>& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

}

TEST(Protocol, NamesAndDefaults) {
    EXPECT_EQ(protocol_from_string("SFTP"), Protocol::Sftp);
    EXPECT_EQ(protocol_from_string("cifs"), Protocol::Smb);
    EXPECT_EQ(protocol_from_string("rsync"), Protocol::Rsync);
    EXPECT_FALSE(protocol_from_string("ftp").has_value());
    EXPECT_STREQ(to_string(Protocol::Nfs), "nfs");
    EXPECT_EQ(default_port(Protocol::Sftp), 22);
    EXPECT_EQ(default_port(Protocol::Nfs), 2049);
    EXPECT_EQ(default_port(Protocol::Smb), 445);
}

TEST(Bandwidth, ParsesUnits) {
    EXPECT_EQ(parse_bandwidth(""), 0);
    EXPECT_EQ(parse_bandwidth("4096"), 4096);
    EXPECT_EQ(parse_bandwidth("512KB/s"), 512 * 1024);
    EXPECT_EQ(parse_bandwidth("100MB/s"), 100LL * 1024 * 1024);
    EXPECT_EQ(parse_bandwidth("1 gb/s"), 1024LL * 1024 * 1024);
    EXPECT_THROW(parse_bandwidth("fast"), ValidationError);
    EXPECT_THROW(parse_bandwidth("10PB/s"), ValidationError);
    EXPECT_THROW(parse_bandwidth("."), ValidationError);
    EXPECT_THROW(parse_bandwidth("/s"), ValidationError);
    EXPECT_THROW(parse_bandwidth("..MB/s"), ValidationError);
}

TEST(ResolveDestination, JoinsBasePathAndFileName) {
    BackendDescriptor d = make_descriptor("nas");
    EXPECT_EQ(resolve_destination(d, movie("movies/")), "/media/movies/Arrival (2016).mkv");
    EXPECT_EQ(resolve_destination(d, movie("movies/arrival.mkv")), "/media/movies/arrival.mkv");
    EXPECT_EQ(resolve_destination(d, movie("/srv/films/")), "/srv/films/Arrival (2016).mkv");
    EXPECT_EQ(resolve_destination(d, movie("")), "/media/Arrival (2016).mkv");
    d.base_path = "";
    EXPECT_EQ(resolve_destination(d, movie("films/")), "/films/Arrival (2016).mkv");
}

TEST(ResolveDestination, RejectsParentComponents) {
    BackendDescriptor d = make_descriptor("nas");
    EXPECT_THROW(resolve_destination(d, movie("../../../outside/")), ValidationError);
    EXPECT_THROW(resolve_destination(d, movie("movies/../../etc/passwd")), ValidationError);
    EXPECT_THROW(resolve_destination(d, movie("/srv/../etc/")), ValidationError);
    EXPECT_THROW(check_destination_path(".."), ValidationError);
    EXPECT_NO_THROW(check_destination_path("movies/..hidden/"));
}

TEST(ResolveDestination, NormalizesAndKeepsTitleInOneComponent) {
    BackendDescriptor d = make_descriptor("nas");
    EXPECT_EQ(resolve_destination(d, movie("./movies//")), "/media/movies/Arrival (2016).mkv");

    JobRecord j = movie("music/");
    j.title = "AC/DC ../../Live";
    EXPECT_EQ(destination_filename(j), "AC-DC ..-..-Live (2016).mkv");
    EXPECT_EQ(resolve_destination(d, j), "/media/music/AC-DC ..-..-Live (2016).mkv");
}

TEST(DfOutput, ParsesSecondLine) {
    auto u = parse_df_output(
        "Filesystem     1024-blocks      Used Available Capacity Mounted on\n"
        "/dev/sdb1         1000000    250000    750000      25% /media\n");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->total, 1000000ULL * 1024);
    EXPECT_EQ(u->used, 250000ULL * 1024);
    EXPECT_EQ(u->available, 750000ULL * 1024);
    EXPECT_DOUBLE_EQ(u->percent, 25.0);
    EXPECT_FALSE(parse_df_output("Filesystem only\n").has_value());
    EXPECT_FALSE(parse_df_output("").has_value());
}

TEST(SshArgv, UsesKeyAndBatchMode) {
    BackendDescriptor d = make_descriptor("box", Protocol::Rsync);
    d.username = "media";
    d.ssh_key_path = "/etc/mediadown/id_ed25519";
    d.port = 2222;
    d.connect_timeout_ms = 15000;
    auto argv = ssh_argv(d, "echo test");
    EXPECT_EQ(argv.front(), "ssh");
    EXPECT_TRUE(contains(argv, "2222"));
    EXPECT_TRUE(contains(argv, "/etc/mediadown/id_ed25519"));
    EXPECT_TRUE(contains(argv, "BatchMode=yes"));
    EXPECT_TRUE(contains(argv, "ConnectTimeout=15"));
    EXPECT_EQ(argv[argv.size() - 2], "media@media.example.net");
    EXPECT_EQ(argv.back(), "echo test");
}

TEST(RsyncProgress, ParsesProgressLines) {
    auto p = parse_rsync_progress("      1,048,576  42%   10.50MB/s    0:00:03");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->bytes, 1048576);
    EXPECT_EQ(p->percent, 42);
    EXPECT_DOUBLE_EQ(p->rate, 10.5 * 1024 * 1024);

    auto k = parse_rsync_progress("  32,768 100%  512.00kB/s    0:00:00 (xfr#1, to-chk=0/1)");
    ASSERT_TRUE(k.has_value());
    EXPECT_EQ(k->percent, 100);
    EXPECT_DOUBLE_EQ(k->rate, 512.0 * 1024);

    EXPECT_FALSE(parse_rsync_progress("sending incremental file list").has_value());
    EXPECT_FALSE(parse_rsync_progress("job_1.mkv").has_value());
    EXPECT_FALSE(parse_rsync_progress("").has_value());
}

TEST(RsyncExit, ClassifiesRetryable) {
    EXPECT_TRUE(rsync_exit_retryable(10, ""));
    EXPECT_TRUE(rsync_exit_retryable(23, ""));
    EXPECT_TRUE(rsync_exit_retryable(30, ""));
    EXPECT_FALSE(rsync_exit_retryable(1, ""));
    EXPECT_FALSE(rsync_exit_retryable(3, ""));
    EXPECT_TRUE(rsync_exit_retryable(255, "ssh: connect to host x port 22: Connection refused"));
    EXPECT_FALSE(rsync_exit_retryable(255, "media@x: Permission denied (publickey)."));
    EXPECT_FALSE(rsync_exit_retryable(255, "Host key verification failed."));
}

TEST(RsyncArgv, CarriesLimitAndRemoteMkdir) {
    BackendDescriptor d = make_descriptor("box", Protocol::Rsync);
    d.username = "media";
    d.bandwidth_limit_bps = 2 * 1024 * 1024;
    RsyncBackend backend(d);
    auto argv = backend.rsync_argv("/tmp/job_1.mkv", "/media/movies/Arrival (2016).mkv");
    EXPECT_EQ(argv.front(), "rsync");
    EXPECT_TRUE(contains(argv, "--partial"));
    EXPECT_TRUE(contains(argv, "--bwlimit=2048"));
    EXPECT_TRUE(contains(argv, "--rsync-path=mkdir -p '/media/movies' && rsync"));
    EXPECT_EQ(argv[argv.size() - 2], "/tmp/job_1.mkv");
    EXPECT_EQ(argv.back(), "media@media.example.net:/media/movies/Arrival (2016).mkv");
}

TEST(Smb, StatusParsingAndService) {
    EXPECT_EQ(smb_status("session setup failed: NT_STATUS_LOGON_FAILURE\n"), "NT_STATUS_LOGON_FAILURE");
    EXPECT_EQ(smb_status("putting file ... NT_STATUS_IO_TIMEOUT."), "NT_STATUS_IO_TIMEOUT");
    EXPECT_EQ(smb_status("all good"), "");
    EXPECT_FALSE(smb_status_retryable("NT_STATUS_ACCESS_DENIED"));
    EXPECT_FALSE(smb_status_retryable("NT_STATUS_BAD_NETWORK_NAME"));
    EXPECT_TRUE(smb_status_retryable("NT_STATUS_IO_TIMEOUT"));

    BackendDescriptor d = make_descriptor("smb", Protocol::Smb);
    d.host = "fileserver/media";
    SmbBackend from_host(d);
    EXPECT_EQ(from_host.service(), "//fileserver/media");

    d.host = "fileserver";
    d.share = "videos";
    d.username = "svc";
    d.password = "secret";
    SmbBackend backend(d);
    ProcessSpec spec = backend.command("ls");
    EXPECT_EQ(spec.argv[1], "//fileserver/videos");
    EXPECT_TRUE(contains(spec.argv, "445"));
    EXPECT_FALSE(contains(spec.argv, "secret"));
    EXPECT_FALSE(contains(spec.argv, "-N"));
}

TEST(Process, CapturesOutputAndExitCode) {
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "printf 'one\\rtwo\\nthree'; echo oops >&2; exit 3"};
    std::vector<std::string> lines;
    LineSplitter splitter([&](const std::string& l) { lines.push_back(l); });
    ProcessResult r = run_process(spec, nullptr, [&](const char* d, std::size_t n) { splitter.feed(d, n); });
    splitter.finish();
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.timed_out);
    EXPECT_NE(r.stderr_text.find("oops"), std::string::npos);
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(Process, MissingToolExits127) {
    ProcessSpec spec;
    spec.argv = {"definitely-not-installed-tool-xyz"};
    ProcessResult r = run_process(spec, nullptr, nullptr);
    EXPECT_EQ(r.exit_code, kExecFailedExit);
}

TEST(Process, TimeoutAndAbortKillChild) {
    ProcessSpec spec;
    spec.argv = {"sleep", "30"};
    spec.timeout_ms = 200;
    ProcessResult r = run_process(spec, nullptr, nullptr);
    EXPECT_TRUE(r.timed_out);

    ProcessSpec forever;
    forever.argv = {"sleep", "30"};
    StageContext ctx("p1", 0, system_now_ms);
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ctx.request_abort("cancel");
    });
    EXPECT_THROW(run_process(forever, &ctx, nullptr), JobAborted);
    canceller.join();
}

TEST(Process, ShellQuote) {
    EXPECT_EQ(shell_quote("/media/movies"), "'/media/movies'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}
