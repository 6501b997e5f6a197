#include "download_task.hpp"
#include "test_runner_utils.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

using srmsync::test::FakeRemote;
using srmsync::test::TestCase;
using srmsync::test::TestContext;
using srmsync::test::kFakeHost;
using srmsync::test::make_workspace;
using srmsync::test::write_file;

std::string url(const std::string& path) {
  return std::string(kFakeHost) + path;
}

bool test_missing_destination_is_pending(TestContext& ctx) {
  auto dir = make_workspace("task_missing");
  DownloadTask task(url("/pnfs/a.root"), dir / "a.root", 100);
  ctx.expect(task.status() == DownloadTask::Status::Pending, "missing file is pending");
  ctx.expect(!fs::exists(dir / "a.root"), "nothing created on construction");
  return true;
}

bool test_complete_destination_is_done(TestContext& ctx) {
  auto dir = make_workspace("task_complete");
  write_file(dir / "exact.root", 100);
  write_file(dir / "bigger.root", 150);
  DownloadTask exact(url("/pnfs/exact.root"), dir / "exact.root", 100);
  DownloadTask bigger(url("/pnfs/bigger.root"), dir / "bigger.root", 100);
  ctx.expect(exact.done(), "same size is done");
  ctx.expect(bigger.done(), "larger local file is done");
  ctx.expect(fs::file_size(dir / "bigger.root") == 150, "larger file left alone");
  return true;
}

bool test_partial_destination_removed(TestContext& ctx) {
  auto dir = make_workspace("task_partial");
  write_file(dir / "part.root", 40);
  auto logger = std::make_shared<Logger>("task-test");
  ctx.logs.attach(logger);
  DownloadTask task(url("/pnfs/part.root"), dir / "part.root", 100, logger.get());
  ctx.expect(task.status() == DownloadTask::Status::Pending, "partial file is pending");
  ctx.expect(!fs::exists(dir / "part.root"), "partial file removed");
  ctx.expect(ctx.logs.contains("Disk size of"), "removal logged");
  ctx.expect(ctx.logs.contains("is 40, but 100 is expected from SRM, removing"), "sizes in the warning");
  return true;
}

bool test_run_copies_and_marks_done(TestContext& ctx) {
  auto dir = make_workspace("task_run");
  FakeRemote remote;
  remote.add_file("/pnfs/root/A/f1.root", 100);
  DownloadTask task(url("/pnfs/root/A/f1.root"), dir / "A" / "f1.root", 100);
  auto outcome = task.run(remote.runner(), CopySettings{});
  ctx.expect(outcome == DownloadTask::Outcome::Downloaded, "downloaded");
  ctx.expect(task.done(), "done after a successful copy");
  ctx.expect(fs::is_directory(dir / "A"), "parent directory created");
  ctx.expect(fs::exists(dir / "A" / "f1.root") && fs::file_size(dir / "A" / "f1.root") == 100,
             "file has the remote size");
  auto copied = remote.copied_paths();
  ctx.expect(copied.size() == 1 && copied[0] == "/pnfs/root/A/f1.root", "one copy of the origin");

  auto again = task.run(remote.runner(), CopySettings{});
  ctx.expect(again == DownloadTask::Outcome::AlreadyComplete, "second run is a no-op");
  ctx.expect(remote.copied_paths().size() == 1, "no second copy");
  return true;
}

bool test_failed_copy_reported(TestContext& ctx) {
  auto dir = make_workspace("task_fail");
  FakeRemote remote;
  remote.add_file("/pnfs/f.root", 10);
  remote.fail_copy("/pnfs/f.root");
  auto logger = std::make_shared<Logger>("task-test");
  ctx.logs.attach(logger);
  DownloadTask task(url("/pnfs/f.root"), dir / "f.root", 10);
  auto outcome = task.run(remote.runner(), CopySettings{}, logger.get());
  ctx.expect(outcome == DownloadTask::Outcome::Failed, "copy failure reported");
  ctx.expect(!task.done(), "still pending");
  ctx.expect(ctx.logs.contains("exited with status code 70"), "exit code logged");
  ctx.expect(ctx.logs.contains("Communication error on send"), "stderr logged");
  return true;
}

bool test_copy_gets_environment(TestContext& ctx) {
  auto dir = make_workspace("task_env");
  FakeRemote remote;
  remote.add_file("/pnfs/f.root", 10);
  CopySettings copy;
  copy.env.variables["LD_LIBRARY_PATH"] = "/opt/gfal/lib";
  DownloadTask task(url("/pnfs/f.root"), dir / "f.root", 10);
  task.run(remote.runner(), copy);
  auto envs = remote.copy_environments();
  ctx.expect(envs.size() == 1, "one copy");
  if(!envs.empty()) {
    ctx.expect(envs[0].variables.count("LD_LIBRARY_PATH") == 1 &&
               envs[0].variables.at("LD_LIBRARY_PATH") == "/opt/gfal/lib",
               "overlay reaches the copy command");
  }
  return true;
}

bool test_describe(TestContext& ctx) {
  auto dir = make_workspace("task_describe");
  DownloadTask task(url("/pnfs/f.root"), dir / "f.root", 1536);
  auto text = task.describe(CopySettings{});
  ctx.expect(text.rfind("% gfal-copy " + url("/pnfs/f.root") + " ", 0) == 0, "command line first");
  ctx.expect(text.find("(1.5KiB, TODO)") != std::string::npos, "size and state");

  write_file(dir / "g.root", 5);
  DownloadTask done(url("/pnfs/g.root"), dir / "g.root", 5);
  ctx.expect(done.describe(CopySettings{}).find("(5.0B, DONE)") != std::string::npos, "done state");
  return true;
}

bool test_copy_arguments_use_absolute_destination(TestContext& ctx) {
  CopySettings copy;
  copy.command = {"gfal-copy", "-p"};
  DownloadTask task(url("/pnfs/f.root"), "relative/f.root", 1);
  auto argv = task.copy_arguments(copy);
  ctx.expect(argv.size() == 4, "command, flag, source, destination");
  if(argv.size() == 4) {
    ctx.expect(argv[1] == "-p", "extra flag kept");
    ctx.expect(argv[2] == url("/pnfs/f.root"), "source url");
    ctx.expect(fs::path(argv[3]).is_absolute(), "absolute destination");
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"missing_destination_is_pending", test_missing_destination_is_pending},
    {"complete_destination_is_done", test_complete_destination_is_done},
    {"partial_destination_removed", test_partial_destination_removed},
    {"run_copies_and_marks_done", test_run_copies_and_marks_done},
    {"failed_copy_reported", test_failed_copy_reported},
    {"copy_gets_environment", test_copy_gets_environment},
    {"describe", test_describe},
    {"copy_arguments_use_absolute_destination", test_copy_arguments_use_absolute_destination},
  };
  return srmsync::test::run_tests("download task", tests, argc, argv);
}
