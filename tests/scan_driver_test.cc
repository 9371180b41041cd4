#include "restart_check/scan_driver.hh"
#include "fake_procfs.hh"

#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <unistd.h>

namespace restart_check {
namespace {

using testing_util::DeniedProcFs;
using testing_util::FakeProcfs;

class ScanDriverTest : public ::testing::Test {
protected:
  ScanDriverTest() : procfs_(fake_.ProcRoot()) {}

  int ScanAll() {
    ScanDriver driver(config_, procfs_, comparator_, out_);
    int status = driver.ScanAllProcesses();
    stats_ = driver.GetLastScanStats();
    return status;
  }

  int ScanPids(const std::vector<pid_t> &pids) {
    ScanDriver driver(config_, procfs_, comparator_, out_);
    int status = driver.ScanProcesses(pids);
    stats_ = driver.GetLastScanStats();
    return status;
  }

  void AddIntactProcess(pid_t pid) {
    fake_.AddProcess(pid);
    fake_.SetIntactExe(pid, "daemon" + std::to_string(pid));
    fake_.WriteMaps(pid, "");
  }

  void AddReplacedProcess(pid_t pid) {
    fake_.AddProcess(pid);
    fake_.ReplaceExe(pid, "bin" + std::to_string(pid), "old",
                     "new content " + std::to_string(pid));
    fake_.WriteMaps(pid, "");
  }

  FakeProcfs fake_;
  ProcFs procfs_;
  ScanConfig config_;
  MmapFileComparator comparator_;
  std::ostringstream out_;
  ScanStats stats_;
};

TEST_F(ScanDriverTest, ExplicitPidsAreScannedInOrder) {
  AddReplacedProcess(30);
  AddIntactProcess(20);
  AddReplacedProcess(10);

  EXPECT_EQ(ScanPids({30, 20, 10}), EXIT_SUCCESS);
  EXPECT_EQ(out_.str(), "30\n10\n");
  EXPECT_EQ(stats_.processes_scanned, 3u);
  EXPECT_EQ(stats_.processes_affected, 2u);
  EXPECT_EQ(stats_.processes_failed, 0u);
}

TEST_F(ScanDriverTest, ExplicitPidsAreNotDeduplicated) {
  AddReplacedProcess(30);
  EXPECT_EQ(ScanPids({30, 30}), EXIT_SUCCESS);
  EXPECT_EQ(out_.str(), "30\n30\n");
}

TEST_F(ScanDriverTest, ErrorDoesNotStopTheScan) {
  AddReplacedProcess(10);
  fake_.AddProcess(11); // no exe link
  AddReplacedProcess(12);

  EXPECT_EQ(ScanPids({10, 11, 12}), kExitScanError);
  EXPECT_EQ(out_.str(), "10\n12\n");
  EXPECT_EQ(stats_.processes_failed, 1u);
}

TEST_F(ScanDriverTest, VanishedProcessIsNotAnError) {
  AddIntactProcess(10);
  EXPECT_EQ(ScanPids({10, 99999}), EXIT_SUCCESS);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(ScanDriverTest, ComparisonFailureSetsScanError) {
  fake_.AddProcess(10);
  fake_.WriteFile("foo", "new");
  fake_.SetExe(10, fake_.FilesDir() + "/foo (deleted)");
  fake_.WriteMaps(10, "");

  EXPECT_EQ(ScanPids({10}), kExitScanError);
  EXPECT_EQ(out_.str(), "10\n");
}

TEST_F(ScanDriverTest, RemovedExecutableSetsScanError) {
  fake_.AddProcess(77);
  fake_.SetExe(77, fake_.WriteFile("removed (deleted)", "old binary"));
  fake_.WriteMaps(77, "");

  EXPECT_EQ(ScanPids({77}), kExitScanError);
  EXPECT_EQ(out_.str(), "77\n");
  EXPECT_EQ(stats_.processes_affected, 1u);
  EXPECT_EQ(stats_.processes_failed, 1u);
}

TEST_F(ScanDriverTest, FullScanCoversEveryProcess) {
  AddIntactProcess(1);
  AddReplacedProcess(2);
  AddIntactProcess(3);
  AddReplacedProcess(4);

  EXPECT_EQ(ScanAll(), EXIT_SUCCESS);
  std::string output = out_.str();
  EXPECT_NE(output.find("2\n"), std::string::npos);
  EXPECT_NE(output.find("4\n"), std::string::npos);
  EXPECT_EQ(output.size(), 4u);
  EXPECT_EQ(stats_.processes_scanned, 4u);
  EXPECT_EQ(stats_.processes_affected, 2u);
}

TEST_F(ScanDriverTest, FullScanIsIdempotent) {
  AddIntactProcess(1);
  AddReplacedProcess(2);
  AddReplacedProcess(3);

  EXPECT_EQ(ScanAll(), EXIT_SUCCESS);
  std::string first = out_.str();
  out_.str("");
  EXPECT_EQ(ScanAll(), EXIT_SUCCESS);
  EXPECT_EQ(out_.str(), first);
}

TEST_F(ScanDriverTest, UnprivilegedFullScanIgnoresPermissionDenied) {
  config_.ignore_permission_denied = true;
  AddIntactProcess(1);
  AddReplacedProcess(2);
  AddReplacedProcess(3);
  DeniedProcFs denied(fake_.ProcRoot(), {2});

  ScanDriver driver(config_, denied, comparator_, out_);
  EXPECT_EQ(driver.ScanAllProcesses(), EXIT_SUCCESS);
  EXPECT_EQ(out_.str(), "3\n");
  EXPECT_EQ(driver.GetLastScanStats().processes_failed, 0u);
}

TEST_F(ScanDriverTest, PrivilegedScanReportsPermissionDenied) {
  config_.ignore_permission_denied = false;
  AddIntactProcess(1);
  AddReplacedProcess(2);
  AddReplacedProcess(3);
  DeniedProcFs denied(fake_.ProcRoot(), {2});

  ScanDriver driver(config_, denied, comparator_, out_);
  EXPECT_EQ(driver.ScanAllProcesses(), kExitScanError);
  EXPECT_EQ(out_.str(), "3\n");
  EXPECT_EQ(driver.GetLastScanStats().processes_failed, 1u);
}

TEST_F(ScanDriverTest, FullScanSkipsKernelThreads) {
  std::ifstream comm("/proc/2/comm");
  std::string name;
  if (!std::getline(comm, name) || name != "kthreadd") {
    GTEST_SKIP() << "kthreadd is not visible as pid 2";
  }

  config_.ignore_permission_denied = geteuid() != 0;
  ProcFs live;
  ScanDriver driver(config_, live, comparator_, out_);
  driver.ScanAllProcesses();
  EXPECT_GT(driver.GetLastScanStats().kernel_processes_skipped, 0u);
}

TEST_F(ScanDriverTest, EmptyProcessTableIsAnError) {
  EXPECT_EQ(ScanAll(), kExitScanError);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(ScanDriverTest, MissingProcessTableIsAnError) {
  ProcFs missing(fake_.ProcRoot() + "/missing");
  ScanDriver driver(config_, missing, comparator_, out_);
  EXPECT_EQ(driver.ScanAllProcesses(), kExitScanError);
}

TEST_F(ScanDriverTest, StatsAreResetBetweenScans) {
  AddReplacedProcess(2);
  ScanDriver driver(config_, procfs_, comparator_, out_);
  driver.ScanProcesses({2});
  driver.ScanProcesses({2});
  EXPECT_EQ(driver.GetLastScanStats().processes_scanned, 1u);
  EXPECT_EQ(driver.GetLastScanStats().files_compared, 1u);
}

TEST_F(ScanDriverTest, StatsArePrintable) {
  ScanStats stats;
  stats.processes_scanned = 12;
  std::ostringstream os;
  os << stats;
  EXPECT_NE(os.str().find("Processes scanned:       12"), std::string::npos);
}

} // namespace
} // namespace restart_check

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
