#include "ChildProcess.hpp"

#include "TestHeaders.hpp"

using namespace tether;

TEST_CASE("Reads the child's output line by line", "[ChildProcess]") {
  ChildProcess process;
  process.start("/bin/sh", {"-c", "echo first; echo second; printf last"},
                "");
  string line;
  REQUIRE(process.readLine(&line, 5000) == ChildProcess::ReadStatus::Line);
  REQUIRE(line == "first");
  REQUIRE(process.readLine(&line, 5000) == ChildProcess::ReadStatus::Line);
  REQUIRE(line == "second");
  REQUIRE(process.readLine(&line, 5000) == ChildProcess::ReadStatus::Line);
  REQUIRE(line == "last");
  REQUIRE(process.readLine(&line, 5000) == ChildProcess::ReadStatus::End);
  REQUIRE(waitUntil([&process] { return bool(process.exitCode()); }));
  REQUIRE(*process.exitCode() == 0);
}

TEST_CASE("Runs inside the requested directory", "[ChildProcess]") {
  TempDirectory dir;
  ChildProcess process;
  process.start("/bin/sh", {"-c", "pwd -P"}, dir.path);
  string line;
  REQUIRE(process.readLine(&line, 5000) == ChildProcess::ReadStatus::Line);
  REQUIRE(line == fs::canonical(dir.path).string());
}

TEST_CASE("Times out while the child is silent", "[ChildProcess]") {
  ChildProcess process;
  process.start("/bin/sh", {"-c", "sleep 10"}, "");
  string line;
  int64_t before = nowMillis();
  REQUIRE(process.readLine(&line, 100) == ChildProcess::ReadStatus::Timeout);
  REQUIRE(nowMillis() - before >= 100);
  REQUIRE(!process.exitCode());

  process.terminate();
  REQUIRE(process.exitCode());
  // terminate is idempotent
  process.terminate();
}

TEST_CASE("Terminate unblocks a waiting reader", "[ChildProcess]") {
  ChildProcess process;
  process.start("/bin/sh", {"-c", "sleep 10"}, "");
  std::thread killer([&process] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    process.terminate();
  });
  string line;
  REQUIRE(process.readLine(&line, 5000) == ChildProcess::ReadStatus::End);
  killer.join();
}

TEST_CASE("A missing command exits with 127", "[ChildProcess]") {
  ChildProcess process;
  process.start("/nonexistent/tether-completion-cli", {}, "");
  string line;
  REQUIRE(process.readLine(&line, 5000) == ChildProcess::ReadStatus::End);
  REQUIRE(waitUntil([&process] { return bool(process.exitCode()); }));
  REQUIRE(*process.exitCode() == 127);
}
