#include "SessionRegistry.hpp"

#include "FakePtyProcess.hpp"
#include "OutputCoalescer.hpp"
#include "PseudoTerminalProcess.hpp"
#include "TestHeaders.hpp"
#include "TetherException.hpp"

using namespace tether;

namespace {
/**
 * @brief Collects output per session.  Chunks are acknowledged right away
 * unless `holdCredit` is set.
 */
class OutputCollector {
 public:
  OutputCollector() : holdCredit(false) {}

  SessionRegistry::OutputSink outputSink() {
    return [this](const string &sessionId, const string &data,
                  std::function<void()> delivered) {
      lock_guard<mutex> guard(collectorMutex);
      output[sessionId].append(data);
      chunks++;
      if (holdCredit) {
        held.push_back(delivered);
      } else {
        delivered();
      }
    };
  }

  SessionRegistry::ExitSink exitSink() {
    return [this](const string &sessionId) {
      lock_guard<mutex> guard(collectorMutex);
      exited.push_back(sessionId);
    };
  }

  string outputOf(const string &sessionId) {
    lock_guard<mutex> guard(collectorMutex);
    return output[sessionId];
  }

  int chunkCount() {
    lock_guard<mutex> guard(collectorMutex);
    return chunks;
  }

  vector<string> exitedSessions() {
    lock_guard<mutex> guard(collectorMutex);
    return exited;
  }

  void setHoldCredit(bool hold) {
    lock_guard<mutex> guard(collectorMutex);
    holdCredit = hold;
  }

  void releaseAll() {
    vector<std::function<void()>> releasing;
    {
      lock_guard<mutex> guard(collectorMutex);
      releasing.swap(held);
      holdCredit = false;
    }
    for (auto &delivered : releasing) {
      delivered();
    }
  }

 protected:
  mutex collectorMutex;
  map<string, string> output;
  vector<string> exited;
  vector<std::function<void()>> held;
  bool holdCredit;
  int chunks = 0;
};
}  // namespace

TEST_CASE("Spawned sessions stream their output", "[SessionRegistry]") {
  FakePtyFactory ptys;
  OutputCollector collector;
  SessionRegistry registry(ptys.factory(), "/bin/zsh");
  registry.setSinks(collector.outputSink(), collector.exitSink());

  string spawnedId;
  string id = registry.spawn("w1", "/repo", 120, 40,
                             [&spawnedId](const string &sessionId) {
                               spawnedId = sessionId;
                             });
  REQUIRE(id == spawnedId);
  REQUIRE(registry.contains(id));
  REQUIRE(registry.size() == 1);

  auto control = ptys.last();
  REQUIRE(control->cwd == "/repo");
  REQUIRE(control->shell == "/bin/zsh");
  REQUIRE(control->cols == 120);
  REQUIRE(control->rows == 40);

  control->emit("$ ");
  control->emit("ls\r\n");
  REQUIRE(waitUntil([&] { return collector.outputOf(id) == "$ ls\r\n"; }));
}

TEST_CASE("Writes and resizes reach the terminal", "[SessionRegistry]") {
  FakePtyFactory ptys;
  SessionRegistry registry(ptys.factory(), "/bin/sh");
  string id = registry.spawn("w1", "/repo", 80, 24);

  registry.write(id, "pwd\n");
  registry.write(id, "ls\n");
  registry.resize(id, 100, 30);
  auto control = ptys.last();
  REQUIRE(waitUntil([&] { return control->written() == "pwd\nls\n"; }));
  REQUIRE(control->cols == 100);
  REQUIRE(control->rows == 30);
}

TEST_CASE("Killed sessions are unknown afterwards", "[SessionRegistry]") {
  FakePtyFactory ptys;
  OutputCollector collector;
  SessionRegistry registry(ptys.factory(), "/bin/sh");
  registry.setSinks(collector.outputSink(), collector.exitSink());
  string id = registry.spawn("w1", "/repo", 80, 24);

  registry.kill(id);
  REQUIRE(!registry.contains(id));
  REQUIRE(ptys.last()->isTerminated());
  REQUIRE_THROWS_AS(registry.write(id, "ls\n"), TetherException);
  try {
    registry.resize(id, 10, 10);
    FAIL("resize of a killed session succeeded");
  } catch (const TetherException &ex) {
    REQUIRE(ex.getKind() == ErrorKind::UnknownSession);
  }
  // Killing twice is harmless, and a kill is not reported as an exit.
  registry.kill(id);
  REQUIRE(collector.exitedSessions().empty());
}

TEST_CASE("Sessions that close on their own are reported", "[SessionRegistry]") {
  FakePtyFactory ptys;
  OutputCollector collector;
  SessionRegistry registry(ptys.factory(), "/bin/sh");
  registry.setSinks(collector.outputSink(), collector.exitSink());
  string id = registry.spawn("w1", "/repo", 80, 24);

  auto control = ptys.last();
  control->emit("logout\r\n");
  control->close();
  REQUIRE(waitUntil([&] { return collector.exitedSessions().size() == 1; }));
  REQUIRE(collector.exitedSessions()[0] == id);
  // Output written before the close is still delivered.
  REQUIRE(collector.outputOf(id) == "logout\r\n");
  registry.kill(id);
  REQUIRE(registry.size() == 0);
}

TEST_CASE("Killing a worktree stops only its sessions", "[SessionRegistry]") {
  FakePtyFactory ptys;
  SessionRegistry registry(ptys.factory(), "/bin/sh");
  string a = registry.spawn("w1", "/repo", 80, 24);
  string b = registry.spawn("w1", "/repo", 80, 24);
  string c = registry.spawn("w2", "/repo-feature", 80, 24);
  REQUIRE(a != b);
  REQUIRE(registry.size() == 3);

  registry.killWorktree("w1");
  REQUIRE(registry.size() == 1);
  REQUIRE(registry.contains(c));
  REQUIRE(!registry.contains(a));
  REQUIRE(!registry.contains(b));

  registry.killAll();
  REQUIRE(registry.size() == 0);
}

TEST_CASE("Failed spawns leave nothing behind", "[SessionRegistry]") {
  FakePtyFactory ptys;
  SessionRegistry registry(ptys.factory(), "/bin/sh");
  ptys.failNextSpawn();
  bool spawned = false;
  REQUIRE_THROWS_AS(registry.spawn("w1", "/repo", 80, 24,
                                   [&spawned](const string &) {
                                     spawned = true;
                                   }),
                    TetherException);
  REQUIRE(!spawned);
  REQUIRE(registry.size() == 0);
}

TEST_CASE("Writes do not wait for a terminal that is not reading",
          "[SessionRegistry]") {
  FakePtyFactory ptys;
  SessionRegistry registry(ptys.factory(), "/bin/sh");
  string id = registry.spawn("w1", "/repo", 80, 24);
  auto control = ptys.last();
  control->setBlockWrites(true);

  registry.write(id, "x");
  REQUIRE(waitUntil([&] { return control->writesBlocked() == 1; }));
  // Queued behind the stuck write.
  registry.write(id, "yes\n");

  const size_t backlog = SessionRegistry::MAX_PENDING_INPUT_BYTES;
  try {
    registry.write(id, string(backlog, 'z'));
    FAIL("write past the input backlog succeeded");
  } catch (const TetherException &ex) {
    REQUIRE(ex.getKind() == ErrorKind::InvalidAction);
  }

  // Resizes and kills still go through while the write hangs.
  registry.resize(id, 100, 30);
  REQUIRE(control->cols == 100);
  registry.kill(id);
  REQUIRE(!registry.contains(id));
  REQUIRE(control->isTerminated());
  REQUIRE(control->writesBlocked() == 0);
  REQUIRE(control->written().empty());
}

TEST_CASE("Queued input is written once the terminal reads again",
          "[SessionRegistry]") {
  FakePtyFactory ptys;
  SessionRegistry registry(ptys.factory(), "/bin/sh");
  string id = registry.spawn("w1", "/repo", 80, 24);
  auto control = ptys.last();
  control->setBlockWrites(true);

  registry.write(id, "echo a\n");
  registry.write(id, "echo b\n");
  REQUIRE(waitUntil([&] { return control->writesBlocked() == 1; }));
  control->setBlockWrites(false);
  REQUIRE(waitUntil(
      [&] { return control->written() == "echo a\necho b\n"; }));
}

TEST_CASE("Output waits for delivery credit", "[SessionRegistry]") {
  FakePtyFactory ptys;
  OutputCollector collector;
  collector.setHoldCredit(true);
  SessionRegistry registry(ptys.factory(), "/bin/sh");
  registry.setSinks(collector.outputSink(), collector.exitSink());
  string id = registry.spawn("w1", "/repo", 80, 24);
  auto control = ptys.last();

  const int maxChunks = SessionRegistry::MAX_IN_FLIGHT_CHUNKS;
  for (int a = 0; a < maxChunks + 2; a++) {
    control->emit(string(OutputCoalescer::FLUSH_BYTES, 'a' + a));
  }
  REQUIRE(waitUntil([&] { return collector.chunkCount() == maxChunks; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(collector.chunkCount() == maxChunks);

  collector.releaseAll();
  REQUIRE(waitUntil([&] { return collector.chunkCount() == maxChunks + 2; }));
  string output = collector.outputOf(id);
  REQUIRE(output.size() == (maxChunks + 2) * OutputCoalescer::FLUSH_BYTES);
  REQUIRE(output.front() == 'a');
  REQUIRE(output.back() == char('a' + maxChunks + 1));
}

TEST_CASE("Runs a real shell on a pseudo-terminal", "[SessionRegistry]") {
  TempDirectory dir;
  OutputCollector collector;
  SessionRegistry registry(
      [] { return unique_ptr<PtyProcess>(new PseudoTerminalProcess()); },
      "/bin/sh");
  registry.setSinks(collector.outputSink(), collector.exitSink());
  string id = registry.spawn("w1", dir.path, 80, 24);

  registry.write(id, "echo tether-$((40+2))\n");
  REQUIRE(waitUntil([&] {
    return collector.outputOf(id).find("tether-42") != string::npos;
  }));

  registry.write(id, "exit\n");
  REQUIRE(waitUntil([&] { return collector.exitedSessions().size() == 1; }));
  registry.kill(id);
}

TEST_CASE("A shell that cannot start is a spawn failure", "[SessionRegistry]") {
  TempDirectory dir;
  OutputCollector collector;
  auto factory = [] {
    return unique_ptr<PtyProcess>(new PseudoTerminalProcess());
  };

  SessionRegistry missingShell(factory, "/nonexistent/shell");
  missingShell.setSinks(collector.outputSink(), collector.exitSink());
  try {
    missingShell.spawn("w1", dir.path, 80, 24);
    FAIL("spawn of a missing shell succeeded");
  } catch (const TetherException &ex) {
    REQUIRE(ex.getKind() == ErrorKind::SpawnFailure);
    REQUIRE(string(ex.what()).find("/nonexistent/shell") != string::npos);
  }
  REQUIRE(missingShell.size() == 0);

  SessionRegistry registry(factory, "/bin/sh");
  string gone = dir.path + "/deleted-worktree";
  try {
    registry.spawn("w1", gone, 80, 24);
    FAIL("spawn in a missing directory succeeded");
  } catch (const TetherException &ex) {
    REQUIRE(ex.getKind() == ErrorKind::SpawnFailure);
    REQUIRE(string(ex.what()).find(gone) != string::npos);
  }
  REQUIRE(registry.size() == 0);
  REQUIRE(collector.exitedSessions().empty());
}
