#ifndef __TETHER_FAKE_PTY_PROCESS__
#define __TETHER_FAKE_PTY_PROCESS__

#include "PtyProcess.hpp"
#include "TetherException.hpp"

namespace tether {
/**
 * @brief In-memory terminal.  Tests feed output and close the terminal
 * through the shared Control block.
 */
class FakePtyProcess : public PtyProcess {
 public:
  struct Control {
    mutex controlMutex;
    condition_variable cv;
    string output;
    string input;
    string cwd;
    string shell;
    int cols = 0;
    int rows = 0;
    bool closed = false;
    bool terminated = false;
    bool reaped = false;
    // Echo every write back as output.
    bool echo = false;
    // Writes hang, like a shell that stops reading its input.
    bool blockWrites = false;
    int blockedWrites = 0;

    void emit(const string &data) {
      lock_guard<mutex> guard(controlMutex);
      output.append(data);
      cv.notify_all();
    }

    void close() {
      lock_guard<mutex> guard(controlMutex);
      closed = true;
      cv.notify_all();
    }

    string written() {
      lock_guard<mutex> guard(controlMutex);
      return input;
    }

    bool isTerminated() {
      lock_guard<mutex> guard(controlMutex);
      return terminated;
    }

    void setBlockWrites(bool block) {
      lock_guard<mutex> guard(controlMutex);
      blockWrites = block;
      cv.notify_all();
    }

    int writesBlocked() {
      lock_guard<mutex> guard(controlMutex);
      return blockedWrites;
    }
  };

  explicit FakePtyProcess(shared_ptr<Control> _control) : control(_control) {}

  virtual void start(const string &cwd, const string &shell, int cols,
                     int rows) {
    lock_guard<mutex> guard(control->controlMutex);
    control->cwd = cwd;
    control->shell = shell;
    control->cols = cols;
    control->rows = rows;
  }

  virtual int readOutput(char *buf, size_t count, int64_t timeoutMs) {
    unique_lock<mutex> guard(control->controlMutex);
    control->cv.wait_for(guard, std::chrono::milliseconds(timeoutMs), [this] {
      return !control->output.empty() || control->closed ||
             control->terminated;
    });
    if (!control->output.empty()) {
      size_t n = std::min(count, control->output.length());
      memcpy(buf, control->output.data(), n);
      control->output.erase(0, n);
      return int(n);
    }
    if (control->closed || control->terminated) {
      return -1;
    }
    return 0;
  }

  virtual void write(const string &data) {
    unique_lock<mutex> guard(control->controlMutex);
    if (control->blockWrites) {
      control->blockedWrites++;
      control->cv.wait(guard, [this] {
        return !control->blockWrites || control->terminated;
      });
      control->blockedWrites--;
      if (control->terminated) {
        throw std::runtime_error("Terminal closed with input pending");
      }
    }
    control->input.append(data);
    if (control->echo) {
      control->output.append(data);
      control->cv.notify_all();
    }
  }

  virtual void resize(int cols, int rows) {
    lock_guard<mutex> guard(control->controlMutex);
    control->cols = cols;
    control->rows = rows;
  }

  virtual void terminate() {
    lock_guard<mutex> guard(control->controlMutex);
    control->terminated = true;
    control->cv.notify_all();
  }

  virtual void reap() {
    unique_lock<mutex> guard(control->controlMutex);
    control->cv.wait(guard,
                     [this] { return control->closed || control->terminated; });
    control->reaped = true;
  }

 protected:
  shared_ptr<Control> control;
};

/** @brief Hands out FakePtyProcesses and remembers their controls. */
class FakePtyFactory {
 public:
  FakePtyFactory() : failNext(false) {}

  PtyProcessFactory factory() {
    return [this]() -> unique_ptr<PtyProcess> {
      lock_guard<mutex> guard(factoryMutex);
      if (failNext) {
        failNext = false;
        throw TetherException(ErrorKind::SpawnFailure, "forkpty failed");
      }
      auto control = make_shared<FakePtyProcess::Control>();
      controls.push_back(control);
      return unique_ptr<PtyProcess>(new FakePtyProcess(control));
    };
  }

  shared_ptr<FakePtyProcess::Control> last() {
    lock_guard<mutex> guard(factoryMutex);
    return controls.empty() ? nullptr : controls.back();
  }

  size_t created() {
    lock_guard<mutex> guard(factoryMutex);
    return controls.size();
  }

  void failNextSpawn() {
    lock_guard<mutex> guard(factoryMutex);
    failNext = true;
  }

 protected:
  mutex factoryMutex;
  vector<shared_ptr<FakePtyProcess::Control>> controls;
  bool failNext;
};
}  // namespace tether

#endif  // __TETHER_FAKE_PTY_PROCESS__
