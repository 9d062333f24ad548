/**
 * @file ffmpeg_executor.hpp
 * @brief Supervised execution of the ffmpeg CLI
 *
 * @details Composition is a single ffmpeg invocation. This module owns the
 *          process side of it:
 *
 *          - run_process(): fork/exec with an argument vector (no shell),
 *            stderr captured, hard wall-clock deadline
 *
 *          - MemoryFile: in-memory script (memfd) handed to ffmpeg as a
 *            /proc path, so filter graphs with hundreds of overlays never hit
 *            the command line length limit
 */

#ifndef LOOPWEAVE_FFMPEG_EXECUTOR_HPP
#define LOOPWEAVE_FFMPEG_EXECUTOR_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace loopweave {

/// Bytes of stderr kept from a child (the tail, where ffmpeg reports errors)
constexpr size_t STDERR_TAIL_BYTES = 64 * 1024;

/**
 * @struct ProcessResult
 * @brief Outcome of one supervised child process.
 */
struct ProcessResult {
  int exit_code = -1;   //< Valid when the child exited normally
  int term_signal = 0;  //< Signal that ended the child, 0 if none
  bool timed_out = false;
  std::string stderr_tail;
  double elapsed_sec = 0.0;

  bool ok() const { return !timed_out && term_signal == 0 && exit_code == 0; }

  /// One-line description ("exit code 1", "killed by signal 9", ...)
  std::string describe() const;
};

/**
 * @brief Run a program and wait for it, killing it at the deadline.
 *
 * @param argv Program and arguments; argv[0] is resolved through PATH
 * @param timeout_sec Wall-clock limit; <= 0 disables the limit
 * @return Exit status, captured stderr tail and elapsed time
 *
 * @attention The child runs in its own process group. On timeout the whole
 *            group receives SIGKILL, so encoder helper processes cannot
 *            outlive the run.
 *
 * @throws CompositionError if the child cannot be started
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          double timeout_sec);

/**
 * @class MemoryFile
 * @brief Anonymous in-memory file readable by child processes.
 *
 * @note The path is /proc/<pid>/fd/<fd> of this process, valid for as long
 *       as the object lives.
 */
class MemoryFile {
public:
  /**
   * @throws CompositionError if the memfd cannot be created or written
   */
  MemoryFile(const char *name, const std::string &content);
  ~MemoryFile();

  MemoryFile(const MemoryFile &) = delete;
  MemoryFile &operator=(const MemoryFile &) = delete;

  const std::string &path() const { return path_; }

private:
  int fd_ = -1;
  std::string path_;
};

} // namespace loopweave

#endif // LOOPWEAVE_FFMPEG_EXECUTOR_HPP
