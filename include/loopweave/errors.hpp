/**
 * @file errors.hpp
 * @brief Error taxonomy for assembly runs
 *
 * @details Every failure that reaches the caller is an AssemblyError that
 *          names the stage it came from, the asset or segment involved and
 *          the underlying tool diagnostic, so the run can be reproduced from
 *          the log alone.
 */

#ifndef LOOPWEAVE_ERRORS_HPP
#define LOOPWEAVE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace loopweave {

enum class Stage { Input, Render, Composition, Integrity };

const char *to_string(Stage stage);

// **----- EXIT CODES -----**

constexpr int EXIT_CODE_PASS = 0;
constexpr int EXIT_CODE_USAGE = 1;
constexpr int EXIT_CODE_VERIFY_FAILED = 5;

/// Process exit code for a failed stage (Input 2, Render 3, Composition 4)
int exit_code_for(Stage stage);

/**
 * @class AssemblyError
 * @brief Base class of all run failures.
 */
class AssemblyError : public std::runtime_error {
public:
  AssemblyError(Stage stage, std::string message, std::string subject = {},
                std::string diagnostic = {});

  Stage stage() const { return stage_; }

  /// Asset path or "segment <n>" the failure relates to (may be empty)
  const std::string &subject() const { return subject_; }

  /// Raw text from the failing tool or library (may be empty)
  const std::string &diagnostic() const { return diagnostic_; }

  /// Bare message without stage or subject decoration
  const std::string &message() const { return message_; }

private:
  Stage stage_;
  std::string message_;
  std::string subject_;
  std::string diagnostic_;
};

/// Malformed segments, bad parameters, unprobeable media
class InputError : public AssemblyError {
public:
  explicit InputError(std::string message, std::string subject = {},
                      std::string diagnostic = {})
      : AssemblyError(Stage::Input, std::move(message), std::move(subject),
                      std::move(diagnostic)) {}
};

/// Font, layout or image writing failure
class RenderError : public AssemblyError {
public:
  explicit RenderError(std::string message, std::string subject = {},
                       std::string diagnostic = {})
      : AssemblyError(Stage::Render, std::move(message), std::move(subject),
                      std::move(diagnostic)) {}
};

/// ffmpeg failed, was killed, or exceeded its deadline
class CompositionError : public AssemblyError {
public:
  explicit CompositionError(std::string message, std::string subject = {},
                            std::string diagnostic = {})
      : AssemblyError(Stage::Composition, std::move(message),
                      std::move(subject), std::move(diagnostic)) {}
};

/// Produced file cannot be sampled at a required timestamp
class IntegrityError : public AssemblyError {
public:
  explicit IntegrityError(std::string message, std::string subject = {},
                          std::string diagnostic = {})
      : AssemblyError(Stage::Integrity, std::move(message),
                      std::move(subject), std::move(diagnostic)) {}
};

/**
 * @brief Translate an FFmpeg error code into text.
 */
std::string av_error_text(int errnum);

} // namespace loopweave

#endif // LOOPWEAVE_ERRORS_HPP
