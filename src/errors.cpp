/**
 * @file errors.cpp
 * @brief Error taxonomy implementation
 */

#include "loopweave/errors.hpp"

extern "C" {
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "loopweave/types.hpp"

namespace loopweave {

namespace {

std::string compose_what(Stage stage, const std::string &message,
                         const std::string &subject) {
  if (subject.empty())
    return fmt::format("{} error: {}", to_string(stage), message);
  return fmt::format("{} error: {} [{}]", to_string(stage), message, subject);
}

} // anonymous namespace

const char *to_string(Stage stage) {
  switch (stage) {
  case Stage::Input:
    return "input";
  case Stage::Render:
    return "render";
  case Stage::Composition:
    return "composition";
  case Stage::Integrity:
    return "integrity";
  }
  return "unknown";
}

int exit_code_for(Stage stage) {
  switch (stage) {
  case Stage::Input:
    return 2;
  case Stage::Render:
    return 3;
  case Stage::Composition:
    return 4;
  case Stage::Integrity:
    return EXIT_CODE_VERIFY_FAILED;
  }
  return EXIT_CODE_USAGE;
}

AssemblyError::AssemblyError(Stage stage, std::string message,
                             std::string subject, std::string diagnostic)
    : std::runtime_error(compose_what(stage, message, subject)),
      stage_(stage), message_(std::move(message)),
      subject_(std::move(subject)), diagnostic_(std::move(diagnostic)) {}

std::string av_error_text(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  if (av_strerror(errnum, buf, sizeof(buf)) < 0)
    return fmt::format("ffmpeg error {}", errnum);
  return buf;
}

// **---- Enum names ----**

const char *to_string(VerificationStatus status) {
  return status == VerificationStatus::Pass ? "pass" : "fail";
}

const char *to_string(AudioMode mode) {
  switch (mode) {
  case AudioMode::Loop:
    return "loop";
  case AudioMode::Trim:
    return "trim";
  case AudioMode::Exact:
    return "exact";
  }
  return "unknown";
}

} // namespace loopweave
