#pragma once
#include "autocode/ipc/RuntimeProfile.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace autocode {
namespace ipc {

/// Returned in place of a payload that is not valid base64.
constexpr const char *BASE64_DECODE_ERROR = "<base64 decode error>";

/// Expressions longer than this (or containing a newline) are sent through
/// the profile's wrapper so the one-line framing holds.
constexpr size_t DEFAULT_WRAP_THRESHOLD = 800;

std::string base64_encode(std::string_view data);

/// Strict decode; std::nullopt on invalid characters or length.
std::optional<std::string> base64_decode(std::string_view encoded);

/// Marker pair for one worker session.
struct Markers {
  std::string result;
  std::string error;

  /// Markers carrying a random per-session nonce.
  static Markers generate();
};

/// Classification of one line read from the worker.
///
/// A reply line is `<marker><seq>:<base64>`, where `seq` echoes the number
/// the request was framed with.
struct ReplyLine {
  enum class Kind { Output, Result, Error };
  Kind kind{Kind::Output};
  std::optional<uint64_t> seq; // unset for output and malformed markers
  std::string text; // decoded payload for markers, raw line otherwise
};

ReplyLine classify_reply_line(std::string_view line, const Markers &markers);

/// Bootstrap program text for a profile and marker pair.
std::string render_bootstrap(const RuntimeProfile &profile,
                             const Markers &markers);

/// Line to send for an expression: `<seq> ` followed by the expression
/// itself, or by the wrapper around its base64 encoding when it is
/// multi-line or long.
std::string frame_expression(const RuntimeProfile &profile, uint64_t seq,
                             const std::string &expression,
                             size_t wrap_threshold = DEFAULT_WRAP_THRESHOLD);

} // namespace ipc
} // namespace autocode
