#include "autocode/ipc/WorkerProtocol.hpp"

#include <array>
#include <cstdio>
#include <cstdint>
#include <random>

namespace autocode {
namespace ipc {

namespace {

constexpr const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<uint8_t, 256> make_decoding_table() {
  std::array<uint8_t, 256> table{};
  table.fill(0xFF);
  for (uint8_t i = 0; i < 64; i++)
    table[static_cast<uint8_t>(BASE64_CHARS[i])] = i;
  return table;
}

void replace_all(std::string &text, const std::string &from,
                 const std::string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::string decode_or_placeholder(std::string_view encoded) {
  auto decoded = base64_decode(encoded);
  return decoded ? *decoded : std::string(BASE64_DECODE_ERROR);
}

} // namespace

std::string base64_encode(std::string_view data) {
  std::string result;
  result.reserve(((data.size() + 2) / 3) * 4);

  for (size_t i = 0; i < data.size(); i += 3) {
    const uint32_t b0 = static_cast<uint8_t>(data[i]);
    const uint32_t b1 =
        (i + 1 < data.size()) ? static_cast<uint8_t>(data[i + 1]) : 0;
    const uint32_t b2 =
        (i + 2 < data.size()) ? static_cast<uint8_t>(data[i + 2]) : 0;
    const uint32_t triple = (b0 << 16) | (b1 << 8) | b2;

    result.push_back(BASE64_CHARS[(triple >> 18) & 0x3F]);
    result.push_back(BASE64_CHARS[(triple >> 12) & 0x3F]);
    result.push_back((i + 1 < data.size()) ? BASE64_CHARS[(triple >> 6) & 0x3F]
                                           : '=');
    result.push_back((i + 2 < data.size()) ? BASE64_CHARS[triple & 0x3F]
                                           : '=');
  }
  return result;
}

std::optional<std::string> base64_decode(std::string_view encoded) {
  static const auto DECODE_TABLE = make_decoding_table();

  // Tolerate a trailing carriage return from the worker's line ending.
  while (!encoded.empty() &&
         (encoded.back() == '\r' || encoded.back() == ' '))
    encoded.remove_suffix(1);

  if (encoded.size() % 4 != 0)
    return std::nullopt;

  size_t padding = 0;
  if (!encoded.empty() && encoded.back() == '=')
    padding++;
  if (encoded.size() > 1 && encoded[encoded.size() - 2] == '=')
    padding++;

  std::string result;
  result.reserve((encoded.size() / 4) * 3);

  uint32_t accum = 0;
  int bits = 0;
  for (size_t i = 0; i < encoded.size() - padding; ++i) {
    const uint8_t val = DECODE_TABLE[static_cast<uint8_t>(encoded[i])];
    if (val == 0xFF)
      return std::nullopt;
    accum = (accum << 6) | val;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      result.push_back(static_cast<char>((accum >> bits) & 0xFF));
    }
  }
  return result;
}

Markers Markers::generate() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<uint64_t> dist;
  char nonce[17];
  std::snprintf(nonce, sizeof(nonce), "%016llx",
                static_cast<unsigned long long>(dist(gen)));

  Markers m;
  m.result = std::string("<<<RESULT:") + nonce + ">>>";
  m.error = std::string("<<<ERROR:") + nonce + ">>>";
  return m;
}

ReplyLine classify_reply_line(std::string_view line, const Markers &markers) {
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.remove_suffix(1);

  ReplyLine reply;
  std::string_view rest;
  if (starts_with(line, markers.result)) {
    reply.kind = ReplyLine::Kind::Result;
    rest = line.substr(markers.result.size());
  } else if (starts_with(line, markers.error)) {
    reply.kind = ReplyLine::Kind::Error;
    rest = line.substr(markers.error.size());
  } else {
    reply.kind = ReplyLine::Kind::Output;
    reply.text = std::string(line);
    return reply;
  }

  auto colon = rest.find(':');
  if (colon != std::string_view::npos && colon > 0 && colon <= 20) {
    uint64_t seq = 0;
    bool digits = true;
    for (char c : rest.substr(0, colon)) {
      if (c < '0' || c > '9') {
        digits = false;
        break;
      }
      seq = seq * 10 + static_cast<uint64_t>(c - '0');
    }
    if (digits) {
      reply.seq = seq;
      rest.remove_prefix(colon + 1);
    }
  }
  reply.text = decode_or_placeholder(rest);
  return reply;
}

std::string render_bootstrap(const RuntimeProfile &profile,
                             const Markers &markers) {
  std::string text = profile.bootstrap_template;
  replace_all(text, "{result_marker}", markers.result);
  replace_all(text, "{error_marker}", markers.error);
  return text;
}

std::string frame_expression(const RuntimeProfile &profile, uint64_t seq,
                             const std::string &expression,
                             size_t wrap_threshold) {
  std::string line = std::to_string(seq) + " ";
  bool multiline = expression.find('\n') != std::string::npos ||
                   expression.find('\r') != std::string::npos;
  if (!multiline && expression.size() <= wrap_threshold)
    return line + expression;

  std::string wrapped = profile.wrapper_template;
  replace_all(wrapped, "{payload}", base64_encode(expression));
  return line + wrapped;
}

} // namespace ipc
} // namespace autocode
