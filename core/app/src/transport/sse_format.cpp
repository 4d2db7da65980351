#include "relay/transport/sse_format.hpp"

#include <charconv>
#include <string>
#include <system_error>

namespace relay {

std::string formatEvent(const StreamEvent& event) {
  std::string frame;
  frame.reserve(event.payload.size() + 48);
  frame += "id: ";
  frame += std::to_string(event.id);
  frame += "\nevent: ";
  frame += eventKindToString(event.kind);
  frame += '\n';

  // Every payload line gets its own data field. A bare CR, LF or CRLF in
  // the payload must never terminate the frame early.
  const std::string& payload = event.payload;
  std::size_t start = 0;
  while (true) {
    const std::size_t brk = payload.find_first_of("\r\n", start);
    frame += "data: ";
    frame.append(payload, start,
                 brk == std::string::npos ? std::string::npos : brk - start);
    frame += '\n';
    if (brk == std::string::npos) {
      break;
    }
    start = brk + 1;
    if (payload[brk] == '\r' && start < payload.size() &&
        payload[start] == '\n') {
      ++start;
    }
  }
  frame += '\n';
  return frame;
}

std::string formatRetryHint(std::int64_t retry_ms) {
  return "retry: " + std::to_string(retry_ms) + "\n\n";
}

std::string renderStream(const std::vector<StreamEvent>& events,
                         std::optional<std::int64_t> retry_ms) {
  std::string out;
  if (retry_ms) {
    out += formatRetryHint(*retry_ms);
  }
  for (const auto& event : events) {
    out += formatEvent(event);
  }
  return out;
}

std::optional<std::uint64_t> parseLastEventId(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  text = text.substr(first, last - first + 1);

  // from_chars accepts neither '+' nor '-' for unsigned types.
  std::uint64_t value = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace relay
