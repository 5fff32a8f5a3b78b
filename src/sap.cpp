#include "dante/sap.h"
#include "dante/test_hooks.h"

#include "internal.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

namespace dante {
namespace {

using internal::SetError;

// SAP header flags (RFC 2974).
constexpr uint8_t kSapVersionShift = 5;
constexpr uint8_t kSapVersion = 1;
constexpr uint8_t kSapFlagIpv6 = 0x10;
constexpr uint8_t kSapFlagDeletion = 0x04;
constexpr uint8_t kSapFlagEncrypted = 0x02;
constexpr uint8_t kSapFlagCompressed = 0x01;
constexpr size_t kSapFixedHeaderSize = 4;

constexpr size_t kMaxSapDatagramSize = 65536;
constexpr size_t kMaxReplayPacketSize = 65536;

std::string Trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitWhitespace(const std::string& text) {
  std::istringstream iss(text);
  std::vector<std::string> parts;
  std::string part;
  while (iss >> part) {
    parts.push_back(part);
  }
  return parts;
}

bool ParseUnsigned(const std::string& text, uint32_t max, uint32_t* out) {
  if (text.empty() || text.size() > 10 ||
      !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  const unsigned long long value = std::stoull(text);
  if (value > max) {
    return false;
  }
  *out = static_cast<uint32_t>(value);
  return true;
}

// "2 channels: Tx Left, Tx Right" -> {"Tx Left", "Tx Right"}.
std::vector<std::string> SplitChannelSummary(const std::string& line) {
  std::vector<std::string> names;
  const auto colon = line.find(':');
  if (colon == std::string::npos) {
    return names;
  }
  std::istringstream iss(line.substr(colon + 1));
  std::string name;
  while (std::getline(iss, name, ',')) {
    name = Trim(name);
    if (!name.empty()) {
      names.push_back(name);
    }
  }
  return names;
}

std::vector<std::string> ChannelNamesFrom(const std::vector<std::string>& info_lines,
                                          uint16_t channels) {
  if (info_lines.size() == 1) {
    auto names = SplitChannelSummary(info_lines.front());
    if (names.size() == channels) {
      return names;
    }
  }
  if (info_lines.size() == channels) {
    return info_lines;
  }
  return DefaultChannelNames(channels);
}

}  // namespace

bool ParseSapPacket(const uint8_t* data, size_t length, std::string* sdp, Error* error) {
  if (!sdp) {
    return SetError(error, ErrorCode::kInvalidArgument, "sdp output is null");
  }
  if (data == nullptr || length < kSapFixedHeaderSize) {
    return SetError(error, ErrorCode::kParseError,
                    "SAP packet truncated: " + std::to_string(length) + " bytes");
  }
  const uint8_t flags = data[0];
  const uint8_t version = static_cast<uint8_t>(flags >> kSapVersionShift);
  if (version != kSapVersion) {
    return SetError(error, ErrorCode::kParseError,
                    "unsupported SAP version " + std::to_string(version));
  }
  if (flags & kSapFlagDeletion) {
    return SetError(error, ErrorCode::kParseError, "SAP deletion packet ignored");
  }
  if (flags & (kSapFlagCompressed | kSapFlagEncrypted)) {
    return SetError(error, ErrorCode::kParseError, "compressed or encrypted SAP payload");
  }
  const size_t auth_length = static_cast<size_t>(data[1]) * 4;
  const size_t origin_length = (flags & kSapFlagIpv6) ? 16 : 4;
  size_t offset = kSapFixedHeaderSize + origin_length + auth_length;
  if (offset >= length) {
    return SetError(error, ErrorCode::kParseError, "SAP packet has no payload");
  }
  const char* payload = reinterpret_cast<const char*>(data + offset);
  const size_t remaining = length - offset;
  if (remaining < 2 || payload[0] != 'v' || payload[1] != '=') {
    // Skip the MIME type ("application/sdp\0").
    const void* nul = std::memchr(payload, 0x00, remaining);
    if (nul == nullptr) {
      return SetError(error, ErrorCode::kParseError, "SAP payload type unterminated");
    }
    offset += static_cast<size_t>(static_cast<const char*>(nul) - payload) + 1;
    if (offset >= length) {
      return SetError(error, ErrorCode::kParseError, "SAP packet has no SDP");
    }
  }
  sdp->assign(reinterpret_cast<const char*>(data + offset), length - offset);
  return true;
}

std::vector<std::string> DefaultChannelNames(uint16_t count) {
  if (count <= 1) {
    return {"Mono"};
  }
  if (count == 2) {
    return {"Left", "Right"};
  }
  std::vector<std::string> names;
  names.reserve(count);
  for (uint16_t i = 1; i <= count; ++i) {
    names.push_back("Ch" + std::to_string(i));
  }
  return names;
}

bool ParseSdp(const std::string& sdp, Aes67Stream* out, Error* error) {
  if (!out) {
    return SetError(error, ErrorCode::kInvalidArgument, "stream output is null");
  }
  Aes67Stream stream;
  bool have_session = false;
  bool have_origin = false;
  bool have_connection = false;
  bool have_media = false;
  bool have_rtpmap = false;
  std::vector<std::string> info_lines;

  std::istringstream lines(sdp);
  std::string line;
  while (std::getline(lines, line)) {
    line = Trim(line);
    if (line.size() < 2 || line[1] != '=') {
      continue;
    }
    const std::string value = line.substr(2);
    switch (line[0]) {
      case 's':
        stream.session_name = Trim(value);
        have_session = !stream.session_name.empty();
        break;
      case 'o': {
        // o=<user> <session id> <version> IN IP4 <address>
        const auto parts = SplitWhitespace(value);
        if (parts.size() >= 6) {
          stream.session_id = parts[1];
          stream.origin_ip = parts[5];
          have_origin = true;
        }
        break;
      }
      case 'c': {
        // c=IN IP4 239.69.85.220/32
        const auto parts = SplitWhitespace(value);
        if (parts.size() >= 3) {
          stream.multicast_addr = parts[2].substr(0, parts[2].find('/'));
          have_connection = !stream.multicast_addr.empty();
        }
        break;
      }
      case 'm': {
        // m=audio 5004 RTP/AVP 97
        const auto parts = SplitWhitespace(value);
        uint32_t port = 0;
        if (parts.size() >= 2 && ParseUnsigned(parts[1], 0xffff, &port) && port != 0) {
          stream.port = static_cast<uint16_t>(port);
          have_media = true;
          uint32_t payload_type = 0;
          if (parts.size() >= 4 && ParseUnsigned(parts[3], 127, &payload_type)) {
            stream.payload_type = static_cast<int>(payload_type);
          }
        }
        break;
      }
      case 'a': {
        // a=rtpmap:97 L24/48000/2
        if (value.compare(0, 7, "rtpmap:") != 0) {
          break;
        }
        const auto space = value.find(' ');
        if (space == std::string::npos) {
          break;
        }
        stream.codec = Trim(value.substr(space + 1));
        if (stream.codec.empty()) {
          break;
        }
        have_rtpmap = true;
        std::vector<std::string> fields;
        std::istringstream codec(stream.codec);
        std::string field;
        while (std::getline(codec, field, '/')) {
          fields.push_back(field);
        }
        uint32_t channels = 0;
        if (fields.size() >= 3 && ParseUnsigned(fields[2], 0xffff, &channels) &&
            channels > 0) {
          stream.channels = static_cast<uint16_t>(channels);
        }
        break;
      }
      case 'i':
        info_lines.push_back(Trim(value));
        break;
      default:
        break;
    }
  }

  std::string missing;
  if (!have_session) {
    missing = "s=";
  } else if (!have_origin) {
    missing = "o=";
  } else if (!have_connection) {
    missing = "c=";
  } else if (!have_media) {
    missing = "m=";
  } else if (!have_rtpmap) {
    missing = "a=rtpmap";
  }
  if (!missing.empty()) {
    return SetError(error, ErrorCode::kParseError,
                    "SDP" + (stream.session_name.empty() ? std::string()
                                                         : " '" + stream.session_name + "'") +
                        " missing " + missing);
  }
  stream.channel_names = ChannelNamesFrom(info_lines, stream.channels);
  *out = std::move(stream);
  return true;
}

bool FindLocalAddressFor(const std::string& remote_address, std::string* local_address) {
  if (!local_address) {
    return false;
  }
  in_addr remote{};
  if (!internal::ParseIpv4(remote_address, &remote)) {
    return false;
  }
  const int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (fd < 0) {
    return false;
  }
  // connect() on a datagram socket only selects a route.
  sockaddr_in addr = internal::MakeSockaddr(remote_address, 1);
  bool ok = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  sockaddr_in local{};
  socklen_t local_len = sizeof(local);
  ok = ok && ::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &local_len) == 0;
  ::close(fd);
  if (!ok || local.sin_addr.s_addr == htonl(INADDR_ANY)) {
    return false;
  }
  *local_address = internal::AddrToString(local);
  return !local_address->empty();
}

SapListener::SapListener(SapOptions options) : options_(std::move(options)) {}

bool SapListener::Collect(std::chrono::milliseconds window,
                          std::vector<std::string>* payloads, Error* error) {
  if (!payloads) {
    return SetError(error, ErrorCode::kInvalidArgument, "payload output is null");
  }
  packets_received_ = 0;
  payloads->clear();
  if (!options_.replay_file.empty()) {
    return CollectFromReplay(payloads, error);
  }
  return CollectFromSocket(window, payloads, error);
}

bool SapListener::CollectFromSocket(std::chrono::milliseconds window,
                                    std::vector<std::string>* payloads, Error* error) {
  in_addr group{};
  if (!internal::ParseIpv4(options_.multicast_address, &group)) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    "invalid SAP group " + options_.multicast_address);
  }
  in_addr interface_addr{};
  if (!internal::ParseIpv4(options_.interface_address, &interface_addr)) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    "invalid SAP interface '" + options_.interface_address + "'");
  }

  internal::UdpSocket socket;
  if (!socket.Open(options_.port, "0.0.0.0", true)) {
    return SetError(error, ErrorCode::kSocketError, socket.last_error());
  }
  ip_mreq membership{};
  membership.imr_multiaddr = group;
  membership.imr_interface = interface_addr;
  if (::setsockopt(socket.fd(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership,
                   sizeof(membership)) < 0) {
    return SetError(error, ErrorCode::kSocketError,
                    "IP_ADD_MEMBERSHIP(" + options_.multicast_address + " on " +
                        options_.interface_address + ") failed: " + std::strerror(errno));
  }

  std::vector<uint8_t> buffer(kMaxSapDatagramSize);
  const auto deadline = std::chrono::steady_clock::now() + window;
  while (true) {
    if (internal::IsCancelled(options_.cancel)) {
      return SetError(error, ErrorCode::kShutdown, "SAP collection cancelled");
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    wait = std::max(std::chrono::milliseconds(1), std::min(wait, internal::kCancelPollSlice));
    const int ready = socket.WaitReadable(wait);
    if (ready < 0) {
      return SetError(error, ErrorCode::kSocketError,
                      "select() failed: " + std::string(std::strerror(errno)));
    }
    if (ready == 0) {
      continue;
    }
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t bytes = socket.RecvFrom(buffer.data(), buffer.size(), &from, &from_len);
    if (bytes <= 0) {
      continue;
    }
    HandleDatagram(buffer.data(), static_cast<size_t>(bytes), payloads);
  }
  // Leaving the group is implied by closing the socket.
  return true;
}

bool SapListener::CollectFromReplay(std::vector<std::string>* payloads, Error* error) {
  std::ifstream replay(options_.replay_file, std::ios::binary | std::ios::in);
  if (!replay) {
    return SetError(error, ErrorCode::kSocketError,
                    "failed to open replay file: " + options_.replay_file);
  }
  while (true) {
    if (internal::IsCancelled(options_.cancel)) {
      return SetError(error, ErrorCode::kShutdown, "SAP collection cancelled");
    }
    uint64_t timestamp_us = 0;
    uint32_t length = 0;
    replay.read(reinterpret_cast<char*>(&timestamp_us), sizeof(timestamp_us));
    if (!replay) {
      break;
    }
    replay.read(reinterpret_cast<char*>(&length), sizeof(length));
    if (!replay) {
      break;
    }
    if (length > kMaxReplayPacketSize) {
      internal::LogMessage("Replay packet too large, stopping replay", options_.log_callback);
      break;
    }
    std::vector<uint8_t> packet(length);
    if (length > 0) {
      replay.read(reinterpret_cast<char*>(packet.data()),
                  static_cast<std::streamsize>(length));
      if (!replay) {
        break;
      }
    }
    HandleDatagram(packet.data(), packet.size(), payloads);
  }
  return true;
}

void SapListener::HandleDatagram(const uint8_t* data, size_t length,
                                 std::vector<std::string>* payloads) {
  ++packets_received_;
  Capture(data, length);
  std::string sdp;
  Error error;
  if (!ParseSapPacket(data, length, &sdp, &error)) {
    internal::LogMessage("SAP packet skipped: " + error.message, options_.log_callback);
    return;
  }
  payloads->push_back(std::move(sdp));
}

void SapListener::Capture(const uint8_t* data, size_t length) {
  if (options_.capture_file.empty() || !options_.replay_file.empty()) {
    return;
  }
  std::ofstream capture(options_.capture_file,
                        std::ios::binary | std::ios::out | std::ios::app);
  if (!capture) {
    internal::LogMessage("failed to open capture file: " + options_.capture_file,
                         options_.log_callback);
    return;
  }
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  const uint64_t timestamp_us =
      std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  const uint32_t length_u32 = static_cast<uint32_t>(length);
  capture.write(reinterpret_cast<const char*>(&timestamp_us), sizeof(timestamp_us));
  capture.write(reinterpret_cast<const char*>(&length_u32), sizeof(length_u32));
  capture.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
}

void Aes67StreamCache::Merge(const Aes67Stream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  streams_[stream.session_name] = stream;
}

std::vector<std::string> Aes67StreamCache::Prune(std::chrono::steady_clock::time_point now,
                                                  std::chrono::milliseconds ttl,
                                                  const std::set<std::string>& pinned) {
  std::vector<std::string> removed;
  if (ttl.count() <= 0) {
    return removed;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = streams_.begin(); it != streams_.end();) {
    if (pinned.count(it->first) == 0 && now - it->second.last_seen > ttl) {
      removed.push_back(it->first);
      it = streams_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

bool Aes67StreamCache::Find(const std::string& session_name, Aes67Stream* out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(session_name);
  if (it == streams_.end()) {
    return false;
  }
  if (out) {
    *out = it->second;
  }
  return true;
}

std::map<std::string, Aes67Stream> Aes67StreamCache::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return streams_;
}

size_t Aes67StreamCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return streams_.size();
}

#ifdef DANTE_TESTING
namespace test {

std::vector<uint8_t> BuildSapPacket(const std::string& sdp, const std::string& origin_ip,
                                    uint16_t message_id_hash, bool deletion,
                                    bool with_mime_type) {
  std::vector<uint8_t> packet;
  uint8_t flags = static_cast<uint8_t>(kSapVersion << kSapVersionShift);
  if (deletion) {
    flags |= kSapFlagDeletion;
  }
  packet.push_back(flags);
  packet.push_back(0x00);
  internal::AppendBe16(packet, message_id_hash);
  in_addr origin{};
  internal::ParseIpv4(origin_ip, &origin);
  const auto* origin_bytes = reinterpret_cast<const uint8_t*>(&origin);
  packet.insert(packet.end(), origin_bytes, origin_bytes + sizeof(origin));
  if (with_mime_type) {
    internal::AppendString(packet, "application/sdp");
  }
  packet.insert(packet.end(), sdp.begin(), sdp.end());
  return packet;
}

bool WriteSapCapture(const std::string& path, const std::vector<std::vector<uint8_t>>& packets) {
  std::ofstream out(path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out) {
    return false;
  }
  uint64_t timestamp_us = 0;
  for (const auto& packet : packets) {
    const uint32_t length = static_cast<uint32_t>(packet.size());
    out.write(reinterpret_cast<const char*>(&timestamp_us), sizeof(timestamp_us));
    out.write(reinterpret_cast<const char*>(&length), sizeof(length));
    out.write(reinterpret_cast<const char*>(packet.data()),
              static_cast<std::streamsize>(packet.size()));
    timestamp_us += 1000;
  }
  return static_cast<bool>(out);
}

}  // namespace test
#endif

}  // namespace dante
