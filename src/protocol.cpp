#include "dante/protocol.h"
#include "dante/test_hooks.h"

#include "internal.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <sstream>

namespace dante {
namespace {

using internal::AppendBe16;
using internal::AppendBe32;
using internal::AppendString;
using internal::ReadBe16;
using internal::ReadBe32;
using internal::SetError;
using internal::WriteBe16;
using internal::WriteBe32;

constexpr size_t kOffsetMagic = 0;
constexpr size_t kOffsetLength = 2;
constexpr size_t kOffsetSequence = 4;
constexpr size_t kOffsetCommand = 6;

constexpr size_t kMaxFrameLength = 0xffff;
constexpr size_t kMaxDatagramSize = 2048;
constexpr size_t kMaxChannelPages = 64;

// Channel table record sizes (bytes).
constexpr size_t kRxRecordSize = 10;
constexpr size_t kTxRecordSize = 4;
constexpr size_t kPageCountSize = 2;

// Device info body: MAC followed by four strings.
constexpr size_t kMacLength = 6;
// Device status body: u32 rate, u32 latency, u16 encoding.
constexpr size_t kStatusBodySize = 10;

// AES67 subscribe frame offsets. Only these fields are written and every
// other byte of the 112-byte frame stays zero. The origin goes at 44..47.
// Frames captured from Dante Controller differ: they carry sub-record words
// at 10..13, 28, 34, 44..47 and 52..55 and put the source address at 68..71.
constexpr size_t kAes67OffsetRecordType = 18;
constexpr size_t kAes67OffsetOrigin = 44;
constexpr size_t kAes67OffsetFlowId = 76;
constexpr size_t kAes67OffsetRxChannel = 96;
constexpr size_t kAes67OffsetChannelCount = 98;
constexpr size_t kAes67OffsetFlowChannel = 102;
constexpr size_t kAes67OffsetEncoding = 104;
constexpr size_t kAes67OffsetChannelCount8 = 105;
constexpr size_t kAes67OffsetRtpPort = 106;
constexpr size_t kAes67OffsetGroup = 108;

// Strings in response bodies are addressed by absolute frame offset.
bool ReadFrameString(const Frame& frame, uint16_t offset, std::string* out) {
  if (offset < kFrameHeaderSize) {
    return false;
  }
  return internal::ReadStringAt(frame.body.data(), frame.body.size(),
                                offset - kFrameHeaderSize, out);
}

std::string FormatMac(const uint8_t* mac) {
  char buffer[18] = {0};
  std::snprintf(buffer, sizeof(buffer), "%02x:%02x:%02x:%02x:%02x:%02x",
                mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
  return buffer;
}

std::optional<std::string> NonEmpty(std::string value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

const char* CommandName(Command command) {
  switch (command) {
    case Command::kChannelCount:
      return "channel count";
    case Command::kDeviceName:
      return "device name";
    case Command::kDeviceInfo:
      return "device info";
    case Command::kDeviceStatus:
      return "device status";
    case Command::kTxChannels:
      return "tx channels";
    case Command::kRxChannels:
      return "rx channels";
    case Command::kAddSubscription:
      return "add subscription";
    case Command::kRemoveSubscription:
      return "remove subscription";
    case Command::kIdentify:
      return "identify";
    case Command::kSetSampleRate:
      return "set sample rate";
    case Command::kSetLatency:
      return "set latency";
    case Command::kSetEncoding:
      return "set encoding";
    case Command::kSetGain:
      return "set gain";
    case Command::kSetAes67Mode:
      return "set aes67 mode";
    case Command::kAes67Subscribe:
      return "aes67 subscribe";
  }
  return "unknown";
}

// Errors that mean the device cannot be reached at all this cycle.
bool IsUnreachable(const Error& error) {
  return error.code == ErrorCode::kTimeout || error.code == ErrorCode::kShutdown ||
         error.code == ErrorCode::kSocketError;
}

void KeepFirst(Error* first, const Error& error) {
  if (first->code == ErrorCode::kNone && error.code != ErrorCode::kNone) {
    *first = error;
  }
}

// Matches replies carrying the request's sequence number. Datagrams too short
// to carry one are passed through so the decoder can report them.
UdpTransport::ResponseMatcher SequenceMatcher(uint16_t sequence) {
  return [sequence](const uint8_t* data, size_t length) {
    return length < kOffsetSequence + 2 || ReadBe16(data, kOffsetSequence) == sequence;
  };
}

}  // namespace

CommandCodec::CommandCodec(uint16_t magic) : magic_(magic) {}

std::vector<uint8_t> CommandCodec::Encode(uint16_t command, uint16_t sequence,
                                          const std::vector<uint8_t>& body) const {
  const size_t total = kFrameHeaderSize + body.size();
  if (total > kMaxFrameLength) {
    return {};
  }
  std::vector<uint8_t> frame(kFrameHeaderSize);
  WriteBe16(frame, kOffsetMagic, magic_);
  WriteBe16(frame, kOffsetLength, static_cast<uint32_t>(total));
  WriteBe16(frame, kOffsetSequence, sequence);
  WriteBe16(frame, kOffsetCommand, command);
  frame.insert(frame.end(), body.begin(), body.end());
  return frame;
}

bool CommandCodec::Decode(const uint8_t* data, size_t length, Frame* out,
                          Error* error) const {
  if (!out) {
    return SetError(error, ErrorCode::kInvalidArgument, "decode output is null");
  }
  if (data == nullptr || length < kFrameHeaderSize) {
    return SetError(error, ErrorCode::kMalformedFrame,
                    "frame truncated: " + std::to_string(length) + " bytes");
  }
  const uint16_t magic = ReadBe16(data, kOffsetMagic);
  if (magic != magic_) {
    std::ostringstream oss;
    oss << "unexpected magic 0x" << std::hex << magic << " (expected 0x" << magic_ << ")";
    return SetError(error, ErrorCode::kMalformedFrame, oss.str());
  }
  const uint16_t declared = ReadBe16(data, kOffsetLength);
  if (declared != length) {
    return SetError(error, ErrorCode::kMalformedFrame,
                    "length field " + std::to_string(declared) +
                        " does not match datagram size " + std::to_string(length));
  }
  out->magic = magic;
  out->length = declared;
  out->sequence = ReadBe16(data, kOffsetSequence);
  out->command = ReadBe16(data, kOffsetCommand);
  out->body.assign(data + kFrameHeaderSize, data + length);
  return true;
}

bool CommandCodec::Decode(const std::vector<uint8_t>& data, Frame* out,
                          Error* error) const {
  return Decode(data.data(), data.size(), out, error);
}

UdpTransport::UdpTransport(const std::atomic<bool>* cancel) : cancel_(cancel) {}

bool UdpTransport::Request(const std::string& ip_address, uint16_t port,
                           const std::vector<uint8_t>& payload,
                           std::chrono::milliseconds timeout,
                           std::vector<uint8_t>* response,
                           Error* error,
                           const ResponseMatcher& matcher) const {
  if (!response) {
    return SetError(error, ErrorCode::kInvalidArgument, "response buffer is null");
  }
  in_addr address{};
  if (port == 0 || !internal::ParseIpv4(ip_address, &address)) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    "invalid destination " + ip_address + ":" + std::to_string(port));
  }
  const sockaddr_in destination = internal::MakeSockaddr(ip_address, port);

  internal::UdpSocket socket;
  if (!socket.Open(0, "0.0.0.0", false)) {
    return SetError(error, ErrorCode::kSocketError, socket.last_error());
  }

  std::array<uint8_t, kMaxDatagramSize> buffer{};
  for (int attempt = 0; attempt < kAttempts; ++attempt) {
    if (internal::IsCancelled(cancel_)) {
      return SetError(error, ErrorCode::kShutdown, "request cancelled");
    }
    const ssize_t sent = socket.SendTo(payload, destination);
    if (sent < 0 || static_cast<size_t>(sent) != payload.size()) {
      return SetError(error, ErrorCode::kSocketError,
                      "sendto(" + ip_address + ":" + std::to_string(port) +
                          ") failed: " + std::strerror(errno));
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
      if (internal::IsCancelled(cancel_)) {
        return SetError(error, ErrorCode::kShutdown, "request cancelled");
      }
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        break;
      }
      auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      wait = std::max(std::chrono::milliseconds(1),
                      std::min(wait, internal::kCancelPollSlice));
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
      if (bytes < 0) {
        continue;
      }
      if (from.sin_addr.s_addr != destination.sin_addr.s_addr ||
          from.sin_port != destination.sin_port) {
        continue;
      }
      const size_t length = static_cast<size_t>(bytes);
      if (matcher && !matcher(buffer.data(), length)) {
        continue;
      }
      response->assign(buffer.begin(), buffer.begin() + length);
      return true;
    }
  }
  return SetError(error, ErrorCode::kTimeout,
                  "no reply from " + ip_address + ":" + std::to_string(port) +
                      " after " + std::to_string(kAttempts) + " attempts");
}

DeviceClient::DeviceClient(DeviceEndpoint endpoint, ClientOptions options)
    : endpoint_(std::move(endpoint)),
      options_(std::move(options)),
      transport_(options_.cancel),
      native_codec_(kNativeMagic),
      settings_codec_(kSettingsMagic) {}

DeviceEndpoint DeviceClient::endpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoint_;
}

void DeviceClient::UpdateEndpoint(const DeviceEndpoint& endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  endpoint_ = endpoint;
}

uint16_t DeviceClient::last_sequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sequence_;
}

// Send one command and return the decoded reply. Must hold mutex_.
bool DeviceClient::Transact(const CommandCodec& codec, uint16_t port, Command command,
                            const std::vector<uint8_t>& body, Frame* reply,
                            Error* error) {
  const std::string context = endpoint_.name + ": " + CommandName(command) + ": ";
  if (port == 0) {
    return SetError(error, ErrorCode::kInvalidArgument, context + "no port for device");
  }
  const uint16_t sequence = ++sequence_;
  const auto request = codec.Encode(static_cast<uint16_t>(command), sequence, body);
  if (request.empty()) {
    return SetError(error, ErrorCode::kInvalidArgument, context + "command body too large");
  }
  std::vector<uint8_t> raw;
  Error step;
  if (!transport_.Request(endpoint_.ip_address, port, request, options_.request_timeout,
                          &raw, &step, SequenceMatcher(sequence))) {
    return SetError(error, step.code, context + step.message);
  }
  Frame frame;
  if (!codec.Decode(raw, &frame, &step)) {
    return SetError(error, step.code, context + step.message);
  }
  if (frame.command != static_cast<uint16_t>(command)) {
    std::ostringstream oss;
    oss << context << "reply echoed command 0x" << std::hex << frame.command;
    return SetError(error, ErrorCode::kCommandFailure, oss.str());
  }
  *reply = std::move(frame);
  return true;
}

bool DeviceClient::SendControl(const CommandCodec& codec, uint16_t port, Command command,
                               const std::vector<uint8_t>& body, Error* error) {
  Frame reply;
  return Transact(codec, port, command, body, &reply, error);
}

bool DeviceClient::QueryChannelCount(uint16_t* tx_count, uint16_t* rx_count,
                                     Error* error) {
  Frame reply;
  if (!Transact(native_codec_, endpoint_.control_port, Command::kChannelCount, {}, &reply,
                error)) {
    return false;
  }
  if (reply.body.size() < 4) {
    return SetError(error, ErrorCode::kMalformedFrame,
                    endpoint_.name + ": channel count reply too short");
  }
  *tx_count = ReadBe16(reply.body.data(), 0);
  *rx_count = ReadBe16(reply.body.data(), 2);
  return true;
}

bool DeviceClient::QueryRxTable(std::optional<uint16_t> expected,
                                std::vector<RxRecord>* out, Error* error) {
  std::vector<RxRecord> records;
  if (expected.has_value() && expected.value() == 0) {
    *out = std::move(records);
    return true;
  }
  uint16_t first = 1;
  for (size_t page = 0; page < kMaxChannelPages; ++page) {
    std::vector<uint8_t> body;
    AppendBe16(body, first);
    Frame reply;
    if (!Transact(native_codec_, endpoint_.control_port, Command::kRxChannels, body,
                  &reply, error)) {
      return false;
    }
    const uint8_t* data = reply.body.data();
    const size_t size = reply.body.size();
    if (size < kPageCountSize) {
      return SetError(error, ErrorCode::kMalformedFrame,
                      endpoint_.name + ": rx channel page too short");
    }
    const uint16_t count = ReadBe16(data, 0);
    if (count > kChannelPageSize || size < kPageCountSize + count * kRxRecordSize) {
      return SetError(error, ErrorCode::kMalformedFrame,
                      endpoint_.name + ": rx channel page truncated");
    }
    for (uint16_t i = 0; i < count; ++i) {
      const size_t offset = kPageCountSize + i * kRxRecordSize;
      RxRecord record;
      record.channel.direction = ChannelDirection::kRx;
      record.channel.number = ReadBe16(data, offset);
      const uint16_t name_offset = ReadBe16(data, offset + 2);
      const uint16_t tx_channel_offset = ReadBe16(data, offset + 4);
      const uint16_t tx_device_offset = ReadBe16(data, offset + 6);
      record.status = ReadBe16(data, offset + 8);
      if (!ReadFrameString(reply, name_offset, &record.channel.name) ||
          (tx_channel_offset != 0 &&
           !ReadFrameString(reply, tx_channel_offset, &record.tx_channel)) ||
          (tx_device_offset != 0 &&
           !ReadFrameString(reply, tx_device_offset, &record.tx_device))) {
        return SetError(error, ErrorCode::kMalformedFrame,
                        endpoint_.name + ": rx channel " +
                            std::to_string(record.channel.number) + " has a bad string offset");
      }
      records.push_back(std::move(record));
    }
    if (count < kChannelPageSize ||
        (expected.has_value() && records.size() >= expected.value())) {
      break;
    }
    first = static_cast<uint16_t>(first + kChannelPageSize);
  }
  *out = std::move(records);
  return true;
}

bool DeviceClient::QueryTxTable(std::optional<uint16_t> expected,
                                std::vector<Channel>* out, Error* error) {
  std::vector<Channel> channels;
  if (expected.has_value() && expected.value() == 0) {
    *out = std::move(channels);
    return true;
  }
  uint16_t first = 1;
  for (size_t page = 0; page < kMaxChannelPages; ++page) {
    std::vector<uint8_t> body;
    AppendBe16(body, first);
    Frame reply;
    if (!Transact(native_codec_, endpoint_.control_port, Command::kTxChannels, body,
                  &reply, error)) {
      return false;
    }
    const uint8_t* data = reply.body.data();
    const size_t size = reply.body.size();
    if (size < kPageCountSize) {
      return SetError(error, ErrorCode::kMalformedFrame,
                      endpoint_.name + ": tx channel page too short");
    }
    const uint16_t count = ReadBe16(data, 0);
    if (count > kChannelPageSize || size < kPageCountSize + count * kTxRecordSize) {
      return SetError(error, ErrorCode::kMalformedFrame,
                      endpoint_.name + ": tx channel page truncated");
    }
    for (uint16_t i = 0; i < count; ++i) {
      const size_t offset = kPageCountSize + i * kTxRecordSize;
      Channel channel;
      channel.direction = ChannelDirection::kTx;
      channel.number = ReadBe16(data, offset);
      if (!ReadFrameString(reply, ReadBe16(data, offset + 2), &channel.name)) {
        return SetError(error, ErrorCode::kMalformedFrame,
                        endpoint_.name + ": tx channel " + std::to_string(channel.number) +
                            " has a bad string offset");
      }
      channels.push_back(std::move(channel));
    }
    if (count < kChannelPageSize ||
        (expected.has_value() && channels.size() >= expected.value())) {
      break;
    }
    first = static_cast<uint16_t>(first + kChannelPageSize);
  }
  *out = std::move(channels);
  return true;
}

bool DeviceClient::GetDeviceInfoLocked(DeviceInfo* out, Error* error) {
  DeviceInfo info;
  Error first;
  bool any = false;

  Frame reply;
  Error step;
  if (Transact(native_codec_, endpoint_.control_port, Command::kDeviceName, {}, &reply,
               &step)) {
    std::string name;
    if (ReadFrameString(reply, kFrameHeaderSize, &name)) {
      info.name = NonEmpty(std::move(name));
      any = any || info.name.has_value();
    } else {
      SetError(&step, ErrorCode::kMalformedFrame, endpoint_.name + ": device name unterminated");
    }
  }
  KeepFirst(&first, step);

  if (!IsUnreachable(step)) {
    step = Error{};
    if (Transact(native_codec_, endpoint_.control_port, Command::kDeviceInfo, {}, &reply,
                 &step)) {
      if (reply.body.size() < kMacLength) {
        SetError(&step, ErrorCode::kMalformedFrame, endpoint_.name + ": device info too short");
      } else {
        const uint8_t* mac = reply.body.data();
        if (std::any_of(mac, mac + kMacLength, [](uint8_t b) { return b != 0; })) {
          info.mac_address = FormatMac(mac);
          any = true;
        }
        std::array<std::optional<std::string>*, 4> fields = {
            &info.manufacturer, &info.model, &info.model_id, &info.software_version};
        uint16_t offset = static_cast<uint16_t>(kFrameHeaderSize + kMacLength);
        for (auto* field : fields) {
          std::string value;
          if (!ReadFrameString(reply, offset, &value)) {
            break;
          }
          offset = static_cast<uint16_t>(offset + value.size() + 1);
          *field = NonEmpty(std::move(value));
          any = any || field->has_value();
        }
      }
    }
    KeepFirst(&first, step);
  }

  if (error) {
    *error = first;
  }
  if (!any) {
    if (first.code == ErrorCode::kNone) {
      SetError(error, ErrorCode::kMalformedFrame, endpoint_.name + ": device info empty");
    }
    return false;
  }
  *out = std::move(info);
  return true;
}

void DeviceClient::GetDeviceStatusLocked(DeviceStatus* out, uint16_t tx_count,
                                         uint16_t rx_count, Error* error) {
  DeviceStatus status;
  status.tx_count = tx_count;
  status.rx_count = rx_count;
  Frame reply;
  if (Transact(native_codec_, endpoint_.control_port, Command::kDeviceStatus, {}, &reply,
               error)) {
    if (reply.body.size() < kStatusBodySize) {
      SetError(error, ErrorCode::kMalformedFrame, endpoint_.name + ": device status too short");
    } else {
      const uint8_t* data = reply.body.data();
      if (const uint32_t rate = ReadBe32(data, 0)) {
        status.sample_rate = rate;
      }
      if (const uint32_t latency = ReadBe32(data, 4)) {
        status.latency_us = latency;
      }
      if (const uint16_t bits = ReadBe16(data, 8)) {
        status.encoding_bits = bits;
      }
    }
  }
  // Fall back to what discovery advertised.
  if (!status.sample_rate) {
    status.sample_rate = endpoint_.advertised_sample_rate;
  }
  if (!status.latency_us) {
    status.latency_us = endpoint_.advertised_latency_us;
  }
  *out = status;
}

std::vector<Subscription> DeviceClient::SubscriptionsFrom(
    const std::vector<RxRecord>& records) const {
  std::vector<Subscription> subscriptions;
  for (const auto& record : records) {
    if (record.tx_channel.empty() || record.tx_device.empty()) {
      continue;
    }
    Subscription subscription;
    subscription.rx_device = endpoint_.name;
    subscription.rx_channel = record.channel.number;
    subscription.rx_channel_name = record.channel.name;
    subscription.tx_device = record.tx_device;
    subscription.tx_channel = record.tx_channel;
    subscription.status_code = record.status;
    subscriptions.push_back(std::move(subscription));
  }
  return subscriptions;
}

bool DeviceClient::GetDeviceInfo(DeviceInfo* out, Error* error) {
  if (!out) {
    return SetError(error, ErrorCode::kInvalidArgument, "device info output is null");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return GetDeviceInfoLocked(out, error);
}

bool DeviceClient::GetDeviceStatus(DeviceStatus* out, Error* error) {
  if (!out) {
    return SetError(error, ErrorCode::kInvalidArgument, "device status output is null");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  uint16_t tx_count = 0;
  uint16_t rx_count = 0;
  if (!QueryChannelCount(&tx_count, &rx_count, error)) {
    return false;
  }
  Error ignored;
  GetDeviceStatusLocked(out, tx_count, rx_count, &ignored);
  return true;
}

bool DeviceClient::GetChannels(ChannelList* out, Error* error) {
  if (!out) {
    return SetError(error, ErrorCode::kInvalidArgument, "channel output is null");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  uint16_t tx_count = 0;
  uint16_t rx_count = 0;
  std::optional<uint16_t> tx_expected;
  std::optional<uint16_t> rx_expected;
  Error step;
  if (QueryChannelCount(&tx_count, &rx_count, &step)) {
    tx_expected = tx_count;
    rx_expected = rx_count;
  } else if (IsUnreachable(step)) {
    return SetError(error, step.code, step.message);
  }
  std::vector<RxRecord> records;
  ChannelList channels;
  if (!QueryRxTable(rx_expected, &records, error) ||
      !QueryTxTable(tx_expected, &channels.tx, error)) {
    return false;
  }
  for (auto& record : records) {
    channels.rx.push_back(std::move(record.channel));
  }
  *out = std::move(channels);
  return true;
}

bool DeviceClient::GetSubscriptions(std::vector<Subscription>* out, Error* error) {
  if (!out) {
    return SetError(error, ErrorCode::kInvalidArgument, "subscription output is null");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RxRecord> records;
  if (!QueryRxTable(std::nullopt, &records, error)) {
    return false;
  }
  *out = SubscriptionsFrom(records);
  return true;
}

bool DeviceClient::Poll(DevicePoll* out, std::chrono::steady_clock::time_point deadline) {
  if (!out) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  DevicePoll poll;
  auto halted = [&]() {
    if (internal::IsCancelled(options_.cancel)) {
      KeepFirst(&poll.error, {ErrorCode::kShutdown, endpoint_.name + ": poll cancelled"});
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      KeepFirst(&poll.error,
                {ErrorCode::kTimeout, endpoint_.name + ": cycle deadline reached"});
      return true;
    }
    return false;
  };
  auto section_failed = [&](const char* section, const Error& step) {
    KeepFirst(&poll.error, step);
    if (!IsUnreachable(step)) {
      internal::LogMessage(endpoint_.name + ": " + section + " unavailable: " + step.message,
                           options_.log_callback);
    }
    return IsUnreachable(step);
  };

  do {
    if (halted()) {
      break;
    }
    Error step;
    DeviceInfo info;
    if (GetDeviceInfoLocked(&info, &step)) {
      poll.info = std::move(info);
    }
    if (step.code != ErrorCode::kNone && section_failed("device info", step)) {
      break;
    }

    if (halted()) {
      break;
    }
    step = Error{};
    uint16_t tx_count = 0;
    uint16_t rx_count = 0;
    std::optional<uint16_t> tx_expected;
    std::optional<uint16_t> rx_expected;
    if (QueryChannelCount(&tx_count, &rx_count, &step)) {
      tx_expected = tx_count;
      rx_expected = rx_count;
      DeviceStatus status;
      Error status_step;
      GetDeviceStatusLocked(&status, tx_count, rx_count, &status_step);
      poll.status = status;
      if (status_step.code != ErrorCode::kNone && section_failed("device status", status_step)) {
        break;
      }
    } else if (section_failed("channel count", step)) {
      break;
    }

    if (halted()) {
      break;
    }
    step = Error{};
    std::vector<RxRecord> records;
    const bool have_rx = QueryRxTable(rx_expected, &records, &step);
    if (have_rx) {
      poll.subscriptions = SubscriptionsFrom(records);
    } else if (section_failed("rx channels", step)) {
      break;
    }

    if (halted()) {
      break;
    }
    step = Error{};
    std::vector<Channel> tx_channels;
    if (QueryTxTable(tx_expected, &tx_channels, &step)) {
      if (have_rx) {
        ChannelList channels;
        for (auto& record : records) {
          channels.rx.push_back(std::move(record.channel));
        }
        channels.tx = std::move(tx_channels);
        poll.channels = std::move(channels);
      }
    } else if (section_failed("tx channels", step)) {
      break;
    }
  } while (false);

  *out = std::move(poll);
  return !out->empty();
}

bool DeviceClient::SetSampleRate(uint32_t rate, Error* error) {
  if (!IsSupportedSampleRate(rate)) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    "unsupported sample rate " + std::to_string(rate));
  }
  std::vector<uint8_t> body;
  AppendBe32(body, rate);
  std::lock_guard<std::mutex> lock(mutex_);
  return SendControl(settings_codec_, endpoint_.settings_port, Command::kSetSampleRate, body,
                     error);
}

bool DeviceClient::SetLatency(uint32_t latency_us, Error* error) {
  if (latency_us < kMinLatencyUs || latency_us > kMaxLatencyUs) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    "latency " + std::to_string(latency_us) + " us outside " +
                        std::to_string(kMinLatencyUs) + ".." + std::to_string(kMaxLatencyUs));
  }
  std::vector<uint8_t> body;
  AppendBe32(body, latency_us);
  std::lock_guard<std::mutex> lock(mutex_);
  return SendControl(settings_codec_, endpoint_.settings_port, Command::kSetLatency, body,
                     error);
}

bool DeviceClient::SetEncoding(uint16_t bits, Error* error) {
  if (!IsSupportedEncoding(bits)) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    "unsupported encoding " + std::to_string(bits) + " bits");
  }
  std::vector<uint8_t> body;
  AppendBe32(body, bits);
  std::lock_guard<std::mutex> lock(mutex_);
  return SendControl(settings_codec_, endpoint_.settings_port, Command::kSetEncoding, body,
                     error);
}

bool DeviceClient::SetGain(GainDirection direction, uint16_t channel, uint8_t level,
                           Error* error) {
  if (channel == 0) {
    return SetError(error, ErrorCode::kInvalidArgument, "gain channel must be 1-based");
  }
  if (level < kMinGainLevel || level > kMaxGainLevel) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    "gain level " + std::to_string(level) + " outside 1..5");
  }
  std::vector<uint8_t> body;
  AppendBe16(body, channel);
  body.push_back(static_cast<uint8_t>(direction));
  body.push_back(level);
  std::lock_guard<std::mutex> lock(mutex_);
  return SendControl(settings_codec_, endpoint_.settings_port, Command::kSetGain, body, error);
}

bool DeviceClient::SetAes67Mode(bool enabled, Error* error) {
  const std::vector<uint8_t> body = {static_cast<uint8_t>(enabled ? 0x01 : 0x00)};
  std::lock_guard<std::mutex> lock(mutex_);
  return SendControl(settings_codec_, endpoint_.settings_port, Command::kSetAes67Mode, body,
                     error);
}

bool DeviceClient::Identify(Error* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  return SendControl(settings_codec_, endpoint_.settings_port, Command::kIdentify, {}, error);
}

bool DeviceClient::AddNativeSubscription(uint16_t rx_channel, const std::string& tx_device,
                                         const std::string& tx_channel, Error* error) {
  if (rx_channel == 0) {
    return SetError(error, ErrorCode::kInvalidArgument, "rx channel must be 1-based");
  }
  if (tx_device.empty() || tx_channel.empty()) {
    return SetError(error, ErrorCode::kInvalidArgument, "tx device and channel are required");
  }
  // u16 rx channel, u16 tx channel offset, u16 tx device offset, strings.
  const size_t channel_offset = kFrameHeaderSize + 6;
  const size_t device_offset = channel_offset + tx_channel.size() + 1;
  if (device_offset + tx_device.size() + 1 > kMaxFrameLength) {
    return SetError(error, ErrorCode::kInvalidArgument, "tx names too long");
  }
  std::vector<uint8_t> body;
  AppendBe16(body, rx_channel);
  AppendBe16(body, static_cast<uint32_t>(channel_offset));
  AppendBe16(body, static_cast<uint32_t>(device_offset));
  AppendString(body, tx_channel);
  AppendString(body, tx_device);
  std::lock_guard<std::mutex> lock(mutex_);
  return SendControl(native_codec_, endpoint_.control_port, Command::kAddSubscription, body,
                     error);
}

bool DeviceClient::RemoveNativeSubscription(uint16_t rx_channel, Error* error) {
  if (rx_channel == 0) {
    return SetError(error, ErrorCode::kInvalidArgument, "rx channel must be 1-based");
  }
  std::vector<uint8_t> body;
  AppendBe16(body, 1);
  AppendBe16(body, rx_channel);
  std::lock_guard<std::mutex> lock(mutex_);
  return SendControl(native_codec_, endpoint_.control_port, Command::kRemoveSubscription, body,
                     error);
}

Aes67SubscriptionClient::Aes67SubscriptionClient(ClientOptions options, uint16_t port)
    : options_(std::move(options)),
      port_(port),
      transport_(options_.cancel),
      sequence_(static_cast<uint16_t>(std::random_device{}() & 0xffff)) {}

Aes67Encoding Aes67SubscriptionClient::EncodingForCodec(const std::string& codec) {
  const std::string prefix = codec.substr(0, codec.find('/'));
  if (prefix == "L16") {
    return Aes67Encoding::kL16;
  }
  if (prefix == "L32") {
    return Aes67Encoding::kL32;
  }
  return Aes67Encoding::kL24;
}

bool Aes67SubscriptionClient::BuildSubscribeFrame(uint16_t sequence, uint16_t rx_channel,
                                                  uint8_t flow_channel,
                                                  const Aes67Stream& stream,
                                                  std::vector<uint8_t>* out, Error* error) {
  if (!out) {
    return SetError(error, ErrorCode::kInvalidArgument, "frame output is null");
  }
  if (rx_channel == 0) {
    return SetError(error, ErrorCode::kInvalidArgument, "rx channel must be 1-based");
  }
  if (flow_channel == 0 || flow_channel > stream.channels) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    "flow channel " + std::to_string(flow_channel) + " outside 1.." +
                        std::to_string(stream.channels) + " of " + stream.session_name);
  }
  if (stream.port == 0) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    stream.session_name + ": no RTP port announced");
  }
  in_addr origin{};
  in_addr group{};
  if (!internal::ParseIpv4(stream.origin_ip, &origin)) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    stream.session_name + ": origin '" + stream.origin_ip + "' is not IPv4");
  }
  if (!internal::ParseIpv4(stream.multicast_addr, &group)) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    stream.session_name + ": group '" + stream.multicast_addr +
                        "' is not IPv4");
  }
  const std::string& id = stream.session_id;
  if (id.empty() || !std::all_of(id.begin(), id.end(),
                                 [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return SetError(error, ErrorCode::kInvalidArgument,
                    stream.session_name + ": session id '" + id + "' is not numeric");
  }
  const uint32_t flow_id =
      static_cast<uint32_t>(std::strtoull(id.c_str(), nullptr, 10) & 0xffffffffull);

  std::vector<uint8_t> frame(kAes67FrameSize, 0x00);
  WriteBe16(frame, kOffsetMagic, kAes67Magic);
  WriteBe16(frame, kOffsetLength, static_cast<uint32_t>(kAes67FrameSize));
  WriteBe16(frame, kOffsetSequence, sequence);
  WriteBe16(frame, kOffsetCommand, static_cast<uint16_t>(Command::kAes67Subscribe));
  WriteBe16(frame, kAes67OffsetRecordType, kAes67RecordType);
  std::memcpy(frame.data() + kAes67OffsetOrigin, &origin, sizeof(origin));
  WriteBe32(frame, kAes67OffsetFlowId, flow_id);
  WriteBe16(frame, kAes67OffsetRxChannel, rx_channel);
  WriteBe16(frame, kAes67OffsetChannelCount, stream.channels);
  frame[kAes67OffsetFlowChannel] = flow_channel;
  frame[kAes67OffsetEncoding] = static_cast<uint8_t>(EncodingForCodec(stream.codec));
  frame[kAes67OffsetChannelCount8] = static_cast<uint8_t>(stream.channels & 0xff);
  WriteBe16(frame, kAes67OffsetRtpPort, stream.port);
  std::memcpy(frame.data() + kAes67OffsetGroup, &group, sizeof(group));
  *out = std::move(frame);
  return true;
}

bool Aes67SubscriptionClient::Subscribe(const DeviceEndpoint& rx_device, uint16_t rx_channel,
                                        const Aes67Stream& stream, uint8_t flow_channel,
                                        Error* error) {
  uint16_t sequence = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sequence = ++sequence_;
  }
  std::vector<uint8_t> frame;
  if (!BuildSubscribeFrame(sequence, rx_channel, flow_channel, stream, &frame, error)) {
    return false;
  }
  const std::string context = rx_device.name + ": aes67 subscribe rx " +
                              std::to_string(rx_channel) + ": ";
  std::vector<uint8_t> reply;
  Error step;
  if (!transport_.Request(rx_device.ip_address, port_, frame, options_.request_timeout,
                          &reply, &step, SequenceMatcher(sequence))) {
    return SetError(error, step.code, context + step.message);
  }
  if (reply.size() < kFrameHeaderSize) {
    return SetError(error, ErrorCode::kMalformedFrame,
                    context + "reply truncated: " + std::to_string(reply.size()) + " bytes");
  }
  const uint16_t magic = ReadBe16(reply.data(), kOffsetMagic);
  if (magic != kAes67ResponseMagic && magic != kAes67Magic) {
    std::ostringstream oss;
    oss << context << "unexpected reply magic 0x" << std::hex << magic;
    return SetError(error, ErrorCode::kMalformedFrame, oss.str());
  }
  const uint16_t command = ReadBe16(reply.data(), kOffsetCommand);
  if (command != static_cast<uint16_t>(Command::kAes67Subscribe)) {
    std::ostringstream oss;
    oss << context << "reply echoed command 0x" << std::hex << command;
    return SetError(error, ErrorCode::kCommandFailure, oss.str());
  }
  return true;
}

#ifdef DANTE_TESTING
namespace test {

std::vector<uint8_t> BuildDeviceNameResponse(uint16_t sequence, const std::string& name) {
  std::vector<uint8_t> body;
  AppendString(body, name);
  return CommandCodec(kNativeMagic)
      .Encode(static_cast<uint16_t>(Command::kDeviceName), sequence, body);
}

std::vector<uint8_t> BuildDeviceInfoResponse(uint16_t sequence,
                                             const std::array<uint8_t, 6>& mac_address,
                                             const std::string& manufacturer,
                                             const std::string& model,
                                             const std::string& model_id,
                                             const std::string& software_version) {
  std::vector<uint8_t> body(mac_address.begin(), mac_address.end());
  AppendString(body, manufacturer);
  AppendString(body, model);
  AppendString(body, model_id);
  AppendString(body, software_version);
  return CommandCodec(kNativeMagic)
      .Encode(static_cast<uint16_t>(Command::kDeviceInfo), sequence, body);
}

std::vector<uint8_t> BuildChannelCountResponse(uint16_t sequence, uint16_t tx_count,
                                               uint16_t rx_count) {
  std::vector<uint8_t> body;
  AppendBe16(body, tx_count);
  AppendBe16(body, rx_count);
  return CommandCodec(kNativeMagic)
      .Encode(static_cast<uint16_t>(Command::kChannelCount), sequence, body);
}

std::vector<uint8_t> BuildDeviceStatusResponse(uint16_t sequence, uint32_t sample_rate,
                                               uint32_t latency_us, uint16_t encoding_bits) {
  std::vector<uint8_t> body;
  AppendBe32(body, sample_rate);
  AppendBe32(body, latency_us);
  AppendBe16(body, encoding_bits);
  return CommandCodec(kNativeMagic)
      .Encode(static_cast<uint16_t>(Command::kDeviceStatus), sequence, body);
}

std::vector<uint8_t> BuildRxChannelsResponse(uint16_t sequence,
                                             const std::vector<RxChannelRecord>& records) {
  std::vector<uint8_t> body;
  std::vector<uint8_t> strings;
  const size_t strings_base =
      kFrameHeaderSize + kPageCountSize + records.size() * kRxRecordSize;
  auto place = [&](const std::string& text) -> uint16_t {
    if (text.empty()) {
      return 0;
    }
    const size_t offset = strings_base + strings.size();
    AppendString(strings, text);
    return static_cast<uint16_t>(offset);
  };
  AppendBe16(body, static_cast<uint32_t>(records.size()));
  for (const auto& record : records) {
    AppendBe16(body, record.number);
    const size_t name_offset = strings_base + strings.size();
    AppendString(strings, record.name);
    AppendBe16(body, static_cast<uint32_t>(name_offset));
    AppendBe16(body, place(record.tx_channel));
    AppendBe16(body, place(record.tx_device));
    AppendBe16(body, record.status);
  }
  body.insert(body.end(), strings.begin(), strings.end());
  return CommandCodec(kNativeMagic)
      .Encode(static_cast<uint16_t>(Command::kRxChannels), sequence, body);
}

std::vector<uint8_t> BuildTxChannelsResponse(uint16_t sequence,
                                             const std::vector<Channel>& channels) {
  std::vector<uint8_t> body;
  std::vector<uint8_t> strings;
  const size_t strings_base =
      kFrameHeaderSize + kPageCountSize + channels.size() * kTxRecordSize;
  AppendBe16(body, static_cast<uint32_t>(channels.size()));
  for (const auto& channel : channels) {
    AppendBe16(body, channel.number);
    AppendBe16(body, static_cast<uint32_t>(strings_base + strings.size()));
    AppendString(strings, channel.name);
  }
  body.insert(body.end(), strings.begin(), strings.end());
  return CommandCodec(kNativeMagic)
      .Encode(static_cast<uint16_t>(Command::kTxChannels), sequence, body);
}

std::vector<uint8_t> BuildAckResponse(uint16_t magic, uint16_t sequence, uint16_t command) {
  return CommandCodec(magic).Encode(command, sequence, {});
}

bool ParseChannelPageRequest(const Frame& frame, uint16_t* first_channel) {
  if (!first_channel || frame.body.size() < 2) {
    return false;
  }
  *first_channel = ReadBe16(frame.body.data(), 0);
  return true;
}

bool ParseAddSubscriptionRequest(const Frame& frame, uint16_t* rx_channel,
                                 std::string* tx_channel, std::string* tx_device) {
  if (!rx_channel || !tx_channel || !tx_device || frame.body.size() < 6) {
    return false;
  }
  const uint8_t* data = frame.body.data();
  *rx_channel = ReadBe16(data, 0);
  return ReadFrameString(frame, ReadBe16(data, 2), tx_channel) &&
         ReadFrameString(frame, ReadBe16(data, 4), tx_device);
}

bool ParseRemoveSubscriptionRequest(const Frame& frame, uint16_t* rx_channel) {
  if (!rx_channel || frame.body.size() < 4 || ReadBe16(frame.body.data(), 0) != 1) {
    return false;
  }
  *rx_channel = ReadBe16(frame.body.data(), 2);
  return true;
}

}  // namespace test
#endif

}  // namespace dante
