#pragma once

#include "dante/dante.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dante {

/**
 * Decoded frame header plus body.
 */
struct Frame {
  uint16_t magic = 0;
  /// Total frame length including the 8-byte header.
  uint16_t length = 0;
  uint16_t sequence = 0;
  uint16_t command = 0;
  std::vector<uint8_t> body;
};

/**
 * Encoder/decoder for the fixed 8-byte command header
 * (magic, length, sequence, command) followed by a command body.
 */
class CommandCodec {
 public:
  explicit CommandCodec(uint16_t magic = kNativeMagic);

  uint16_t magic() const { return magic_; }

  /// Build a frame. Returns an empty vector if the body does not fit the
  /// 16-bit length field.
  std::vector<uint8_t> Encode(uint16_t command, uint16_t sequence,
                              const std::vector<uint8_t>& body) const;

  /// Decode a frame, rejecting a wrong magic, a truncated header or a length
  /// field that disagrees with the datagram size.
  bool Decode(const uint8_t* data, size_t length, Frame* out,
              Error* error = nullptr) const;
  bool Decode(const std::vector<uint8_t>& data, Frame* out,
              Error* error = nullptr) const;

 private:
  uint16_t magic_;
};

/**
 * Stateless UDP request/response primitive. Each request uses a fresh
 * socket, waits for a matching reply from the destination and retries once
 * on timeout.
 */
class UdpTransport {
 public:
  /// Return true for datagrams that answer the request; others are ignored.
  using ResponseMatcher = std::function<bool(const uint8_t*, size_t)>;

  /// Attempts per request (the first send plus one retry).
  static constexpr int kAttempts = 2;

  /// @param cancel Optional flag; when set, waits end with kShutdown.
  explicit UdpTransport(const std::atomic<bool>* cancel = nullptr);

  bool Request(const std::string& ip_address, uint16_t port,
               const std::vector<uint8_t>& payload,
               std::chrono::milliseconds timeout,
               std::vector<uint8_t>* response,
               Error* error = nullptr,
               const ResponseMatcher& matcher = nullptr) const;

 private:
  const std::atomic<bool>* cancel_;
};

/**
 * Options shared by the protocol clients.
 */
struct ClientOptions {
  std::chrono::milliseconds request_timeout{1000};
  /// Optional cancellation flag owned by the caller.
  const std::atomic<bool>* cancel = nullptr;
  LogCallback log_callback;
};

struct ChannelList {
  std::vector<Channel> rx;
  std::vector<Channel> tx;
};

/**
 * Result of one device poll. Sections that could not be read stay empty.
 */
struct DevicePoll {
  std::optional<DeviceInfo> info;
  std::optional<DeviceStatus> status;
  std::optional<ChannelList> channels;
  std::optional<std::vector<Subscription>> subscriptions;
  /// First error observed during the poll, if any.
  Error error;

  bool empty() const {
    return !info && !status && !channels && !subscriptions;
  }
};

/**
 * Native control client bound to one device. Commands are issued one at a
 * time with a per-instance increasing sequence number.
 */
class DeviceClient {
 public:
  explicit DeviceClient(DeviceEndpoint endpoint, ClientOptions options = {});

  DeviceClient(const DeviceClient&) = delete;
  DeviceClient& operator=(const DeviceClient&) = delete;

  DeviceEndpoint endpoint() const;
  /// Follow address or port changes reported by discovery.
  void UpdateEndpoint(const DeviceEndpoint& endpoint);

  /// Name and identity fields. Succeeds if any field could be read.
  bool GetDeviceInfo(DeviceInfo* out, Error* error = nullptr);
  /// Channel counts, sample rate, latency and encoding.
  bool GetDeviceStatus(DeviceStatus* out, Error* error = nullptr);
  bool GetChannels(ChannelList* out, Error* error = nullptr);
  /// One entry per bound RX channel.
  bool GetSubscriptions(std::vector<Subscription>* out, Error* error = nullptr);

  /**
   * Read every section with a single RX table scan. A timeout stops the
   * poll (device unreachable); other failures only lose their section.
   * out->error keeps the first failure either way.
   *
   * @return false when no section could be read.
   */
  bool Poll(DevicePoll* out,
            std::chrono::steady_clock::time_point deadline =
                std::chrono::steady_clock::time_point::max());

  bool SetSampleRate(uint32_t rate, Error* error = nullptr);
  bool SetLatency(uint32_t latency_us, Error* error = nullptr);
  bool SetEncoding(uint16_t bits, Error* error = nullptr);
  bool SetGain(GainDirection direction, uint16_t channel, uint8_t level,
               Error* error = nullptr);
  bool SetAes67Mode(bool enabled, Error* error = nullptr);
  bool Identify(Error* error = nullptr);

  /// Bind an RX channel of this device to a named TX channel.
  bool AddNativeSubscription(uint16_t rx_channel, const std::string& tx_device,
                             const std::string& tx_channel, Error* error = nullptr);
  bool RemoveNativeSubscription(uint16_t rx_channel, Error* error = nullptr);

  /// Sequence number used by the most recent command.
  uint16_t last_sequence() const;

 private:
  struct RxRecord {
    Channel channel;
    std::string tx_channel;
    std::string tx_device;
    uint16_t status = 0;
  };

  bool Transact(const CommandCodec& codec, uint16_t port, Command command,
                const std::vector<uint8_t>& body, Frame* reply, Error* error);
  bool SendControl(const CommandCodec& codec, uint16_t port, Command command,
                   const std::vector<uint8_t>& body, Error* error);
  bool QueryChannelCount(uint16_t* tx_count, uint16_t* rx_count, Error* error);
  bool QueryRxTable(std::optional<uint16_t> expected, std::vector<RxRecord>* out,
                    Error* error);
  bool QueryTxTable(std::optional<uint16_t> expected, std::vector<Channel>* out,
                    Error* error);
  bool GetDeviceInfoLocked(DeviceInfo* out, Error* error);
  void GetDeviceStatusLocked(DeviceStatus* out, uint16_t tx_count, uint16_t rx_count,
                             Error* error);
  std::vector<Subscription> SubscriptionsFrom(const std::vector<RxRecord>& records) const;

  DeviceEndpoint endpoint_;
  ClientOptions options_;
  UdpTransport transport_;
  CommandCodec native_codec_;
  CommandCodec settings_codec_;
  uint16_t sequence_ = 0;
  mutable std::mutex mutex_;
};

/**
 * Builds and sends the 112-byte AES67 subscribe frame.
 */
class Aes67SubscriptionClient {
 public:
  explicit Aes67SubscriptionClient(ClientOptions options = {},
                                   uint16_t port = kAes67CommandPort);

  Aes67SubscriptionClient(const Aes67SubscriptionClient&) = delete;
  Aes67SubscriptionClient& operator=(const Aes67SubscriptionClient&) = delete;

  /**
   * Build a subscribe frame binding rx_channel to flow_channel of stream.
   *
   * @return false if an address or the session id cannot be encoded.
   */
  static bool BuildSubscribeFrame(uint16_t sequence, uint16_t rx_channel,
                                  uint8_t flow_channel, const Aes67Stream& stream,
                                  std::vector<uint8_t>* out, Error* error = nullptr);

  /// Encoding byte for a codec string such as "L24/48000/2" (L24 if unknown).
  static Aes67Encoding EncodingForCodec(const std::string& codec);

  /// Send the subscribe frame and verify the echoed command and sequence.
  bool Subscribe(const DeviceEndpoint& rx_device, uint16_t rx_channel,
                 const Aes67Stream& stream, uint8_t flow_channel,
                 Error* error = nullptr);

 private:
  ClientOptions options_;
  uint16_t port_;
  UdpTransport transport_;
  std::mutex mutex_;
  uint16_t sequence_;
};

}  // namespace dante
