#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dante {

class Coordinator;

#ifdef DANTE_TESTING
namespace test {
void SetEndpointLastSeen(Coordinator& coordinator,
                         const std::string& server_name,
                         std::chrono::steady_clock::time_point when);
void PruneEndpoints(Coordinator& coordinator,
                    std::chrono::steady_clock::time_point now);
size_t GetEndpointRecordCount(Coordinator& coordinator);
/// The next `count` internal thread starts throw std::system_error.
void RefuseThreadStarts(Coordinator& coordinator, int count);
}  // namespace test
#endif

/**
 * Well-known UDP ports and addresses.
 */
constexpr uint16_t kSapPort = 9875;
constexpr uint16_t kAes67CommandPort = 4440;
constexpr uint16_t kSettingsPort = 8700;
constexpr char kSapMulticastAddress[] = "239.255.255.255";

/**
 * Frame magic numbers. Native control frames and settings frames share the
 * same 8-byte header layout; AES67 subscribe frames use their own magic.
 */
constexpr uint16_t kNativeMagic = 0x27ff;
constexpr uint16_t kSettingsMagic = 0xffff;
constexpr uint16_t kAes67Magic = 0x2809;
constexpr uint16_t kAes67ResponseMagic = 0x2801;

constexpr size_t kFrameHeaderSize = 8;
constexpr size_t kAes67FrameSize = 112;
constexpr uint16_t kAes67RecordType = 0x4202;

/// Records returned per channel table request.
constexpr size_t kChannelPageSize = 16;

constexpr uint32_t kMinLatencyUs = 150;
constexpr uint32_t kMaxLatencyUs = 10000;
constexpr uint8_t kMinGainLevel = 1;
constexpr uint8_t kMaxGainLevel = 5;

/**
 * Command codes carried in bytes 6-7 of every frame.
 */
enum class Command : uint16_t {
  kChannelCount = 0x1000,
  kDeviceName = 0x1002,
  kDeviceInfo = 0x1003,
  kDeviceStatus = 0x1100,
  kTxChannels = 0x2000,
  kRxChannels = 0x3000,
  kAddSubscription = 0x3010,
  kRemoveSubscription = 0x3014,
  kIdentify = 0x0063,
  kSetSampleRate = 0x0081,
  kSetLatency = 0x0082,
  kSetEncoding = 0x0083,
  kSetGain = 0x0084,
  kSetAes67Mode = 0x0085,
  kAes67Subscribe = 0x3201,
};

/**
 * Sample encoding byte used in the AES67 subscribe frame.
 */
enum class Aes67Encoding : uint8_t {
  kL16 = 0x06,
  kL24 = 0x08,
  kL32 = 0x0a,
};

enum class ChannelDirection : uint8_t {
  kRx,
  kTx,
};

/// Gain direction byte of the set-gain command.
enum class GainDirection : uint8_t {
  kInput = 0x01,
  kOutput = 0x02,
};

/**
 * Error taxonomy shared by every component.
 */
enum class ErrorCode {
  kNone,
  kTimeout,
  kMalformedFrame,
  kParseError,
  kCommandFailure,
  kPartialPollFailure,
  kSocketError,
  kInvalidArgument,
  kNotFound,
  kShutdown,
};

struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;
};

const char* ErrorCodeName(ErrorCode code);

using LogCallback = std::function<void(const std::string&)>;

/// Sample rates accepted by SetSampleRate.
bool IsSupportedSampleRate(uint32_t rate);
/// Bit depths accepted by SetEncoding (16, 24, 32).
bool IsSupportedEncoding(uint32_t bits);
/// True for AVIO input adapters (gain applies to TX channels).
bool IsAvioInputModel(const std::string& model_id);
/// True for AVIO output adapters (gain applies to RX channels).
bool IsAvioOutputModel(const std::string& model_id);

/**
 * Network identity of a controllable device, as produced by discovery.
 */
struct DeviceEndpoint {
  /// Normalized host name (no trailing dot or ".local").
  std::string name;
  /// IPv4 address of the device.
  std::string ip_address;
  /// Native control port (from the ARC service). 0 if unknown.
  uint16_t control_port = 0;
  /// Settings port for sample rate, latency, gain and identify.
  uint16_t settings_port = kSettingsPort;
  std::string mac_address;
  std::string manufacturer;
  std::string model;
  std::string model_id;
  std::string software_version;
  /// Values advertised in discovery TXT records, if any.
  std::optional<uint32_t> advertised_sample_rate;
  std::optional<uint32_t> advertised_latency_us;
};

/**
 * Identity fields reported by the device. Missing fields stay empty.
 */
struct DeviceInfo {
  std::optional<std::string> name;
  std::optional<std::string> manufacturer;
  std::optional<std::string> model;
  std::optional<std::string> model_id;
  std::optional<std::string> software_version;
  std::optional<std::string> mac_address;
};

/**
 * Volatile per-device state, refreshed every poll.
 */
struct DeviceStatus {
  std::optional<uint32_t> sample_rate;
  std::optional<uint32_t> latency_us;
  std::optional<uint16_t> encoding_bits;
  uint16_t rx_count = 0;
  uint16_t tx_count = 0;
};

struct Channel {
  ChannelDirection direction = ChannelDirection::kRx;
  /// 1-based channel number, stable within a session.
  uint16_t number = 0;
  std::string name;
};

/**
 * Native subscription of one RX channel to a TX channel, as reported by the
 * RX device.
 */
struct Subscription {
  std::string rx_device;
  uint16_t rx_channel = 0;
  std::string rx_channel_name;
  std::string tx_device;
  std::string tx_channel;
  uint16_t status_code = 0;
};

/**
 * One announced AES67 multicast flow, keyed by session name.
 */
struct Aes67Stream {
  std::string session_name;
  /// Verbatim o= session id; reused as the flow identifier.
  std::string session_id;
  std::string origin_ip;
  std::string multicast_addr;
  uint16_t port = 0;
  int payload_type = -1;
  /// rtpmap encoding, e.g. "L24/48000/2".
  std::string codec;
  uint16_t channels = 1;
  std::vector<std::string> channel_names;
  /// Last time an announcement for this session was merged.
  std::chrono::steady_clock::time_point last_seen;

  /// Encoding prefix of the codec string ("L24"), empty if unknown.
  std::string encoding() const;
};

bool operator==(const Aes67Stream& lhs, const Aes67Stream& rhs);
bool operator!=(const Aes67Stream& lhs, const Aes67Stream& rhs);

/**
 * Local override recording that an RX channel is bound to an AES67 flow
 * channel. AES67 bindings are not visible through the native subscription
 * query, so this record wins over native data.
 */
struct Aes67Selection {
  std::string device;
  uint16_t rx_channel = 0;
  std::string stream;
  /// 1-based channel index within the flow.
  uint8_t flow_channel = 0;
};

using SelectionKey = std::pair<std::string, uint16_t>;

enum class SourceKind {
  kNone,
  kAes67,
  kNative,
};

/**
 * Effective source of an RX channel.
 */
struct SourceRef {
  SourceKind kind = SourceKind::kNone;
  /// Native source (kNative).
  std::string tx_device;
  std::string tx_channel;
  /// AES67 source (kAes67).
  std::string stream;
  uint8_t flow_channel = 0;
};

/**
 * Everything known about one device at the end of a cycle.
 */
struct DeviceSnapshot {
  /// Device-reported name, falling back to the discovery host name.
  std::string name;
  DeviceEndpoint endpoint;
  DeviceInfo info;
  DeviceStatus status;
  std::vector<Channel> rx_channels;
  std::vector<Channel> tx_channels;
  std::vector<Subscription> subscriptions;
  /// True when the last poll failed and these values are from an earlier cycle.
  bool stale = false;
  uint32_t consecutive_failures = 0;
  std::chrono::steady_clock::time_point last_updated;

  const Channel* FindRxChannel(uint16_t number) const;
  const Channel* FindTxChannel(uint16_t number) const;
  const Subscription* FindSubscription(uint16_t rx_channel) const;
};

/**
 * Immutable network-wide state published once per cycle.
 */
struct NetworkSnapshot {
  uint64_t cycle = 0;
  std::chrono::steady_clock::time_point published;
  std::map<std::string, DeviceSnapshot> devices;
  std::map<std::string, Aes67Stream> aes67_streams;
  std::map<SelectionKey, Aes67Selection> aes67_selections;

  const DeviceSnapshot* FindDevice(const std::string& name) const;
  /// AES67 selection first, then native subscription, then none.
  SourceRef EffectiveSource(const std::string& device, uint16_t rx_channel) const;
};

/// Render a source as a picker label ("Dev - Ch", "[AES67] Stream - Ch", "None").
std::string DescribeSource(const NetworkSnapshot& snapshot, const SourceRef& source);

/**
 * mDNS service events delivered by the host's discovery browser.
 */
enum class DiscoveryEventType {
  kAdded,
  kRemoved,
};

struct DiscoveryEvent {
  DiscoveryEventType type = DiscoveryEventType::kAdded;
  /// e.g. "_netaudio-arc._udp.local."
  std::string service_type;
  /// Full service instance name.
  std::string service_name;
  /// SRV target host; normalized before use.
  std::string server_name;
  std::string ip_address;
  uint16_t port = 0;
  /// Decoded TXT record properties.
  std::map<std::string, std::string> properties;
};

/**
 * Lightweight counters for cycles, commands and error reporting.
 */
struct CoordinatorMetrics {
  uint64_t cycles_completed = 0;
  uint64_t cycles_failed = 0;
  uint64_t device_polls = 0;
  uint64_t device_poll_failures = 0;
  uint64_t sap_packets_received = 0;
  uint64_t sdp_parse_errors = 0;
  uint64_t commands_sent = 0;
  uint64_t command_failures = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Coordinator configuration for polling, SAP capture and timing behavior.
 */
struct Config {
  using LogCallback = dante::LogCallback;

  /// Time between the end of one cycle and the start of the next.
  std::chrono::milliseconds poll_interval{30000};
  /// Per-attempt reply timeout for every UDP request (one retry follows).
  std::chrono::milliseconds request_timeout{1000};
  /// No command is started for a device after this much of a cycle elapsed.
  std::chrono::milliseconds cycle_deadline{25000};
  /// Upper bound on concurrent device poll workers.
  size_t max_poll_workers = 8;

  /// Enable SAP capture during each cycle.
  bool sap_enabled = true;
  /// Local interface used to join the SAP group (empty: derive per cycle).
  std::string sap_interface_address;
  std::string sap_multicast_address = kSapMulticastAddress;
  uint16_t sap_port = kSapPort;
  /// Collection window for SAP announcements.
  std::chrono::milliseconds sap_window{10000};

  /// Destination port for AES67 subscribe frames.
  uint16_t aes67_command_port = kAes67CommandPort;
  /// Streams not re-announced within this time are dropped (0 keeps them).
  std::chrono::milliseconds aes67_stream_ttl{300000};
  /// Discovered hosts not refreshed within this time are dropped.
  std::chrono::milliseconds endpoint_timeout{300000};

  /// Optional SAP capture file (binary).
  std::string sap_capture_file;
  /// Optional SAP replay file (binary); replaces the multicast socket.
  std::string sap_replay_file;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Polls every discovered device, collects SAP announcements and publishes a
 * consistent network snapshot once per cycle. Also the entry point for
 * routing and control commands.
 */
class Coordinator {
 public:
  using SnapshotCallback =
      std::function<void(const std::shared_ptr<const NetworkSnapshot>&)>;
  using EndpointProvider =
      std::function<bool(std::vector<DeviceEndpoint>*, std::string*)>;

  /// Construct a coordinator with the provided configuration.
  explicit Coordinator(Config config);
  /// Stop the polling thread.
  ~Coordinator();

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  /// Validate configuration and start the polling thread.
  bool Start();
  /// Abandon the in-flight cycle and stop the polling thread.
  void Stop();

  /// Run one full cycle synchronously and publish its snapshot.
  bool PollOnce(Error* error = nullptr);

  /// Feed an mDNS service event into the endpoint registry.
  void HandleDiscoveryEvent(const DiscoveryEvent& event);
  /// Replace the endpoint registry with a host-provided endpoint list.
  void SetEndpointProvider(EndpointProvider provider);
  /// Set callback invoked after every snapshot publish.
  void SetSnapshotCallback(SnapshotCallback cb);

  /// Return the last published snapshot (never null).
  std::shared_ptr<const NetworkSnapshot> GetSnapshot() const;
  /// Effective source of an RX channel in the current snapshot.
  SourceRef EffectiveSource(const std::string& device, uint16_t rx_channel) const;
  /// Every TX channel and AES67 flow channel as a picker label.
  std::vector<std::string> ListSources() const;

  bool AddNativeSubscription(const std::string& rx_device, uint16_t rx_channel,
                             const std::string& tx_device, uint16_t tx_channel,
                             Error* error = nullptr);
  bool RemoveNativeSubscription(const std::string& rx_device, uint16_t rx_channel,
                                Error* error = nullptr);
  bool SetSampleRate(const std::string& device, uint32_t rate, Error* error = nullptr);
  bool SetLatency(const std::string& device, uint32_t latency_us, Error* error = nullptr);
  bool SetEncoding(const std::string& device, uint16_t bits, Error* error = nullptr);
  bool SetGain(const std::string& device, uint16_t channel, uint8_t level,
               Error* error = nullptr);
  bool Identify(const std::string& device, Error* error = nullptr);
  bool SetAes67Mode(const std::string& device, bool enabled, Error* error = nullptr);

  /// Subscribe an RX channel to an AES67 flow channel and record the selection.
  bool AddAes67Subscription(const std::string& rx_device, uint16_t rx_channel,
                            const std::string& stream, uint8_t flow_channel,
                            Error* error = nullptr);
  /// Forget the AES67 selection for an RX channel. Returns false if none existed.
  bool RemoveAes67Selection(const std::string& rx_device, uint16_t rx_channel);

  /// Return the last Start()/cycle error message, if any.
  std::string GetLastError() const;
  /// Return metrics for cycles, commands and errors.
  CoordinatorMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef DANTE_TESTING
  friend void test::SetEndpointLastSeen(Coordinator& coordinator,
                                        const std::string& server_name,
                                        std::chrono::steady_clock::time_point when);
  friend void test::PruneEndpoints(Coordinator& coordinator,
                                   std::chrono::steady_clock::time_point now);
  friend size_t test::GetEndpointRecordCount(Coordinator& coordinator);
  friend void test::RefuseThreadStarts(Coordinator& coordinator, int count);
#endif
};

}  // namespace dante
