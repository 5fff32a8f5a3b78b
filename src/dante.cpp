#include "dante/dante.h"
#include "dante/protocol.h"
#include "dante/sap.h"

#include "internal.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <set>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace dante {
namespace {

constexpr char kArcServiceType[] = "_netaudio-arc._udp";
constexpr char kCmcServiceType[] = "_netaudio-cmc._udp";
constexpr char kDanteViaRouter[] = "Dante Via";

constexpr std::array<uint32_t, 6> kSupportedSampleRates = {44100, 48000, 88200,
                                                           96000, 176400, 192000};

void LogError(const std::string& message, const Config* config) {
  internal::LogMessage(message, config ? config->log_callback : LogCallback());
}

void LogCallbackError(const char* name, const std::string& what, const Config* config) {
  std::string message = "callback threw exception: ";
  message += name;
  if (!what.empty()) {
    message += ": " + what;
  }
  LogError(message, config);
}

// "studio-rack.local." -> "studio-rack".
std::string NormalizeServerName(std::string name) {
  while (!name.empty() && name.back() == '.') {
    name.pop_back();
  }
  const std::string suffix = ".local";
  if (name.size() > suffix.size() &&
      name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
    name.resize(name.size() - suffix.size());
  }
  return name;
}

bool IsServiceType(const std::string& service_type, const char* expected) {
  return service_type.compare(0, std::strlen(expected), expected) == 0;
}

std::optional<uint32_t> ParseProperty(const std::map<std::string, std::string>& properties,
                                      const std::string& key) {
  auto it = properties.find(key);
  if (it == properties.end() || it->second.empty() || it->second.size() > 12 ||
      !std::all_of(it->second.begin(), it->second.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  const unsigned long long value = std::stoull(it->second);
  if (value > 0xffffffffull) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

std::string JoinNames(const std::vector<std::string>& names) {
  std::ostringstream oss;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    oss << names[i];
  }
  return oss.str();
}

std::string FlowChannelName(const Aes67Stream* stream, uint8_t flow_channel) {
  if (stream && flow_channel >= 1 && flow_channel <= stream->channel_names.size()) {
    return stream->channel_names[flow_channel - 1];
  }
  return "Ch" + std::to_string(flow_channel);
}

}  // namespace

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kMalformedFrame:
      return "malformed frame";
    case ErrorCode::kParseError:
      return "parse error";
    case ErrorCode::kCommandFailure:
      return "command failure";
    case ErrorCode::kPartialPollFailure:
      return "partial poll failure";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kInvalidArgument:
      return "invalid argument";
    case ErrorCode::kNotFound:
      return "not found";
    case ErrorCode::kShutdown:
      return "shutdown";
  }
  return "unknown";
}

bool IsSupportedSampleRate(uint32_t rate) {
  return std::find(kSupportedSampleRates.begin(), kSupportedSampleRates.end(), rate) !=
         kSupportedSampleRates.end();
}

bool IsSupportedEncoding(uint32_t bits) {
  return bits == 16 || bits == 24 || bits == 32;
}

bool IsAvioInputModel(const std::string& model_id) {
  return model_id == "DAI1" || model_id == "DAI2";
}

bool IsAvioOutputModel(const std::string& model_id) {
  return model_id == "DAO1" || model_id == "DAO2";
}

std::string Aes67Stream::encoding() const {
  return codec.substr(0, codec.find('/'));
}

bool operator==(const Aes67Stream& lhs, const Aes67Stream& rhs) {
  return lhs.session_name == rhs.session_name && lhs.session_id == rhs.session_id &&
         lhs.origin_ip == rhs.origin_ip && lhs.multicast_addr == rhs.multicast_addr &&
         lhs.port == rhs.port && lhs.payload_type == rhs.payload_type &&
         lhs.codec == rhs.codec && lhs.channels == rhs.channels &&
         lhs.channel_names == rhs.channel_names && lhs.last_seen == rhs.last_seen;
}

bool operator!=(const Aes67Stream& lhs, const Aes67Stream& rhs) {
  return !(lhs == rhs);
}

const Channel* DeviceSnapshot::FindRxChannel(uint16_t number) const {
  for (const auto& channel : rx_channels) {
    if (channel.number == number) {
      return &channel;
    }
  }
  return nullptr;
}

const Channel* DeviceSnapshot::FindTxChannel(uint16_t number) const {
  for (const auto& channel : tx_channels) {
    if (channel.number == number) {
      return &channel;
    }
  }
  return nullptr;
}

const Subscription* DeviceSnapshot::FindSubscription(uint16_t rx_channel) const {
  for (const auto& subscription : subscriptions) {
    if (subscription.rx_channel == rx_channel) {
      return &subscription;
    }
  }
  return nullptr;
}

// Matches the discovery key first, then the device-reported name.
const DeviceSnapshot* NetworkSnapshot::FindDevice(const std::string& name) const {
  auto it = devices.find(name);
  if (it != devices.end()) {
    return &it->second;
  }
  for (const auto& entry : devices) {
    if (entry.second.name == name) {
      return &entry.second;
    }
  }
  return nullptr;
}

SourceRef NetworkSnapshot::EffectiveSource(const std::string& device,
                                           uint16_t rx_channel) const {
  SourceRef source;
  const DeviceSnapshot* snapshot = FindDevice(device);
  const std::string key = snapshot ? snapshot->endpoint.name : device;

  auto selection = aes67_selections.find({key, rx_channel});
  if (selection == aes67_selections.end() && key != device) {
    selection = aes67_selections.find({device, rx_channel});
  }
  if (selection != aes67_selections.end()) {
    source.kind = SourceKind::kAes67;
    source.stream = selection->second.stream;
    source.flow_channel = selection->second.flow_channel;
    return source;
  }
  if (snapshot) {
    if (const Subscription* subscription = snapshot->FindSubscription(rx_channel)) {
      source.kind = SourceKind::kNative;
      source.tx_device = subscription->tx_device;
      source.tx_channel = subscription->tx_channel;
    }
  }
  return source;
}

std::string DescribeSource(const NetworkSnapshot& snapshot, const SourceRef& source) {
  switch (source.kind) {
    case SourceKind::kNative:
      return source.tx_device + " - " + source.tx_channel;
    case SourceKind::kAes67: {
      auto it = snapshot.aes67_streams.find(source.stream);
      const Aes67Stream* stream = it == snapshot.aes67_streams.end() ? nullptr : &it->second;
      return "[AES67] " + source.stream + " - " + FlowChannelName(stream, source.flow_channel);
    }
    case SourceKind::kNone:
      break;
  }
  return "None";
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    in_addr parsed{};
    return internal::ParseIpv4(addr, &parsed);
  };
  if (poll_interval.count() <= 0 || request_timeout.count() <= 0 ||
      cycle_deadline.count() <= 0) {
    return fail("poll_interval, request_timeout and cycle_deadline must be positive");
  }
  if (cycle_deadline < request_timeout) {
    return fail("cycle_deadline must be >= request_timeout");
  }
  if (max_poll_workers == 0) {
    return fail("max_poll_workers must be non-zero");
  }
  if (!sap_interface_address.empty() && !is_valid_ipv4(sap_interface_address)) {
    return fail("sap_interface_address must be a valid IPv4 address");
  }
  in_addr group{};
  if (!internal::ParseIpv4(sap_multicast_address, &group) ||
      !IN_MULTICAST(ntohl(group.s_addr))) {
    return fail("sap_multicast_address must be an IPv4 multicast address");
  }
  if (sap_port == 0 || aes67_command_port == 0) {
    return fail("sap_port and aes67_command_port must be non-zero");
  }
  if (sap_window.count() <= 0) {
    return fail("sap_window must be positive");
  }
  if (aes67_stream_ttl.count() < 0) {
    return fail("aes67_stream_ttl must not be negative");
  }
  if (endpoint_timeout.count() <= 0) {
    return fail("endpoint_timeout must be positive");
  }
  if (!sap_capture_file.empty() && !sap_replay_file.empty()) {
    return fail("sap_capture_file and sap_replay_file are mutually exclusive");
  }
  return true;
}

struct CoordinatorMetricsAtomic {
  std::atomic<uint64_t> cycles_completed{0};
  std::atomic<uint64_t> cycles_failed{0};
  std::atomic<uint64_t> device_polls{0};
  std::atomic<uint64_t> device_poll_failures{0};
  std::atomic<uint64_t> sap_packets_received{0};
  std::atomic<uint64_t> sdp_parse_errors{0};
  std::atomic<uint64_t> commands_sent{0};
  std::atomic<uint64_t> command_failures{0};
  std::atomic<uint64_t> callback_exceptions{0};

  CoordinatorMetrics Snapshot() const {
    CoordinatorMetrics snapshot;
    snapshot.cycles_completed = cycles_completed.load();
    snapshot.cycles_failed = cycles_failed.load();
    snapshot.device_polls = device_polls.load();
    snapshot.device_poll_failures = device_poll_failures.load();
    snapshot.sap_packets_received = sap_packets_received.load();
    snapshot.sdp_parse_errors = sdp_parse_errors.load();
    snapshot.commands_sent = commands_sent.load();
    snapshot.command_failures = command_failures.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

struct Coordinator::Impl {
#ifdef DANTE_TESTING
  friend void test::SetEndpointLastSeen(Coordinator& coordinator,
                                        const std::string& server_name,
                                        std::chrono::steady_clock::time_point when);
  friend void test::PruneEndpoints(Coordinator& coordinator,
                                   std::chrono::steady_clock::time_point now);
  friend size_t test::GetEndpointRecordCount(Coordinator& coordinator);
  friend void test::RefuseThreadStarts(Coordinator& coordinator, int count);
#endif

  explicit Impl(Config config)
      : config_(std::move(config)),
        aes67_client_(ClientOptionsFor(), config_.aes67_command_port),
        snapshot_(std::make_shared<const NetworkSnapshot>()) {}

  ~Impl() { Stop(); }

  bool Start() {
    if (std::this_thread::get_id() == poll_thread_id_.load()) {
      SetLastError("cannot start from the poll thread");
      return false;
    }
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
      return true;
    }
    SetLastError("");
    std::string error;
    if (!config_.Validate(&error)) {
      SetLastError(error);
      LogError(error, &config_);
      return false;
    }
    // A callback may have stopped the loop without joining it.
    if (poll_thread_.joinable()) {
      poll_thread_.join();
    }
    cancel_ = false;
    running_ = true;
    try {
      poll_thread_ = StartThread([this]() { PollLoop(); });
      poll_thread_id_ = poll_thread_.get_id();
    } catch (const std::exception& ex) {
      SetLastError(std::string("thread start failed: ") + ex.what());
      LogError(GetLastError(), &config_);
      running_ = false;
      return false;
    }
    return true;
  }

  void Stop() {
    cancel_ = true;
    {
      std::lock_guard<std::mutex> lock(wake_mutex_);
      running_ = false;
    }
    wake_cv_.notify_all();
    // Called from a callback on the poll thread: the loop exits on its own and
    // the next Start or the destructor joins it.
    if (std::this_thread::get_id() == poll_thread_id_.load()) {
      return;
    }
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (poll_thread_.joinable()) {
      poll_thread_.join();
      poll_thread_id_ = std::thread::id();
    }
  }

  bool PollOnce(Error* error) {
    std::string message;
    if (!config_.Validate(&message)) {
      SetLastError(message);
      return internal::SetError(error, ErrorCode::kInvalidArgument, message);
    }
    return RunCycle(error);
  }

  void HandleDiscoveryEvent(const DiscoveryEvent& event) {
    std::string server = NormalizeServerName(event.server_name);
    if (server.empty()) {
      server = NormalizeServerName(event.service_name.substr(0, event.service_name.find('.')));
    }
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    if (event.type == DiscoveryEventType::kRemoved) {
      for (auto it = endpoints_.begin(); it != endpoints_.end();) {
        if (server.empty() || it->first == server) {
          it->second.services.erase(event.service_name);
        }
        if (it->second.services.empty()) {
          it = endpoints_.erase(it);
        } else {
          ++it;
        }
      }
      return;
    }
    if (server.empty()) {
      LogError("discovery event without a host name: " + event.service_name, &config_);
      return;
    }
    auto& record = endpoints_[server];
    auto& service = record.services[event.service_name];
    service.service_type = event.service_type;
    service.ip_address = event.ip_address;
    service.port = event.port;
    service.properties = event.properties;
    record.last_seen = std::chrono::steady_clock::now();
  }

  void SetEndpointProvider(EndpointProvider provider) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    endpoint_provider_ = std::move(provider);
  }

  void SetSnapshotCallback(SnapshotCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    snapshot_cb_ = std::move(cb);
  }

  std::shared_ptr<const NetworkSnapshot> GetSnapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return snapshot_;
  }

  std::vector<std::string> ListSources() const {
    const auto snapshot = GetSnapshot();
    std::vector<std::string> sources;
    for (const auto& entry : snapshot->devices) {
      for (const auto& channel : entry.second.tx_channels) {
        sources.push_back(entry.second.name + " - " + channel.name);
      }
    }
    for (const auto& entry : snapshot->aes67_streams) {
      for (const auto& name : entry.second.channel_names) {
        sources.push_back("[AES67] " + entry.first + " - " + name);
      }
    }
    return sources;
  }

  bool AddNativeSubscription(const std::string& rx_device, uint16_t rx_channel,
                             const std::string& tx_device, uint16_t tx_channel,
                             Error* error) {
    DeviceSnapshot rx;
    DeviceSnapshot tx;
    if (!ResolveDevice(rx_device, &rx, error) || !ResolveDevice(tx_device, &tx, error)) {
      return false;
    }
    if (!rx.rx_channels.empty() && rx.FindRxChannel(rx_channel) == nullptr) {
      return internal::SetError(error, ErrorCode::kNotFound,
                                rx.name + " has no rx channel " + std::to_string(rx_channel));
    }
    const Channel* source = tx.FindTxChannel(tx_channel);
    if (source == nullptr) {
      return internal::SetError(error, ErrorCode::kNotFound,
                                tx.name + " has no tx channel " + std::to_string(tx_channel));
    }
    auto client = ClientFor(rx.endpoint);
    Error step;
    const bool ok = client->AddNativeSubscription(rx_channel, tx.name, source->name, &step);
    return RecordCommand(ok, step, error);
  }

  bool RemoveNativeSubscription(const std::string& rx_device, uint16_t rx_channel,
                                Error* error) {
    DeviceSnapshot rx;
    if (!ResolveDevice(rx_device, &rx, error)) {
      return false;
    }
    Error step;
    const bool ok = ClientFor(rx.endpoint)->RemoveNativeSubscription(rx_channel, &step);
    return RecordCommand(ok, step, error);
  }

  bool SetSampleRate(const std::string& device, uint32_t rate, Error* error) {
    DeviceSnapshot target;
    if (!ResolveDevice(device, &target, error)) {
      return false;
    }
    Error step;
    const bool ok = ClientFor(target.endpoint)->SetSampleRate(rate, &step);
    return RecordCommand(ok, step, error);
  }

  bool SetLatency(const std::string& device, uint32_t latency_us, Error* error) {
    DeviceSnapshot target;
    if (!ResolveDevice(device, &target, error)) {
      return false;
    }
    Error step;
    const bool ok = ClientFor(target.endpoint)->SetLatency(latency_us, &step);
    return RecordCommand(ok, step, error);
  }

  bool SetEncoding(const std::string& device, uint16_t bits, Error* error) {
    DeviceSnapshot target;
    if (!ResolveDevice(device, &target, error)) {
      return false;
    }
    Error step;
    const bool ok = ClientFor(target.endpoint)->SetEncoding(bits, &step);
    return RecordCommand(ok, step, error);
  }

  // AVIO input adapters take gain on TX channels, output adapters on RX.
  bool SetGain(const std::string& device, uint16_t channel, uint8_t level, Error* error) {
    DeviceSnapshot target;
    if (!ResolveDevice(device, &target, error)) {
      return false;
    }
    const std::string model_id = target.info.model_id.value_or(target.endpoint.model_id);
    GainDirection direction = GainDirection::kInput;
    const Channel* found = nullptr;
    if (IsAvioInputModel(model_id)) {
      direction = GainDirection::kInput;
      found = target.FindTxChannel(channel);
    } else if (IsAvioOutputModel(model_id)) {
      direction = GainDirection::kOutput;
      found = target.FindRxChannel(channel);
    } else {
      return internal::SetError(error, ErrorCode::kInvalidArgument,
                                target.name + " (" + (model_id.empty() ? "unknown model" : model_id) +
                                    ") does not support gain control");
    }
    const auto& channels =
        direction == GainDirection::kInput ? target.tx_channels : target.rx_channels;
    if (!channels.empty() && found == nullptr) {
      return internal::SetError(error, ErrorCode::kNotFound,
                                target.name + " has no channel " + std::to_string(channel));
    }
    Error step;
    const bool ok = ClientFor(target.endpoint)->SetGain(direction, channel, level, &step);
    return RecordCommand(ok, step, error);
  }

  bool Identify(const std::string& device, Error* error) {
    DeviceSnapshot target;
    if (!ResolveDevice(device, &target, error)) {
      return false;
    }
    Error step;
    const bool ok = ClientFor(target.endpoint)->Identify(&step);
    return RecordCommand(ok, step, error);
  }

  bool SetAes67Mode(const std::string& device, bool enabled, Error* error) {
    DeviceSnapshot target;
    if (!ResolveDevice(device, &target, error)) {
      return false;
    }
    Error step;
    const bool ok = ClientFor(target.endpoint)->SetAes67Mode(enabled, &step);
    return RecordCommand(ok, step, error);
  }

  bool AddAes67Subscription(const std::string& rx_device, uint16_t rx_channel,
                            const std::string& stream_name, uint8_t flow_channel,
                            Error* error) {
    DeviceSnapshot rx;
    if (!ResolveDevice(rx_device, &rx, error)) {
      return false;
    }
    Aes67Stream stream;
    if (!stream_cache_.Find(stream_name, &stream)) {
      return internal::SetError(error, ErrorCode::kNotFound,
                                "no AES67 stream named '" + stream_name + "'");
    }
    Error step;
    const bool ok = aes67_client_.Subscribe(rx.endpoint, rx_channel, stream, flow_channel, &step);
    if (!RecordCommand(ok, step, error)) {
      return false;
    }
    Aes67Selection selection;
    selection.device = rx.endpoint.name;
    selection.rx_channel = rx_channel;
    selection.stream = stream_name;
    selection.flow_channel = flow_channel;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      selections_[{selection.device, rx_channel}] = selection;
    }
    RepublishSelections();
    return true;
  }

  bool RemoveAes67Selection(const std::string& rx_device, uint16_t rx_channel) {
    const auto snapshot = GetSnapshot();
    const DeviceSnapshot* device = snapshot->FindDevice(rx_device);
    const std::string key = device ? device->endpoint.name : rx_device;
    size_t erased = 0;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      erased = selections_.erase({key, rx_channel});
      if (erased == 0 && key != rx_device) {
        erased = selections_.erase({rx_device, rx_channel});
      }
    }
    if (erased == 0) {
      return false;
    }
    RepublishSelections();
    return true;
  }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

  CoordinatorMetrics GetMetrics() const {
    return metrics_.Snapshot();
  }

 private:
  struct ServiceRecord {
    std::string service_type;
    std::string ip_address;
    uint16_t port = 0;
    std::map<std::string, std::string> properties;
  };

  struct EndpointRecord {
    std::map<std::string, ServiceRecord> services;
    std::chrono::steady_clock::time_point last_seen;
  };

  struct PollResult {
    DevicePoll poll;
    bool ok = false;
  };

  ClientOptions ClientOptionsFor() const {
    ClientOptions options;
    options.request_timeout = config_.request_timeout;
    options.cancel = &cancel_;
    options.log_callback = config_.log_callback;
    return options;
  }

  void SetLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
  }

  void RecordCallbackException(const char* name, const std::string& what) {
    metrics_.callback_exceptions.fetch_add(1);
    LogCallbackError(name, what, &config_);
  }

  bool RecordCommand(bool ok, const Error& step, Error* error) {
    metrics_.commands_sent.fetch_add(1);
    if (ok) {
      return true;
    }
    metrics_.command_failures.fetch_add(1);
    LogError("command failed: " + step.message, &config_);
    return internal::SetError(error, step.code, step.message);
  }

  // Copy the device's current snapshot entry; commands never run after Stop().
  bool ResolveDevice(const std::string& name, DeviceSnapshot* out, Error* error) const {
    if (cancel_) {
      return internal::SetError(error, ErrorCode::kShutdown, "coordinator is stopping");
    }
    const auto snapshot = GetSnapshot();
    const DeviceSnapshot* device = snapshot->FindDevice(name);
    if (device == nullptr) {
      return internal::SetError(error, ErrorCode::kNotFound, "unknown device '" + name + "'");
    }
    *out = *device;
    return true;
  }

  // One client per device so sequence numbers keep increasing across cycles.
  // UpdateEndpoint waits for an in-flight poll of that device, so it runs
  // outside clients_mutex_.
  std::shared_ptr<DeviceClient> ClientFor(const DeviceEndpoint& endpoint) {
    std::shared_ptr<DeviceClient> client;
    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      auto& entry = clients_[endpoint.name];
      if (!entry) {
        entry = std::make_shared<DeviceClient>(endpoint, ClientOptionsFor());
        return entry;
      }
      client = entry;
    }
    client->UpdateEndpoint(endpoint);
    return client;
  }

  template <typename Fn>
  std::thread StartThread(Fn&& fn) {
#ifdef DANTE_TESTING
    if (refused_thread_starts_ > 0) {
      --refused_thread_starts_;
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                              "thread start refused");
    }
#endif
    return std::thread(std::forward<Fn>(fn));
  }

  void PollLoop() {
    poll_thread_id_ = std::this_thread::get_id();
    while (running_) {
      Error error;
      RunCycle(&error);
      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_cv_.wait_for(lock, config_.poll_interval, [this]() { return !running_.load(); });
    }
  }

  DeviceEndpoint BuildEndpoint(const std::string& server, const EndpointRecord& record) const {
    DeviceEndpoint endpoint;
    endpoint.name = server;
    for (const auto& entry : record.services) {
      const ServiceRecord& service = entry.second;
      const bool arc = IsServiceType(service.service_type, kArcServiceType);
      in_addr parsed{};
      if (internal::ParseIpv4(service.ip_address, &parsed) &&
          (endpoint.ip_address.empty() || arc)) {
        endpoint.ip_address = service.ip_address;
      }
      if (arc) {
        endpoint.control_port = service.port;
      }
      const auto& properties = service.properties;
      if (IsServiceType(service.service_type, kCmcServiceType)) {
        auto id = properties.find("id");
        if (id != properties.end()) {
          endpoint.mac_address = id->second;
        }
      }
      auto model = properties.find("model");
      if (model != properties.end() && !model->second.empty()) {
        endpoint.model_id = model->second;
      }
      if (auto rate = ParseProperty(properties, "rate")) {
        endpoint.advertised_sample_rate = rate;
      }
      if (auto latency_ns = ParseProperty(properties, "latency_ns")) {
        endpoint.advertised_latency_us = latency_ns.value() / 1000;
      }
      auto router = properties.find("router_info");
      if (router != properties.end() && router->second == kDanteViaRouter) {
        endpoint.software_version = kDanteViaRouter;
      }
    }
    return endpoint;
  }

  // Drop hosts whose services were not refreshed within endpoint_timeout.
  void RunPrune(std::chrono::steady_clock::time_point now) {
    std::vector<std::string> expired;
    {
      std::lock_guard<std::mutex> lock(endpoints_mutex_);
      for (auto it = endpoints_.begin(); it != endpoints_.end();) {
        if (now - it->second.last_seen > config_.endpoint_timeout) {
          expired.push_back(it->first);
          it = endpoints_.erase(it);
        } else {
          ++it;
        }
      }
    }
    if (!expired.empty()) {
      LogError("discovery expired: " + JoinNames(expired), &config_);
    }
  }

  bool ListEndpoints(std::vector<DeviceEndpoint>* endpoints, std::string* error) {
    EndpointProvider provider;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      provider = endpoint_provider_;
    }
    if (provider) {
      try {
        if (!provider(endpoints, error)) {
          if (error->empty()) {
            *error = "endpoint provider failed";
          }
          return false;
        }
      } catch (const std::exception& ex) {
        RecordCallbackException("EndpointProvider", ex.what());
        *error = std::string("endpoint provider threw: ") + ex.what();
        return false;
      }
    } else {
      RunPrune(std::chrono::steady_clock::now());
      std::lock_guard<std::mutex> lock(endpoints_mutex_);
      for (const auto& entry : endpoints_) {
        DeviceEndpoint endpoint = BuildEndpoint(entry.first, entry.second);
        if (endpoint.ip_address.empty()) {
          continue;
        }
        endpoints->push_back(std::move(endpoint));
      }
    }
    // Duplicate names would collide in the snapshot.
    std::set<std::string> seen;
    endpoints->erase(std::remove_if(endpoints->begin(), endpoints->end(),
                                    [&seen](const DeviceEndpoint& endpoint) {
                                      return endpoint.name.empty() ||
                                             !seen.insert(endpoint.name).second;
                                    }),
                     endpoints->end());
    if (endpoints->empty()) {
      *error = "no devices discovered";
      return false;
    }
    return true;
  }

  void CollectSap(const std::vector<DeviceEndpoint>& endpoints,
                  std::vector<std::string>* payloads) {
    SapOptions options;
    options.interface_address = config_.sap_interface_address;
    options.multicast_address = config_.sap_multicast_address;
    options.port = config_.sap_port;
    options.capture_file = config_.sap_capture_file;
    options.replay_file = config_.sap_replay_file;
    options.cancel = &cancel_;
    options.log_callback = config_.log_callback;
    if (options.replay_file.empty() && options.interface_address.empty()) {
      for (const auto& endpoint : endpoints) {
        if (FindLocalAddressFor(endpoint.ip_address, &options.interface_address)) {
          break;
        }
      }
      if (options.interface_address.empty()) {
        LogError("SAP skipped: no local interface toward any device", &config_);
        return;
      }
    }
    SapListener listener(options);
    Error error;
    const bool ok = listener.Collect(config_.sap_window, payloads, &error);
    metrics_.sap_packets_received.fetch_add(listener.packets_received());
    if (!ok && error.code != ErrorCode::kShutdown) {
      LogError("SAP collection failed: " + error.message, &config_);
    }
  }

  void MergeStreams(const std::vector<std::string>& payloads,
                    std::chrono::steady_clock::time_point now) {
    for (const auto& payload : payloads) {
      Aes67Stream stream;
      Error error;
      if (!ParseSdp(payload, &stream, &error)) {
        metrics_.sdp_parse_errors.fetch_add(1);
        LogError("SDP rejected: " + error.message, &config_);
        continue;
      }
      stream.last_seen = now;
      stream_cache_.Merge(stream);
    }
    std::set<std::string> pinned;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      for (const auto& entry : selections_) {
        pinned.insert(entry.second.stream);
      }
    }
    const auto expired = stream_cache_.Prune(now, config_.aes67_stream_ttl, pinned);
    if (!expired.empty()) {
      LogError("AES67 streams expired: " + JoinNames(expired), &config_);
    }
  }

  void PollDevices(const std::vector<DeviceEndpoint>& endpoints,
                   std::chrono::steady_clock::time_point deadline,
                   std::vector<PollResult>* results) {
    results->assign(endpoints.size(), PollResult{});
    std::vector<std::shared_ptr<DeviceClient>> clients;
    clients.reserve(endpoints.size());
    for (const auto& endpoint : endpoints) {
      clients.push_back(ClientFor(endpoint));
    }
    std::atomic<size_t> next{0};
    auto worker = [&]() {
      for (size_t i = next.fetch_add(1); i < endpoints.size(); i = next.fetch_add(1)) {
        PollResult& result = (*results)[i];
        result.ok = clients[i]->Poll(&result.poll, deadline);
        metrics_.device_polls.fetch_add(1);
        if (!result.ok) {
          metrics_.device_poll_failures.fetch_add(1);
        }
      }
    };
    const size_t count = std::min(endpoints.size(), config_.max_poll_workers);
    std::vector<std::thread> workers;
    workers.reserve(count);
    for (size_t i = 1; i < count; ++i) {
      try {
        workers.push_back(StartThread(worker));
      } catch (const std::system_error& ex) {
        LogError(std::string("poll worker start failed: ") + ex.what(), &config_);
        break;
      }
    }
    worker();
    for (auto& thread : workers) {
      thread.join();
    }
  }

  DeviceSnapshot MergeDevice(const DeviceEndpoint& endpoint, const PollResult& result,
                             const DeviceSnapshot* previous,
                             std::chrono::steady_clock::time_point now) const {
    DeviceSnapshot device;
    if (previous) {
      device = *previous;
    }
    device.endpoint = endpoint;
    const DevicePoll& poll = result.poll;
    if (poll.info) {
      device.info = poll.info.value();
    }
    if (poll.status) {
      device.status = poll.status.value();
    }
    if (poll.channels) {
      device.rx_channels = poll.channels->rx;
      device.tx_channels = poll.channels->tx;
    }
    if (poll.subscriptions) {
      device.subscriptions = poll.subscriptions.value();
    }
    device.name = device.info.name.value_or(endpoint.name);
    device.stale = false;
    device.consecutive_failures = 0;
    device.last_updated = now;
    return device;
  }

  bool RunCycle(Error* error) {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    if (cancel_) {
      return internal::SetError(error, ErrorCode::kShutdown, "coordinator is stopping");
    }
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + config_.cycle_deadline;

    std::vector<DeviceEndpoint> endpoints;
    std::string discovery_error;
    if (!ListEndpoints(&endpoints, &discovery_error)) {
      metrics_.cycles_failed.fetch_add(1);
      const std::string message = "discovery failed: " + discovery_error;
      SetLastError(message);
      LogError(message, &config_);
      return internal::SetError(error, ErrorCode::kNotFound, message);
    }

    std::vector<std::string> payloads;
    std::thread sap_thread;
    if (config_.sap_enabled) {
      try {
        sap_thread = StartThread([this, &endpoints, &payloads]() { CollectSap(endpoints, &payloads); });
      } catch (const std::exception& ex) {
        LogError(std::string("SAP thread start failed: ") + ex.what(), &config_);
      }
    }
    std::vector<PollResult> results;
    try {
      PollDevices(endpoints, deadline, &results);
    } catch (...) {
      if (sap_thread.joinable()) {
        sap_thread.join();
      }
      throw;
    }
    if (sap_thread.joinable()) {
      sap_thread.join();
    }

    if (cancel_) {
      metrics_.cycles_failed.fetch_add(1);
      return internal::SetError(error, ErrorCode::kShutdown, "cycle abandoned");
    }

    const auto now = std::chrono::steady_clock::now();
    MergeStreams(payloads, now);

    std::vector<std::string> failed;
    std::shared_ptr<const NetworkSnapshot> published;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      auto next = std::make_shared<NetworkSnapshot>();
      next->cycle = snapshot_->cycle + 1;
      next->published = now;
      for (size_t i = 0; i < endpoints.size(); ++i) {
        const DeviceEndpoint& endpoint = endpoints[i];
        const PollResult& result = results[i];
        auto prior = snapshot_->devices.find(endpoint.name);
        const DeviceSnapshot* previous =
            prior == snapshot_->devices.end() ? nullptr : &prior->second;
        if (result.ok) {
          next->devices[endpoint.name] = MergeDevice(endpoint, result, previous, now);
          continue;
        }
        failed.push_back(endpoint.name + " (" + result.poll.error.message + ")");
        if (previous) {
          DeviceSnapshot stale = *previous;
          stale.endpoint = endpoint;
          stale.stale = true;
          ++stale.consecutive_failures;
          next->devices[endpoint.name] = std::move(stale);
        }
      }
      next->aes67_streams = stream_cache_.Entries();
      next->aes67_selections = selections_;
      snapshot_ = next;
      published = snapshot_;
    }
    metrics_.cycles_completed.fetch_add(1);
    NotifySnapshot(published);

    if (!failed.empty()) {
      const std::string message = "poll failed for " + JoinNames(failed);
      SetLastError(message);
      LogError(message, &config_);
      internal::SetError(error, ErrorCode::kPartialPollFailure, message);
    }
    return true;
  }

  // Publish a copy of the current snapshot carrying the current selections.
  void RepublishSelections() {
    std::shared_ptr<const NetworkSnapshot> published;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      auto next = std::make_shared<NetworkSnapshot>(*snapshot_);
      next->aes67_selections = selections_;
      next->published = std::chrono::steady_clock::now();
      snapshot_ = next;
      published = snapshot_;
    }
    NotifySnapshot(published);
  }

  void NotifySnapshot(const std::shared_ptr<const NetworkSnapshot>& snapshot) {
    SnapshotCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = snapshot_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(snapshot);
    } catch (const std::exception& ex) {
      RecordCallbackException("SnapshotCallback", ex.what());
    } catch (...) {
      RecordCallbackException("SnapshotCallback", "");
    }
  }

  Config config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> cancel_{false};
  std::mutex lifecycle_mutex_;
  std::thread poll_thread_;
  std::atomic<std::thread::id> poll_thread_id_{};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::mutex cycle_mutex_;

  mutable std::mutex endpoints_mutex_;
  std::map<std::string, EndpointRecord> endpoints_;

  std::mutex clients_mutex_;
  std::map<std::string, std::shared_ptr<DeviceClient>> clients_;
  Aes67SubscriptionClient aes67_client_;
  Aes67StreamCache stream_cache_;

  mutable std::mutex state_mutex_;
  std::shared_ptr<const NetworkSnapshot> snapshot_;
  std::map<SelectionKey, Aes67Selection> selections_;

  std::mutex callback_mutex_;
  EndpointProvider endpoint_provider_;
  SnapshotCallback snapshot_cb_;

  mutable std::mutex error_mutex_;
  std::string last_error_;
  CoordinatorMetricsAtomic metrics_;
#ifdef DANTE_TESTING
  std::atomic<int> refused_thread_starts_{0};
#endif
};

Coordinator::Coordinator(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

Coordinator::~Coordinator() = default;

bool Coordinator::Start() {
  return impl_->Start();
}

void Coordinator::Stop() {
  impl_->Stop();
}

bool Coordinator::PollOnce(Error* error) {
  return impl_->PollOnce(error);
}

void Coordinator::HandleDiscoveryEvent(const DiscoveryEvent& event) {
  impl_->HandleDiscoveryEvent(event);
}

void Coordinator::SetEndpointProvider(EndpointProvider provider) {
  impl_->SetEndpointProvider(std::move(provider));
}

void Coordinator::SetSnapshotCallback(SnapshotCallback cb) {
  impl_->SetSnapshotCallback(std::move(cb));
}

std::shared_ptr<const NetworkSnapshot> Coordinator::GetSnapshot() const {
  return impl_->GetSnapshot();
}

SourceRef Coordinator::EffectiveSource(const std::string& device, uint16_t rx_channel) const {
  return impl_->GetSnapshot()->EffectiveSource(device, rx_channel);
}

std::vector<std::string> Coordinator::ListSources() const {
  return impl_->ListSources();
}

bool Coordinator::AddNativeSubscription(const std::string& rx_device, uint16_t rx_channel,
                                        const std::string& tx_device, uint16_t tx_channel,
                                        Error* error) {
  return impl_->AddNativeSubscription(rx_device, rx_channel, tx_device, tx_channel, error);
}

bool Coordinator::RemoveNativeSubscription(const std::string& rx_device, uint16_t rx_channel,
                                           Error* error) {
  return impl_->RemoveNativeSubscription(rx_device, rx_channel, error);
}

bool Coordinator::SetSampleRate(const std::string& device, uint32_t rate, Error* error) {
  return impl_->SetSampleRate(device, rate, error);
}

bool Coordinator::SetLatency(const std::string& device, uint32_t latency_us, Error* error) {
  return impl_->SetLatency(device, latency_us, error);
}

bool Coordinator::SetEncoding(const std::string& device, uint16_t bits, Error* error) {
  return impl_->SetEncoding(device, bits, error);
}

bool Coordinator::SetGain(const std::string& device, uint16_t channel, uint8_t level,
                          Error* error) {
  return impl_->SetGain(device, channel, level, error);
}

bool Coordinator::Identify(const std::string& device, Error* error) {
  return impl_->Identify(device, error);
}

bool Coordinator::SetAes67Mode(const std::string& device, bool enabled, Error* error) {
  return impl_->SetAes67Mode(device, enabled, error);
}

bool Coordinator::AddAes67Subscription(const std::string& rx_device, uint16_t rx_channel,
                                       const std::string& stream, uint8_t flow_channel,
                                       Error* error) {
  return impl_->AddAes67Subscription(rx_device, rx_channel, stream, flow_channel, error);
}

bool Coordinator::RemoveAes67Selection(const std::string& rx_device, uint16_t rx_channel) {
  return impl_->RemoveAes67Selection(rx_device, rx_channel);
}

std::string Coordinator::GetLastError() const {
  return impl_->GetLastError();
}

CoordinatorMetrics Coordinator::GetMetrics() const {
  return impl_->GetMetrics();
}

#ifdef DANTE_TESTING
namespace test {

void SetEndpointLastSeen(Coordinator& coordinator, const std::string& server_name,
                         std::chrono::steady_clock::time_point when) {
  std::lock_guard<std::mutex> lock(coordinator.impl_->endpoints_mutex_);
  auto it = coordinator.impl_->endpoints_.find(server_name);
  if (it != coordinator.impl_->endpoints_.end()) {
    it->second.last_seen = when;
  }
}

void PruneEndpoints(Coordinator& coordinator, std::chrono::steady_clock::time_point now) {
  coordinator.impl_->RunPrune(now);
}

size_t GetEndpointRecordCount(Coordinator& coordinator) {
  std::lock_guard<std::mutex> lock(coordinator.impl_->endpoints_mutex_);
  return coordinator.impl_->endpoints_.size();
}

void RefuseThreadStarts(Coordinator& coordinator, int count) {
  coordinator.impl_->refused_thread_starts_ = count;
}

}  // namespace test
#endif

}  // namespace dante
