#pragma once

#include "dante/dante.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace dante {

/**
 * Strip the SAP header from one datagram and return the SDP text.
 *
 * Deletion and compressed announcements are rejected with kParseError, as is
 * any version other than 1. A MIME type string is skipped when present.
 */
bool ParseSapPacket(const uint8_t* data, size_t length, std::string* sdp,
                    Error* error = nullptr);

/**
 * Parse an SDP announcement into a stream record.
 *
 * s=, o=, c=, m= and a=rtpmap are required; i= lines name the flow channels.
 * last_seen is left for the caller to stamp.
 */
bool ParseSdp(const std::string& sdp, Aes67Stream* out, Error* error = nullptr);

/// Generic channel names: "Mono", "Left"/"Right", otherwise "Ch1".."ChN".
std::vector<std::string> DefaultChannelNames(uint16_t count);

/**
 * Find the local IPv4 address the kernel would use to reach remote_address.
 * No packet is sent.
 */
bool FindLocalAddressFor(const std::string& remote_address, std::string* local_address);

struct SapOptions {
  /// Interface address used for the multicast join.
  std::string interface_address;
  std::string multicast_address = kSapMulticastAddress;
  uint16_t port = kSapPort;
  /// Append every received datagram to this file.
  std::string capture_file;
  /// Read datagrams from this file instead of the network.
  std::string replay_file;
  /// Optional cancellation flag owned by the caller.
  const std::atomic<bool>* cancel = nullptr;
  LogCallback log_callback;
};

/**
 * Joins the SAP group for a bounded window and returns the SDP payloads seen.
 */
class SapListener {
 public:
  explicit SapListener(SapOptions options);

  SapListener(const SapListener&) = delete;
  SapListener& operator=(const SapListener&) = delete;

  /**
   * Collect announcements for window. Packets that fail header parsing are
   * logged and skipped. Duplicates are returned as received.
   *
   * @return false on a socket or file error, or when cancelled.
   */
  bool Collect(std::chrono::milliseconds window, std::vector<std::string>* payloads,
               Error* error = nullptr);

  /// Datagrams received by the most recent Collect().
  size_t packets_received() const { return packets_received_; }

 private:
  bool CollectFromSocket(std::chrono::milliseconds window,
                         std::vector<std::string>* payloads, Error* error);
  bool CollectFromReplay(std::vector<std::string>* payloads, Error* error);
  void HandleDatagram(const uint8_t* data, size_t length,
                      std::vector<std::string>* payloads);
  void Capture(const uint8_t* data, size_t length);

  SapOptions options_;
  size_t packets_received_ = 0;
};

/**
 * Session-keyed table of announced streams that persists across cycles.
 * Thread-safe.
 */
class Aes67StreamCache {
 public:
  /// Insert or fully replace the entry for stream.session_name.
  void Merge(const Aes67Stream& stream);

  /**
   * Drop streams whose last_seen is older than ttl, except those named in
   * pinned. A zero ttl keeps everything.
   *
   * @return names of the dropped streams.
   */
  std::vector<std::string> Prune(std::chrono::steady_clock::time_point now,
                                 std::chrono::milliseconds ttl,
                                 const std::set<std::string>& pinned);

  bool Find(const std::string& session_name, Aes67Stream* out) const;
  std::map<std::string, Aes67Stream> Entries() const;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Aes67Stream> streams_;
};

}  // namespace dante
