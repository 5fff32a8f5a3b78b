#pragma once

#include "dante/dante.h"

#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace dante {
namespace internal {

// Receive loops wake at least this often to observe cancellation.
constexpr std::chrono::milliseconds kCancelPollSlice{100};

// Read big-endian integers from frame bytes.
inline uint16_t ReadBe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

inline uint32_t ReadBe32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
         static_cast<uint32_t>(data[offset + 3]);
}

// Write big-endian integers into preallocated frames.
inline void WriteBe16(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
  data[offset] = static_cast<uint8_t>((value >> 8) & 0xff);
  data[offset + 1] = static_cast<uint8_t>(value & 0xff);
}

inline void WriteBe32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
  data[offset] = static_cast<uint8_t>((value >> 24) & 0xff);
  data[offset + 1] = static_cast<uint8_t>((value >> 16) & 0xff);
  data[offset + 2] = static_cast<uint8_t>((value >> 8) & 0xff);
  data[offset + 3] = static_cast<uint8_t>(value & 0xff);
}

// Append big-endian integers to a growing body.
inline void AppendBe16(std::vector<uint8_t>& data, uint32_t value) {
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>(value & 0xff));
}

inline void AppendBe32(std::vector<uint8_t>& data, uint32_t value) {
  data.push_back(static_cast<uint8_t>((value >> 24) & 0xff));
  data.push_back(static_cast<uint8_t>((value >> 16) & 0xff));
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>(value & 0xff));
}

inline void AppendString(std::vector<uint8_t>& data, const std::string& text) {
  data.insert(data.end(), text.begin(), text.end());
  data.push_back(0x00);
}

// Read a NUL-terminated string at an absolute frame offset. Fails when the
// offset is outside the frame or the string runs off the end.
inline bool ReadStringAt(const uint8_t* data, size_t length, size_t offset,
                         std::string* out) {
  if (offset >= length) {
    return false;
  }
  const void* nul = std::memchr(data + offset, 0x00, length - offset);
  if (nul == nullptr) {
    return false;
  }
  const size_t end = static_cast<const uint8_t*>(nul) - data;
  out->assign(reinterpret_cast<const char*>(data + offset), end - offset);
  return true;
}

inline bool SetError(Error* error, ErrorCode code, const std::string& message) {
  if (error) {
    error->code = code;
    error->message = message;
  }
  return false;
}

inline void LogMessage(const std::string& message, const LogCallback& callback) {
  if (callback) {
    callback(message);
    return;
  }
  std::cerr << "[dante] " << message << std::endl;
}

inline bool IsCancelled(const std::atomic<bool>* cancel) {
  return cancel != nullptr && cancel->load();
}

inline bool ParseIpv4(const std::string& address, in_addr* out) {
  if (address.empty()) {
    return false;
  }
  return inet_pton(AF_INET, address.c_str(), out) == 1;
}

// Convert a string address and port into a sockaddr_in.
inline sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  }
  return addr;
}

inline std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

// Minimal UDP socket wrapper for send/recv with an optional bound port.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(uint16_t port, const std::string& bind_address, bool reuse_address) {
    if (fd_ >= 0) {
      return true;
    }
    fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ < 0) {
      last_error_ = "socket() failed: " + std::string(std::strerror(errno));
      return false;
    }
    if (reuse_address) {
      int reuse = 1;
      if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        last_error_ = "setsockopt(SO_REUSEADDR) failed: " +
                      std::string(std::strerror(errno));
        Close();
        return false;
      }
    }
    sockaddr_in addr = MakeSockaddr(bind_address, port);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      last_error_ = "bind(" + (bind_address.empty() ? std::string("0.0.0.0") : bind_address) +
                    ":" + std::to_string(port) + ") failed: " + std::strerror(errno);
      Close();
      return false;
    }
    return true;
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

  ssize_t SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
    return ::sendto(fd_, data.data(), data.size(), 0,
                    reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  }

  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len) {
    return ::recvfrom(fd_, buffer, length, 0,
                      reinterpret_cast<sockaddr*>(addr), addr_len);
  }

  // Wait until the socket is readable or the wait elapses. Returns >0 when
  // readable, 0 on timeout, <0 on error.
  int WaitReadable(std::chrono::milliseconds wait) const {
    if (fd_ < 0) {
      return -1;
    }
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(fd_, &readfds);
    const auto count = wait.count() < 0 ? 0 : wait.count();
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(count / 1000);
    tv.tv_usec = static_cast<suseconds_t>((count % 1000) * 1000);
    const int ready = ::select(fd_ + 1, &readfds, nullptr, nullptr, &tv);
    if (ready < 0 && errno == EINTR) {
      return 0;
    }
    return ready;
  }

 private:
  int fd_ = -1;
  std::string last_error_;
};

}  // namespace internal
}  // namespace dante
