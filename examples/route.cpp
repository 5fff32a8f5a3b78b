// Example: route one TX channel (native or AES67) to an RX channel.
// Usage:
//   dante_route rx=ip:port tx=ip:port <rx_channel> <tx_channel>
//   dante_route rx=ip:port --aes67 <stream> <rx_channel> <flow_channel>
#include "dante/dante.h"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool ParseEndpoint(const std::string& arg, dante::DeviceEndpoint* out) {
  const auto eq = arg.find('=');
  const auto colon = arg.rfind(':');
  if (eq == std::string::npos || colon == std::string::npos || colon < eq) {
    return false;
  }
  out->name = arg.substr(0, eq);
  out->ip_address = arg.substr(eq + 1, colon - eq - 1);
  try {
    out->control_port = static_cast<uint16_t>(std::stoi(arg.substr(colon + 1)));
  } catch (const std::exception&) {
    return false;
  }
  return !out->name.empty() && out->control_port != 0;
}

bool ParseNumber(const std::string& arg, uint16_t* out) {
  try {
    const int value = std::stoi(arg);
    if (value <= 0 || value > 0xffff) {
      return false;
    }
    *out = static_cast<uint16_t>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

int Usage(const char* program) {
  std::cerr << "usage: " << program << " rx=ip:port tx=ip:port <rx_channel> <tx_channel>\n"
            << "       " << program
            << " rx=ip:port --aes67 <stream> <rx_channel> <flow_channel>" << std::endl;
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 5 && argc != 6) {
    return Usage(argv[0]);
  }
  const bool aes67 = argc == 6 && std::string(argv[2]) == "--aes67";
  std::vector<dante::DeviceEndpoint> endpoints(1);
  if (!ParseEndpoint(argv[1], &endpoints[0])) {
    return Usage(argv[0]);
  }
  uint16_t rx_channel = 0;
  uint16_t source_channel = 0;
  std::string stream;
  if (aes67) {
    stream = argv[3];
    if (!ParseNumber(argv[4], &rx_channel) || !ParseNumber(argv[5], &source_channel) ||
        source_channel > 0xff) {
      return Usage(argv[0]);
    }
  } else {
    dante::DeviceEndpoint tx;
    if (argc != 5 || !ParseEndpoint(argv[2], &tx) || !ParseNumber(argv[3], &rx_channel) ||
        !ParseNumber(argv[4], &source_channel)) {
      return Usage(argv[0]);
    }
    if (tx.name != endpoints[0].name) {
      endpoints.push_back(tx);
    }
  }

  dante::Config config;
  config.request_timeout = std::chrono::milliseconds(500);
  config.sap_enabled = aes67;
  config.sap_window = std::chrono::seconds(5);
  dante::Coordinator coordinator(config);
  coordinator.SetEndpointProvider(
      [endpoints](std::vector<dante::DeviceEndpoint>* out, std::string*) {
        *out = endpoints;
        return true;
      });

  std::cout << "Polling " << endpoints.size() << " device(s)..." << std::endl;
  dante::Error error;
  if (!coordinator.PollOnce(&error)) {
    std::cerr << "Poll failed: " << error.message << std::endl;
    return 1;
  }
  if (error.code != dante::ErrorCode::kNone) {
    std::cerr << "warning: " << error.message << std::endl;
  }

  std::cout << "Available sources:" << std::endl;
  for (const auto& source : coordinator.ListSources()) {
    std::cout << " - " << source << std::endl;
  }

  const std::string& rx_name = endpoints[0].name;
  bool ok = false;
  if (aes67) {
    ok = coordinator.AddAes67Subscription(rx_name, rx_channel, stream,
                                          static_cast<uint8_t>(source_channel), &error);
  } else {
    ok = coordinator.AddNativeSubscription(rx_name, rx_channel, endpoints.back().name,
                                           source_channel, &error);
  }
  if (!ok) {
    std::cerr << "Route failed (" << dante::ErrorCodeName(error.code) << "): " << error.message
              << std::endl;
    return 1;
  }
  if (!aes67) {
    // Native subscriptions show up on the next poll of the RX device.
    if (!coordinator.PollOnce(&error)) {
      std::cerr << "Refresh failed: " << error.message << std::endl;
    }
  }

  const auto snapshot = coordinator.GetSnapshot();
  std::cout << rx_name << " rx " << rx_channel << " <- "
            << dante::DescribeSource(*snapshot, snapshot->EffectiveSource(rx_name, rx_channel))
            << std::endl;
  return 0;
}
