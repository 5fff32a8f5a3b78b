// Example: poll devices and print each published network snapshot.
// Usage: dante_monitor name=ip:port [name=ip:port ...]
#include "dante/dante.h"

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

}  // namespace

int main(int argc, char** argv) {
  std::vector<dante::DeviceEndpoint> endpoints;
  for (int i = 1; i < argc; ++i) {
    dante::DeviceEndpoint endpoint;
    if (!ParseEndpoint(argv[i], &endpoint)) {
      std::cerr << "bad endpoint '" << argv[i] << "', expected name=ip:port" << std::endl;
      return 1;
    }
    endpoints.push_back(endpoint);
  }
  if (endpoints.empty()) {
    std::cerr << "usage: " << argv[0] << " name=ip:port [name=ip:port ...]" << std::endl;
    return 1;
  }

  dante::Config config;
  config.poll_interval = std::chrono::seconds(5);
  config.sap_window = std::chrono::seconds(3);

  dante::Coordinator coordinator(config);
  coordinator.SetEndpointProvider(
      [endpoints](std::vector<dante::DeviceEndpoint>* out, std::string*) {
        *out = endpoints;
        return true;
      });
  coordinator.SetSnapshotCallback(
      [](const std::shared_ptr<const dante::NetworkSnapshot>& snapshot) {
        std::cout << "cycle " << snapshot->cycle << ": " << snapshot->devices.size()
                  << " devices, " << snapshot->aes67_streams.size() << " AES67 streams\n";
        for (const auto& entry : snapshot->devices) {
          const auto& device = entry.second;
          std::cout << " - " << device.name << " ip=" << device.endpoint.ip_address
                    << " tx=" << device.tx_channels.size()
                    << " rx=" << device.rx_channels.size();
          if (device.status.sample_rate) {
            std::cout << " rate=" << device.status.sample_rate.value();
          }
          if (device.stale) {
            std::cout << " stale(" << device.consecutive_failures << ")";
          }
          std::cout << "\n";
          for (const auto& channel : device.rx_channels) {
            const auto source = snapshot->EffectiveSource(entry.first, channel.number);
            std::cout << "     rx " << channel.number << " " << channel.name << " <- "
                      << dante::DescribeSource(*snapshot, source) << "\n";
          }
        }
        for (const auto& entry : snapshot->aes67_streams) {
          std::cout << " - [AES67] " << entry.first << " " << entry.second.multicast_addr
                    << ":" << entry.second.port << " " << entry.second.codec << "\n";
        }
        std::cout << std::flush;
      });

  if (!coordinator.Start()) {
    std::cerr << "Failed to start coordinator: " << coordinator.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Polling. Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  coordinator.Stop();

  const auto metrics = coordinator.GetMetrics();
  std::cout << "cycles=" << metrics.cycles_completed << " failed=" << metrics.cycles_failed
            << " polls=" << metrics.device_polls
            << " poll_failures=" << metrics.device_poll_failures
            << " sap_packets=" << metrics.sap_packets_received << std::endl;
  return 0;
}
