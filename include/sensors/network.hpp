#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace device_agent::sensors {

// Interface counters and link state from /sys/class/net/<iface>/.
class NetworkSensor {
 public:
  struct InterfaceSource {
    std::string name{};
    std::FILE* rx_bytes_file{nullptr};
    std::FILE* tx_bytes_file{nullptr};
    std::FILE* rx_packets_file{nullptr};
    std::FILE* tx_packets_file{nullptr};
    std::FILE* operstate_file{nullptr};
    std::FILE* mtu_file{nullptr};
  };

  struct InterfaceFields {
    std::string name{};
    bool up{false};
    std::uint64_t mtu{0};
    std::uint64_t bytes_received{0};
    std::uint64_t bytes_sent{0};
    std::uint64_t packets_received{0};
    std::uint64_t packets_sent{0};
  };

  struct RawFields {
    std::uint64_t bytes_received{0};
    std::uint64_t bytes_sent{0};
    std::uint64_t packets_received{0};
    std::uint64_t packets_sent{0};
    std::vector<InterfaceFields> interfaces{};
  };

  NetworkSensor();
  explicit NetworkSensor(const std::string& net_root);
  NetworkSensor(std::vector<InterfaceSource> interfaces, bool owns_files = false);
  ~NetworkSensor();

  NetworkSensor(const NetworkSensor&) = delete;
  NetworkSensor& operator=(const NetworkSensor&) = delete;
  NetworkSensor(NetworkSensor&&) = delete;
  NetworkSensor& operator=(NetworkSensor&&) = delete;

  // False when no interface could be read at all.
  bool sample() noexcept;
  const RawFields& raw() const noexcept;
  [[nodiscard]] std::size_t interface_count() const noexcept { return interfaces_.size(); }

 private:
  void discover_interfaces(const std::string& net_root);
  static bool read_u64_file(std::FILE* file, std::uint64_t& value) noexcept;
  static bool read_operstate(std::FILE* file, bool& up) noexcept;

  std::vector<InterfaceSource> interfaces_{};
  bool owns_files_{true};
  RawFields raw_{};
};

}  // namespace device_agent::sensors
