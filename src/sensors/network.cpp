#include "sensors/network.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <memory>
#include <utility>

namespace device_agent::sensors {

namespace {
constexpr const char* kSysClassNet = "/sys/class/net";

void close_sources(NetworkSensor::InterfaceSource& iface) {
  for (std::FILE** file : {&iface.rx_bytes_file, &iface.tx_bytes_file, &iface.rx_packets_file,
                           &iface.tx_packets_file, &iface.operstate_file, &iface.mtu_file}) {
    if (*file != nullptr) {
      std::fclose(*file);
      *file = nullptr;
    }
  }
}
}  // namespace

NetworkSensor::NetworkSensor() : owns_files_(true) { discover_interfaces(kSysClassNet); }

NetworkSensor::NetworkSensor(const std::string& net_root) : owns_files_(true) { discover_interfaces(net_root); }

NetworkSensor::NetworkSensor(std::vector<InterfaceSource> interfaces, const bool owns_files)
    : interfaces_(std::move(interfaces)), owns_files_(owns_files) {}

void NetworkSensor::discover_interfaces(const std::string& net_root) {
  try {
    if (!std::filesystem::exists(net_root)) {
      return;
    }

    std::vector<std::filesystem::path> entries;
    for (const auto& entry : std::filesystem::directory_iterator(net_root)) {
      entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& path : entries) {
      const std::string iface = path.filename().string();
      if (iface == "lo" || !std::filesystem::is_directory(path)) {
        continue;
      }

      auto file_closer = [](std::FILE* file) {
        if (file != nullptr) {
          std::fclose(file);
        }
      };
      using file_ptr = std::unique_ptr<std::FILE, decltype(file_closer)>;
      const auto open = [&file_closer](const std::filesystem::path& file) {
        return file_ptr(std::fopen(file.c_str(), "r"), file_closer);
      };

      const std::filesystem::path stats = path / "statistics";
      file_ptr rx_bytes = open(stats / "rx_bytes");
      file_ptr tx_bytes = open(stats / "tx_bytes");
      file_ptr rx_packets = open(stats / "rx_packets");
      file_ptr tx_packets = open(stats / "tx_packets");
      file_ptr operstate = open(path / "operstate");
      file_ptr mtu = open(path / "mtu");

      InterfaceSource source{};
      source.name = iface;
      source.rx_bytes_file = rx_bytes.get();
      source.tx_bytes_file = tx_bytes.get();
      source.rx_packets_file = rx_packets.get();
      source.tx_packets_file = tx_packets.get();
      source.operstate_file = operstate.get();
      source.mtu_file = mtu.get();

      interfaces_.push_back(source);

      rx_bytes.release();
      tx_bytes.release();
      rx_packets.release();
      tx_packets.release();
      operstate.release();
      mtu.release();
    }
  } catch (const std::filesystem::filesystem_error&) {
    for (InterfaceSource& iface : interfaces_) {
      close_sources(iface);
    }
    interfaces_.clear();
  }
}

NetworkSensor::~NetworkSensor() {
  if (!owns_files_) {
    return;
  }
  for (InterfaceSource& iface : interfaces_) {
    close_sources(iface);
  }
}

bool NetworkSensor::sample() noexcept {
  raw_ = {};

  for (const InterfaceSource& iface : interfaces_) {
    InterfaceFields fields{};
    fields.name = iface.name;

    // An interface counts once its byte counters are readable.
    if (!read_u64_file(iface.rx_bytes_file, fields.bytes_received) ||
        !read_u64_file(iface.tx_bytes_file, fields.bytes_sent)) {
      continue;
    }
    // Packet counters, mtu and operstate are optional; a failed read leaves them zero or down.
    static_cast<void>(read_u64_file(iface.rx_packets_file, fields.packets_received));
    static_cast<void>(read_u64_file(iface.tx_packets_file, fields.packets_sent));
    static_cast<void>(read_u64_file(iface.mtu_file, fields.mtu));
    static_cast<void>(read_operstate(iface.operstate_file, fields.up));

    raw_.bytes_received += fields.bytes_received;
    raw_.bytes_sent += fields.bytes_sent;
    raw_.packets_received += fields.packets_received;
    raw_.packets_sent += fields.packets_sent;
    raw_.interfaces.push_back(std::move(fields));
  }

  return !raw_.interfaces.empty();
}

const NetworkSensor::RawFields& NetworkSensor::raw() const noexcept { return raw_; }

bool NetworkSensor::read_u64_file(std::FILE* file, std::uint64_t& value) noexcept {
  if (file == nullptr) {
    value = 0;
    return false;
  }

  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    value = 0;
    return false;
  }

  unsigned long long parsed = 0;
  if (std::fscanf(file, "%llu", &parsed) != 1) {
    std::clearerr(file);
    value = 0;
    return false;
  }

  value = static_cast<std::uint64_t>(parsed);
  return true;
}

bool NetworkSensor::read_operstate(std::FILE* file, bool& up) noexcept {
  up = false;
  if (file == nullptr || std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }

  char state[32] = {};
  if (std::fscanf(file, "%31s", state) != 1) {
    std::clearerr(file);
    return false;
  }
  up = std::strcmp(state, "up") == 0;
  return true;
}

}  // namespace device_agent::sensors
