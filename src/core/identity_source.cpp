#include "pxid/core/identity_source.hpp"

#include <unistd.h>
#include <zlib.h>

#include "pxid/core/host_id.hpp"
#include "pxid/util/filesystem.hpp"
#include "pxid/util/logging.hpp"

namespace pxid::core {

MachineId machineIdFromHostId(std::string_view host_id) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(host_id.data()),
              static_cast<uInt>(host_id.size()));

  auto digest = static_cast<std::uint32_t>(crc);
  return {static_cast<std::uint8_t>(digest >> 24), static_cast<std::uint8_t>(digest >> 16),
          static_cast<std::uint8_t>(digest >> 8)};
}

ProcessId processIdFromPid(std::uint32_t pid) noexcept {
  return {static_cast<std::uint8_t>(pid >> 8), static_cast<std::uint8_t>(pid)};
}

Result<Identity> IdentitySource::resolve() const {
  auto machine_id = resolveMachineId();
  if (!machine_id.has_value()) {
    return std::unexpected(machine_id.error());
  }

  auto process_id = resolveProcessId();
  if (!process_id.has_value()) {
    return std::unexpected(process_id.error());
  }

  return Identity{*machine_id, *process_id};
}

SystemIdentitySource::SystemIdentitySource(Options options) : options_(std::move(options)) {}

Result<MachineId> SystemIdentitySource::resolveMachineId() const {
  if (!options_.host_id.empty()) {
    util::logger()->debug("Using configured host id");
    return machineIdFromHostId(options_.host_id);
  }

  if (!options_.machine_id_file.empty()) {
    auto content = util::FileSystem::readFile(options_.machine_id_file);
    if (content.has_value()) {
      auto value = trimHostId(*content);
      if (!value.empty()) {
        util::logger()->debug("Host id read from {}", options_.machine_id_file.string());
        return machineIdFromHostId(value);
      }
      util::logger()->warn("Machine id file {} is empty, using system lookup",
                           options_.machine_id_file.string());
    } else {
      util::logger()->warn("Cannot read machine id file {}: {}",
                           options_.machine_id_file.string(), content.error().message());
    }
  }

  auto host_id = readHostId();
  if (!host_id.has_value()) {
    return std::unexpected(host_id.error());
  }
  return machineIdFromHostId(*host_id);
}

Result<ProcessId> SystemIdentitySource::resolveProcessId() const {
  pid_t pid = getpid();
  if (pid <= 0) {
    return makeErrorResult<ProcessId>(ErrorCode::kProcessIdUnavailable,
                                      "The operating system reported no process id");
  }
  return processIdFromPid(static_cast<std::uint32_t>(pid));
}

}  // namespace pxid::core
