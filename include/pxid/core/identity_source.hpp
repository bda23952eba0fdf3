#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "pxid/common.hpp"
#include "pxid/core/identifier.hpp"

namespace pxid::core {

// Machine and process components shared by every identifier a factory makes
struct Identity {
  MachineId machine_id{};
  ProcessId process_id{};
};

// Hash a host identifier string down to the 3 byte machine id (CRC-32,
// most significant bytes first)
MachineId machineIdFromHostId(std::string_view host_id);

// Fold an OS process id to its low 16 bits, big endian
ProcessId processIdFromPid(std::uint32_t pid) noexcept;

// Provider of machine and process identity
class IdentitySource {
 public:
  virtual ~IdentitySource() = default;

  virtual Result<MachineId> resolveMachineId() const = 0;
  virtual Result<ProcessId> resolveProcessId() const = 0;

  // Resolve both components; the first failure wins
  Result<Identity> resolve() const;
};

// Reads identity from the running host
class SystemIdentitySource final : public IdentitySource {
 public:
  struct Options {
    // Used verbatim instead of the platform lookup when non-empty
    std::string host_id;
    // File whose trimmed content is the host id; consulted before the platform lookup
    std::filesystem::path machine_id_file;
  };

  SystemIdentitySource() = default;
  explicit SystemIdentitySource(Options options);

  Result<MachineId> resolveMachineId() const override;
  Result<ProcessId> resolveProcessId() const override;

 private:
  Options options_;
};

// Returns the identity it was constructed with
class FixedIdentitySource final : public IdentitySource {
 public:
  explicit FixedIdentitySource(Identity identity) : identity_(identity) {}
  FixedIdentitySource(const MachineId& machine_id, const ProcessId& process_id)
      : identity_{machine_id, process_id} {}

  Result<MachineId> resolveMachineId() const override { return identity_.machine_id; }
  Result<ProcessId> resolveProcessId() const override { return identity_.process_id; }

 private:
  Identity identity_;
};

}  // namespace pxid::core
