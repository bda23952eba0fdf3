#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "pxid/common.hpp"
#include "pxid/core/counter.hpp"
#include "pxid/core/identifier.hpp"
#include "pxid/core/identity_source.hpp"
#include "pxid/util/clock.hpp"

namespace pxid::core {

// Reusable identifier generator. Machine and process identity are resolved
// once at construction; each call reads the clock and advances the counter.
// Thread-safe. Copies share the counter, so ids from copies never collide.
class Factory {
 public:
  // Resolve the system identity and validate the default prefix
  static Result<Factory> create(std::string_view prefix);

  // Factory whose identifiers carry no prefix
  static Result<Factory> createWithoutPrefix();

  // Explicit identity, clock and counter seed. A null clock means the system clock.
  static Result<Factory> create(std::string_view prefix, const IdentitySource& source,
                                std::shared_ptr<util::Clock> clock,
                                std::optional<std::uint32_t> seed = std::nullopt);

  // Next identifier with the configured prefix
  Identifier generate() const;

  // Next identifier with a different prefix; fails only if the prefix is invalid
  Result<Identifier> withPrefix(std::string_view prefix) const;

  // Next identifier stamped with an explicit time in seconds since the epoch
  Identifier generateAt(std::uint32_t timestamp) const;

  const std::string& prefix() const { return prefix_; }
  const Identity& identity() const { return identity_; }

 private:
  Factory(std::string prefix, Identity identity, std::shared_ptr<Counter> counter,
          std::shared_ptr<util::Clock> clock);

  std::string prefix_;
  Identity identity_;
  std::shared_ptr<Counter> counter_;
  std::shared_ptr<util::Clock> clock_;
};

}  // namespace pxid::core
