#include "pxid/core/factory.hpp"

#include "pxid/util/logging.hpp"

namespace pxid::core {

Result<Factory> Factory::create(std::string_view prefix) {
  SystemIdentitySource source;
  return create(prefix, source, std::make_shared<util::SystemClock>());
}

Result<Factory> Factory::createWithoutPrefix() {
  return create("");
}

Result<Factory> Factory::create(std::string_view prefix, const IdentitySource& source,
                                std::shared_ptr<util::Clock> clock,
                                std::optional<std::uint32_t> seed) {
  if (auto valid = Identifier::validatePrefix(prefix); !valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto identity = source.resolve();
  if (!identity.has_value()) {
    util::logger()->error("Identity resolution failed: {}", identity.error().message());
    return std::unexpected(identity.error());
  }

  if (!clock) {
    clock = std::make_shared<util::SystemClock>();
  }

  auto counter = seed ? std::make_shared<Counter>(*seed) : std::make_shared<Counter>();

  const auto& machine_id = identity->machine_id;
  util::logger()->debug("Factory ready: prefix='{}' machine_id={:02x}{:02x}{:02x} counter={}",
                        prefix, machine_id[0], machine_id[1], machine_id[2], counter->peek());

  return Factory(std::string(prefix), *identity, std::move(counter), std::move(clock));
}

Factory::Factory(std::string prefix, Identity identity, std::shared_ptr<Counter> counter,
                 std::shared_ptr<util::Clock> clock)
    : prefix_(std::move(prefix)),
      identity_(identity),
      counter_(std::move(counter)),
      clock_(std::move(clock)) {}

Identifier Factory::generate() const {
  return generateAt(clock_->nowSeconds());
}

Result<Identifier> Factory::withPrefix(std::string_view prefix) const {
  if (auto valid = Identifier::validatePrefix(prefix); !valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return Identifier::assemble(std::string(prefix), clock_->nowSeconds(), identity_.machine_id,
                              identity_.process_id, counter_->next());
}

Identifier Factory::generateAt(std::uint32_t timestamp) const {
  return Identifier::assemble(prefix_, timestamp, identity_.machine_id, identity_.process_id,
                              counter_->next());
}

}  // namespace pxid::core
