#include "identity/identifier_resolver.hpp"

#include <utility>

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace devlaunch::identity {

IdentifierResolver::IdentifierResolver(
    std::vector<IIdentityProvider::Ptr> providers, DeviceIdentifierStore store,
    customio::ConsoleOutput &output, RandomIdFn random_id)
    : providers_(std::move(providers)), store_(std::move(store)),
      output_(output), random_id_(std::move(random_id)) {
  if (!random_id_) {
    random_id_ = []() { return stringutil::generate_uuid(); };
  }
}

ResolvedIdentifier IdentifierResolver::resolve_device_identifier() {
  if (auto existing = store_.load()) {
    output_.logger().debug() << "Using persisted device identifier from "
                             << store_.path() << std::endl;
    return ResolvedIdentifier{std::move(*existing), kSourcePersisted, false,
                              std::nullopt};
  }
  if (store_.exists()) {
    output_.logger().warning()
        << "Identifier file " << store_.path()
        << " is blank, resolving a new identifier" << std::endl;
  }
  return regenerate();
}

ResolvedIdentifier IdentifierResolver::regenerate() {
  ResolvedIdentifier resolved;
  resolved.fresh = true;

  for (const auto &provider : providers_) {
    auto value = provider->query();
    if (value && provider->name() == kMacAddress) {
      stringutil::trim(*value);
      *value = stringutil::strip_chars(*value, "\"'");
    }
    if (value) {
      stringutil::trim(*value);
    }
    if (!value || value->empty()) {
      output_.logger().debug()
          << "Identity provider '" << provider->name()
          << "' returned nothing" << std::endl;
      continue;
    }
    resolved.value = std::move(*value);
    resolved.source = provider->name();
    break;
  }

  if (resolved.value.empty()) {
    resolved.value = random_id_();
    resolved.source = kSourceGenerated;
    output_.logger().warning()
        << fmt::format("[{}] no identity provider returned a value "
                       "(tried {}), using generated identifier",
                       my_errors::IDENTITY::PROVIDER_UNAVAILABLE,
                       providers_.size())
        << std::endl;
  } else {
    output_.logger().info() << "Device identifier resolved from '"
                            << resolved.source << "'" << std::endl;
  }

  if (auto err = store_.save(resolved.value)) {
    output_.logger().error()
        << "Failed to persist device identifier: " << err->what << std::endl;
    resolved.persist_error = std::move(err);
  }

  output_.logger().stream() << resolved.value << std::endl;
  return resolved;
}

} // namespace devlaunch::identity
