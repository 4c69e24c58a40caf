#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "identity/identifier_store.hpp"
#include "identity/identity_provider.hpp"
#include "launch_error.hpp"

namespace devlaunch::identity {

inline constexpr const char kSourcePersisted[] = "persisted";
inline constexpr const char kSourceGenerated[] = "generated";

struct ResolvedIdentifier {
  std::string value;
  // Provider name, kSourcePersisted or kSourceGenerated.
  std::string source;
  // True when the value was produced by this call rather than read back.
  bool fresh{false};
  // Set when a fresh value could not be written; the value is still usable
  // for this run.
  std::optional<Error> persist_error;
};

// Lifetime: created once per launcher run with the configured provider
// chain; holds no state besides its collaborators.
class IdentifierResolver {
public:
  using RandomIdFn = std::function<std::string()>;

  IdentifierResolver(std::vector<IIdentityProvider::Ptr> providers,
                     DeviceIdentifierStore store,
                     customio::ConsoleOutput &output,
                     RandomIdFn random_id = {});

  // Returns the persisted identifier when the file holds one, without
  // touching any provider. Otherwise behaves like regenerate().
  ResolvedIdentifier resolve_device_identifier();

  // Queries the providers in priority order and takes the first non-blank
  // value (quotes stripped for MAC addresses). When every provider comes
  // back empty a random UUID is used instead. The result is persisted
  // (overwriting) and echoed to stdout.
  ResolvedIdentifier regenerate();

  const DeviceIdentifierStore &store() const { return store_; }
  const std::vector<IIdentityProvider::Ptr> &providers() const {
    return providers_;
  }

private:
  std::vector<IIdentityProvider::Ptr> providers_;
  DeviceIdentifierStore store_;
  customio::ConsoleOutput &output_;
  RandomIdFn random_id_;
};

} // namespace devlaunch::identity
