#include "sandbox/provider.hpp"

#include "glog/logging.h"

namespace sandbox {

const char* InstanceStateName(InstanceState state) {
  switch (state) {
    case InstanceState::kCreated:
      return "Created";
    case InstanceState::kRunning:
      return "Running";
    case InstanceState::kStopped:
      return "Stopped";
    case InstanceState::kRemoved:
      return "Removed";
  }
  return "Unknown";
}

IsolationProvider::store_t* IsolationProvider::Providers_() {
  static store_t* providers = new store_t;
  return providers;
}

void IsolationProvider::Register_(const std::string& name,
                                  IsolationProvider::create_t create) {
  CHECK(Providers_()->emplace(name, std::move(create)).second)
      << "Isolation provider " << name << " registered twice";
}

std::unique_ptr<IsolationProvider> IsolationProvider::Create(
    const std::string& name, const ProviderOptions& options) {
  const store_t& providers = *Providers_();
  auto it = providers.find(name);
  if (it == providers.end()) {
    LOG(ERROR) << "Unknown isolation provider " << name;
    return nullptr;
  }
  return std::unique_ptr<IsolationProvider>(it->second(options));
}

std::vector<std::string> IsolationProvider::Names() {
  std::vector<std::string> names;
  for (const auto& provider : *Providers_()) names.push_back(provider.first);
  return names;
}

}  // namespace sandbox
