// Persistence Contract - Implementation
//
// See persistence.h for the Story and error handling description.

#include "persistence.h"

#include <utility>

namespace broker_admin {

bool PersistenceFactoryRegistry::Register(
    const std::string& name, std::unique_ptr<PersistenceFactory> factory) {
  if (name.empty() || !factory) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return factories_.emplace(name, std::move(factory)).second;
}

bool PersistenceFactoryRegistry::Has(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return factories_.find(name) != factories_.end();
}

grpc::Status PersistenceFactoryRegistry::Create(
    const PersistenceConfig& config, BrokerEventListener* hooks,
    std::unique_ptr<Persistence>* persistence) const {
  if (config.type.empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "persistence type cannot be empty");
  }

  PersistenceFactory* factory = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = factories_.find(config.type);
    if (it == factories_.end()) {
      return grpc::Status(grpc::StatusCode::NOT_FOUND,
                          "unknown persistence type: " + config.type);
    }
    factory = it->second.get();
  }

  // Factories are never unregistered, so the pointer stays valid
  return factory->New(config, hooks, persistence);
}

}  // namespace broker_admin
