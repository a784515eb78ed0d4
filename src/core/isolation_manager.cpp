/**
 * @file isolation_manager.cpp
 * @brief Implementation of per-instance network and volume allocation
 *
 * @date 2025
 */

#include "sandpool/core/isolation_manager.hpp"

#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace sandpool {
namespace core {

using utils::StringUtils;

namespace {

bool IsMissingResource(const RuntimeError& e) {
    std::string stderr_lower = StringUtils::ToLower(e.StderrOutput());
    return StringUtils::Contains(stderr_lower, "no such") ||
           StringUtils::Contains(stderr_lower, "not found");
}

std::map<std::string, std::string> OwnerLabels(const std::string& owner_id) {
    return {
        {"sandpool.owner", owner_id},
        {"sandpool.pool", "true"},
    };
}

} // anonymous namespace

IsolationManager::IsolationManager(std::shared_ptr<utils::ContainerUtils> gateway)
    : gateway_(std::move(gateway)) {
}

std::string IsolationManager::NetworkName(const std::string& owner_id) {
    return "sandpool-net-" + owner_id;
}

std::string IsolationManager::VolumeName(const std::string& owner_id) {
    return "sandpool-vol-" + owner_id;
}

std::string IsolationManager::CreateIsolatedNetwork(const std::string& owner_id) {
    std::string name = NetworkName(owner_id);
    try {
        gateway_->CreateNetwork(name, OwnerLabels(owner_id), true);
    } catch (const SandpoolError& e) {
        spdlog::error("Network allocation failed for {}: {}", owner_id, e.what());
        throw ResourceCreationError("network", owner_id, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    live_networks_.insert(name);
    return name;
}

std::string IsolationManager::CreateIsolatedVolume(const std::string& owner_id) {
    std::string name = VolumeName(owner_id);
    try {
        gateway_->CreateVolume(name, OwnerLabels(owner_id));
    } catch (const SandpoolError& e) {
        spdlog::error("Volume allocation failed for {}: {}", owner_id, e.what());
        throw ResourceCreationError("volume", owner_id, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    live_volumes_.insert(name);
    return name;
}

void IsolationManager::RemoveNetwork(const std::string& network_id) {
    if (network_id.empty()) {
        return;
    }
    try {
        gateway_->RemoveNetwork(network_id);
    } catch (const RuntimeError& e) {
        if (!IsMissingResource(e)) {
            throw;
        }
        spdlog::debug("Network {} already gone", network_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    live_networks_.erase(network_id);
}

void IsolationManager::RemoveVolume(const std::string& volume_id) {
    if (volume_id.empty()) {
        return;
    }
    try {
        gateway_->RemoveVolume(volume_id);
    } catch (const RuntimeError& e) {
        if (!IsMissingResource(e)) {
            throw;
        }
        spdlog::debug("Volume {} already gone", volume_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    live_volumes_.erase(volume_id);
}

std::size_t IsolationManager::ReleaseAll() {
    std::vector<std::string> networks;
    std::vector<std::string> volumes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        networks.assign(live_networks_.begin(), live_networks_.end());
        volumes.assign(live_volumes_.begin(), live_volumes_.end());
    }

    std::size_t failures = 0;
    for (const auto& network : networks) {
        try {
            RemoveNetwork(network);
        } catch (const SandpoolError& e) {
            spdlog::warn("Failed to release network {}: {}", network, e.what());
            ++failures;
        }
    }
    for (const auto& volume : volumes) {
        try {
            RemoveVolume(volume);
        } catch (const SandpoolError& e) {
            spdlog::warn("Failed to release volume {}: {}", volume, e.what());
            ++failures;
        }
    }

    if (!networks.empty() || !volumes.empty()) {
        spdlog::info("Released {} orphaned isolation resources ({} failures)",
                     networks.size() + volumes.size() - failures, failures);
    }
    return failures;
}

std::size_t IsolationManager::LiveNetworkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_networks_.size();
}

std::size_t IsolationManager::LiveVolumeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_volumes_.size();
}

} // namespace core
} // namespace sandpool
