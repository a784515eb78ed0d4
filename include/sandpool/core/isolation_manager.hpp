/**
 * @file isolation_manager.hpp
 * @brief Per-instance network and volume allocation
 *
 * Every sandbox instance gets its own internal bridge network and its own
 * named volume. Names are derived from the owner id, which is unique, so two
 * live instances never share either resource.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/utils/container_utils.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace sandpool {
namespace core {

/**
 * @class IsolationManager
 * @brief Allocates and releases isolation resources
 *
 * Removal of a resource that no longer exists counts as success, so every
 * call can be retried safely. Live ids are tracked so that ReleaseAll() can
 * reclaim anything left behind at shutdown.
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class IsolationManager {
public:
    explicit IsolationManager(std::shared_ptr<utils::ContainerUtils> gateway);

    /**
     * @brief Create an internal network named sandpool-net-<owner_id>
     * @return Network id
     * @throws ResourceCreationError if the engine refuses
     */
    std::string CreateIsolatedNetwork(const std::string& owner_id);

    /**
     * @brief Create a volume named sandpool-vol-<owner_id>
     * @return Volume id
     * @throws ResourceCreationError if the engine refuses
     */
    std::string CreateIsolatedVolume(const std::string& owner_id);

    /**
     * @brief Remove a network; a missing network is not an error
     * @throws RuntimeError / TimeoutError on other failures
     */
    void RemoveNetwork(const std::string& network_id);

    /**
     * @brief Remove a volume; a missing volume is not an error
     */
    void RemoveVolume(const std::string& volume_id);

    /**
     * @brief Remove every still-tracked network and volume
     *
     * Failures are logged and skipped.
     *
     * @return Number of resources that could not be removed
     */
    std::size_t ReleaseAll();

    std::size_t LiveNetworkCount() const;
    std::size_t LiveVolumeCount() const;

    static std::string NetworkName(const std::string& owner_id);
    static std::string VolumeName(const std::string& owner_id);

private:
    std::shared_ptr<utils::ContainerUtils> gateway_;

    mutable std::mutex mutex_;
    std::set<std::string> live_networks_;  ///< Created and not yet removed
    std::set<std::string> live_volumes_;
};

} // namespace core
} // namespace sandpool
