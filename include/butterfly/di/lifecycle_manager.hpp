#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "butterfly/di/binding.hpp"
#include "butterfly/di/chain_executor.hpp"
#include "butterfly/di/errors.hpp"

namespace butterfly::di {

/**
 * @brief A cached singleton waiting for disposal
 */
struct DisposableInstance {
    std::string binding_name;
    Value instance;
    DisposeHook hook;
    uint64_t version = 0;
};

/**
 * @brief Configure phase, disposal order and shutdown gating
 *
 * Disposable singletons are kept in the order their construction completed
 * and disposed in reverse, so a singleton can still use anything built
 * before it while it is torn down.
 */
class LifecycleManager {
public:
    explicit LifecycleManager(const ChainExecutor& executor);
    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /**
     * @brief Run the binding's configure chain on a new instance
     *
     * The caller caches the instance only if this returns normally.
     * @throws ConfigurationError
     */
    void run_configure_chain(const Binding& binding, const Value& instance,
                             const Resolver& resolve) const;

    void track(DisposableInstance record);

    // Removes and returns the record of a binding, if it has one
    std::optional<DisposableInstance> untrack(const std::string& binding_name);

    /**
     * @brief Dispose one instance outside shutdown (replace, unregister)
     * @throws DisposalError listing the single failure
     */
    void dispose_now(const DisposableInstance& record) const;

    std::size_t tracked_count() const;

    /**
     * @brief Register an external resolution as in flight
     * @throws ContainerShuttingDownError once shutdown has begun
     */
    void enter(const std::string& operation);
    void leave() noexcept;

    // Fails fast with ContainerShuttingDownError once shutdown has begun
    void ensure_running(const std::string& operation) const;

    bool is_shutting_down() const;

    /**
     * @brief Stop accepting resolutions and dispose every tracked instance
     *
     * Blocks until no resolution is in flight, then runs every dispose hook
     * in reverse construction order. Calling it again does nothing.
     * @return false if shutdown had already begun
     * @throws DisposalError if any hook failed; all hooks still ran
     */
    bool shutdown();

private:
    const ChainExecutor& executor_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::vector<DisposableInstance> disposables_;
    std::size_t in_flight_ = 0;
    bool shutting_down_ = false;
};

/**
 * @brief RAII marker for one in-flight external resolution
 */
class ResolutionTicket {
public:
    ResolutionTicket(LifecycleManager& lifecycle, const std::string& operation)
        : lifecycle_(lifecycle) {
        lifecycle_.enter(operation);
    }

    ~ResolutionTicket() { lifecycle_.leave(); }

    ResolutionTicket(const ResolutionTicket&) = delete;
    ResolutionTicket& operator=(const ResolutionTicket&) = delete;

private:
    LifecycleManager& lifecycle_;
};

}  // namespace butterfly::di
