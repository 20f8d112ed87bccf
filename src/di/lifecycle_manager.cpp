#include "butterfly/di/lifecycle_manager.hpp"

#include <algorithm>

#include "butterfly/log/logger.hpp"

namespace butterfly::di {

LifecycleManager::LifecycleManager(const ChainExecutor& executor)
    : executor_(executor) {}

void LifecycleManager::run_configure_chain(const Binding& binding,
                                           const Value& instance,
                                           const Resolver& resolve) const {
    if (binding.configure().empty()) {
        return;
    }
    BUTTERFLY_LOG_DEBUG << "Configuring '" << binding.name << "': "
                        << binding.configure().describe();
    executor_.run_configure(binding.name, instance, binding.configure(),
                            resolve);
}

void LifecycleManager::track(DisposableInstance record) {
    std::lock_guard<std::mutex> lock(mutex_);
    disposables_.push_back(std::move(record));
}

std::optional<DisposableInstance> LifecycleManager::untrack(
    const std::string& binding_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(disposables_.begin(), disposables_.end(),
                           [&binding_name](const DisposableInstance& record) {
                               return record.binding_name == binding_name;
                           });
    if (it == disposables_.end()) {
        return std::nullopt;
    }
    DisposableInstance record = std::move(*it);
    disposables_.erase(it);
    return record;
}

void LifecycleManager::dispose_now(const DisposableInstance& record) const {
    try {
        executor_.dispose(record.instance, record.hook);
        BUTTERFLY_LOG_DEBUG << "Disposed '" << record.binding_name
                            << "' (version " << record.version << ") via "
                            << record.hook.describe();
    } catch (const std::exception& e) {
        BUTTERFLY_LOG_ERROR << "Dispose hook of '" << record.binding_name
                            << "' failed: " << e.what();
        throw DisposalError({DisposalFailure{record.binding_name, e.what()}});
    } catch (...) {
        BUTTERFLY_LOG_ERROR << "Dispose hook of '" << record.binding_name
                            << "' threw a non-standard exception";
        throw DisposalError(
            {DisposalFailure{record.binding_name, "unknown exception"}});
    }
}

std::size_t LifecycleManager::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposables_.size();
}

void LifecycleManager::enter(const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        BUTTERFLY_LOG_WARN << "Rejected " << operation
                           << ": container is shutting down";
        throw ContainerShuttingDownError(operation);
    }
    ++in_flight_;
}

void LifecycleManager::leave() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ > 0 && --in_flight_ == 0) {
        idle_cv_.notify_all();
    }
}

void LifecycleManager::ensure_running(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        BUTTERFLY_LOG_WARN << "Rejected " << operation
                           << ": container is shutting down";
        throw ContainerShuttingDownError(operation);
    }
}

bool LifecycleManager::is_shutting_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutting_down_;
}

bool LifecycleManager::shutdown() {
    std::vector<DisposableInstance> records;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return false;
        }
        shutting_down_ = true;
        if (in_flight_ > 0) {
            BUTTERFLY_LOG_DEBUG << "Waiting for " << in_flight_
                                << " in-flight resolution(s)";
        }
        idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
        records.swap(disposables_);
    }

    BUTTERFLY_LOG_INFO << "Disposing " << records.size()
                       << " singleton instance(s)";

    std::vector<DisposalFailure> failures;
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        try {
            executor_.dispose(it->instance, it->hook);
            BUTTERFLY_LOG_DEBUG << "Disposed '" << it->binding_name << "'";
        } catch (const std::exception& e) {
            BUTTERFLY_LOG_ERROR << "Dispose hook of '" << it->binding_name
                                << "' failed: " << e.what();
            failures.push_back({it->binding_name, e.what()});
        } catch (...) {
            BUTTERFLY_LOG_ERROR << "Dispose hook of '" << it->binding_name
                                << "' threw a non-standard exception";
            failures.push_back({it->binding_name, "unknown exception"});
        }
    }

    if (!failures.empty()) {
        throw DisposalError(std::move(failures));
    }
    return true;
}

}  // namespace butterfly::di
