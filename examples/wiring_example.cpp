// Wires a small object graph, swaps one binding at runtime and shuts down.
//
// Usage: wiring_example [config.yaml]

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "butterfly/config/config.hpp"
#include "butterfly/di/container.hpp"
#include "butterfly/log/logger.hpp"

using namespace butterfly;

class Counter {
public:
    void increment() { ++count_; }
    int value() const { return count_; }
    void flush() {
        BUTTERFLY_LOG_INFO << "Counter flushed at " << count_;
    }

private:
    int count_ = 0;
};

class Greeter {
public:
    virtual ~Greeter() = default;
    virtual std::string greet(const std::string& who) const = 0;
};

class PlainGreeter : public Greeter {
public:
    std::string greet(const std::string& who) const override {
        return "Hello, " + who;
    }
};

class LoudGreeter : public Greeter {
public:
    std::string greet(const std::string& who) const override {
        return "HELLO, " + who + "!";
    }
};

class Service {
public:
    Service(std::shared_ptr<Counter> counter, std::shared_ptr<Greeter> greeter)
        : counter_(std::move(counter)), greeter_(std::move(greeter)) {}

    std::string handle(const std::string& who) {
        counter_->increment();
        return greeter_->greet(who);
    }

    void set_prefix(const std::string& prefix) { prefix_ = prefix; }
    const std::string& prefix() const { return prefix_; }

private:
    std::shared_ptr<Counter> counter_;
    std::shared_ptr<Greeter> greeter_;
    std::string prefix_;
};

class Registry {
public:
    void add(const std::string& name) { names_.push_back(name); }
    std::size_t size() const { return names_.size(); }

private:
    std::vector<std::string> names_;
};

int main(int argc, char* argv[]) {
    auto log_config = std::make_shared<log::LogConfig>();
    auto container_config = std::make_shared<di::ContainerConfig>();

    auto& config_manager = config::ConfigManager::instance();
    config_manager.register_configuration_properties(log_config);
    config_manager.register_configuration_properties(container_config);

    try {
        if (argc > 1) {
            config_manager.load_config(argv[1]);
        }
        log::Logger::init(*log_config);
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << std::endl;
        return 1;
    }

    auto types = std::make_shared<di::TypeRegistry>();
    types->add_type<Counter>("Counter")
        .constructor<>()
        .method("increment", &Counter::increment)
        .method("value", &Counter::value)
        .disposer("flush");
    types->add_type<Greeter>("Greeter").method("greet", &Greeter::greet);
    types->add_type<PlainGreeter>("PlainGreeter")
        .constructor<>()
        .implements<Greeter>();
    types->add_type<LoudGreeter>("LoudGreeter")
        .constructor<>()
        .implements<Greeter>();
    types->add_type<Service>("Service")
        .constructor<std::shared_ptr<Counter>, std::shared_ptr<Greeter>>()
        .method("set_prefix", &Service::set_prefix);
    types->add_type<Registry>("Registry")
        .constructor<>()
        .method("add", &Registry::add)
        .method("size", &Registry::size);

    // Log level follows reloads
    config_manager.subscribe_to_reloads<log::LogConfig>(
        [](const log::LogConfig& reloaded) {
            log::Logger::set_level(reloaded.global_level);
        });

    di::Container container(types, *container_config);
    config_manager.subscribe_to_reloads<di::ContainerConfig>(
        [&container](const di::ContainerConfig& reloaded) {
            container.apply_config(reloaded);
        });

    try {
        container.register_singleton("counter",
                                     di::FactoryChain().construct("Counter"));
        container.register_singleton(
            "greeter", di::FactoryChain().construct("PlainGreeter"));
        container.register_singleton("registry",
                                     di::FactoryChain().construct("Registry"));

        di::BindingDefinition service;
        service.chain.construct("Service", {di::ref("counter"), di::ref("greeter")})
            .invoke("set_prefix", {di::lit("svc")});
        service.configure.configure_ref(
            "registry", [](const di::Value&, const di::Value& registry) {
                registry.get<std::shared_ptr<Registry>>()->add("service");
            });
        container.register_binding("service", di::Scope::SINGLETON,
                                   std::move(service), true);

        container.preinstantiate();

        auto svc = container.resolve_object<Service>("service");
        std::cout << svc->handle("world") << std::endl;

        // New resolutions of "greeter" use the loud chain; svc keeps its own
        container.replace("greeter",
                          di::FactoryChain().construct("LoudGreeter"));
        container.refresh("service");
        auto loud = container.resolve_object<Service>("service");
        std::cout << loud->handle("world") << std::endl;
        std::cout << svc->handle("again") << std::endl;

        std::cout << "handled "
                  << container.resolve_object<Counter>("counter")->value()
                  << " request(s)" << std::endl;

        container.shutdown();
    } catch (const di::ContainerError& e) {
        BUTTERFLY_LOG_ERROR << "Wiring failed: " << e.what();
        log::Logger::shutdown();
        return 1;
    }

    log::Logger::shutdown();
    return 0;
}
