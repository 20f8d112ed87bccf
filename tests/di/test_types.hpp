// tests/di/test_types.hpp
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "butterfly/di/type_registry.hpp"

namespace butterfly_test {

// Disposal order shared by every test type
class DisposalLog {
public:
    static DisposalLog& instance() {
        static DisposalLog log;
        return log;
    }

    void record(const std::string& what) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(what);
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

class Counter {
public:
    static std::atomic<int> constructed;

    Counter() { ++constructed; }
    explicit Counter(int start) : count_(start) { ++constructed; }

    void increment() { ++count_; }
    void add(int amount) { count_ += amount; }
    int value() const { return count_; }
    void flush() { DisposalLog::instance().record("counter"); }

private:
    int count_ = 0;
};

inline std::atomic<int> Counter::constructed{0};

class Service {
public:
    explicit Service(std::shared_ptr<Counter> counter)
        : counter_(std::move(counter)) {}

    int handle() {
        counter_->increment();
        return counter_->value();
    }

    std::shared_ptr<Counter> counter() const { return counter_; }
    void close() { DisposalLog::instance().record("service"); }

private:
    std::shared_ptr<Counter> counter_;
};

// Named file logger stand-in used as a prototype
class FileLogger {
public:
    explicit FileLogger(std::string path) : path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class Greeter {
public:
    virtual ~Greeter() = default;
    virtual std::string greet(const std::string& who) const = 0;
};

class PlainGreeter : public Greeter {
public:
    std::string greet(const std::string& who) const override {
        return "hello " + who;
    }
};

class LoudGreeter : public Greeter {
public:
    std::string greet(const std::string& who) const override {
        return "HELLO " + who;
    }
};

class Welcome {
public:
    explicit Welcome(std::shared_ptr<Greeter> greeter)
        : greeter_(std::move(greeter)) {}

    std::string text() const { return greeter_->greet("world"); }

private:
    std::shared_ptr<Greeter> greeter_;
};

// Mixes void, fluent and value-returning methods
class Builder {
public:
    void set_name(const std::string& name) { name_ = name; }
    Builder& with_size(int size) {
        size_ = size;
        return *this;
    }
    std::string name() const { return name_; }
    int size() const { return size_; }
    std::shared_ptr<FileLogger> make_logger() const {
        return std::make_shared<FileLogger>(name_ + ".log");
    }

private:
    std::string name_;
    int size_ = 0;
};

// Holds references set during the configure phase
class Node {
public:
    explicit Node(std::string label) : label_(std::move(label)) {}

    const std::string& label() const { return label_; }
    void link(const std::shared_ptr<Node>& other) { peer_ = other; }
    std::shared_ptr<Node> peer() const { return peer_.lock(); }
    void tag(const std::string& tag) { tags_.push_back(tag); }
    const std::vector<std::string>& tags() const { return tags_; }
    void close() { DisposalLog::instance().record(label_); }
    void fail() { throw std::runtime_error("close failed: " + label_); }

private:
    std::string label_;
    std::weak_ptr<Node> peer_;
    std::vector<std::string> tags_;
};

class Exploding {
public:
    Exploding() { throw std::runtime_error("boom"); }
};

inline std::shared_ptr<butterfly::di::TypeRegistry> make_types() {
    auto types = std::make_shared<butterfly::di::TypeRegistry>();
    types->add_type<Counter>("Counter")
        .constructor<>()
        .constructor<int>()
        .method("increment", &Counter::increment)
        .method("add", &Counter::add)
        .method("value", &Counter::value)
        .method("flush", &Counter::flush);
    types->add_type<Service>("Service")
        .constructor<std::shared_ptr<Counter>>()
        .method("handle", &Service::handle)
        .method("counter", &Service::counter)
        .method("close", &Service::close);
    types->add_type<FileLogger>("FileLogger")
        .constructor<std::string>()
        .method("path", &FileLogger::path);
    types->add_type<Greeter>("Greeter").method("greet", &Greeter::greet);
    types->add_type<PlainGreeter>("PlainGreeter")
        .constructor<>()
        .implements<Greeter>();
    types->add_type<LoudGreeter>("LoudGreeter")
        .constructor<>()
        .implements<Greeter>();
    types->add_type<Welcome>("Welcome")
        .constructor<std::shared_ptr<Greeter>>()
        .method("text", &Welcome::text);
    types->add_type<Builder>("Builder")
        .constructor<>()
        .method("set_name", &Builder::set_name)
        .method("with_size", &Builder::with_size)
        .method("name", &Builder::name)
        .method("size", &Builder::size)
        .method("make_logger", &Builder::make_logger);
    types->add_type<Node>("Node")
        .constructor<std::string>()
        .method("link", &Node::link)
        .method("tag", &Node::tag)
        .method("close", &Node::close)
        .method("fail", &Node::fail);
    types->add_type<Exploding>("Exploding").constructor<>();
    return types;
}

}  // namespace butterfly_test
