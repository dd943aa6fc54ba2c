#pragma once
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>

#include "BindValue.hpp"

// Resolves logical platform operations to the first native call shape that
// binds, and keeps using it until it stops working.
class CapabilityBinder {
public:
    using Invoker = std::function<hostlink::Value(const hostlink::Args&)>;

    // bind() probes the shape (symbol lookup, arity check) and returns the
    // invoker, or throws BindingError when this shape is not available.
    struct Shape {
        std::string label;
        std::function<Invoker()> bind;
    };

    // Shapes are tried in registration order.
    void addShape(const std::string& op, const std::string& label, std::function<Invoker()> bind);

    bool resolve(const std::string& op);
    hostlink::CallResult invoke(const std::string& op, const hostlink::Args& args = {});

    bool hasOperation(const std::string& op) const;
    bool isResolved(const std::string& op) const;
    int workingShape(const std::string& op) const; // -1 while unresolved
    std::string workingShapeLabel(const std::string& op) const;

private:
    struct Binding {
        std::vector<Shape> shapes;
        int working{ -1 };
        Invoker invoker;
        bool exhausted{ false }; // every shape failed to bind; not retried
    };

    bool probe(const std::string& op, Binding& b);
    bool retryOthers(const std::string& op, Binding& b, const hostlink::Args& args, hostlink::Value& out);

private:
    std::unordered_map<std::string, Binding> m_bindings;
};
