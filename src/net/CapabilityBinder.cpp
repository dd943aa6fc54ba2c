#include "CapabilityBinder.hpp"
#include <iostream>

using hostlink::Status;

void CapabilityBinder::addShape(const std::string& op, const std::string& label, std::function<Invoker()> bind) {
    auto& b = m_bindings[op];
    b.shapes.push_back(Shape{ label, std::move(bind) });
    b.exhausted = false;
}

bool CapabilityBinder::hasOperation(const std::string& op) const {
    return m_bindings.find(op) != m_bindings.end();
}

bool CapabilityBinder::isResolved(const std::string& op) const {
    return workingShape(op) >= 0;
}

int CapabilityBinder::workingShape(const std::string& op) const {
    auto it = m_bindings.find(op);
    if (it == m_bindings.end()) return -1;
    return it->second.working;
}

std::string CapabilityBinder::workingShapeLabel(const std::string& op) const {
    auto it = m_bindings.find(op);
    if (it == m_bindings.end() || it->second.working < 0) return {};
    return it->second.shapes[(size_t)it->second.working].label;
}

bool CapabilityBinder::probe(const std::string& op, Binding& b) {
    for (size_t i = 0; i < b.shapes.size(); ++i) {
        try {
            Invoker inv = b.shapes[i].bind();
            if (!inv) continue;

            b.working = (int)i;
            b.invoker = std::move(inv);
            std::cout << "[Binder] " << op << " -> " << b.shapes[i].label << "\n";
            return true;
        }
        catch (const std::exception& e) {
            std::cout << "[Binder] " << op << ": shape " << b.shapes[i].label << " rejected (" << e.what() << ")\n";
        }
        catch (...) {
            std::cout << "[Binder] " << op << ": shape " << b.shapes[i].label << " rejected (non-standard exception)\n";
        }
    }

    b.exhausted = true;
    std::cerr << "[Binder] " << op << ": no candidate shape could be bound\n";
    return false;
}

bool CapabilityBinder::resolve(const std::string& op) {
    auto it = m_bindings.find(op);
    if (it == m_bindings.end()) return false;

    auto& b = it->second;
    if (b.working >= 0) return true;
    if (b.exhausted) return false;
    return probe(op, b);
}

bool CapabilityBinder::retryOthers(const std::string& op, Binding& b, const hostlink::Args& args, hostlink::Value& out) {
    const int failed = b.working;

    for (size_t i = 0; i < b.shapes.size(); ++i) {
        if ((int)i == failed) continue;

        try {
            Invoker inv = b.shapes[i].bind();
            if (!inv) continue;

            out = inv(args);

            b.working = (int)i;
            b.invoker = std::move(inv);
            std::cout << "[Binder] " << op << " re-bound -> " << b.shapes[i].label << "\n";
            return true;
        }
        catch (const std::exception& e) {
            std::cout << "[Binder] " << op << ": fallback " << b.shapes[i].label << " failed (" << e.what() << ")\n";
        }
        catch (...) {
            std::cout << "[Binder] " << op << ": fallback " << b.shapes[i].label << " failed (non-standard exception)\n";
        }
    }
    return false;
}

hostlink::CallResult CapabilityBinder::invoke(const std::string& op, const hostlink::Args& args) {
    hostlink::CallResult r{};

    if (!resolve(op)) {
        r.status = Status::BindingUnresolved;
        return r;
    }

    auto& b = m_bindings[op];
    try {
        r.value = b.invoker(args);
        return r;
    }
    catch (const std::exception& e) {
        std::cerr << "[Binder] " << op << " via " << b.shapes[(size_t)b.working].label
            << " failed: " << e.what() << "\n";
    }
    catch (...) {
        std::cerr << "[Binder] " << op << " via " << b.shapes[(size_t)b.working].label
            << " failed: non-standard exception\n";
    }

    if (retryOthers(op, b, args, r.value)) return r;

    r.value = hostlink::Value{};
    r.status = Status::BindingFailed;
    return r;
}
