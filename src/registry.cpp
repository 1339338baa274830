#include "linerpc/registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace linerpc {

void HandlerRegistry::register_handler(const std::string& method, Handler handler) {
    if (method.empty()) {
        throw std::invalid_argument("Method name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Handler for '" + method + "' must not be empty");
    }
    handlers_[method] = std::move(handler);
}

bool HandlerRegistry::remove_handler(const std::string& method) {
    return handlers_.erase(method) > 0;
}

const Handler* HandlerRegistry::lookup(const std::string& method) const {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) return nullptr;
    return &it->second;
}

bool HandlerRegistry::has_handler(const std::string& method) const {
    return handlers_.count(method) > 0;
}

std::vector<std::string> HandlerRegistry::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace linerpc
