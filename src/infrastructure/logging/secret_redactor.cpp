#include "infrastructure/logging/secret_redactor.hpp"

namespace FGL {

void SecretRedactor::add(const std::string& value) {
    if (value.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++values_[value];
}

void SecretRedactor::remove(const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(value);
    if (it != values_.end() && --it->second == 0) {
        values_.erase(it);
    }
}

void SecretRedactor::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

bool SecretRedactor::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.empty();
}

size_t SecretRedactor::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

std::string SecretRedactor::apply(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (values_.empty() || text.empty()) {
        return text;
    }

    std::string masked = text;
    const std::string mask(kMask);
    for (const auto& entry : values_) {
        const std::string& secret = entry.first;
        for (size_t at = masked.find(secret); at != std::string::npos; at = masked.find(secret, at + mask.size())) {
            masked.replace(at, secret.size(), mask);
        }
    }
    return masked;
}

} // namespace FGL
