#include "chunkscribe/claim_registry.hpp"

#include "chunkscribe/logging.hpp"

#include <utility>

namespace chunkscribe {

Claim::Claim(ClaimRegistry* registry, std::string key) : registry_(registry), key_(std::move(key)) {}

Claim::Claim(Claim&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)), key_(std::move(other.key_)) {}

Claim& Claim::operator=(Claim&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = std::exchange(other.registry_, nullptr);
        key_ = std::move(other.key_);
    }
    return *this;
}

Claim::~Claim() {
    release();
}

bool Claim::finish_or_rerun() {
    if (!registry_) {
        return false;
    }
    if (registry_->finish_or_rerun(key_)) {
        return true;
    }
    registry_ = nullptr;
    return false;
}

void Claim::release() {
    if (registry_) {
        registry_->release(key_);
        registry_ = nullptr;
    }
}

std::optional<Claim> ClaimRegistry::try_claim(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = claims_.try_emplace(key);
    if (!inserted) {
        it->second.rerun = true;
        ++contended_;
        LOG_DEBUG("Claim on ", key, " is held elsewhere; re-run requested");
        return std::nullopt;
    }
    return Claim(this, key);
}

bool ClaimRegistry::is_claimed(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claims_.count(key) > 0;
}

std::size_t ClaimRegistry::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claims_.size();
}

uint64_t ClaimRegistry::contended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contended_;
}

bool ClaimRegistry::finish_or_rerun(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(key);
    if (it == claims_.end()) {
        return false;
    }
    if (it->second.rerun) {
        it->second.rerun = false;
        return true;
    }
    claims_.erase(it);
    return false;
}

void ClaimRegistry::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    claims_.erase(key);
}

} // namespace chunkscribe
