#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace chunkscribe {

class ClaimRegistry;

/**
 * Exclusive hold on one key. Move-only; destruction releases the key.
 *
 * Typical holder loop:
 *
 *     if (auto claim = registry.try_claim(key)) {
 *         do {
 *             evaluate_and_merge(key);
 *         } while (claim->finish_or_rerun());
 *     }
 */
class Claim {
public:
    Claim(Claim&& other) noexcept;
    Claim& operator=(Claim&& other) noexcept;
    Claim(const Claim&) = delete;
    Claim& operator=(const Claim&) = delete;
    ~Claim();

    const std::string& key() const { return key_; }
    bool held() const { return registry_ != nullptr; }

    // True when another caller asked for a re-run while the claim was held;
    // the request is consumed and the claim stays held. Otherwise the claim
    // is released and false is returned.
    bool finish_or_rerun();

    void release();

private:
    friend class ClaimRegistry;
    Claim(ClaimRegistry* registry, std::string key);

    ClaimRegistry* registry_;
    std::string key_;
};

/**
 * In-process claims keyed by string.
 *
 * try_claim never blocks. A caller that loses records a re-run request on the
 * current holder and gets an empty optional, which is the signal to do
 * nothing. The registry must outlive every Claim it hands out.
 */
class ClaimRegistry {
public:
    std::optional<Claim> try_claim(const std::string& key);

    bool is_claimed(const std::string& key) const;
    std::size_t active() const;
    uint64_t contended() const;

private:
    friend class Claim;

    struct Entry {
        bool rerun = false;
    };

    bool finish_or_rerun(const std::string& key);
    void release(const std::string& key);

    mutable std::mutex mutex_;
    std::map<std::string, Entry> claims_;
    uint64_t contended_ = 0;
};

} // namespace chunkscribe
