#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace filelink::stream {

class AdmissionController;

/// @brief Move-only token for one unit of the global session ceiling.
///
/// Release() is idempotent; the destructor releases a slot that is still held.
class AdmissionSlot {
public:
    AdmissionSlot() = default;
    ~AdmissionSlot();

    AdmissionSlot(AdmissionSlot&& other) noexcept;
    AdmissionSlot& operator=(AdmissionSlot&& other) noexcept;
    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

    void Release();
    bool held() const { return controller_ != nullptr; }

private:
    friend class AdmissionController;
    explicit AdmissionSlot(AdmissionController* controller) : controller_(controller) {}

    AdmissionController* controller_{nullptr};
};

/// @brief Hard concurrency gate: fails fast once the ceiling is reached, never queues.
///
/// The controller must outlive every slot it hands out.
class AdmissionController {
public:
    explicit AdmissionController(std::size_t ceiling);

    std::optional<AdmissionSlot> TryAcquire();

    std::size_t ceiling() const { return ceiling_; }
    std::size_t in_use() const { return in_use_.load(std::memory_order_acquire); }
    std::uint64_t rejected() const { return rejected_.load(std::memory_order_relaxed); }

private:
    friend class AdmissionSlot;
    void ReleaseOne();

    const std::size_t ceiling_;
    std::atomic<std::size_t> in_use_{0};
    std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace filelink::stream
