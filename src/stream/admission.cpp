#include "filelink/stream/admission.h"

#include <utility>

namespace filelink::stream {

AdmissionSlot::~AdmissionSlot() { Release(); }

AdmissionSlot::AdmissionSlot(AdmissionSlot&& other) noexcept
    : controller_(std::exchange(other.controller_, nullptr)) {}

AdmissionSlot& AdmissionSlot::operator=(AdmissionSlot&& other) noexcept {
    if (this != &other) {
        Release();
        controller_ = std::exchange(other.controller_, nullptr);
    }
    return *this;
}

void AdmissionSlot::Release() {
    if (auto* controller = std::exchange(controller_, nullptr)) {
        controller->ReleaseOne();
    }
}

AdmissionController::AdmissionController(std::size_t ceiling) : ceiling_(ceiling) {}

std::optional<AdmissionSlot> AdmissionController::TryAcquire() {
    auto current = in_use_.load(std::memory_order_relaxed);
    // Only a successful compare-exchange grants a slot, so two callers can never both
    // observe the last free slot.
    while (current < ceiling_) {
        if (in_use_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
            return AdmissionSlot(this);
        }
    }
    rejected_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

void AdmissionController::ReleaseOne() { in_use_.fetch_sub(1, std::memory_order_acq_rel); }

}  // namespace filelink::stream
