// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "admission_gate.hpp"

namespace cirrus {
namespace uploader {

void AdmissionGate::Permit::release() {
  if (gate_) {
    gate_->giveBack();
    gate_ = nullptr;
  }
}

AdmissionGate::AdmissionGate(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1)
    , available_(capacity_) {}

AdmissionGate::Permit AdmissionGate::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return available_ > 0; });
  --available_;
  return Permit(this);
}

AdmissionGate::Permit AdmissionGate::tryAcquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (available_ == 0) {
    return Permit();
  }
  --available_;
  return Permit(this);
}

size_t AdmissionGate::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

size_t AdmissionGate::inUse() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_ - available_;
}

void AdmissionGate::giveBack() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++available_;
  }
  cv_.notify_one();
}

}  // namespace uploader
}  // namespace cirrus
