// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_ADMISSION_GATE_HPP
#define CIRRUS_ADMISSION_GATE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace cirrus {
namespace uploader {

/**
 * Counting semaphore bounding the number of part uploads in flight
 *
 * acquire() blocks until a permit is free. The returned Permit gives it back
 * when destroyed, so a permit moved into a part task is released on every
 * exit path of that task. The gate must outlive all its permits.
 */
class AdmissionGate {
public:
  class Permit {
  public:
    Permit() = default;
    ~Permit() { release(); }

    Permit(Permit&& other) noexcept
        : gate_(other.gate_) {
      other.gate_ = nullptr;
    }

    Permit& operator=(Permit&& other) noexcept {
      if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
      }
      return *this;
    }

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    /**
     * Return the permit early. Safe to call more than once.
     */
    void release();

    bool valid() const { return gate_ != nullptr; }

  private:
    friend class AdmissionGate;
    explicit Permit(AdmissionGate* gate)
        : gate_(gate) {}

    AdmissionGate* gate_ = nullptr;
  };

  /**
   * @param capacity Number of permits, values below 1 are raised to 1
   */
  explicit AdmissionGate(size_t capacity);

  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  /**
   * Block until a permit is free and take it
   */
  Permit acquire();

  /**
   * Take a permit if one is free, otherwise return an invalid Permit
   */
  Permit tryAcquire();

  size_t capacity() const { return capacity_; }
  size_t available() const;
  size_t inUse() const;

private:
  void giveBack();

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  size_t available_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_ADMISSION_GATE_HPP
