#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace nuid::core {

// EntropyUnavailable signals a broken host environment: the cryptographic random source
// could not deliver bytes. It is fatal for the caller and never retried internally.
class EntropyUnavailable : public std::runtime_error {
 public:
  explicit EntropyUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Abstract cryptographic byte source.
// Allows production code to use the OS entropy provider while tests use fixed bytes.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Fill out completely with random bytes.
  // Contract: either every byte of out is written or EntropyUnavailable is thrown.
  virtual void fill(std::span<std::uint8_t> out) = 0;

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Production source: std::random_device, which reads the kernel CSPRNG on Linux.
// Thread-safe. Opening the device is deferred to the first fill() so that a missing
// device surfaces as EntropyUnavailable at the point of use.
class SystemEntropySource final : public IEntropySource {
 public:
  SystemEntropySource() = default;
  ~SystemEntropySource() override = default;

  // Not copyable or movable (owns a device handle and a mutex)
  SystemEntropySource(const SystemEntropySource&) = delete;
  SystemEntropySource& operator=(const SystemEntropySource&) = delete;
  SystemEntropySource(SystemEntropySource&&) = delete;
  SystemEntropySource& operator=(SystemEntropySource&&) = delete;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::mutex mutex_;
  std::unique_ptr<std::random_device> device_;
};

// Fixed source: replays a byte pattern cyclically for deterministic tests/demos.
// Not thread-safe.
class FixedEntropySource final : public IEntropySource {
 public:
  explicit FixedEntropySource(std::vector<std::uint8_t> pattern);
  ~FixedEntropySource() override = default;

  FixedEntropySource(const FixedEntropySource&) = default;
  FixedEntropySource& operator=(const FixedEntropySource&) = default;
  FixedEntropySource(FixedEntropySource&&) = default;
  FixedEntropySource& operator=(FixedEntropySource&&) = default;

  void fill(std::span<std::uint8_t> out) override;

  // Total number of bytes handed out so far.
  [[nodiscard]] std::size_t bytes_drawn() const { return drawn_; }

 private:
  std::vector<std::uint8_t> pattern_;
  std::size_t drawn_{0};
};

// system_entropy returns the process-wide SystemEntropySource.
IEntropySource& system_entropy();

// pseudo_random_below returns a uniformly distributed value in [0, bound) from a fast,
// non-cryptographic generator. Each thread owns its own engine, seeded once from
// std::random_device. Precondition: bound > 0.
std::uint64_t pseudo_random_below(std::uint64_t bound);

}  // namespace nuid::core
