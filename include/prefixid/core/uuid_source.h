#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <utility>

namespace prefixid::core {

// Length of the hex form of a 128-bit value (UUID without dashes).
constexpr std::size_t kUuidHexLength = 32;

// Abstract source of 128-bit values for dependency injection.
// Production code draws random UUIDs; tests and demos use a reproducible sequence.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
// Special members are protected (C.67) so a source cannot be sliced through the interface.
class IUuidSource {
 public:
  virtual ~IUuidSource() = default;

  // Return the next value as kUuidHexLength lowercase hex characters, no dashes.
  virtual std::string next_uuid_hex() = 0;

 protected:
  IUuidSource() = default;
  IUuidSource(const IUuidSource&) = default;
  IUuidSource& operator=(const IUuidSource&) = default;
  IUuidSource(IUuidSource&&) = default;
  IUuidSource& operator=(IUuidSource&&) = default;
};

// Production source: RFC 4122 version 4 UUIDs from libuuid, seeded by OS entropy.
// Stateless and thread-safe (CP.1: assume code will run as part of a multi-threaded program).
class SystemUuidSource final : public IUuidSource {
 public:
  SystemUuidSource() = default;
  ~SystemUuidSource() override = default;

  SystemUuidSource(const SystemUuidSource&) = default;
  SystemUuidSource& operator=(const SystemUuidSource&) = default;
  SystemUuidSource(SystemUuidSource&&) = default;
  SystemUuidSource& operator=(SystemUuidSource&&) = default;

  std::string next_uuid_hex() override;
};

// Deterministic source: the n-th value is derived from (seed, n) only.
// Same seed and same sequence of calls produce the same values. Thread-safe.
class DeterministicUuidSource final : public IUuidSource {
 public:
  explicit DeterministicUuidSource(std::string seed = "prefixid") : seed_(std::move(seed)) {}
  ~DeterministicUuidSource() override = default;

  // Not copyable or movable (contains atomic counter)
  DeterministicUuidSource(const DeterministicUuidSource&) = delete;
  DeterministicUuidSource& operator=(const DeterministicUuidSource&) = delete;
  DeterministicUuidSource(DeterministicUuidSource&&) = delete;
  DeterministicUuidSource& operator=(DeterministicUuidSource&&) = delete;

  std::string next_uuid_hex() override;

 private:
  std::string seed_;
  std::atomic<unsigned long long> counter_{0};
};

// system_uuid_source returns the process-wide SystemUuidSource.
IUuidSource& system_uuid_source();

}  // namespace prefixid::core
