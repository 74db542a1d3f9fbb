#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>

namespace resilient_http {

/**
 * Admission pool bounding the number of logical requests in flight.
 *
 * Permits are move-only handles. Releasing is idempotent: a permit that was
 * already released, moved from, or issued by another gate never changes the
 * count. A permit still held when destroyed is released.
 *
 * Gates are always owned through std::shared_ptr so several executors can
 * share one admission limit.
 */
class ConcurrencyGate : public std::enable_shared_from_this<ConcurrencyGate> {
public:
	class Permit {
	public:
		Permit() = default;
		~Permit();

		// Moveable, Not copyable
		Permit(const Permit&) = delete;
		Permit& operator=(const Permit&) = delete;
		Permit(Permit&& other) noexcept;
		Permit& operator=(Permit&& other) noexcept;

		bool held() const { return gate_ != nullptr; }
		uint64_t id() const { return id_; }

		// Give the slot back, returns false if nothing was held
		bool release();

	private:
		friend class ConcurrencyGate;
		Permit(std::shared_ptr<ConcurrencyGate> gate, uint64_t id);

		std::shared_ptr<ConcurrencyGate> gate_;
		uint64_t id_ = 0;
	};

	static std::shared_ptr<ConcurrencyGate> create(size_t limit);

	// non-copyable
	ConcurrencyGate(const ConcurrencyGate&) = delete;
	ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

	// Wait until a slot is free (blocking), throws InternalError once closed
	Permit acquire();

	// Acquire a slot (Non-blocking)
	std::optional<Permit> tryAcquire();

	// Wait at most timeout for a slot
	std::optional<Permit> tryAcquireFor(std::chrono::milliseconds timeout);

	bool release(Permit& permit);

	// Wake every waiter; later acquisitions fail
	void close();
	bool closed() const;

	size_t limit() const { return limit_; }
	size_t available() const;
	size_t inUse() const;

private:
	explicit ConcurrencyGate(size_t limit);

	bool releaseId(uint64_t id);
	Permit issueLocked();

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	const size_t limit_;
	std::unordered_set<uint64_t> outstanding_;
	uint64_t nextId_ = 1;
	bool closed_ = false;
};

} // namespace resilient_http
