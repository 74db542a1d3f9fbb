#include "ConcurrencyGate.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <utility>

namespace resilient_http {

// ConcurrencyGate::Permit implementation
ConcurrencyGate::Permit::Permit(std::shared_ptr<ConcurrencyGate> gate, uint64_t id)
	: gate_(std::move(gate)), id_(id) {}

ConcurrencyGate::Permit::~Permit() {
	this->release();
}

ConcurrencyGate::Permit::Permit(Permit&& other) noexcept
	: gate_(std::move(other.gate_)), id_(std::exchange(other.id_, 0)) {}

ConcurrencyGate::Permit& ConcurrencyGate::Permit::operator=(Permit&& other) noexcept {
	if (this != &other) {
		this->release();
		this->gate_ = std::move(other.gate_);
		this->id_ = std::exchange(other.id_, 0);
	}
	return *this;
}

bool ConcurrencyGate::Permit::release() {
	if (!this->gate_)
		return false;
	std::shared_ptr<ConcurrencyGate> gate = std::move(this->gate_);
	this->gate_.reset();
	return gate->releaseId(std::exchange(this->id_, 0));
}

// ConcurrencyGate implementation
std::shared_ptr<ConcurrencyGate> ConcurrencyGate::create(size_t limit) {
	return std::shared_ptr<ConcurrencyGate>(new ConcurrencyGate(limit));
}

ConcurrencyGate::ConcurrencyGate(size_t limit) : limit_(std::max<size_t>(limit, 1)) {}

ConcurrencyGate::Permit ConcurrencyGate::issueLocked() {
	uint64_t id = this->nextId_++;
	this->outstanding_.insert(id);
	return Permit(this->shared_from_this(), id);
}

ConcurrencyGate::Permit ConcurrencyGate::acquire() {
	std::unique_lock<std::mutex> lock(this->mutex_);
	this->cv_.wait(lock, [&]() { return this->closed_ || this->outstanding_.size() < this->limit_; });
	if (this->closed_)
		throw InternalError("Concurrency gate closed");
	return this->issueLocked();
}

std::optional<ConcurrencyGate::Permit> ConcurrencyGate::tryAcquire() {
	std::unique_lock<std::mutex> lock(this->mutex_);
	if (this->closed_ || this->outstanding_.size() >= this->limit_)
		return std::nullopt;
	return this->issueLocked();
}

std::optional<ConcurrencyGate::Permit> ConcurrencyGate::tryAcquireFor(std::chrono::milliseconds timeout) {
	std::unique_lock<std::mutex> lock(this->mutex_);
	bool ready = this->cv_.wait_for(lock, timeout, [&]() {
		return this->closed_ || this->outstanding_.size() < this->limit_;
	});
	if (!ready || this->closed_)
		return std::nullopt;
	return this->issueLocked();
}

bool ConcurrencyGate::release(Permit& permit) {
	if (permit.gate_.get() != this)
		return false;
	return permit.release();
}

bool ConcurrencyGate::releaseId(uint64_t id) {
	{
		std::unique_lock<std::mutex> lock(this->mutex_);
		if (this->outstanding_.erase(id) == 0)
			return false;
	}
	this->cv_.notify_one();
	return true;
}

void ConcurrencyGate::close() {
	{
		std::unique_lock<std::mutex> lock(this->mutex_);
		this->closed_ = true;
	}
	this->cv_.notify_all();
}

bool ConcurrencyGate::closed() const {
	std::unique_lock<std::mutex> lock(this->mutex_);
	return this->closed_;
}

size_t ConcurrencyGate::available() const {
	std::unique_lock<std::mutex> lock(this->mutex_);
	return this->limit_ - this->outstanding_.size();
}

size_t ConcurrencyGate::inUse() const {
	std::unique_lock<std::mutex> lock(this->mutex_);
	return this->outstanding_.size();
}

} // namespace resilient_http
