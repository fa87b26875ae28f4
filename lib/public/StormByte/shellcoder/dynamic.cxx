#include <StormByte/shellcoder/dynamic.hxx>

#include <algorithm>
#include <new>
#include <stdexcept>

using namespace StormByte::Shellcoder;

Dynamic::Dynamic(const std::size_t& size_hint) noexcept: Generic() {
	try {
		m_buffer.reserve(std::min(size_hint, m_buffer.max_size()));
	}
	catch (const std::bad_alloc&) {
		// The hint is advisory: storage then grows on the first writes
	}
}

Dynamic::Dynamic(Dynamic&& other) noexcept: Generic(std::move(other)), m_buffer(std::move(other.m_buffer)) {
	other.m_buffer.clear();
}

Dynamic& Dynamic::operator=(Dynamic&& other) noexcept {
	if (this != &other) {
		Generic::operator=(std::move(other));
		m_buffer = std::move(other.m_buffer);
		other.m_buffer.clear();
	}
	return *this;
}

ExpectedChain Dynamic::Add(const Ops::Op& op) noexcept {
	const std::size_t count = op.Size();
	auto room = Check(count);
	if (!room)
		return std::unexpected(room.error());

	if (count == 0)
		return Chain();

	const std::size_t offset = m_buffer.size();
	if (m_buffer.capacity() - offset >= count) {
		// No reallocation: views into the current payload stay valid
		m_buffer.resize(offset + count);
		auto written = op.WriteTo(std::span<std::byte>(m_buffer).subspan(offset, count));
		if (!written) {
			m_buffer.resize(offset);
			return std::unexpected(written.error());
		}
		return Chain();
	}

	// Render into new storage while the old one is still alive, as the
	// operation may be reading from this writer's own payload
	DataType grown;
	try {
		grown.reserve(std::max(offset + count, std::min(offset * 2, m_buffer.max_size())));
		grown.assign(m_buffer.begin(), m_buffer.end());
		grown.resize(offset + count);
	}
	catch (const std::bad_alloc& e) {
		return StormByte::Unexpected(AllocationFailed(count, e.what()));
	}
	catch (const std::length_error& e) {
		return StormByte::Unexpected(AllocationFailed(count, e.what()));
	}

	auto written = op.WriteTo(std::span<std::byte>(grown).subspan(offset, count));
	if (!written)
		return std::unexpected(written.error());

	m_buffer.swap(grown);
	return Chain();
}

ExpectedVoid<Error> Dynamic::Check(const std::size_t& count) const noexcept {
	if (count > m_buffer.max_size() - m_buffer.size())
		return StormByte::Unexpected(Overflow(m_buffer.size(), count));
	return {};
}

DataType Dynamic::Release() noexcept {
	DataType payload = std::move(m_buffer);
	m_buffer.clear();
	return payload;
}
