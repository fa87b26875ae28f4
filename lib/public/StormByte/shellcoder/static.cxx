#include <StormByte/shellcoder/static.hxx>

#include <limits>

using namespace StormByte::Shellcoder;

Static::Static(Static&& other) noexcept: Generic(std::move(other)), m_buffer(other.m_buffer), m_cursor(other.m_cursor) {
	other.m_buffer = {};
	other.m_cursor = 0;
}

Static& Static::operator=(Static&& other) noexcept {
	if (this != &other) {
		Generic::operator=(std::move(other));
		m_buffer = other.m_buffer;
		m_cursor = other.m_cursor;
		other.m_buffer = {};
		other.m_cursor = 0;
	}
	return *this;
}

ExpectedChain Static::Add(const Ops::Op& op) noexcept {
	const std::size_t count = op.Size();
	auto room = Check(count);
	if (!room)
		return std::unexpected(room.error());

	if (count > 0) {
		auto written = op.WriteTo(m_buffer.subspan(m_cursor, count));
		if (!written)
			return std::unexpected(written.error());
	}

	m_cursor += count;
	return Chain();
}

ExpectedVoid<Error> Static::Check(const std::size_t& count) const noexcept {
	if (count > std::numeric_limits<std::size_t>::max() - m_cursor)
		return StormByte::Unexpected(Overflow(m_cursor, count));

	const std::size_t available = m_buffer.size() - m_cursor;
	if (count > available)
		return StormByte::Unexpected(CapacityExceeded(count, available));

	return {};
}
