#include <StormByte/shellcoder/ops.hxx>

#include <iomanip>
#include <ios>
#include <sstream>

using namespace StormByte::Shellcoder;
using namespace StormByte::Shellcoder::Ops;

namespace {
	// Fill renders to streams in blocks of this size
	constexpr std::size_t FILL_CHUNK = 4096;
}

std::string Ops::HexString(std::span<const std::byte> data) {
	std::ostringstream oss;
	oss << std::hex << std::setfill('0');
	for (std::size_t i = 0; i < data.size(); ++i) {
		if (i > 0) oss << ' ';
		oss << std::setw(2) << static_cast<unsigned int>(std::to_integer<unsigned char>(data[i]));
	}
	return oss.str();
}

ExpectedSize Op::WriteTo(std::span<std::byte> out) const noexcept {
	const std::size_t needed = Size();
	if (out.size() < needed)
		return StormByte::Unexpected(CapacityExceeded(needed, out.size()));

	Render(out.first(needed));
	return needed;
}

ExpectedSize Op::WriteTo(std::ostream& stream) const noexcept {
	DataType tmp(Size());
	Render(tmp);
	return WriteStream(stream, tmp);
}

ExpectedSize Op::WriteStream(std::ostream& stream, std::span<const std::byte> data) noexcept {
	if (!stream)
		return StormByte::Unexpected(IOError("output stream is not in a good state"));

	try {
		stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
	}
	catch (const std::ios_base::failure& e) {
		return StormByte::Unexpected(IOError(e.what()));
	}

	if (!stream)
		return StormByte::Unexpected(IOError("output stream failed while writing"));
	return data.size();
}

void Fill::Render(std::span<std::byte> out) const noexcept {
	std::fill(out.begin(), out.end(), m_value);
}

ExpectedSize Fill::WriteTo(std::ostream& stream) const noexcept {
	if (m_count == 0)
		return static_cast<std::size_t>(0);

	DataType chunk(std::min(m_count, FILL_CHUNK), m_value);
	std::size_t remaining = m_count;
	while (remaining > 0) {
		const std::size_t n = std::min(remaining, chunk.size());
		auto res = WriteStream(stream, std::span<const std::byte>(chunk).first(n));
		if (!res)
			return res;
		remaining -= n;
	}
	return m_count;
}

std::string Fill::Describe() const {
	return std::format("Fill({} x 0x{:02x})", m_count, std::to_integer<unsigned int>(m_value));
}

std::string Advance::Describe() const {
	return std::format("Advance({})", Size());
}

void WriteBuffer::Render(std::span<std::byte> out) const noexcept {
	std::copy(m_data.begin(), m_data.end(), out.begin());
}

ExpectedSize WriteBuffer::WriteTo(std::ostream& stream) const noexcept {
	if (m_data.empty())
		return static_cast<std::size_t>(0);
	return WriteStream(stream, m_data);
}

std::string WriteBuffer::Describe() const {
	// Long buffers are shortened to their first bytes
	constexpr std::size_t preview = 16;
	if (m_data.size() <= preview)
		return std::format("WriteBuffer({}: {})", m_data.size(), HexString(m_data));
	return std::format("WriteBuffer({}: {} ...)", m_data.size(), HexString(m_data.first(preview)));
}
