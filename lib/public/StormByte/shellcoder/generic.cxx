#include <StormByte/shellcoder/generic.hxx>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

using namespace StormByte::Shellcoder;

Generic::~Generic() noexcept = default;

std::string Generic::HexDump(const std::size_t& collumns, const std::size_t& byte_limit) const noexcept {
	const std::size_t cols = (collumns == 0) ? 16 : collumns;
	std::span<const std::byte> shown = Data();
	if (byte_limit > 0 && byte_limit < shown.size())
		shown = shown.first(byte_limit);

	std::ostringstream oss;
	oss << "Size: " << Size() << " bytes\n";
	oss << "Capacity: " << Capacity() << " bytes";

	oss << std::hex << std::uppercase << std::setfill('0');
	for (std::size_t offset = 0; offset < shown.size(); offset += cols) {
		const auto row = shown.subspan(offset, std::min(cols, shown.size() - offset));

		oss << '\n' << std::setw(8) << offset << ": ";
		for (std::size_t i = 0; i < cols; ++i) {
			if (i < row.size())
				oss << std::setw(2) << std::to_integer<unsigned int>(row[i]) << ' ';
			else
				oss << "   ";
		}

		oss << "  ";
		for (const std::byte b: row) {
			const unsigned char c = std::to_integer<unsigned char>(b);
			oss << (std::isprint(c) ? static_cast<char>(c) : '.');
		}
	}

	return oss.str();
}
