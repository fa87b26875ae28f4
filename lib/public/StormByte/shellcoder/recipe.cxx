#include <StormByte/shellcoder/recipe.hxx>

#include <limits>

using namespace StormByte::Shellcoder;

namespace {
	// Bytes of the applied payload shown in the LowLevel hex dump
	constexpr std::size_t HEXDUMP_LIMIT = 256;
}

Recipe& Recipe::Add(std::shared_ptr<const Ops::Op> op) {
	if (op)
		m_ops.push_back(std::move(op));
	return *this;
}

ExpectedChain Recipe::Apply(Generic& target, Logger::Log& log) const noexcept {
	auto total = Size();
	if (!total) {
		log << Logger::Level::Error << "Recipe: " << total.error()->what() << std::endl;
		return std::unexpected(total.error());
	}

	auto room = target.Check(*total);
	if (!room) {
		log << Logger::Level::Error << "Recipe: " << room.error()->what() << std::endl;
		return std::unexpected(room.error());
	}

	log << Logger::Level::Debug << "Recipe: applying " << m_ops.size() << " operation(s), "
		<< *total << " byte(s) at offset " << target.Size() << std::endl;

	for (const auto& op: m_ops) {
		log << Logger::Level::Debug << "Recipe: " << op->Describe() << " at offset " << target.Size() << std::endl;
		auto res = target.Add(*op);
		if (!res) {
			log << Logger::Level::Error << "Recipe: " << op->Describe() << " failed: " << res.error()->what() << std::endl;
			return res;
		}
	}

	log << Logger::Level::LowLevel << target.HexDump(16, HEXDUMP_LIMIT) << std::endl;
	return std::ref(target);
}

ExpectedSize Recipe::Emit(std::ostream& stream, Logger::Log& log) const noexcept {
	auto total = Size();
	if (!total) {
		log << Logger::Level::Error << "Recipe: " << total.error()->what() << std::endl;
		return total;
	}

	std::size_t written = 0;
	for (const auto& op: m_ops) {
		log << Logger::Level::Debug << "Recipe: emitting " << op->Describe() << std::endl;
		auto res = op->WriteTo(stream);
		if (!res) {
			log << Logger::Level::Error << "Recipe: emit stopped after " << written << " byte(s): " << res.error()->what() << std::endl;
			return res;
		}
		written += *res;
	}

	log << Logger::Level::Debug << "Recipe: emitted " << written << " byte(s)" << std::endl;
	return written;
}

ExpectedSize Recipe::Size() const noexcept {
	std::size_t total = 0;
	for (const auto& op: m_ops) {
		const std::size_t n = op->Size();
		if (n > std::numeric_limits<std::size_t>::max() - total)
			return StormByte::Unexpected(Overflow(total, n));
		total += n;
	}
	return total;
}

Recipe& Recipe::Write(std::span<const std::byte> data) {
	return Add(Ops::WriteBuffer(DataType(data.begin(), data.end())));
}
