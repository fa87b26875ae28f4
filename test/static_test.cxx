#include <StormByte/shellcoder/static.hxx>
#include <StormByte/string.hxx>
#include <StormByte/test_handlers.h>

#include <array>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

using StormByte::Shellcoder::CapacityExceeded;
using StormByte::Shellcoder::DataType;
using StormByte::Shellcoder::ErrorReason;
using StormByte::Shellcoder::Generic;
using StormByte::Shellcoder::Overflow;
using StormByte::Shellcoder::Static;
using StormByte::Shellcoder::Ops::HexString;

template<typename I>
static I DecodeLE(std::span<const std::byte> bytes) {
	I value = 0;
	for (std::size_t i = bytes.size(); i-- > 0;)
		value = static_cast<I>((value << 8) | static_cast<I>(std::to_integer<unsigned char>(bytes[i])));
	return value;
}

template<typename I>
static I DecodeBE(std::span<const std::byte> bytes) {
	I value = 0;
	for (std::size_t i = 0; i < bytes.size(); ++i)
		value = static_cast<I>((value << 8) | static_cast<I>(std::to_integer<unsigned char>(bytes[i])));
	return value;
}

int test_static_documented_payload() {
	std::array<std::byte, 24> scratch {};
	Static writer(scratch);
	auto res = writer.WriteLE<std::uint64_t>(0x10000abcc)
		.and_then([](Generic& w) { return w.Fill(8, 'A'); })
		.and_then([](Generic& w) { return w.WriteLE<std::uint64_t>(0x10000fffc); });
	ASSERT_TRUE("documented payload chain ok", res.has_value());
	ASSERT_EQUAL("documented payload size", static_cast<std::size_t>(24), writer.Size());
	ASSERT_EQUAL("documented payload bytes",
		std::string("cc ab 00 00 01 00 00 00 41 41 41 41 41 41 41 41 fc ff 00 00 01 00 00 00"),
		HexString(writer.Get()));

	auto full = writer.Write("X");
	ASSERT_FALSE("write on full buffer fails", full.has_value());
	ASSERT_TRUE("write on full buffer reason", full.error()->Reason() == ErrorReason::CapacityExceeded);
	auto capacity = std::dynamic_pointer_cast<CapacityExceeded>(full.error());
	ASSERT_TRUE("write on full buffer is CapacityExceeded", capacity != nullptr);
	ASSERT_EQUAL("requested bytes", static_cast<std::size_t>(1), capacity->Requested());
	ASSERT_EQUAL("available bytes", static_cast<std::size_t>(0), capacity->Available());
	ASSERT_EQUAL("size unchanged after failure", static_cast<std::size_t>(24), writer.Size());
	RETURN_TEST("test_static_documented_payload", 0);
}

int test_static_initial_state() {
	std::array<std::byte, 16> scratch {};
	Static writer(scratch);
	ASSERT_TRUE("starts empty", writer.Empty());
	ASSERT_EQUAL("cursor at zero", static_cast<std::size_t>(0), writer.Size());
	ASSERT_EQUAL("capacity is region size", static_cast<std::size_t>(16), writer.Capacity());
	ASSERT_EQUAL("remaining is region size", static_cast<std::size_t>(16), writer.Remaining());
	ASSERT_TRUE("get is empty", writer.Get().empty());
	RETURN_TEST("test_static_initial_state", 0);
}

int test_static_write_appends_at_cursor() {
	std::array<std::byte, 8> scratch {};
	Static writer(scratch);
	(void)writer.Write("AB");
	auto res = writer.Write(StormByte::String::ToByteVector("CDE"));
	ASSERT_TRUE("second write ok", res.has_value());
	ASSERT_EQUAL("size after writes", static_cast<std::size_t>(5), writer.Size());
	ASSERT_EQUAL("content after writes", std::string("ABCDE"), StormByte::String::FromByteVector(DataType(writer.Get().begin(), writer.Get().end())));
	ASSERT_EQUAL("remaining after writes", static_cast<std::size_t>(3), writer.Remaining());
	RETURN_TEST("test_static_write_appends_at_cursor", 0);
}

int test_static_write_exact_fit() {
	std::array<std::byte, 4> scratch {};
	Static writer(scratch);
	auto res = writer.Write("pwnd");
	ASSERT_TRUE("exact fit ok", res.has_value());
	ASSERT_EQUAL("exact fit size", static_cast<std::size_t>(4), writer.Size());
	ASSERT_EQUAL("exact fit remaining", static_cast<std::size_t>(0), writer.Remaining());
	RETURN_TEST("test_static_write_exact_fit", 0);
}

int test_static_overflowing_write_leaves_state() {
	std::array<std::byte, 6> scratch;
	scratch.fill(std::byte{0xEE});
	Static writer(scratch);
	(void)writer.Write("abc");
	auto res = writer.Write("defg");
	ASSERT_FALSE("overflowing write fails", res.has_value());
	ASSERT_TRUE("overflowing write reason", res.error()->Reason() == ErrorReason::CapacityExceeded);
	auto capacity = std::dynamic_pointer_cast<CapacityExceeded>(res.error());
	ASSERT_EQUAL("overflowing requested", static_cast<std::size_t>(4), capacity->Requested());
	ASSERT_EQUAL("overflowing available", static_cast<std::size_t>(3), capacity->Available());
	ASSERT_EQUAL("size unchanged", static_cast<std::size_t>(3), writer.Size());
	ASSERT_EQUAL("region untouched", std::string("61 62 63 ee ee ee"), HexString(scratch));
	RETURN_TEST("test_static_overflowing_write_leaves_state", 0);
}

int test_static_overflowing_integer_leaves_state() {
	std::array<std::byte, 3> scratch {};
	Static writer(scratch);
	auto res = writer.WriteBE<std::uint32_t>(0xdeadbeef);
	ASSERT_FALSE("integer wider than region fails", res.has_value());
	ASSERT_TRUE("integer wider than region reason", res.error()->Reason() == ErrorReason::CapacityExceeded);
	ASSERT_EQUAL("integer wider than region requested", static_cast<std::size_t>(4),
		std::dynamic_pointer_cast<CapacityExceeded>(res.error())->Requested());
	ASSERT_TRUE("nothing written", writer.Empty());
	ASSERT_EQUAL("region untouched", std::string("00 00 00"), HexString(scratch));
	RETURN_TEST("test_static_overflowing_integer_leaves_state", 0);
}

int test_static_zero_length_on_full_buffer() {
	std::array<std::byte, 2> scratch {};
	Static writer(scratch);
	(void)writer.Fill(2, 'Z');
	auto empty_write = writer.Write(DataType{});
	ASSERT_TRUE("empty write on full buffer ok", empty_write.has_value());
	auto empty_fill = writer.Fill(0, 'Q');
	ASSERT_TRUE("empty fill on full buffer ok", empty_fill.has_value());
	auto empty_advance = writer.Advance(0);
	ASSERT_TRUE("empty advance on full buffer ok", empty_advance.has_value());
	ASSERT_EQUAL("size unchanged", static_cast<std::size_t>(2), writer.Size());
	ASSERT_EQUAL("content unchanged", std::string("5a 5a"), HexString(writer.Get()));
	RETURN_TEST("test_static_zero_length_on_full_buffer", 0);
}

int test_static_fill() {
	std::array<std::byte, 16> scratch {};
	Static writer(scratch);
	(void)writer.Write("X");
	auto res = writer.Fill(5, std::byte{0x90});
	ASSERT_TRUE("fill ok", res.has_value());
	ASSERT_EQUAL("fill size", static_cast<std::size_t>(6), writer.Size());
	ASSERT_EQUAL("fill content", std::string("58 90 90 90 90 90"), HexString(writer.Get()));
	RETURN_TEST("test_static_fill", 0);
}

int test_static_bytes_past_cursor_untouched() {
	std::array<std::byte, 8> scratch;
	scratch.fill(std::byte{0xCC});
	Static writer(scratch);
	(void)writer.WriteLE<std::uint16_t>(0x1234);
	ASSERT_EQUAL("prefix and untouched tail", std::string("34 12 cc cc cc cc cc cc"), HexString(scratch));
	ASSERT_EQUAL("get is prefix only", std::string("34 12"), HexString(writer.Get()));
	RETURN_TEST("test_static_bytes_past_cursor_untouched", 0);
}

int test_static_get_tracks_cursor() {
	std::array<std::byte, 8> scratch {};
	Static writer(scratch);
	(void)writer.Write("ab");
	auto first = writer.Get();
	ASSERT_EQUAL("first get size", static_cast<std::size_t>(2), first.size());
	(void)writer.Write("cd");
	auto second = writer.Get();
	ASSERT_EQUAL("second get size", static_cast<std::size_t>(4), second.size());
	ASSERT_EQUAL("get does not reset", static_cast<std::size_t>(4), writer.Size());
	ASSERT_TRUE("get views caller region", second.data() == scratch.data());
	RETURN_TEST("test_static_get_tracks_cursor", 0);
}

int test_static_string_literal_embedded_nul() {
	std::array<std::byte, 8> scratch {};
	Static writer(scratch);
	auto res = writer.Write("\x90\x00\xcc");
	ASSERT_TRUE("literal with NUL ok", res.has_value());
	ASSERT_EQUAL("literal with NUL size", static_cast<std::size_t>(3), writer.Size());
	ASSERT_EQUAL("literal with NUL content", std::string("90 00 cc"), HexString(writer.Get()));
	RETURN_TEST("test_static_string_literal_embedded_nul", 0);
}

int test_static_integer_encodings() {
	std::array<std::byte, 64> scratch {};
	Static writer(scratch);
	(void)writer.WriteBE<std::uint8_t>(1);
	(void)writer.WriteLE<std::uint8_t>(2);
	ASSERT_EQUAL("u8", std::string("01 02"), HexString(writer.Get()));

	Static be16(scratch);
	(void)be16.WriteBE<std::uint16_t>(0xdead);
	ASSERT_EQUAL("u16 be", std::string("de ad"), HexString(be16.Get()));

	Static le16(scratch);
	(void)le16.WriteLE<std::uint16_t>(0xdead);
	ASSERT_EQUAL("u16 le", std::string("ad de"), HexString(le16.Get()));

	Static be32(scratch);
	(void)be32.WriteBE<std::uint32_t>(0xdeadbeef);
	ASSERT_EQUAL("u32 be", std::string("de ad be ef"), HexString(be32.Get()));

	Static le32(scratch);
	(void)le32.WriteLE<std::uint32_t>(0xdeadbeef);
	ASSERT_EQUAL("u32 le", std::string("ef be ad de"), HexString(le32.Get()));

	Static be64(scratch);
	(void)be64.WriteBE<std::uint64_t>(0xdeadbeefcafebabe);
	ASSERT_EQUAL("u64 be", std::string("de ad be ef ca fe ba be"), HexString(be64.Get()));

	Static le64(scratch);
	(void)le64.WriteLE<std::uint64_t>(0xdeadbeefcafebabe);
	ASSERT_EQUAL("u64 le", std::string("be ba fe ca ef be ad de"), HexString(le64.Get()));

	Static negative(scratch);
	(void)negative.WriteLE<std::int32_t>(-2);
	ASSERT_EQUAL("i32 le negative", std::string("fe ff ff ff"), HexString(negative.Get()));
	RETURN_TEST("test_static_integer_encodings", 0);
}

int test_static_integer_round_trip() {
	std::array<std::byte, 16> scratch {};
	{
		Static le(scratch);
		(void)le.WriteLE<std::int16_t>(-12345);
		ASSERT_EQUAL("i16 le round trip", static_cast<int>(-12345), static_cast<int>(DecodeLE<std::int16_t>(le.Get())));
		Static be(scratch);
		(void)be.WriteBE<std::int16_t>(-12345);
		ASSERT_EQUAL("i16 be round trip", static_cast<int>(-12345), static_cast<int>(DecodeBE<std::int16_t>(be.Get())));
	}
	{
		Static le(scratch);
		(void)le.WriteLE<std::uint32_t>(0x01020304);
		ASSERT_EQUAL("u32 le round trip", static_cast<std::uint32_t>(0x01020304), DecodeLE<std::uint32_t>(le.Get()));
		Static be(scratch);
		(void)be.WriteBE<std::uint32_t>(0x01020304);
		ASSERT_EQUAL("u32 be round trip", static_cast<std::uint32_t>(0x01020304), DecodeBE<std::uint32_t>(be.Get()));
	}
	{
		const std::int64_t value = std::numeric_limits<std::int64_t>::min() + 7;
		Static le(scratch);
		(void)le.WriteLE<std::int64_t>(value);
		ASSERT_EQUAL("i64 le round trip", value, DecodeLE<std::int64_t>(le.Get()));
		Static be(scratch);
		(void)be.WriteBE<std::int64_t>(value);
		ASSERT_EQUAL("i64 be round trip", value, DecodeBE<std::int64_t>(be.Get()));
	}
#ifdef __SIZEOF_INT128__
	{
		const unsigned __int128 value = (static_cast<unsigned __int128>(0x0102030405060708ULL) << 64) | 0x090a0b0c0d0e0f10ULL;
		Static le(scratch);
		auto res = le.WriteLE<unsigned __int128>(value);
		ASSERT_TRUE("u128 le ok", res.has_value());
		ASSERT_EQUAL("u128 le width", static_cast<std::size_t>(16), le.Size());
		ASSERT_TRUE("u128 le round trip", DecodeLE<unsigned __int128>(le.Get()) == value);
		ASSERT_EQUAL("u128 le first byte", std::string("10"), HexString(le.Get().first(1)));
		Static be(scratch);
		(void)be.WriteBE<unsigned __int128>(value);
		ASSERT_TRUE("u128 be round trip", DecodeBE<unsigned __int128>(be.Get()) == value);
		ASSERT_EQUAL("u128 be first byte", std::string("01"), HexString(be.Get().first(1)));
	}
#endif
	RETURN_TEST("test_static_integer_round_trip", 0);
}

int test_static_overflow_at_boundary() {
	std::array<std::byte, 4> scratch {};
	Static writer(scratch);
	auto huge = writer.Fill(std::numeric_limits<std::size_t>::max(), 'A');
	ASSERT_FALSE("huge fill from zero fails", huge.has_value());
	ASSERT_TRUE("huge fill from zero is capacity", huge.error()->Reason() == ErrorReason::CapacityExceeded);

	(void)writer.Write("a");
	auto wrapped = writer.Fill(std::numeric_limits<std::size_t>::max(), 'A');
	ASSERT_FALSE("wrapping fill fails", wrapped.has_value());
	ASSERT_TRUE("wrapping fill is overflow", wrapped.error()->Reason() == ErrorReason::Overflow);
	auto overflow = std::dynamic_pointer_cast<Overflow>(wrapped.error());
	ASSERT_TRUE("wrapping fill is Overflow", overflow != nullptr);
	ASSERT_EQUAL("overflow offset", static_cast<std::size_t>(1), overflow->Offset());
	ASSERT_EQUAL("overflow requested", std::numeric_limits<std::size_t>::max(), overflow->Requested());
	ASSERT_EQUAL("size unchanged", static_cast<std::size_t>(1), writer.Size());
	RETURN_TEST("test_static_overflow_at_boundary", 0);
}

int test_static_check_does_not_mutate() {
	std::array<std::byte, 4> scratch {};
	Static writer(scratch);
	ASSERT_TRUE("check fitting", writer.Check(4).has_value());
	ASSERT_FALSE("check too large", writer.Check(5).has_value());
	ASSERT_TRUE("check left writer empty", writer.Empty());
	RETURN_TEST("test_static_check_does_not_mutate", 0);
}

int test_static_move() {
	std::array<std::byte, 8> scratch {};
	Static a(scratch);
	(void)a.Write("abc");
	Static b(std::move(a));
	ASSERT_EQUAL("move ctor keeps cursor", static_cast<std::size_t>(3), b.Size());
	ASSERT_EQUAL("move ctor keeps capacity", static_cast<std::size_t>(8), b.Capacity());
	ASSERT_EQUAL("moved-from capacity", static_cast<std::size_t>(0), a.Capacity());
	ASSERT_TRUE("moved-from empty", a.Empty());
	ASSERT_FALSE("moved-from refuses writes", a.Write("x").has_value());

	std::array<std::byte, 2> other {};
	Static c(other);
	c = std::move(b);
	ASSERT_EQUAL("move assign keeps cursor", static_cast<std::size_t>(3), c.Size());
	ASSERT_EQUAL("move assign content", std::string("61 62 63"), HexString(c.Get()));
	ASSERT_EQUAL("move assign source capacity", static_cast<std::size_t>(0), b.Capacity());
	RETURN_TEST("test_static_move", 0);
}

int main() {
	int result = 0;
	result += test_static_documented_payload();
	result += test_static_initial_state();
	result += test_static_write_appends_at_cursor();
	result += test_static_write_exact_fit();
	result += test_static_overflowing_write_leaves_state();
	result += test_static_overflowing_integer_leaves_state();
	result += test_static_zero_length_on_full_buffer();
	result += test_static_fill();
	result += test_static_bytes_past_cursor_untouched();
	result += test_static_get_tracks_cursor();
	result += test_static_string_literal_embedded_nul();
	result += test_static_integer_encodings();
	result += test_static_integer_round_trip();
	result += test_static_overflow_at_boundary();
	result += test_static_check_does_not_mutate();
	result += test_static_move();

	if (result == 0) {
		std::cout << "Static tests passed!" << std::endl;
	} else {
		std::cout << result << " Static tests failed." << std::endl;
	}
	return result;
}
