#pragma once

#include <StormByte/shellcoder/ops.hxx>
#include <StormByte/shellcoder/typedefs.hxx>

#include <expected>
#include <span>
#include <string>
#include <string_view>

/**
 * @namespace Shellcoder
 * @brief Namespace for payload writing components in the StormByte library.
 *
 * The Shellcoder namespace provides cursor-tracked byte writers over fixed
 * (caller-owned) and growable storage, the operations they are built on, and
 * reusable recipes of operations.
 */
namespace StormByte::Shellcoder {
	/**
	 * @class Generic
	 * @brief Common contract of every payload writer.
	 * @par Overview
	 *  A writer owns or borrows a backing store and a cursor: the offset of the
	 *  next byte to write. Bytes in `[0, Size())` are the payload produced so far.
	 *  Every mutating call goes through `Add()` and is all-or-nothing: on failure
	 *  the backing store and the cursor are exactly as they were before the call.
	 *
	 * @par Chaining
	 *  Mutating calls return an `ExpectedChain` referring back to the writer, so
	 *  a payload can be described as one expression that stops at the first error:
	 * @code{.cpp}
	 * std::array<std::byte, 24> scratch;
	 * Static writer(scratch);
	 * auto res = writer.WriteLE<std::uint64_t>(0x10000abcc)
	 *     .and_then([](Generic& w) { return w.Fill(8, 'A'); })
	 *     .and_then([](Generic& w) { return w.WriteLE<std::uint64_t>(0x10000fffc); });
	 * if (!res) std::cerr << res.error()->what() << std::endl;
	 * @endcode
	 *
	 * @par Thread safety
	 *  Writers are **not thread-safe**. A finished payload may be read from many
	 *  threads once no further writes happen.
	 *
	 * @see Static, Dynamic, Recipe
	 */
	class STORMBYTE_SHELLCODER_PUBLIC Generic {
		public:
			/**
			 * 	@brief Construct Generic.
			 */
			Generic() noexcept												= default;

			/**
			 * 	@brief Virtual destructor.
			 */
			virtual ~Generic() noexcept 									= 0;

			/**
			 * @brief Apply an operation at the cursor.
			 * @param op Operation to render.
			 * @return This writer, or the error that prevented the write.
			 * @details The only primitive writers implement; every other mutating
			 *          call is expressed through it.
			 */
			virtual ExpectedChain 											Add(const Ops::Op& op) noexcept = 0;

			/**
			 * @brief Move the cursor `count` bytes ahead, zero-filling the gap.
			 */
			inline ExpectedChain 											Advance(const std::size_t& count) noexcept {
				return Add(Ops::Advance(count));
			}

			/**
			 * @brief Bytes that can still be written before `Check()` fails.
			 */
			virtual std::size_t 											Available() const noexcept = 0;

			/**
			 * @brief Total addressable size of the backing store.
			 * @details Fixed for bounded writers. For growable writers this is the
			 *          current allocation and is informational only.
			 */
			virtual std::size_t 											Capacity() const noexcept = 0;

			/**
			 * @brief Tell whether `count` more bytes could be written.
			 * @param count Number of bytes.
			 * @return Success, or exactly the error a write of that size would return.
			 * @details Never modifies the writer.
			 */
			virtual ExpectedVoid<Error> 									Check(const std::size_t& count) const noexcept = 0;

			/**
			 * @brief Read-only view of the payload written so far.
			 * @details Valid until the next mutating call.
			 */
			virtual std::span<const std::byte> 								Data() const noexcept = 0;

			/**
			 * @brief Check if nothing has been written yet.
			 */
			inline bool 													Empty() const noexcept {
				return Size() == 0;
			}

			/**
			 * @brief Write `count` copies of `value`.
			 * @details `count == 0` is a no-op that always succeeds.
			 */
			inline ExpectedChain 											Fill(const std::size_t& count, const std::byte& value) noexcept {
				return Add(Ops::Fill(count, value));
			}

			/**
			 * @brief Write `count` copies of a character value.
			 */
			inline ExpectedChain 											Fill(const std::size_t& count, char value) noexcept {
				return Fill(count, static_cast<std::byte>(value));
			}

			/**
			 * @brief Produce a hexdump of the payload.
			 * @param collumns Number of bytes per line (0 -> default 16).
			 * @param byte_limit Maximum number of bytes to include (0 -> no limit).
			 * @return Header lines with size and capacity followed by hex/ASCII lines.
			 *         The returned string does not include a trailing newline.
			 * Example output:
			 * @code{.text}
			 * Size: 4 bytes
			 * Capacity: 8 bytes
			 * 00000000: 70 77 6E 64                                       pwnd
			 * @endcode
			 */
			std::string														HexDump(const std::size_t& collumns = 16, const std::size_t& byte_limit = 0) const noexcept;

			/**
			 * @brief Number of bytes written so far (the cursor).
			 */
			virtual std::size_t 											Size() const noexcept = 0;

			/**
			 * @brief Write bytes verbatim.
			 * @details Zero-length input is a no-op that always succeeds.
			 */
			inline ExpectedChain 											Write(std::span<const std::byte> data) noexcept {
				return Add(Ops::WriteBuffer(data));
			}

			/**
			 * @brief Write the characters of a string view.
			 */
			inline ExpectedChain 											Write(std::string_view sv) noexcept {
				return Write(std::as_bytes(std::span<const char>(sv.data(), sv.size())));
			}

			/**
			 * @brief Write from a string literal without its trailing NUL.
			 * @details Writes the whole array but its last element, embedded NUL
			 *          bytes included. A `char` array used as a text buffer
			 *          (`char name[32]` holding `"abc"`) therefore writes 31 bytes;
			 *          pass `std::string_view(name)` to write only its text.
			 */
			template<std::size_t N>
			ExpectedChain 													Write(const char (&s)[N]) noexcept {
				return Write(std::string_view(s, (N > 0) ? (N - 1) : 0));
			}

			/**
			 * @brief Write an integer in big endian.
			 * @tparam I Integer type; its width decides the number of bytes.
			 */
			template<EncodableInteger I>
			ExpectedChain 													WriteBE(const I& value) noexcept {
				return Add(Ops::WriteInteger<I>::BE(value));
			}

			/**
			 * @brief Write an integer in little endian.
			 * @tparam I Integer type; its width decides the number of bytes.
			 */
			template<EncodableInteger I>
			ExpectedChain 													WriteLE(const I& value) noexcept {
				return Add(Ops::WriteInteger<I>::LE(value));
			}

			/**
			 * @brief Write an integer in a byte order chosen at runtime.
			 */
			template<EncodableInteger I>
			ExpectedChain 													WriteInteger(const I& value, const Endianness& order) noexcept {
				return Add(Ops::WriteInteger<I>(value, order));
			}

		protected:
			Generic(const Generic&) noexcept								= default;
			Generic(Generic&&) noexcept										= default;
			Generic& operator=(const Generic&) noexcept						= default;
			Generic& operator=(Generic&&) noexcept							= default;

			/**
			 * @brief Success result referring back to this writer.
			 */
			inline ExpectedChain 											Chain() noexcept {
				return std::ref(*this);
			}
	};
}
