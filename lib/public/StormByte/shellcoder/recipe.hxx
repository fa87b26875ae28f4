#pragma once

#include <StormByte/shellcoder/generic.hxx>
#include <StormByte/logger/log.hxx>

#include <concepts>
#include <memory>
#include <ostream>
#include <vector>

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
	 * @class Recipe
	 * @brief Ordered, reusable list of operations describing a payload.
	 *
	 * @par Overview
	 * A Recipe records the same calls a writer accepts (`Write`, `WriteLE`,
	 * `Fill`, ...) without performing them. It can then be applied to any
	 * writer, as many times as needed, or emitted straight to an output stream.
	 * Building a recipe never fails; errors surface when it is applied.
	 *
	 * @par Example
	 * @code{.cpp}
	 * Recipe recipe;
	 * recipe.WriteLE<std::uint64_t>(0x10000abcc).Fill(8, 'A').WriteLE<std::uint64_t>(0x10000fffc);
	 *
	 * std::array<std::byte, 24> scratch;
	 * Static writer(scratch);
	 * auto res = recipe.Apply(writer, log);
	 * @endcode
	 *
	 * @par Ownership
	 * Byte sequences passed to `Write` are copied into the recipe. Operations
	 * passed to `Add` are shared, so copying a recipe is cheap.
	 *
	 * @see Generic, Ops::Op
	 */
	class STORMBYTE_SHELLCODER_PUBLIC Recipe final {
		public:
			/**
			 * @brief Default constructor
			 * Initializes an empty recipe.
			 */
			Recipe() noexcept												= default;

			Recipe(const Recipe& other)										= default;

			Recipe(Recipe&& other) noexcept 								= default;

			~Recipe() noexcept												= default;

			Recipe& operator=(const Recipe& other)							= default;

			Recipe& operator=(Recipe&& other) noexcept						= default;

			/**
			 * @brief Append a shared operation.
			 * @param op Operation; ignored when null.
			 * @return Reference to this recipe.
			 */
			Recipe& 														Add(std::shared_ptr<const Ops::Op> op);

			/**
			 * @brief Append a copy of an operation.
			 * @tparam O Concrete operation type.
			 * @return Reference to this recipe.
			 * @note A borrowing `Ops::WriteBuffer` keeps borrowing: the caller must
			 *       keep its bytes alive while the recipe is used.
			 */
			template<std::derived_from<Ops::Op> O>
			Recipe& 														Add(O op) {
				return Add(std::make_shared<const O>(std::move(op)));
			}

			inline Recipe& 													Advance(const std::size_t& count) {
				return Add(Ops::Advance(count));
			}

			/**
			 * @brief Apply every operation to a writer, in order.
			 * @param target Writer to apply to.
			 * @param log Logger receiving a line per operation.
			 * @return `target` on success, or the first error.
			 * @details The total length is checked with `target.Check()` before
			 *          anything is written, so a recipe that does not fit leaves
			 *          `target` untouched. The hex dump logged at `LowLevel` shows
			 *          at most the first 256 bytes of the payload.
			 */
			ExpectedChain 													Apply(Generic& target, Logger::Log& log) const noexcept;

			/**
			 * @brief Remove every operation.
			 */
			inline void 													Clear() noexcept {
				m_ops.clear();
			}

			/**
			 * @brief Number of operations.
			 */
			inline std::size_t 												Count() const noexcept {
				return m_ops.size();
			}

			/**
			 * @brief Render every operation to an output stream, in order.
			 * @param stream Destination stream.
			 * @param log Logger receiving a line per operation.
			 * @return Bytes written, `Overflow` if the total length is not
			 *         representable, or `IOError` if the stream failed.
			 */
			ExpectedSize 													Emit(std::ostream& stream, Logger::Log& log) const noexcept;

			inline bool 													Empty() const noexcept {
				return m_ops.empty();
			}

			inline Recipe& 													Fill(const std::size_t& count, const std::byte& value) {
				return Add(Ops::Fill(count, value));
			}

			inline Recipe& 													Fill(const std::size_t& count, char value) {
				return Fill(count, static_cast<std::byte>(value));
			}

			/**
			 * @brief Total number of bytes the recipe produces.
			 * @return The sum of every operation's size, or `Overflow`.
			 */
			ExpectedSize 													Size() const noexcept;

			/**
			 * @brief Append a copy of `data`.
			 */
			Recipe& 														Write(std::span<const std::byte> data);

			inline Recipe& 													Write(std::string_view sv) {
				return Write(std::as_bytes(std::span<const char>(sv.data(), sv.size())));
			}

			/**
			 * @brief Append a string literal without its trailing NUL.
			 * @details Takes every element of the array but the last one, so a
			 *          partly used `char` buffer should be passed as a
			 *          `std::string_view` instead.
			 */
			template<std::size_t N>
			Recipe& 														Write(const char (&s)[N]) {
				return Write(std::string_view(s, (N > 0) ? (N - 1) : 0));
			}

			template<EncodableInteger I>
			Recipe& 														WriteBE(const I& value) {
				return Add(Ops::WriteInteger<I>::BE(value));
			}

			template<EncodableInteger I>
			Recipe& 														WriteLE(const I& value) {
				return Add(Ops::WriteInteger<I>::LE(value));
			}

			template<EncodableInteger I>
			Recipe& 														WriteInteger(const I& value, const Endianness& order) {
				return Add(Ops::WriteInteger<I>(value, order));
			}

		private:
			std::vector<std::shared_ptr<const Ops::Op>> m_ops;				///< Operations in application order.
	};
}
