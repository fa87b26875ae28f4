#pragma once

#include <StormByte/shellcoder/generic.hxx>

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
	 * @class Static
	 * @brief Payload writer over a fixed-size, caller-owned region.
	 *
	 * @par Overview
	 *  Static borrows a region supplied by the caller (a stack array, a mapped
	 *  page, ...) and never allocates. Every write is checked against the
	 *  region size first; a write that does not fit fails with
	 *  `CapacityExceeded` and nothing is written. Bytes past the cursor are
	 *  never touched.
	 *
	 * @par Lifetime
	 *  The region must outlive the writer and must not be modified by anyone
	 *  else while the writer holds it. A Static cannot be copied, so only one
	 *  writer ever refers to a given region; moving hands the region over and
	 *  leaves the source empty with zero capacity. The region keeps its size and
	 *  returns to the caller unchanged when the writer goes away.
	 *
	 * @code{.cpp}
	 * std::array<std::byte, 42> scratch;
	 * Static writer(scratch);
	 * (void)writer.Write("pwnd");
	 * std::span<const std::byte> shellcode = writer.Get();
	 * @endcode
	 */
	class STORMBYTE_SHELLCODER_PUBLIC Static final: public Generic {
		public:
			/**
			 * 	@brief Construct over `buffer`, with the cursor at its start.
			 *  @param buffer Caller-owned region.
			 */
			explicit Static(std::span<std::byte> buffer) noexcept: Generic(), m_buffer(buffer) {}

			/**
			 * 	@brief Copy construct deleted
			 */
			Static(const Static&) 											= delete;

			/**
			 * 	@brief Move construct, taking over the region and the cursor.
			 *  @param other Source writer; left empty with zero capacity.
			 */
			Static(Static&& other) noexcept;

			/**
			 * 	@brief Destructor.
			 */
			~Static() noexcept override										= default;

			/**
			 * 	@brief Copy assign deleted
			 */
			Static& operator=(const Static&) 								= delete;

			/**
			 * 	@brief Move assign, taking over the region and the cursor.
			 *  @param other Source writer; left empty with zero capacity.
			 */
			Static& operator=(Static&& other) noexcept;

			ExpectedChain 													Add(const Ops::Op& op) noexcept override;

			inline std::size_t 												Available() const noexcept override {
				return m_buffer.size() - m_cursor;
			}

			/**
			 * @brief Size of the borrowed region.
			 */
			inline std::size_t 												Capacity() const noexcept override {
				return m_buffer.size();
			}

			/**
			 * @brief Tell whether `count` more bytes fit.
			 * @return `Overflow` when `Size() + count` is not representable,
			 *         `CapacityExceeded` when it exceeds `Capacity()`.
			 */
			ExpectedVoid<Error> 											Check(const std::size_t& count) const noexcept override;

			inline std::span<const std::byte> 								Data() const noexcept override {
				return m_buffer.first(m_cursor);
			}

			/**
			 * @brief Written prefix of the caller's region.
			 * @details A view into the caller's memory, not a copy: it stays valid
			 *          as long as the region does. It always reflects the current
			 *          cursor and does not reset it.
			 */
			inline std::span<const std::byte> 								Get() const noexcept {
				return Data();
			}

			/**
			 * @brief Bytes left before the region is full.
			 */
			inline std::size_t 												Remaining() const noexcept {
				return Available();
			}

			inline std::size_t 												Size() const noexcept override {
				return m_cursor;
			}

		private:
			std::span<std::byte> m_buffer;									///< Borrowed region.
			std::size_t m_cursor {0};										///< Next write offset, never above `m_buffer.size()`.
	};
}
