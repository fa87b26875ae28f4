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
	* @class Dynamic
	* @brief Payload writer with grow-on-demand storage.
	*
	* @par Overview
	*  A contiguous growable buffer implemented atop @c DataType. Storage is
	*  reallocated as needed, so writes never fail for lack of room. A write
	*  fails with `Overflow` when the resulting length would exceed what the
	*  buffer can represent, detected before any allocation, and with
	*  `AllocationFailed` when the system cannot provide the storage. Either
	*  way the payload is left as it was.
	*
	*  Bytes taken from the writer's own payload (`w.Write(w.Data())`) are
	*  copied before the old storage is released.
	*
	* @par Thread safety
	*  This class is **not thread-safe**.
	*
	* @see Static for a writer that never allocates
	*/
	class STORMBYTE_SHELLCODER_PUBLIC Dynamic final: public Generic {
		public:
			/**
			 * 	@brief Construct an empty writer.
			 */
			Dynamic() noexcept 												= default;

			/**
			 * 	@brief Construct an empty writer with storage reserved up front.
			 *  @param size_hint Number of bytes to reserve; nothing is written.
			 *         A hint that cannot be allocated is ignored.
			 */
			explicit Dynamic(const std::size_t& size_hint) noexcept;

			Dynamic(const Dynamic& other)									= default;

			/**
			 * 	@brief Move construct; `other` is left empty.
			 */
			Dynamic(Dynamic&& other) noexcept;

			~Dynamic() noexcept override									= default;

			Dynamic& operator=(const Dynamic& other)						= default;

			/**
			 * 	@brief Move assign; `other` is left empty.
			 */
			Dynamic& operator=(Dynamic&& other) noexcept;

			/**
			 * @brief Equality comparison.
			 * @details Two writers are equal when their payloads are identical.
			 */
			inline bool operator==(const Dynamic& other) const noexcept {
				return m_buffer == other.m_buffer;
			}

			ExpectedChain 													Add(const Ops::Op& op) noexcept override;

			inline std::size_t 												Available() const noexcept override {
				return m_buffer.max_size() - m_buffer.size();
			}

			/**
			 * @brief Bytes currently allocated.
			 * @details Informational only: writes grow the storage as needed.
			 */
			inline std::size_t 												Capacity() const noexcept override {
				return m_buffer.capacity();
			}

			/**
			 * @brief Tell whether `count` more bytes can be represented.
			 * @return `Overflow` when `Size() + count` exceeds the maximum buffer size.
			 */
			ExpectedVoid<Error> 											Check(const std::size_t& count) const noexcept override;

			inline std::span<const std::byte> 								Data() const noexcept override {
				return m_buffer;
			}

			/**
			 * @brief Copy of the payload written so far.
			 * @details Does not reset the writer; may be called repeatedly.
			 */
			inline DataType 												Get() const {
				return m_buffer;
			}

			/**
			 * @brief Move the payload out, leaving the writer empty.
			 */
			DataType 														Release() noexcept;

			inline std::size_t 												Size() const noexcept override {
				return m_buffer.size();
			}

		private:
			DataType m_buffer;												///< Payload; its size is the cursor.
	};
}
