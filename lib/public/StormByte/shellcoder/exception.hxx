#pragma once

#include <StormByte/shellcoder/visibility.h>
#include <StormByte/exception.hxx>

#include <cstddef>
#include <format>
#include <string>

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
	 * @enum ErrorReason
	 * @brief Closed set of reasons a write can fail.
	 */
	enum class STORMBYTE_SHELLCODER_PUBLIC ErrorReason {
		CapacityExceeded,											///< Not enough room left in a fixed-size region.
		Overflow,													///< New cursor or length is not representable.
		IO,															///< Output stream rejected the bytes.
		Allocation													///< Growable storage could not be allocated.
	};

	// Generic Shellcoder exceptions
	class STORMBYTE_SHELLCODER_PUBLIC Exception: public StormByte::Exception {
		public:
			template <typename... Args>
			Exception(const std::string& component, std::format_string<Args...> fmt, Args&&... args):
			StormByte::Exception("Shellcoder::" + component, fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class Error
	 * @brief Base class for every failure reported by a writer or an operation.
	 * @details Errors are never thrown by this library: they travel inside
	 *          `Expected` results back to the caller that triggered them.
	 *          Use `Reason()` to tell them apart without casting.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC Error: public Exception {
		public:
			template <typename... Args>
			Error(const ErrorReason& reason, const std::string& component, std::format_string<Args...> fmt, Args&&... args):
			Exception(component, fmt, std::forward<Args>(args)...), m_reason(reason) {}

			/**
			 * @brief Why the write failed.
			 */
			inline ErrorReason 										Reason() const noexcept {
				return m_reason;
			}

		private:
			ErrorReason m_reason;
	};

	/**
	 * @class CapacityExceeded
	 * @brief A write needs more bytes than the destination has left.
	 * 
	 * @details Raised by the fixed-size writer, and by operations rendered into
	 *          a region that is too small for them.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC CapacityExceeded: public Error {
		public:
			CapacityExceeded(const std::size_t& requested, const std::size_t& available):
			Error(ErrorReason::CapacityExceeded, "CapacityExceeded", "requested {} byte(s) but only {} available", requested, available),
			m_requested(requested), m_available(available) {}

			/**
			 * @brief Number of bytes the write needed.
			 */
			inline std::size_t 										Requested() const noexcept {
				return m_requested;
			}

			/**
			 * @brief Number of bytes that were left.
			 */
			inline std::size_t 										Available() const noexcept {
				return m_available;
			}

		private:
			std::size_t m_requested, m_available;
	};

	/**
	 * @class Overflow
	 * @brief `offset + requested` does not fit the length counter.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC Overflow: public Error {
		public:
			Overflow(const std::size_t& offset, const std::size_t& requested):
			Error(ErrorReason::Overflow, "Overflow", "offset {} plus {} byte(s) is not representable", offset, requested),
			m_offset(offset), m_requested(requested) {}

			inline std::size_t 										Offset() const noexcept {
				return m_offset;
			}

			inline std::size_t 										Requested() const noexcept {
				return m_requested;
			}

		private:
			std::size_t m_offset, m_requested;
	};

	/**
	 * @class AllocationFailed
	 * @brief The growable writer could not obtain storage for a write.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC AllocationFailed: public Error {
		public:
			AllocationFailed(const std::size_t& requested, const std::string& detail):
			Error(ErrorReason::Allocation, "AllocationFailed", "could not allocate {} more byte(s): {}", requested, detail),
			m_requested(requested) {}

			inline std::size_t 										Requested() const noexcept {
				return m_requested;
			}

		private:
			std::size_t m_requested;
	};

	/**
	 * @class IOError
	 * @brief An output stream failed while operations were emitted to it.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC IOError: public Error {
		public:
			IOError(const std::string& detail):
			Error(ErrorReason::IO, "IOError", "{}", detail) {}
	};
}
