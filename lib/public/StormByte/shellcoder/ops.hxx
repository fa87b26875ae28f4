#pragma once

#include <StormByte/shellcoder/typedefs.hxx>

#include <algorithm>
#include <array>
#include <bit>
#include <cstring>
#include <format>
#include <memory>
#include <ostream>
#include <span>
#include <string>

/**
 * @namespace Ops
 * @brief Units of output a payload is assembled from.
 *
 * Every writer call (`Write`, `WriteLE`, `Fill`, ...) is expressed as one of
 * these operations. They can also be rendered on their own, into a raw region
 * or an output stream, or collected into a Recipe.
 */
namespace StormByte::Shellcoder::Ops {
	/**
	 * @brief Render bytes as lowercase hex pairs separated by spaces.
	 * @param data Bytes to render.
	 * @return e.g. `"cc ab 00 00"`; empty string for empty input.
	 */
	STORMBYTE_SHELLCODER_PUBLIC std::string 						HexString(std::span<const std::byte> data);

	/**
	 * @class Op
	 * @brief Abstract operation producing a known number of bytes.
	 * @par Overview
	 *  An operation knows its encoded size before it is rendered, which lets
	 *  writers reject it up front instead of applying it partially.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC Op {
		public:
			Op() noexcept													= default;
			Op(const Op&) noexcept											= default;
			Op(Op&&) noexcept												= default;
			virtual ~Op() noexcept											= default;
			Op& operator=(const Op&) noexcept								= default;
			Op& operator=(Op&&) noexcept									= default;

			/**
			 * @brief Exact number of bytes this operation produces.
			 */
			virtual std::size_t 											Size() const noexcept = 0;

			/**
			 * @brief Render the operation at the start of a region.
			 * @param out Destination region; only its first `Size()` bytes are touched.
			 * @return Number of bytes written, or `CapacityExceeded` if `out` is
			 *         smaller than `Size()`, in which case `out` is left untouched.
			 */
			ExpectedSize 													WriteTo(std::span<std::byte> out) const noexcept;

			/**
			 * @brief Render the operation to an output stream.
			 * @param stream Destination stream.
			 * @return Number of bytes written, or `IOError` if the stream failed.
			 */
			virtual ExpectedSize 											WriteTo(std::ostream& stream) const noexcept;

			/**
			 * @brief One-line description for logs.
			 */
			virtual std::string 											Describe() const = 0;

		protected:
			/**
			 * @brief Render into a region of exactly `Size()` bytes.
			 */
			virtual void 													Render(std::span<std::byte> out) const noexcept = 0;

			/**
			 * @brief Write raw bytes to a stream, mapping stream failures to `IOError`.
			 */
			static ExpectedSize 											WriteStream(std::ostream& stream, std::span<const std::byte> data) noexcept;
	};

	/**
	 * @class Fill
	 * @brief Repeats a single byte value.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC Fill: public Op {
		public:
			/**
			 * @brief Construct a fill of `count` copies of `value`.
			 */
			Fill(const std::size_t& count, const std::byte& value) noexcept: m_count(count), m_value(value) {}

			inline std::size_t 												Size() const noexcept override {
				return m_count;
			}

			/**
			 * @brief Repeated byte value.
			 */
			inline std::byte 												Value() const noexcept {
				return m_value;
			}

			ExpectedSize 													WriteTo(std::ostream& stream) const noexcept override;

			std::string 													Describe() const override;

			using Op::WriteTo;

		protected:
			void 															Render(std::span<std::byte> out) const noexcept override;

		private:
			std::size_t m_count;
			std::byte m_value;
	};

	/**
	 * @class Advance
	 * @brief Moves the cursor ahead, zero-filling the gap.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC Advance final: public Fill {
		public:
			explicit Advance(const std::size_t& count) noexcept: Fill(count, std::byte{0}) {}

			std::string 													Describe() const override;
	};

	/**
	 * @class WriteBuffer
	 * @brief Copies a byte sequence verbatim.
	 * @details Either borrows the bytes (the caller keeps them alive while the
	 *          operation is in use) or owns a shared copy of them, which stays
	 *          valid through copies of the operation.
	 */
	class STORMBYTE_SHELLCODER_PUBLIC WriteBuffer final: public Op {
		public:
			/**
			 * @brief Borrow `data`.
			 */
			explicit WriteBuffer(std::span<const std::byte> data) noexcept: m_data(data) {}

			/**
			 * @brief Take ownership of `data`.
			 */
			explicit WriteBuffer(DataType&& data):
			m_storage(std::make_shared<const DataType>(std::move(data))), m_data(*m_storage) {}

			inline std::size_t 												Size() const noexcept override {
				return m_data.size();
			}

			/**
			 * @brief Bytes this operation writes.
			 */
			inline std::span<const std::byte> 								Data() const noexcept {
				return m_data;
			}

			/**
			 * @brief Whether the bytes are owned by the operation.
			 */
			inline bool 													Owning() const noexcept {
				return m_storage != nullptr;
			}

			ExpectedSize 													WriteTo(std::ostream& stream) const noexcept override;

			std::string 													Describe() const override;

			using Op::WriteTo;

		protected:
			void 															Render(std::span<std::byte> out) const noexcept override;

		private:
			std::shared_ptr<const DataType> m_storage;
			std::span<const std::byte> m_data;
	};

	/**
	 * @class WriteInteger
	 * @brief Encodes a fixed-width integer in a given byte order.
	 * @tparam I Integer type; its width alone decides how many bytes are written.
	 */
	template<EncodableInteger I>
	class WriteInteger final: public Op {
		public:
			WriteInteger(const I& value, const Endianness& order) noexcept: m_value(value), m_order(order) {}

			/**
			 * @brief Little-endian encoding of `value`.
			 */
			static WriteInteger 											LE(const I& value) noexcept {
				return WriteInteger(value, Endianness::Little);
			}

			/**
			 * @brief Big-endian encoding of `value`.
			 */
			static WriteInteger 											BE(const I& value) noexcept {
				return WriteInteger(value, Endianness::Big);
			}

			inline std::size_t 												Size() const noexcept override {
				return sizeof(I);
			}

			inline I 														Value() const noexcept {
				return m_value;
			}

			inline Endianness 												Order() const noexcept {
				return m_order;
			}

			/**
			 * @brief Encoded representation of the value.
			 */
			std::array<std::byte, sizeof(I)> 								Bytes() const noexcept {
				std::array<std::byte, sizeof(I)> bytes;
				std::memcpy(bytes.data(), &m_value, sizeof(I));
				const bool native_little = std::endian::native == std::endian::little;
				if (native_little != (m_order == Endianness::Little))
					std::reverse(bytes.begin(), bytes.end());
				return bytes;
			}

			ExpectedSize 													WriteTo(std::ostream& stream) const noexcept override {
				const auto bytes = Bytes();
				return WriteStream(stream, bytes);
			}

			std::string 													Describe() const override {
				const auto bytes = Bytes();
				return std::format("WriteInteger({} byte(s), {}: {})", sizeof(I),
					m_order == Endianness::Little ? "LE" : "BE", HexString(bytes));
			}

			using Op::WriteTo;

		protected:
			void 															Render(std::span<std::byte> out) const noexcept override {
				const auto bytes = Bytes();
				std::copy(bytes.begin(), bytes.end(), out.begin());
			}

		private:
			I m_value;
			Endianness m_order;
	};
}
