#pragma once

#include <StormByte/shellcoder/exception.hxx>
#include <StormByte/expected.hxx>

#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>
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
	class Generic;					///< Forward declaration of Generic class.

	/**
	 * @enum Endianness
	 * @brief Byte order used when encoding an integer.
	 */
	enum class STORMBYTE_SHELLCODER_PUBLIC Endianness {
		Little,						///< Least significant byte first.
		Big							///< Most significant byte first.
	};

	using DataType = std::vector<std::byte>;

	template<class Exception>
	using ExpectedVoid = Expected<void, Exception>;

	/**
	 * @brief Result of an operation rendered into a region or a stream.
	 * @details Holds the number of bytes written on success.
	 */
	using ExpectedSize = Expected<std::size_t, Error>;

	/**
	 * @brief Result of every mutating writer call.
	 *
	 * @details On success it refers back to the writer the call was made on,
	 *          so calls can be chained with `and_then` and stop at the first
	 *          failure:
	 * @code{.cpp}
	 * auto res = writer.WriteLE<std::uint64_t>(0x10000abcc)
	 *     .and_then([](Generic& w) { return w.Fill(8, 'A'); })
	 *     .and_then([](Generic& w) { return w.WriteLE<std::uint64_t>(0x10000fffc); });
	 * @endcode
	 */
	using ExpectedChain = Expected<std::reference_wrapper<Generic>, Error>;

	/**
	 * @brief Integer types whose fixed width can be encoded.
	 * @details Every standard integer type except `bool`, plus the 128-bit
	 *          integers where the compiler provides them.
	 */
	template<typename I>
	concept EncodableInteger = (std::integral<I> && !std::same_as<std::remove_cv_t<I>, bool>)
	#ifdef __SIZEOF_INT128__
		|| std::same_as<std::remove_cv_t<I>, __int128>
		|| std::same_as<std::remove_cv_t<I>, unsigned __int128>
	#endif
	;
}
