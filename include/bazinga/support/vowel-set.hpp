/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace bzg
{
	/**
	 * @brief Byte classification table deciding which characters count as vowels
	 *
	 * The default set is the ASCII lowercase vowels `a e i o u`. Uppercase letters
	 * and bytes outside ASCII are consonants unless a set says otherwise.
	 */
	class VowelSet
	{
	public:
		/**
		 * @brief Construct an empty set; nothing is a vowel
		 */
		constexpr VowelSet() = default;

		/**
		 * @return The set `{a, e, i, o, u}`
		 */
		static constexpr VowelSet ascii_lower()
		{
			return from_chars("aeiou");
		}

		/**
		 * @return The set `{a, e, i, o, u, A, E, I, O, U}`
		 */
		static constexpr VowelSet ascii_any_case()
		{
			return from_chars("aeiouAEIOU");
		}

		/**
		 * @param chars Every byte of this string becomes a vowel
		 * @return The resulting set; duplicates are ignored
		 */
		static constexpr VowelSet from_chars(const std::string_view chars)
		{
			VowelSet set;
			for (const char c: chars)
				set.table[static_cast<std::uint8_t>(c)] = true;
			return set;
		}

		/**
		 * @param c Character to classify
		 * @return `true` if `c` is a vowel in this set
		 */
		[[nodiscard]] constexpr bool contains(const char c) const noexcept
		{
			return table[static_cast<std::uint8_t>(c)];
		}

		/**
		 * @return Number of distinct bytes classified as vowels
		 */
		[[nodiscard]] std::size_t size() const noexcept;

		/**
		 * @return The vowels in ascending byte order
		 */
		[[nodiscard]] std::string members() const;

		constexpr bool operator==(const VowelSet &) const = default;

	private:
		std::array<bool, 256> table{};
	};

	inline constexpr VowelSet ASCII_VOWELS = VowelSet::ascii_lower();

	/**
	 * @brief Classify against the default ASCII lowercase set
	 */
	[[nodiscard]] constexpr bool is_vowel(const char c) noexcept
	{
		return ASCII_VOWELS.contains(c);
	}
}
