/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <string>
#include <string_view>
#include <bazinga/foundation/text.hpp>
#include <bazinga/foundation/transform-pass.hpp>
#include <bazinga/support/vowel-set.hpp>

namespace bzg
{
	inline constexpr std::string_view DEFAULT_MARKER = "bazinga";

	/**
	 * @brief Replace every maximal run of vowels with the marker
	 *
	 * Uses the ASCII lowercase vowels `a e i o u` and the marker `"bazinga"`.
	 * Non-vowels are copied unchanged and in order; a run of any length
	 * produces exactly one marker.
	 *
	 * @param word Input of any length, including empty
	 * @return The rewritten word
	 */
	[[nodiscard]] std::string bazingafy(std::string_view word);

	/**
	 * @param word Null-terminated input
	 * @throws std::invalid_argument if `word` is null
	 */
	[[nodiscard]] std::string bazingafy(const char *word);

	/**
	 * @brief Replace every maximal run of `vowels` with `marker`
	 *
	 * @param word Input of any length, including empty
	 * @param vowels Characters that form runs
	 * @param marker Replacement emitted once per run; may be empty
	 */
	[[nodiscard]] std::string bazingafy(std::string_view word, const VowelSet &vowels,
	                                    std::string_view marker = DEFAULT_MARKER);

	/**
	 * @brief Rewrites a text with bazingafy
	 */
	class BazingafyPass final : public TransformPass
	{
	public:
		struct Options
		{
			std::string marker = std::string(DEFAULT_MARKER);
			bool fold_case = false; /* treat A E I O U as vowels too */
		};

		BazingafyPass();

		explicit BazingafyPass(Options options);

		[[nodiscard]] std::string_view name() const override;

		[[nodiscard]] std::string_view description() const override;

		[[nodiscard]] std::vector<const std::type_info *> required_passes() const override;

		bool run(Text &text, PassContext &ctx) override;

		[[nodiscard]] const Options &options() const;

	private:
		Options opts;
		VowelSet vowels;
	};
}
