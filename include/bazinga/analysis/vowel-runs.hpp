/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>
#include <bazinga/foundation/analysis-pass.hpp>
#include <bazinga/support/vowel-set.hpp>

namespace bzg
{
	enum class SegmentKind : std::uint8_t
	{
		CHARACTER, /* exactly one non-vowel */
		VOWEL_RUN  /* maximal run of one or more vowels */
	};

	/**
	 * @brief A piece of the left-to-right partition of a text
	 */
	struct Segment
	{
		SegmentKind kind;
		std::size_t offset;
		std::size_t length;

		bool operator==(const Segment &) const = default;
	};

	/**
	 * @brief Partition `text` into single non-vowel characters and maximal vowel runs
	 *
	 * Segments are returned in order; they are contiguous and cover the whole input.
	 *
	 * @param text Text to partition
	 * @param vowels Vowel classification to use
	 */
	[[nodiscard]] std::vector<Segment> segment_vowel_runs(std::string_view text,
	                                                      const VowelSet &vowels = ASCII_VOWELS);

	/**
	 * @brief Result of VowelRunAnalysis
	 */
	class VowelRunInfo final : public AnalysisResult
	{
	public:
		VowelRunInfo(std::vector<Segment> segments, const VowelSet &vowels, std::uint64_t revision = 0);

		[[nodiscard]] bool invalidated_by(const std::type_info &transform_type) const override;

		[[nodiscard]] const std::vector<Segment> &segments() const;

		/**
		 * @return Number of vowel runs; one marker is emitted per run
		 */
		[[nodiscard]] std::size_t run_count() const;

		/**
		 * @return Number of characters covered by vowel runs
		 */
		[[nodiscard]] std::size_t vowel_count() const;

		/**
		 * @return Length of the longest vowel run, 0 if there is none
		 */
		[[nodiscard]] std::size_t longest_run() const;

		/**
		 * @return The vowel set the segments were computed with
		 */
		[[nodiscard]] const VowelSet &vowels() const;

		/**
		 * @return Revision of the text the segments describe
		 */
		[[nodiscard]] std::uint64_t revision() const;

		/**
		 * @return `true` if this partition still describes `text` under `vowels`
		 */
		[[nodiscard]] bool describes(const Text &text, const VowelSet &vowels) const;

	private:
		std::vector<Segment> segs;
		VowelSet vset;
		std::uint64_t rev;
		std::size_t runs = 0;
		std::size_t nvowels = 0;
		std::size_t longest = 0;
	};

	/**
	 * @brief Computes the vowel run partition of a text
	 */
	class VowelRunAnalysis final : public AnalysisPass
	{
	public:
		explicit VowelRunAnalysis(const VowelSet &vowels = ASCII_VOWELS);

		[[nodiscard]] std::string_view name() const override;

		[[nodiscard]] std::string_view description() const override;

		std::unique_ptr<AnalysisResult> analyze(Text &text, PassContext &ctx) override;

	private:
		VowelSet vowels;
	};
}
