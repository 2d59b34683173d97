/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <bazinga/analysis/vowel-runs.hpp>
#include <bazinga/foundation/pass-context.hpp>

namespace bzg
{
	std::vector<Segment> segment_vowel_runs(const std::string_view text, const VowelSet &vowels)
	{
		std::vector<Segment> out;
		bool in_run = false;
		for (std::size_t i = 0; i < text.size(); ++i)
		{
			if (!vowels.contains(text[i]))
			{
				out.push_back({ SegmentKind::CHARACTER, i, 1 });
				in_run = false;
				continue;
			}

			if (in_run)
				++out.back().length;
			else
				out.push_back({ SegmentKind::VOWEL_RUN, i, 1 });
			in_run = true;
		}
		return out;
	}

	VowelRunInfo::VowelRunInfo(std::vector<Segment> segments, const VowelSet &vowels, const std::uint64_t revision)
		: segs(std::move(segments)), vset(vowels), rev(revision)
	{
		for (const auto &seg: segs)
		{
			if (seg.kind != SegmentKind::VOWEL_RUN)
				continue;

			++runs;
			nvowels += seg.length;
			longest = std::max(longest, seg.length);
		}
	}

	bool VowelRunInfo::invalidated_by(const std::type_info &transform_type) const
	{
		/* anything other than the analysis itself may have rewritten the text */
		return transform_type != typeid(VowelRunAnalysis);
	}

	const std::vector<Segment> &VowelRunInfo::segments() const
	{
		return segs;
	}

	std::size_t VowelRunInfo::run_count() const
	{
		return runs;
	}

	std::size_t VowelRunInfo::vowel_count() const
	{
		return nvowels;
	}

	std::size_t VowelRunInfo::longest_run() const
	{
		return longest;
	}

	const VowelSet &VowelRunInfo::vowels() const
	{
		return vset;
	}

	std::uint64_t VowelRunInfo::revision() const
	{
		return rev;
	}

	bool VowelRunInfo::describes(const Text &text, const VowelSet &vowels) const
	{
		return rev == text.revision() && vset == vowels;
	}

	VowelRunAnalysis::VowelRunAnalysis(const VowelSet &vowels) : vowels(vowels) {}

	// ReSharper disable once CppMemberFunctionMayBeStatic
	std::string_view VowelRunAnalysis::name() const // NOLINT(*-convert-member-functions-to-static)
	{
		return "vowel-run-analysis";
	}

	// ReSharper disable once CppMemberFunctionMayBeStatic
	std::string_view VowelRunAnalysis::description() const // NOLINT(*-convert-member-functions-to-static)
	{
		return "partitions the text into single consonants and maximal vowel runs";
	}

	std::unique_ptr<AnalysisResult> VowelRunAnalysis::analyze(Text &text, PassContext &ctx)
	{
		auto info = std::make_unique<VowelRunInfo>(segment_vowel_runs(text.get_content(), vowels),
		                                           vowels, text.revision());
		ctx.update_stat("vowel-runs.segments", info->segments().size());
		ctx.update_stat("vowel-runs.runs", info->run_count());
		return info;
	}
}
