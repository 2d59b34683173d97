/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <stdexcept>
#include <bazinga/analysis/vowel-runs.hpp>
#include <bazinga/foundation/pass-context.hpp>
#include <bazinga/transform/bazingafy.hpp>

namespace bzg
{
	std::string bazingafy(const std::string_view word)
	{
		return bazingafy(word, ASCII_VOWELS, DEFAULT_MARKER);
	}

	std::string bazingafy(const char *word)
	{
		if (!word)
			throw std::invalid_argument("bazingafy: word must not be null");
		return bazingafy(std::string_view(word));
	}

	std::string bazingafy(const std::string_view word, const VowelSet &vowels, const std::string_view marker)
	{
		std::string out;
		out.reserve(word.size());

		bool prev_vowel = false;
		for (const char c: word)
		{
			const bool vowel = vowels.contains(c);
			if (!vowel)
				out.push_back(c);
			else if (!prev_vowel)
				out.append(marker);
			/* otherwise the run already has its marker */
			prev_vowel = vowel;
		}
		return out;
	}

	BazingafyPass::BazingafyPass() : BazingafyPass(Options{}) {}

	BazingafyPass::BazingafyPass(Options options)
		: opts(std::move(options)),
		  vowels(opts.fold_case ? VowelSet::ascii_any_case() : VowelSet::ascii_lower()) {}

	// ReSharper disable once CppMemberFunctionMayBeStatic
	std::string_view BazingafyPass::name() const // NOLINT(*-convert-member-functions-to-static)
	{
		return "bazingafy";
	}

	// ReSharper disable once CppMemberFunctionMayBeStatic
	std::string_view BazingafyPass::description() const // NOLINT(*-convert-member-functions-to-static)
	{
		return "replaces every maximal vowel run with a marker";
	}

	std::vector<const std::type_info *> BazingafyPass::required_passes() const
	{
		/* the shared analysis only knows the lowercase set */
		if (opts.fold_case)
			return {};
		return get_pass_types<VowelRunAnalysis>();
	}

	bool BazingafyPass::run(Text &text, PassContext &ctx)
	{
		std::size_t runs = 0;
		std::size_t nvowels = 0;

		if (const auto *info = ctx.get_result<VowelRunAnalysis, VowelRunInfo>();
			info && info->describes(text, vowels))
		{
			runs = info->run_count();
			nvowels = info->vowel_count();
		}
		else
		{
			const VowelRunInfo local(segment_vowel_runs(text.get_content(), vowels), vowels);
			runs = local.run_count();
			nvowels = local.vowel_count();
		}

		text.set_content(bazingafy(text.get_content(), vowels, opts.marker));

		ctx.update_stat("bazingafy.markers", runs);
		ctx.update_stat("bazingafy.vowels", nvowels);
		return true;
	}

	const BazingafyPass::Options &BazingafyPass::options() const
	{
		return opts;
	}
}
