/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <vector>
#include <bazinga/foundation/pass-context.hpp>
#include <bazinga/foundation/text.hpp>

namespace bzg
{
	PassContext::PassContext(Text& text, const bool debug_mode)
		: txt(text), dbg_mode(debug_mode) {}

	Text& PassContext::text()
	{
		return txt;
	}

	const Text& PassContext::text() const
	{
		return txt;
	}

	bool PassContext::debug_mode() const
	{
		return dbg_mode;
	}

	void PassContext::store_result(const std::type_info& pass_type,
								  std::unique_ptr<AnalysisResult> result)
	{
		res[std::type_index(pass_type)] = { std::move(result), txt.revision() };
	}

	const AnalysisResult* PassContext::find_current(const std::type_info& pass_type) const
	{
		const auto it = res.find(std::type_index(pass_type));
		if (it == res.end() || it->second.revision != txt.revision())
			return nullptr;
		return it->second.result.get();
	}

	bool PassContext::has_result(const std::type_info& pass_type) const
	{
		return find_current(pass_type) != nullptr;
	}

	void PassContext::invalidate(const std::type_info& pass_type)
	{
		res.erase(std::type_index(pass_type));
	}

	void PassContext::invalidate_by(const std::type_info& invalidating_pass)
	{
		std::vector<std::type_index> stale;
		for (const auto& [key, cached] : res)
		{
			if (cached.result->invalidated_by(invalidating_pass))
				stale.push_back(key);
		}

		for (const auto& key : stale)
			res.erase(key);
	}

	void PassContext::update_stat(const std::string_view name, const std::size_t delta)
	{
		stats[std::string(name)] += delta;
	}

	std::size_t PassContext::get_stat(const std::string_view name) const
	{
		const auto it = stats.find(std::string(name));
		if (it == stats.end())
			return 0;
		return it->second;
	}
}
