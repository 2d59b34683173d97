/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <string>
#include <bazinga/support/vowel-set.hpp>

namespace bzg
{
	std::size_t VowelSet::size() const noexcept
	{
		return static_cast<std::size_t>(std::ranges::count(table, true));
	}

	std::string VowelSet::members() const
	{
		std::string out;
		for (std::size_t i = 0; i < table.size(); ++i)
		{
			if (table[i])
				out.push_back(static_cast<char>(i));
		}
		return out;
	}
}
