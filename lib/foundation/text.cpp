/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <utility>
#include <bazinga/foundation/text.hpp>

namespace bzg
{
	Text::Text(const std::string_view name, std::string content) : name(name), content(std::move(content)) {}

	std::string_view Text::get_name() const
	{
		return name;
	}

	std::string_view Text::get_content() const
	{
		return content;
	}

	void Text::set_content(std::string content)
	{
		this->content = std::move(content);
		++rev;
	}

	std::size_t Text::size() const
	{
		return content.size();
	}

	bool Text::empty() const
	{
		return content.empty();
	}

	std::uint64_t Text::revision() const
	{
		return rev;
	}
}
