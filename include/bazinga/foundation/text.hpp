/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bzg
{
	/**
	 * @brief Named character buffer that passes read and rewrite
	 */
	class Text
	{
	public:
		/**
		 * @brief Construct a new Text
		 *
		 * @param name Name of the text, used in diagnostics
		 * @param content Initial content
		 */
		explicit Text(std::string_view name, std::string content = {});

		Text(const Text &) = delete;

		Text &operator=(const Text &) = delete;

		Text(Text &&) = delete;

		Text &operator=(Text &&) = delete;

		/**
		 * @brief Get the name of the text
		 */
		[[nodiscard]] std::string_view get_name() const;

		/**
		 * @brief Get a read-only view of the current content
		 */
		[[nodiscard]] std::string_view get_content() const;

		/**
		 * @brief Replace the content
		 *
		 * Every call bumps the revision, even if the new content is equal to the old.
		 *
		 * @param content New content
		 */
		void set_content(std::string content);

		[[nodiscard]] std::size_t size() const;

		[[nodiscard]] bool empty() const;

		/**
		 * @brief Number of times the content has been replaced
		 */
		[[nodiscard]] std::uint64_t revision() const;

	private:
		std::string name;
		std::string content;
		std::uint64_t rev = 0;
	};
}
